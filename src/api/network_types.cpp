// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "network_types.h"

namespace netpanel {

const char* connect_status_name(ConnectStatus status) {
    switch (status) {
    case ConnectStatus::Connected:
        return "connected";
    case ConnectStatus::Queued:
        return "queued";
    }
    return "unknown";
}

const char* device_kind_name(DeviceKind kind) {
    switch (kind) {
    case DeviceKind::Phone:
        return "phone";
    case DeviceKind::Computer:
        return "computer";
    case DeviceKind::Tv:
        return "tv";
    case DeviceKind::Iot:
        return "iot";
    case DeviceKind::Unknown:
        return "unknown";
    }
    return "unknown";
}

} // namespace netpanel
