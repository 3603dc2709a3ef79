// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "net_error.h"

namespace netpanel {

const char* net_result_name(NetResult result) {
    switch (result) {
    case NetResult::SUCCESS:
        return "SUCCESS";
    case NetResult::INVALID_PARAMETERS:
        return "INVALID_PARAMETERS";
    case NetResult::DEVICE_NOT_FOUND:
        return "DEVICE_NOT_FOUND";
    case NetResult::DEVICE_WRONG_TYPE:
        return "DEVICE_WRONG_TYPE";
    case NetResult::HARDWARE_NOT_AVAILABLE:
        return "HARDWARE_NOT_AVAILABLE";
    case NetResult::EXEC_FAILED:
        return "EXEC_FAILED";
    case NetResult::COMMAND_FAILED:
        return "COMMAND_FAILED";
    case NetResult::ACTIVATION_FAILED:
        return "ACTIVATION_FAILED";
    case NetResult::IO_ERROR:
        return "IO_ERROR";
    }
    return "UNKNOWN";
}

} // namespace netpanel
