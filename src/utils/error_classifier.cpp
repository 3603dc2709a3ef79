// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "utils/error_classifier.h"

#include "utils/nmcli_parser.h"

#include <vector>

namespace netpanel {

namespace {

/// A rule matches when every phrase of at least one alternative is present
struct PhraseRule {
    NmcliErrorClass cls;
    std::vector<std::vector<const char*>> alternatives;
};

// Lowercase phrases, checked in order. Add new nmcli wordings here.
const std::vector<PhraseRule>& phrase_table() {
    static const std::vector<PhraseRule> table = {
        {NmcliErrorClass::ActivationQueued, {{"activation was enqueued"}, {"enqueued"}}},
        {NmcliErrorClass::KeyMgmtMissing, {{"key-mgmt", "missing"}}},
        {NmcliErrorClass::ConnectionInterrupted,
         {{"base network connection was interrupted"}, {"connection was interrupted"}}},
        {NmcliErrorClass::NetworkNotFound,
         {{"network could not be found"}, {"no network with ssid"}, {"not found", "ssid"}}},
        {NmcliErrorClass::AlreadyExists, {{"already exists"}}},
        {NmcliErrorClass::UnknownConnection, {{"unknown connection"}}},
    };
    return table;
}

bool rule_matches(const PhraseRule& rule, const std::string& lower) {
    for (const auto& alternative : rule.alternatives) {
        bool all = true;
        for (const char* phrase : alternative) {
            if (lower.find(phrase) == std::string::npos) {
                all = false;
                break;
            }
        }
        if (all) {
            return true;
        }
    }
    return false;
}

} // namespace

NmcliErrorClass classify_nmcli_error(const std::string& message) {
    std::string lower = to_lower(message);
    for (const auto& rule : phrase_table()) {
        if (rule_matches(rule, lower)) {
            return rule.cls;
        }
    }
    return NmcliErrorClass::Fatal;
}

bool matches_error_class(const std::string& message, NmcliErrorClass cls) {
    if (cls == NmcliErrorClass::Fatal) {
        return classify_nmcli_error(message) == NmcliErrorClass::Fatal;
    }
    std::string lower = to_lower(message);
    for (const auto& rule : phrase_table()) {
        if (rule.cls == cls) {
            return rule_matches(rule, lower);
        }
    }
    return false;
}

bool is_rescan_recoverable(NmcliErrorClass cls) {
    return cls == NmcliErrorClass::ConnectionInterrupted ||
           cls == NmcliErrorClass::NetworkNotFound;
}

const char* nmcli_error_class_name(NmcliErrorClass cls) {
    switch (cls) {
    case NmcliErrorClass::ActivationQueued:
        return "activation-queued";
    case NmcliErrorClass::KeyMgmtMissing:
        return "key-mgmt-missing";
    case NmcliErrorClass::ConnectionInterrupted:
        return "connection-interrupted";
    case NmcliErrorClass::NetworkNotFound:
        return "network-not-found";
    case NmcliErrorClass::AlreadyExists:
        return "already-exists";
    case NmcliErrorClass::UnknownConnection:
        return "unknown-connection";
    case NmcliErrorClass::Fatal:
        return "fatal";
    }
    return "unknown";
}

} // namespace netpanel
