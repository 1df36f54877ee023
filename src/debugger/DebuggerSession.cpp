/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "DebuggerSession.h"
#include <cstdlib>

uint32_t DebuggerSession::tcbFromTargetId(const std::string& targetId) {
    static const std::string PREFIX = "process ";
    std::string number = targetId;
    if (number.compare(0, PREFIX.size(), PREFIX) == 0) {
        number = number.substr(PREFIX.size());
    }
    if (number.empty()) {
        return 0;
    }
    char* end = nullptr;
    unsigned long value = std::strtoul(number.c_str(), &end, 0);
    if (end == number.c_str() || *end != '\0') {
        return 0;
    }
    return static_cast<uint32_t>(value);
}
