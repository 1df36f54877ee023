/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "VersionInfo.h"
#include <iostream>
#include <string>

/// @brief Build date macro (set by build system)
#ifndef BUILD_DATE
#define BUILD_DATE "unknown"
#endif

/// @brief Build time macro (set by build system)
#ifndef BUILD_TIME
#define BUILD_TIME "unknown"
#endif

const char* VersionInfo::getVersionString() {
    static std::string version_string = std::string(APP_NAME) + " v" + VERSION;
    return version_string.c_str();
}

void VersionInfo::showVersion() {
    std::cout << getVersionString() << std::endl;
    std::cout << COPYRIGHT << std::endl;
    std::cout << "Build Date: " << BUILD_DATE << std::endl;
    std::cout << "Build Time: " << BUILD_TIME << std::endl;
    std::cout << std::endl;
    std::cout << "License: " << LICENSE_URL << std::endl;
    std::cout << "Supported targets: esp32, esp32s2, esp32s3, esp32c3" << std::endl;
    std::cout << std::endl;
}
