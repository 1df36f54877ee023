/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

/**
 * @file VersionInfo.h
 * @brief Centralized version information
 *
 * Single source of truth for the application version and copyright shown by
 * --version. Help text is generated by CLI11 from the option definitions.
 */

/**
 * @class VersionInfo
 * @brief Centralized version information
 *
 * ## Usage:
 * ```cpp
 * VersionInfo::showVersion();
 * std::string version = VersionInfo::getVersionString();
 * ```
 */
class VersionInfo {
public:
    /// @brief Application version string
    static constexpr const char* VERSION = "1.0.0";

    /// @brief Copyright notice
    static constexpr const char* COPYRIGHT = "Copyright (c) 2025 - Licensed under Mozilla Public License 2.0";

    /// @brief License URL
    static constexpr const char* LICENSE_URL = "https://mozilla.org/MPL/2.0/";

    /// @brief Application name
    static constexpr const char* APP_NAME = "coretk";

    /**
     * @brief Get formatted version string
     * @return Complete version string with application name
     */
    static const char* getVersionString();

    /**
     * @brief Display application version and build information
     *
     * Outputs the application name and version, the copyright notice, the
     * build timestamp (if available) and the license.
     */
    static void showVersion();
};
