/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include "../CoreDumpAnalyzer.h"
#include <string>
#include <vector>

/**
 * @file ConfigValidator.h
 * @brief Configuration validation and conflict detection
 *
 * CLI11 checks each option on its own; this validator checks the options
 * against each other and against the file system before any file is parsed.
 */

/**
 * @class ConfigValidator
 * @brief Validates configuration options and detects conflicts
 *
 * ## Validation Categories:
 * - **Mutual Exclusion**: --print-mem needs GDB, --json runs without it
 * - **File Access**: program and core dump exist and are non-empty
 * - **Output Safety**: --save-core must not overwrite the core dump it copies
 * - **Logical Consistency**: options that have no effect produce warnings
 *
 * ## Usage:
 * ```cpp
 * auto result = ConfigValidator::validate(config);
 * if (!result.is_valid) {
 *     std::cerr << "Configuration error: " << result.error_message << std::endl;
 *     return 1;
 * }
 * ```
 */
class ConfigValidator {
public:
    /**
     * @brief Validation result structure
     */
    struct ValidationResult {
        bool is_valid = true;           ///< Whether configuration is valid
        std::string error_message;      ///< Detailed error message if invalid
        std::vector<std::string> warnings; ///< Non-fatal warnings
    };

    /**
     * @brief Validate complete configuration
     *
     * @param config Configuration to validate
     * @return ValidationResult with validation status and messages
     */
    static ValidationResult validate(const Config& config);

    /**
     * @brief Check for mutually exclusive options
     *
     * @param config Configuration to check
     * @param error Output parameter for error message
     * @return true if no conflicts, false if mutually exclusive options found
     */
    static bool validateMutualExclusion(const Config& config, std::string& error);

    /**
     * @brief Validate input file accessibility
     *
     * @param filepath Path to input file
     * @param role Description used in messages ("program", "core dump")
     * @param error Output parameter for error message
     * @return true if file is accessible, false otherwise
     */
    static bool validateInputFile(const std::string& filepath, const std::string& role,
                                  std::string& error);

    /**
     * @brief Make sure --save-core does not name the core dump itself
     */
    static bool validateSaveCore(const Config& config, std::string& error);

    /**
     * @brief Check logical consistency of option combinations
     *
     * @param config Configuration to check
     * @param warnings Output parameter for warning messages
     */
    static void checkLogicalConsistency(const Config& config, std::vector<std::string>& warnings);
};
