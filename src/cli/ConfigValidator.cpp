/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "ConfigValidator.h"
#include <filesystem>
#include <fstream>
#include <system_error>
#include "../TargetResolver.h"

ConfigValidator::ValidationResult ConfigValidator::validate(const Config& config) {
    ValidationResult result;
    std::string error;

    if (!validateMutualExclusion(config, error)) {
        result.is_valid = false;
        result.error_message = error;
        return result;
    }

    if (!validateInputFile(config.programFile, "program", error) ||
        !validateInputFile(config.coreFile, "core dump", error)) {
        result.is_valid = false;
        result.error_message = error;
        return result;
    }

    if (!validateSaveCore(config, error)) {
        result.is_valid = false;
        result.error_message = error;
        return result;
    }

    if (config.gdbTimeoutSec <= 0) {
        result.is_valid = false;
        result.error_message = "--gdb-timeout-sec must be a positive number of seconds";
        return result;
    }

    // Check logical consistency (warnings only)
    checkLogicalConsistency(config, result.warnings);

    return result;
}

bool ConfigValidator::validateMutualExclusion(const Config& config, std::string& error) {
    if (config.printMemory && config.format == "json") {
        error = "--print-mem reads memory through GDB and cannot be combined with --json, which "
                "runs without GDB.";
        return false;
    }
    return true;
}

bool ConfigValidator::validateInputFile(const std::string& filepath, const std::string& role,
                                        std::string& error) {
    if (filepath.empty()) {
        error = "No " + role + " file given";
        return false;
    }

    // Check if file exists and is readable
    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        error = "Cannot open " + role + " file '" + filepath +
                "'. Please check that the file exists and is readable.";
        return false;
    }

    // Check file size (should not be empty)
    file.seekg(0, std::ios::end);
    auto file_size = file.tellg();
    if (file_size <= 0) {
        error = "The " + role + " file '" + filepath + "' is empty or cannot determine file size.";
        return false;
    }

    return true;
}

bool ConfigValidator::validateSaveCore(const Config& config, std::string& error) {
    if (config.saveCore.empty()) {
        return true;
    }
    std::error_code ec;
    bool sameFile = config.saveCore == config.coreFile ||
                    std::filesystem::equivalent(config.saveCore, config.coreFile, ec);
    if (sameFile) {
        error = "--save-core '" + config.saveCore + "' is the core dump being analyzed";
        return false;
    }
    return true;
}

void ConfigValidator::checkLogicalConsistency(const Config& config,
                                              std::vector<std::string>& warnings) {
    if (config.portGiven && config.chip != TargetInfo::AUTO_TARGET) {
        warnings.push_back("--port has no effect when --chip is given. The chip is not detected.");
    }

    if (config.format == "json" && !config.gdbPath.empty()) {
        warnings.push_back("--gdb has no effect with --json. JSON output does not start GDB.");
    }
}
