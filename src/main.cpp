/**
 * @file main.cpp
 * @brief Command-line entry point of coretk
 *
 * @section usage_examples Usage Examples
 * @code
 * // Print the crash report of an ESP32 core dump
 * ./coretk info_corefile --core core.elf app.elf
 *
 * // Same, with the chip given explicitly and the dumped memory printed
 * ./coretk --chip esp32s3 info_corefile -m --core core.elf app.elf
 *
 * // Reconciled memory map and task records as JSON
 * ./coretk info_corefile --json --core core.elf app.elf
 *
 * // Interactive GDB on the core dump
 * ./coretk dbg_corefile --core core.elf app.elf
 * @endcode
 *
 * @copyright Mozilla Public License 2.0
 */

/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <csignal>
#include <iostream>
#include <stdexcept>
#include "CoreDumpAnalyzer.h"
#include "CoreDumpExceptions.h"
#include "cli/CLI11Parser.h"
#include "cli/ConfigValidator.h"

/**
 * @brief Entry point
 *
 * 1. Parse arguments with CLI11 (automatic help/version/error handling)
 * 2. Validate the configuration
 * 3. Run info_corefile or dbg_corefile
 *
 * @return 0 on success and when the chip cannot be identified (the guidance
 *         is the result), 1 on any other error
 */
int main(int argc, char* argv[]) {
    // A GDB child that dies must surface as a write error, not terminate us
    std::signal(SIGPIPE, SIG_IGN);

    try {
        int parseExitCode = 0;
        auto config_result = CLI11Parser::parse(argc, argv, parseExitCode);
        if (!config_result) {
            // CLI11 already printed the error/help message
            return parseExitCode;
        }
        Config config = *config_result;

        auto validationResult = ConfigValidator::validate(config);
        if (!validationResult.is_valid) {
            std::cerr << "Configuration error: " << validationResult.error_message << '\n';
            return 1;
        }

        for (const auto& warning : validationResult.warnings) {
            std::cerr << "Warning: " << warning << '\n';
        }

        CoreDumpAnalyzer analyzer(config);
        return analyzer.run(std::cout);

    } catch (const CoreDumpExceptions::TargetResolutionError& e) {
        std::cout << e.what() << '\n';
        if (!e.getContext().empty()) {
            std::cerr << "Chip detection failed: " << e.getContext() << '\n';
        }
        return 0;
    } catch (const CoreDumpExceptions::CoreDumpError& e) {
        std::cerr << "Core Dump Error: " << e.getDetailedMessage() << '\n';
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Configuration error: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected Error: " << e.what() << '\n';
        return 1;
    }
}
