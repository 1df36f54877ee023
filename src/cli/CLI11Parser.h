/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include "../CoreDumpAnalyzer.h"
#include <CLI11.hpp>
#include <optional>

/**
 * @file CLI11Parser.h
 * @brief Command line parsing using the CLI11 library
 *
 * coretk has two subcommands sharing the target selection options:
 * ```
 * coretk [--chip C] [--port P] [--baud B] info_corefile --core core.elf [--print-mem] app.elf
 * coretk [--chip C] [--port P] [--baud B] dbg_corefile --core core.elf app.elf
 * ```
 * --chip, --port and --baud default to the ESPTOOL_CHIP, ESPTOOL_PORT and
 * ESPTOOL_BAUD environment variables.
 */

/**
 * @brief Compact formatter that removes positionals section and reduces blank lines
 */
class CompactFormatter : public CLI::Formatter {
public:
    std::string make_help(const CLI::App *app, std::string name, CLI::AppFormatMode mode) const override;
};

class CLI11Parser {
public:
    /**
     * @brief Parse command line arguments using CLI11
     * @param argc Number of arguments
     * @param argv Array of argument strings
     * @param exitCode Set to the process exit status when parsing stops early
     *        (0 for --help and --version, non-zero for errors)
     * @return std::optional<Config> with parsed options, or std::nullopt if parsing stops
     */
    static std::optional<Config> parse(int argc, char* argv[], int& exitCode);

private:
    static void setupApp(CLI::App& app, Config& config);
    static void addDumpOptions(CLI::App& command, Config& config);
};
