/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "CLI11Parser.h"
#include <regex>
#include "../TargetResolver.h"
#include "VersionInfo.h"

std::string
CompactFormatter::make_help(const CLI::App* app, std::string name, CLI::AppFormatMode mode) const {
    std::string help = CLI::Formatter::make_help(app, name, mode);

    // Remove the positionals section entirely
    size_t pos = help.find("\nPOSITIONALS:");
    if (pos != std::string::npos) {
        size_t end = help.find("\nOPTIONS:", pos);
        if (end != std::string::npos) {
            help.erase(pos, end - pos);
        }
    }

    // Reduce multiple blank lines to single blank line
    help = std::regex_replace(help, std::regex("\n\n\n+"), "\n\n");

    return help;
}

std::optional<Config> CLI11Parser::parse(int argc, char* argv[], int& exitCode) {
    Config config;

    CLI::App app{"coretk - core dump analysis tool kit for ESP32 firmware", "coretk"};
    setupApp(app, config);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Prints help, version or the error message
        exitCode = app.exit(e);
        return std::nullopt;
    }

    for (const auto* subcommand : app.get_subcommands()) {
        config.command = subcommand->get_name();
    }
    config.portGiven = app.get_option("--port")->count() > 0;

    return config;
}

void CLI11Parser::setupApp(CLI::App& app, Config& config) {
    // Configure formatter for clean output
    auto formatter = std::make_shared<CompactFormatter>();
    formatter->column_width(40);
    formatter->label("REQUIRED", "");
    app.formatter(formatter);

    // Strict argument parsing
    app.allow_extras(false);
    app.allow_config_extras(false);
    app.require_subcommand(1);

    // Version and help flags
    app.set_version_flag("--version,-v", []() {
        VersionInfo::showVersion();
        return std::string{};
    });
    app.set_help_flag("--help,-h", "Show this help");

    // Target selection
    std::vector<std::string> chips = {TargetInfo::AUTO_TARGET};
    for (const auto& target : TargetInfo::supportedTargets()) {
        chips.push_back(target);
    }
    app.add_option("--chip", config.chip, "Target chip type")
        ->envname("ESPTOOL_CHIP")
        ->check(CLI::IsMember(chips))
        ->default_val(TargetInfo::AUTO_TARGET);
    app.add_option("--port,-p", config.port, "Serial port device used to detect the chip")
        ->envname("ESPTOOL_PORT")
        ->default_val("/dev/ttyUSB0");
    app.add_option("--baud,-b", config.baud, "Serial port baud rate used to detect the chip")
        ->envname("ESPTOOL_BAUD")
        ->check(CLI::PositiveNumber)
        ->default_val(115200);
    app.add_option("--gdb-timeout-sec",
                   config.gdbTimeoutSec,
                   "Time to wait for each GDB response (default: 3)")
        ->check(CLI::PositiveNumber)
        ->default_val(3);
    app.add_flag_function(
        "--verbose",
        [&config](int64_t count) { config.verbosity = static_cast<int>(count); },
        "Show diagnostic messages (use twice for more detail)");

    CLI::App* dbg = app.add_subcommand("dbg_corefile",
                                       "Start GDB debug session with specified core dump");
    addDumpOptions(*dbg, config);

    CLI::App* info = app.add_subcommand("info_corefile",
                                        "Print core dump info from file");
    addDumpOptions(*info, config);
    info->add_flag("--print-mem,-m", config.printMemory, "Print memory dump");
    info->add_flag_callback(
        "--json",
        [&config]() { config.format = "json"; },
        "Output reconciled data in JSON format, without GDB");
}

void CLI11Parser::addDumpOptions(CLI::App& command, Config& config) {
    command.fallthrough();

    command.add_option("prog", config.programFile, "Path to program's ELF binary")
        ->required()
        ->check(CLI::ExistingFile);
    command.add_option("--core,-c", config.coreFile, "Path to core dump ELF file")
        ->required()
        ->check(CLI::ExistingFile);
    command.add_option("--gdb,-g", config.gdbPath, "Path to gdb");
    command.add_option("--rom-elf,-r", config.romElf, "Path to ROM ELF file (default: <chip>_rom.elf)");
    command.add_option("--save-core,-s", config.saveCore, "Save core dump to this file");
}
