/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "ChipDetector.h"
#include "CoreStructures.h"
#include "ElfContainerReader.h"
#include "debugger/DebuggerSession.h"
#include "debugger/GdbMiSession.h"
#include "output/ReportComposer.h"

/**
 * @file CoreDumpAnalyzer.h
 * @brief The two operations of coretk: info_corefile and dbg_corefile
 */

/**
 * @brief Command-line configuration
 */
struct Config {
    std::string command;              ///< "info_corefile" or "dbg_corefile"
    std::string programFile;          ///< Executable ELF the dump was produced by
    std::string coreFile;             ///< Core dump ELF
    std::string chip = "auto";        ///< Target chip or "auto"
    std::string port = "/dev/ttyUSB0";  ///< Serial port for chip detection
    int baud = 115200;                ///< Baud rate for chip detection
    std::string gdbPath;              ///< GDB override (empty = per target)
    std::string romElf;               ///< ROM ELF override (empty = <target>_rom.elf)
    int gdbTimeoutSec = 3;            ///< GDB response timeout
    std::string saveCore;             ///< Copy the core dump here (empty = no copy)
    bool printMemory = false;         ///< Dump core-only region contents
    std::string format = "text";      ///< "text" or "json"
    int verbosity = 0;
    bool portGiven = false;           ///< --port was passed explicitly
};

/**
 * @brief Creates the debugger session for a report
 */
using DebuggerFactory =
    std::function<std::unique_ptr<DebuggerSession>(const GdbLaunchOptions& options)>;

/**
 * @class CoreDumpAnalyzer
 * @brief Loads a dump, resolves the target and produces the report
 *
 * ## info_corefile:
 * 1. Read executable and core dump, refuse mismatching architectures
 * 2. Decode notes and resolve the target chip
 * 3. Reconcile sections against core segments
 * 4. Start GDB with ROM symbols and write the report (or JSON without GDB)
 *
 * ## dbg_corefile:
 * Steps 1-2, then GDB runs interactively on the terminal until the user quits.
 *
 * ## Usage:
 * ```cpp
 * CoreDumpAnalyzer analyzer(config);
 * analyzer.infoCorefile(std::cout);
 * ```
 */
class CoreDumpAnalyzer {
public:
    /**
     * @brief Analyzer with esptool chip detection and a GDB MI debugger
     */
    explicit CoreDumpAnalyzer(const Config& config);

    /**
     * @brief Analyzer with injected chip detection and debugger
     */
    CoreDumpAnalyzer(const Config& config, ChipDetector& detector, DebuggerFactory debuggerFactory);

    /**
     * @brief Run the configured command
     * @return Process exit status
     */
    int run(std::ostream& out);

    /**
     * @brief Print the core dump report
     * @throws CoreDumpExceptions::CoreDumpError subclasses on unreadable input,
     *         architecture mismatch, malformed notes or resolution failure
     */
    void infoCorefile(std::ostream& out);

    /**
     * @brief Run an interactive GDB session on the core dump
     * @return Exit status of GDB
     */
    int dbgCorefile(std::ostream& out);

    /**
     * @brief Debugger command that loads ROM symbols for a target
     * @return "add-symbol-file <rom.elf> 0x<.text>", or empty if the ROM ELF
     *         is missing or has no .text section
     */
    std::string romSymbolCommand(const std::string& target) const;

private:
    /// Inputs shared by both commands
    struct LoadedDump {
        ElfContainerReader program;
        ElfContainerReader core;
        NoteDiagnostics diagnostics;
        std::string target;
    };

    Config config_;
    std::unique_ptr<ChipDetector> ownedDetector_;
    ChipDetector& detector_;
    DebuggerFactory debuggerFactory_;

    LoadedDump load();
    void saveCoreCopy() const;
    GdbLaunchOptions launchOptions(const std::string& target) const;
    int launchInteractiveGdb(const GdbLaunchOptions& options) const;
};
