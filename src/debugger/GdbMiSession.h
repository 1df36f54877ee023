/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <sys/types.h>
#include <string>
#include <vector>
#include "DebuggerSession.h"
#include "MiParser.h"

/**
 * @file GdbMiSession.h
 * @brief DebuggerSession backed by a GDB child process speaking MI
 */

/**
 * @brief Launch parameters of a GDB session
 */
struct GdbLaunchOptions {
    std::string gdbPath;                    ///< GDB executable, looked up in PATH
    std::string programFile;                ///< Executable ELF with symbols
    std::string coreFile;                   ///< Core dump ELF
    std::vector<std::string> initCommands;  ///< Console commands run after startup
    int timeoutSec = 3;                     ///< Per-command response timeout
};

/**
 * @class GdbMiSession
 * @brief Drives `gdb --interpreter=mi2` over a pair of pipes
 *
 * ## Lifecycle:
 * - The constructor forks GDB with the core and program loaded, waits for the
 *   first prompt and runs the init commands (e.g. add-symbol-file for ROM)
 * - Each command writes one MI line and collects records up to the next
 *   prompt after the result record
 * - The destructor asks GDB to exit and reaps the child
 *
 * A command that does not complete within the timeout returns whatever was
 * collected so far. GDB exiting unexpectedly raises DebuggerError.
 *
 * ## Usage:
 * ```cpp
 * GdbMiSession gdb({"xtensa-esp32-elf-gdb", "app.elf", "core.elf", {romCmd}, 3});
 * std::cout << gdb.runCommand("bt") << "\n";
 * ```
 */
class GdbMiSession : public DebuggerSession {
public:
    /**
     * @throws CoreDumpExceptions::DebuggerError if GDB cannot be started
     */
    explicit GdbMiSession(GdbLaunchOptions options);
    ~GdbMiSession() override;

    GdbMiSession(const GdbMiSession&) = delete;
    GdbMiSession& operator=(const GdbMiSession&) = delete;

    std::string runCommand(const std::string& command) override;
    std::vector<DebuggerThread> threads() override;
    void selectThread(int id) override;
    std::string taskName(uint32_t tcbAddress) override;

    /**
     * @brief Send a raw MI command and collect its records
     * @return Records up to the prompt following the result record
     */
    std::vector<MiRecord> execute(const std::string& miCommand);

    /**
     * @brief Extract the task name from an evaluated pcTaskName value
     * @param value Value such as `0x3ffb5f4c "main"`
     * @return Text between the first pair of quotes, or an empty string
     */
    static std::string parseTaskNameValue(const std::string& value);

private:
    GdbLaunchOptions options_;
    pid_t pid_ = -1;
    int toGdb_ = -1;
    int fromGdb_ = -1;
    unsigned nextToken_ = 0;
    std::string pending_;  ///< Bytes read past the last complete line

    void spawn();
    void shutdown();
    void writeLine(const std::string& line);

    /**
     * @brief Read records until a prompt follows the result record of a command
     * @param token Token of the pending command, empty to stop at the first
     *        prompt (startup banner)
     * @return Records collected before the prompt or the deadline
     */
    std::vector<MiRecord> readUntilPrompt(const std::string& token);
};
