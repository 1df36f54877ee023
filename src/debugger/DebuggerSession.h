/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * @file DebuggerSession.h
 * @brief Interface to a debugger that has the program and its core dump loaded
 */

/**
 * @brief One thread as listed by the debugger
 */
struct DebuggerThread {
    int id = 0;             ///< Debugger thread number, starting at 1
    std::string target_id;  ///< Target identifier, "process <tcb>" for FreeRTOS tasks
};

/**
 * @class DebuggerSession
 * @brief Commands the report needs from a debugger
 *
 * Implementations block on the debugger and return its textual output. Task
 * indices of the dump map to thread ids as task_index = thread id - 1.
 */
class DebuggerSession {
public:
    virtual ~DebuggerSession() = default;

    /**
     * @brief Run a console command and return its output
     */
    virtual std::string runCommand(const std::string& command) = 0;

    /**
     * @brief List the threads of the core dump in debugger order
     */
    virtual std::vector<DebuggerThread> threads() = 0;

    /**
     * @brief Make a thread current for subsequent commands
     */
    virtual void selectThread(int id) = 0;

    /**
     * @brief Name of the FreeRTOS task whose TCB is at the given address
     * @return Task name, or an empty string if the debugger cannot tell
     */
    virtual std::string taskName(uint32_t tcbAddress) = 0;

    /**
     * @brief TCB address encoded in a thread target id
     * @param targetId Target id such as "process 1073431968" (decimal or 0x-prefixed)
     * @return TCB address, 0 when the id carries no number
     */
    static uint32_t tcbFromTargetId(const std::string& targetId);
};
