/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include "CoreStructures.h"
#include "../RegionReconciler.h"
#include "../debugger/DebuggerSession.h"

/**
 * @file ReportComposer.h
 * @brief Text and JSON rendering of a core dump analysis
 */

/**
 * @brief Everything the report shows besides debugger output
 */
struct ReportData {
    std::string target;                ///< Resolved chip name
    uint16_t machine = 0;              ///< e_machine of the executable
    NoteDiagnostics diagnostics;       ///< Decoded notes
    ReconciliationResult regions;      ///< Reconciled memory map
};

/**
 * @class ReportComposer
 * @brief Writes the core dump report
 *
 * ## Design Pattern: Dependency Injection
 * The composer receives the output stream and the debugger session, so the
 * report can be rendered into a string stream against a scripted debugger.
 *
 * ## Text Report Layout:
 * ```
 * ==================== ESP32 CORE DUMP START ====================
 * Crashed task handle: 0x3ffb8a10, name: 'main', GDB name: 'process 1073449488'
 * ================== CURRENT THREAD REGISTERS ===================
 * ==================== CURRENT THREAD STACK =====================
 * ======================== THREADS INFO =========================
 * ==================== THREAD 1 (TCB: 0x3ffb8a10, name: 'main') =====================
 * ======================= ALL MEMORY REGIONS ========================
 * Name   Address   Size   Attrs
 * .iram0.vectors 0x40080000 0x400 R XA
 * .coredump.tasks.data 0x3ffb8a10 0x15c RW
 * ====================== CORE DUMP MEMORY CONTENTS ========================
 * ===================== ESP32 CORE DUMP END =====================
 * ```
 *
 * ## JSON Output:
 * ```json
 * {
 *   "target": "esp32",
 *   "crashedTask": "0x3ffb8a10",
 *   "tasks": [{"index": 0, "flags": 0, "tcb": "0x3ffb8a10", "stack": "0x3ffb8900"}],
 *   "regions": [{"name": ".dram0.data", "address": "0x3ffb0000", "size": 4096, ...}]
 * }
 * ```
 */
class ReportComposer {
public:
    ReportComposer(std::ostream& out, DebuggerSession& debugger);

    /**
     * @brief Write the full text report
     * @param data Decoded notes and reconciled regions
     * @param printMemory Append a hex dump of every core-only region
     */
    void composeTextReport(const ReportData& data, bool printMemory);

    /**
     * @brief Write the reconciled data as JSON (no debugger output)
     */
    static void composeJson(std::ostream& out, const ReportData& data);

    /**
     * @brief Region line of the memory map, "<name> 0x<addr> 0x<size> <attrs>"
     */
    static std::string formatRegionLine(const MergedRegion& region, bool coreOnly);

private:
    std::ostream& out_;
    DebuggerSession& debugger_;

    void writeCrashedTask(const NoteDiagnostics& diagnostics);
    void writeCurrentThreadRegisters(const ReportData& data);
    void writeCurrentThreadStack(const NoteDiagnostics& diagnostics);
    void writeThreads(const NoteDiagnostics& diagnostics);
    void writeMemoryRegions(const ReconciliationResult& regions);
    void writeMemoryContents(const ReconciliationResult& regions);
    void writeTaskInfo(const TaskStatusRecord& record);

    static std::string jsonEscape(const std::string& text);
};
