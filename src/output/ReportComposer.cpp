/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file ReportComposer.cpp
 * @brief Implementation of the text and JSON core dump reports
 *
 * ## Key Methods:
 * - composeTextReport() - Banner sections interleaved with debugger output
 * - composeJson() - Reconciled data only, for scripting
 *
 * Task records are matched to debugger threads positionally: the thread with
 * id N is task N - 1. Threads without a record are shown without a corruption
 * notice.
 */

#include "ReportComposer.h"
#include <iomanip>
#include <optional>
#include <sstream>
#include "../XtensaExceptionInfo.h"

namespace {

std::string hex(uint64_t value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << value;
    return oss.str();
}

}  // namespace

ReportComposer::ReportComposer(std::ostream& out, DebuggerSession& debugger)
    : out_(out), debugger_(debugger) {}

void ReportComposer::composeTextReport(const ReportData& data, bool printMemory) {
    out_ << "===============================================================\n";
    out_ << "==================== ESP32 CORE DUMP START ====================\n";

    writeCrashedTask(data.diagnostics);
    writeCurrentThreadRegisters(data);
    writeCurrentThreadStack(data.diagnostics);
    writeThreads(data.diagnostics);
    writeMemoryRegions(data.regions);
    if (printMemory) {
        writeMemoryContents(data.regions);
    }

    out_ << "\n===================== ESP32 CORE DUMP END =====================\n";
    out_ << "===============================================================\n";
}

void ReportComposer::writeCrashedTask(const NoteDiagnostics& diagnostics) {
    if (!diagnostics.register_snapshot || diagnostics.register_snapshot->words.empty()) {
        return;
    }
    const RegisterSnapshot& snapshot = *diagnostics.register_snapshot;
    if (snapshot.crashedTaskSkipped()) {
        out_ << "\nCrashed task has been skipped.\n";
        return;
    }
    uint32_t handle = snapshot.marker();
    out_ << "\nCrashed task handle: " << hex(handle) << ", name: '" << debugger_.taskName(handle)
         << "', GDB name: 'process " << std::dec << handle << "'\n";
}

void ReportComposer::writeCurrentThreadRegisters(const ReportData& data) {
    out_ << "\n================== CURRENT THREAD REGISTERS ===================\n";
    // Only Xtensa dumps carry exception registers
    if (data.machine == static_cast<uint16_t>(ElfMachine::EM_XTENSA)) {
        std::optional<XtensaExceptionRegisters> registers;
        if (data.diagnostics.register_snapshot) {
            registers = XtensaExceptionInfo::decode(*data.diagnostics.register_snapshot);
        }
        if (registers) {
            out_ << XtensaExceptionInfo::format(*registers);
        } else {
            out_ << "Exception registers have not been found!\n";
        }
    }
    out_ << debugger_.runCommand("info registers") << "\n";
}

void ReportComposer::writeCurrentThreadStack(const NoteDiagnostics& diagnostics) {
    out_ << "\n==================== CURRENT THREAD STACK =====================\n";
    out_ << debugger_.runCommand("bt") << "\n";
    if (!diagnostics.task_status.empty() && diagnostics.task_status.front().isCorrupted()) {
        out_ << "The current crashed task is corrupted.\n";
        writeTaskInfo(diagnostics.task_status.front());
    }
}

void ReportComposer::writeThreads(const NoteDiagnostics& diagnostics) {
    out_ << "\n======================== THREADS INFO =========================\n";
    out_ << debugger_.runCommand("info threads") << "\n";

    for (const auto& thread : debugger_.threads()) {
        uint32_t tcb = DebuggerSession::tcbFromTargetId(thread.target_id);
        std::string name = debugger_.taskName(tcb);
        debugger_.selectThread(thread.id);

        out_ << "\n==================== THREAD " << std::dec << thread.id << " (TCB: " << hex(tcb)
             << ", name: '" << name << "') =====================\n";
        out_ << debugger_.runCommand("bt") << "\n";

        if (thread.id < 1) {
            continue;
        }
        size_t taskIndex = static_cast<size_t>(thread.id - 1);
        if (taskIndex < diagnostics.task_status.size() &&
            diagnostics.task_status[taskIndex].isCorrupted()) {
            out_ << "The task '" << std::dec << thread.id << "' is corrupted.\n";
            writeTaskInfo(diagnostics.task_status[taskIndex]);
        }
    }
}

void ReportComposer::writeTaskInfo(const TaskStatusRecord& record) {
    out_ << "Task #" << std::dec << record.task_index << " info: flags, tcb, stack (" << std::hex
         << record.flags << ", " << record.tcb_address << ", " << record.stack_start_address
         << ").\n"
         << std::dec;
}

void ReportComposer::writeMemoryRegions(const ReconciliationResult& regions) {
    out_ << "\n\n======================= ALL MEMORY REGIONS ========================\n";
    out_ << "Name   Address   Size   Attrs\n";
    for (const auto& region : regions.section_regions) {
        out_ << formatRegionLine(region, false) << "\n";
    }
    for (const auto& region : regions.core_only_regions) {
        out_ << formatRegionLine(region, true) << "\n";
    }
}

void ReportComposer::writeMemoryContents(const ReconciliationResult& regions) {
    out_ << "\n====================== CORE DUMP MEMORY CONTENTS ========================\n";
    for (const auto& region : regions.core_only_regions) {
        out_ << formatRegionLine(region, true) << "\n";
        std::ostringstream command;
        command << "x/" << std::dec << region.byte_length / 4 << "x 0x" << std::hex
                << region.start_address;
        out_ << debugger_.runCommand(command.str()) << "\n";
    }
}

std::string ReportComposer::formatRegionLine(const MergedRegion& region, bool coreOnly) {
    std::ostringstream oss;
    if (coreOnly) {
        oss << ".coredump.";
    }
    oss << region.name << " " << hex(region.start_address) << " " << hex(region.byte_length) << " "
        << region.attribute_string;
    return oss.str();
}

void ReportComposer::composeJson(std::ostream& out, const ReportData& data) {
    const NoteDiagnostics& diag = data.diagnostics;

    out << "{\n";
    out << "  \"target\": \"" << jsonEscape(data.target) << "\",\n";
    out << "  \"machine\": " << std::dec << data.machine << ",\n";

    if (diag.chip_version) {
        out << "  \"chipVersion\": " << std::dec << *diag.chip_version << ",\n";
    }

    if (diag.register_snapshot && !diag.register_snapshot->words.empty()) {
        if (diag.register_snapshot->crashedTaskSkipped()) {
            out << "  \"crashedTask\": null,\n";
        } else {
            out << "  \"crashedTask\": \"" << hex(diag.register_snapshot->marker()) << "\",\n";
        }
        if (data.machine == static_cast<uint16_t>(ElfMachine::EM_XTENSA)) {
            auto registers = XtensaExceptionInfo::decode(*diag.register_snapshot);
            if (registers) {
                out << "  \"exception\": {\n";
                out << "    \"exccause\": \"" << hex(registers->exccause) << "\",\n";
                out << "    \"cause\": \"" << XtensaExceptionInfo::causeName(registers->exccause)
                    << "\",\n";
                out << "    \"excvaddr\": \"" << hex(registers->excvaddr) << "\"\n";
                out << "  },\n";
            }
        }
    }

    out << "  \"tasks\": [\n";
    for (size_t i = 0; i < diag.task_status.size(); ++i) {
        const auto& task = diag.task_status[i];
        out << "    {\n";
        out << "      \"index\": " << std::dec << task.task_index << ",\n";
        out << "      \"flags\": " << task.flags << ",\n";
        out << "      \"tcb\": \"" << hex(task.tcb_address) << "\",\n";
        out << "      \"stack\": \"" << hex(task.stack_start_address) << "\",\n";
        out << "      \"corrupted\": " << (task.isCorrupted() ? "true" : "false") << "\n";
        out << "    }" << (i + 1 == diag.task_status.size() ? "" : ",") << "\n";
    }
    out << "  ],\n";

    std::vector<MergedRegion> all = data.regions.allRegions();
    size_t sectionCount = data.regions.section_regions.size();
    out << "  \"regions\": [\n";
    for (size_t i = 0; i < all.size(); ++i) {
        const auto& region = all[i];
        bool coreOnly = i >= sectionCount;
        out << "    {\n";
        out << "      \"name\": \"" << jsonEscape(coreOnly ? ".coredump." + region.name : region.name)
            << "\",\n";
        out << "      \"address\": \"" << hex(region.start_address) << "\",\n";
        out << "      \"size\": " << std::dec << region.byte_length << ",\n";
        out << "      \"attrs\": \"" << jsonEscape(region.attribute_string) << "\",\n";
        out << "      \"merged\": " << (region.is_merged ? "true" : "false") << ",\n";
        out << "      \"coreOnly\": " << (coreOnly ? "true" : "false") << "\n";
        out << "    }" << (i + 1 == all.size() ? "" : ",") << "\n";
    }
    out << "  ],\n";

    out << "  \"contestedSections\": [";
    for (size_t i = 0; i < data.regions.contested_sections.size(); ++i) {
        out << (i == 0 ? "" : ", ") << "\"" << jsonEscape(data.regions.contested_sections[i])
            << "\"";
    }
    out << "]\n";
    out << "}\n";
}

std::string ReportComposer::jsonEscape(const std::string& text) {
    std::ostringstream oss;
    for (char c : text) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c);
                } else {
                    oss << c;
                }
                break;
        }
    }
    return oss.str();
}
