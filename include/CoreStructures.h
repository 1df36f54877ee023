/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file CoreStructures.h
 * @brief Core data structures shared by the core dump analysis components
 *
 * This file defines the data model used when analyzing an ESP32-family core dump:
 *
 * ## Structure Categories:
 * 1. **Container Structures**: Sections, segments and notes read from ELF containers
 * 2. **Diagnostic Records**: Register snapshot and per-task status decoded from notes
 * 3. **Analysis Result Structures**: Reconciled memory regions for report output
 *
 * ## Design Philosophy:
 * - **Container Agnostic**: Structures carry plain addresses and lengths, no libelf types
 * - **Immutable After Load**: Containers are read once, results are computed once
 * - **Type Safety**: Strong typing with enums for note tags, machines and chip versions
 *
 * @note All multi-byte note fields are little-endian (Xtensa and RISC-V ESP targets)
 * @see CoreDumpAnalyzer.h for how these structures flow between components
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// ============================================================================
// ELF Format Enumerations
// ============================================================================

/**
 * @brief ELF machine architecture types relevant for ESP core dumps
 *
 * ## Supported Architectures:
 * - **EM_XTENSA**: Tensilica Xtensa processors (ESP32, ESP32-S2, ESP32-S3)
 * - **EM_RISCV**: RISC-V processors (ESP32-C3)
 *
 * The executable and the core dump must agree on the machine type before any
 * reconciliation takes place.
 */
enum class ElfMachine : uint16_t {
    EM_NONE = 0x00,    ///< No machine / unknown
    EM_XTENSA = 0x5E,  ///< Tensilica Xtensa processors (ESP32, ESP32-S2, ESP32-S3)
    EM_RISCV = 0xF3    ///< RISC-V processors (ESP32-C3)
};

/**
 * @brief ELF section attribute flags (subset of sh_flags)
 */
enum class SectionFlags : uint64_t {
    SHF_WRITE = 0x1,      ///< Section is writable at runtime
    SHF_ALLOC = 0x2,      ///< Section occupies memory during execution
    SHF_EXECINSTR = 0x4   ///< Section contains executable instructions
};

/**
 * @brief ELF segment permission flags (p_flags)
 */
enum class SegmentFlags : uint32_t {
    PF_X = 0x1,  ///< Execute permission
    PF_W = 0x2,  ///< Write permission
    PF_R = 0x4   ///< Read permission
};

/**
 * @brief Note type tags written by the ESP-IDF core dump component
 *
 * The core dump ELF carries these notes inside its PT_NOTE segments next to the
 * standard NT_PRSTATUS thread notes. Any other tag is treated as OTHER.
 */
enum class NoteType : uint32_t {
    OTHER = 0,              ///< Any note the extractor does not decode
    EXTRA_INFO = 677,       ///< Crashed task marker followed by extra register pairs
    TASK_INFO = 678,        ///< Per-task status record
    CHIP_VERSION_INFO = 8266  ///< Dump format and chip version (PT_INFO)
};

/**
 * @brief Chip version codes stored in the PT_INFO note
 */
enum class ChipVersion : uint32_t {
    ESP32 = 0,
    ESP32S2 = 2,
    ESP32C3 = 5,
    ESP32S3 = 9
};

/**
 * @brief Core dump format constants
 */
namespace CoreDumpFormat {
/** @brief EXTRA_INFO marker meaning the crashed task's own context was not dumped */
constexpr uint32_t CURR_TASK_MARKER = 0xDEADBEEF;

/** @brief Name fragment identifying an EXTRA_INFO note */
constexpr const char* EXTRA_INFO_NAME = "EXTRA_INFO";

/** @brief Name fragment identifying a TASK_INFO note */
constexpr const char* TASK_INFO_NAME = "TASK_INFO";

/** @brief Size of one encoded task status record (four u32 fields) */
constexpr size_t TASK_STATUS_RECORD_SIZE = 16;

/** @brief Minimum PT_INFO payload carrying the chip version */
constexpr size_t CHIP_VERSION_FIELD_SIZE = 4;

/** @brief Task flag value for a task whose TCB and stack are intact */
constexpr uint32_t TASK_STATUS_CORRECT = 0x00;

/** @brief Task flag bit: TCB failed validation while dumping */
constexpr uint32_t TASK_STATUS_TCB_CORRUPTED = 0x01;

/** @brief Task flag bit: stack failed validation while dumping */
constexpr uint32_t TASK_STATUS_STACK_CORRUPTED = 0x02;

/** @brief Region name for unmatched executable core segments */
constexpr const char* CORE_ONLY_CODE_NAME = "rom.text";

/** @brief Region name for unmatched data core segments (TCBs and stacks) */
constexpr const char* CORE_ONLY_DATA_NAME = "tasks.data";
}  // namespace CoreDumpFormat

// ============================================================================
// Container Structures
// ============================================================================

/**
 * @brief Named section of the executable ELF
 *
 * Sections keep the order in which they appear in the section header table;
 * they are not sorted by address.
 */
struct ExecutableSection {
    std::string name;             ///< Section name (.text, .dram0.data, ...)
    uint64_t start_address = 0;   ///< Load address (sh_addr)
    uint64_t byte_length = 0;     ///< Size in bytes (sh_size)
    uint64_t attribute_flags = 0; ///< Raw sh_flags bit-set

    bool hasFlag(SectionFlags flag) const {
        return (attribute_flags & static_cast<uint64_t>(flag)) != 0;
    }

    uint64_t endAddress() const { return start_address + byte_length; }

    /**
     * @brief Get attribute string, e.g. "RWX", "R  X", "RW "
     *
     * Sections are always readable; write and execute positions are padded with
     * a space when the flag is absent.
     */
    std::string attributeString() const {
        std::string result = "R";
        result += hasFlag(SectionFlags::SHF_WRITE) ? 'W' : ' ';
        result += hasFlag(SectionFlags::SHF_EXECINSTR) ? 'X' : ' ';
        return result;
    }
};

/**
 * @brief Loadable memory segment captured in the core dump
 */
struct CoreSegment {
    uint64_t start_address = 0;    ///< Virtual address (p_vaddr)
    uint64_t byte_length = 0;      ///< Captured size in bytes
    uint32_t flags = 0;            ///< Raw p_flags bit-set
    std::vector<uint8_t> raw_bytes;  ///< Captured memory contents

    bool hasFlag(SegmentFlags flag) const {
        return (flags & static_cast<uint32_t>(flag)) != 0;
    }

    bool isExecutable() const { return hasFlag(SegmentFlags::PF_X); }

    uint64_t endAddress() const { return start_address + byte_length; }

    /**
     * @brief Get attribute string, e.g. "RWX", "R X", "RW "
     */
    std::string attributeString() const {
        std::string result;
        result += hasFlag(SegmentFlags::PF_R) ? 'R' : ' ';
        result += hasFlag(SegmentFlags::PF_W) ? 'W' : ' ';
        result += hasFlag(SegmentFlags::PF_X) ? 'X' : ' ';
        return result;
    }
};

/**
 * @brief One note entry from a PT_NOTE segment
 */
struct NoteSection {
    uint32_t raw_type = 0;          ///< n_type exactly as stored
    std::string name;               ///< Note name without padding or terminator
    std::vector<uint8_t> payload;   ///< Note descriptor bytes

    /**
     * @brief Map the raw note type onto the tags the extractor understands
     */
    NoteType type() const {
        switch (raw_type) {
            case static_cast<uint32_t>(NoteType::EXTRA_INFO):
                return NoteType::EXTRA_INFO;
            case static_cast<uint32_t>(NoteType::TASK_INFO):
                return NoteType::TASK_INFO;
            case static_cast<uint32_t>(NoteType::CHIP_VERSION_INFO):
                return NoteType::CHIP_VERSION_INFO;
            default:
                return NoteType::OTHER;
        }
    }
};

// ============================================================================
// Diagnostic Records
// ============================================================================

/**
 * @brief Register words decoded from the EXTRA_INFO note
 *
 * Element 0 is the crashed task handle, or CURR_TASK_MARKER when the crashed
 * task's context was omitted. Xtensa dumps follow it with (register id, value)
 * pairs for the exception registers.
 */
struct RegisterSnapshot {
    std::vector<uint32_t> words;

    uint32_t marker() const { return words.empty() ? 0 : words.front(); }

    bool crashedTaskSkipped() const {
        return !words.empty() && words.front() == CoreDumpFormat::CURR_TASK_MARKER;
    }
};

/**
 * @brief Per-task status decoded from a TASK_INFO note
 *
 * Records are kept in capture order; index 0 is the task that was running
 * when the crash happened.
 */
struct TaskStatusRecord {
    uint32_t task_index = 0;
    uint32_t flags = 0;
    uint32_t tcb_address = 0;
    uint32_t stack_start_address = 0;

    bool isCorrupted() const { return flags != CoreDumpFormat::TASK_STATUS_CORRECT; }
    bool isTcbCorrupted() const { return (flags & CoreDumpFormat::TASK_STATUS_TCB_CORRUPTED) != 0; }
    bool isStackCorrupted() const {
        return (flags & CoreDumpFormat::TASK_STATUS_STACK_CORRUPTED) != 0;
    }
};

/**
 * @brief Everything the note extractor recovers from a core dump
 */
struct NoteDiagnostics {
    std::optional<RegisterSnapshot> register_snapshot;  ///< Absent when no EXTRA_INFO note
    std::vector<TaskStatusRecord> task_status;          ///< Empty when no TASK_INFO notes
    std::optional<uint32_t> chip_version;               ///< Absent when no PT_INFO note
};

// ============================================================================
// Analysis Result Structures
// ============================================================================

/**
 * @brief One entry of the reconciled memory map
 *
 * Merged regions are backed by both an executable section and a core segment.
 * Unmerged regions come from one side only: either a section absent from the
 * dump, or a core-only segment named rom.text / tasks.data.
 */
struct MergedRegion {
    std::string name;
    uint64_t start_address = 0;
    uint64_t byte_length = 0;
    std::string attribute_string;
    bool is_merged = false;

    uint64_t endAddress() const { return start_address + byte_length; }

    bool operator==(const MergedRegion& other) const {
        return name == other.name && start_address == other.start_address &&
               byte_length == other.byte_length && attribute_string == other.attribute_string &&
               is_merged == other.is_merged;
    }

    bool operator!=(const MergedRegion& other) const { return !(*this == other); }
};
