/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <optional>
#include <vector>
#include "CoreStructures.h"

/**
 * @file NoteExtractor.h
 * @brief Decoding of ESP-IDF diagnostic notes from core dump PT_NOTE segments
 */

/**
 * @class NoteExtractor
 * @brief Extracts the register snapshot, task status and chip version from notes
 *
 * Runs once over the complete ordered note list of a core dump:
 * - The first EXTRA_INFO note whose name contains "EXTRA_INFO" yields the
 *   register snapshot (packed little-endian u32 words)
 * - Every TASK_INFO note whose name contains "TASK_INFO" yields one
 *   TaskStatusRecord, in encounter order
 * - The first PT_INFO note yields the chip version
 *
 * Missing notes are not errors; malformed TASK_INFO or PT_INFO payloads throw
 * NoteDecodeError because consumers index task records positionally.
 *
 * ## Usage:
 * ```cpp
 * NoteDiagnostics diag = NoteExtractor::extract(coreReader.noteSections());
 * if (diag.register_snapshot && diag.register_snapshot->crashedTaskSkipped()) {
 *     std::cout << "Crashed task has been skipped.\n";
 * }
 * ```
 */
class NoteExtractor {
public:
    /**
     * @brief Decode every supported note in one pass
     * @param notes Note sections in the order they are stored in the dump
     * @return Decoded diagnostics
     * @throws CoreDumpExceptions::NoteDecodeError on a malformed payload
     */
    static NoteDiagnostics extract(const std::vector<NoteSection>& notes);

    /**
     * @brief Find and decode the register snapshot
     * @return Snapshot, or std::nullopt when no EXTRA_INFO note matches
     */
    static std::optional<RegisterSnapshot> extractRegisterSnapshot(
        const std::vector<NoteSection>& notes);

    /**
     * @brief Decode all task status records in encounter order
     * @throws CoreDumpExceptions::NoteDecodeError if a payload is not 16 bytes
     */
    static std::vector<TaskStatusRecord> extractTaskStatus(const std::vector<NoteSection>& notes);

    /**
     * @brief Recover the chip version from the first PT_INFO note
     * @return (byte[3] << 8) | byte[2] of the payload, or std::nullopt without PT_INFO
     * @throws CoreDumpExceptions::NoteDecodeError if the payload is shorter than 4 bytes
     */
    static std::optional<uint32_t> extractChipVersion(const std::vector<NoteSection>& notes);

    static RegisterSnapshot decodeRegisterSnapshot(const NoteSection& note);
    static TaskStatusRecord decodeTaskStatus(const NoteSection& note);
    static uint32_t decodeChipVersion(const NoteSection& note);

private:
    static bool isExtraInfo(const NoteSection& note);
    static bool isTaskInfo(const NoteSection& note);
};
