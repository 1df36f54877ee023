/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "NoteExtractor.h"
#include "CoreMemoryValidator.h"

using CoreDumpUtils::PayloadReader;

NoteDiagnostics NoteExtractor::extract(const std::vector<NoteSection>& notes) {
    NoteDiagnostics diagnostics;
    diagnostics.register_snapshot = extractRegisterSnapshot(notes);
    diagnostics.task_status = extractTaskStatus(notes);
    diagnostics.chip_version = extractChipVersion(notes);
    return diagnostics;
}

std::optional<RegisterSnapshot> NoteExtractor::extractRegisterSnapshot(
    const std::vector<NoteSection>& notes) {
    for (const auto& note : notes) {
        if (isExtraInfo(note)) {
            return decodeRegisterSnapshot(note);
        }
    }
    return std::nullopt;
}

std::vector<TaskStatusRecord> NoteExtractor::extractTaskStatus(
    const std::vector<NoteSection>& notes) {
    std::vector<TaskStatusRecord> records;
    for (const auto& note : notes) {
        if (isTaskInfo(note)) {
            records.push_back(decodeTaskStatus(note));
        }
    }
    return records;
}

std::optional<uint32_t> NoteExtractor::extractChipVersion(const std::vector<NoteSection>& notes) {
    for (const auto& note : notes) {
        if (note.type() == NoteType::CHIP_VERSION_INFO) {
            return decodeChipVersion(note);
        }
    }
    return std::nullopt;
}

RegisterSnapshot NoteExtractor::decodeRegisterSnapshot(const NoteSection& note) {
    PayloadReader reader(note.payload, note.name);
    RegisterSnapshot snapshot;
    snapshot.words = reader.readU32Array();
    return snapshot;
}

TaskStatusRecord NoteExtractor::decodeTaskStatus(const NoteSection& note) {
    PayloadReader reader(note.payload, note.name);
    reader.requireSize(CoreDumpFormat::TASK_STATUS_RECORD_SIZE, "TASK_INFO");

    TaskStatusRecord record;
    record.task_index = reader.readU32LE(0);
    record.flags = reader.readU32LE(4);
    record.tcb_address = reader.readU32LE(8);
    record.stack_start_address = reader.readU32LE(12);
    return record;
}

uint32_t NoteExtractor::decodeChipVersion(const NoteSection& note) {
    PayloadReader reader(note.payload, note.name);
    reader.requireAtLeast(CoreDumpFormat::CHIP_VERSION_FIELD_SIZE, "PT_INFO");

    // Bytes 0-1 hold the dump format version, the chip code is in bytes 2-3
    return reader.readU16LE(2);
}

bool NoteExtractor::isExtraInfo(const NoteSection& note) {
    return note.type() == NoteType::EXTRA_INFO &&
           note.name.find(CoreDumpFormat::EXTRA_INFO_NAME) != std::string::npos;
}

bool NoteExtractor::isTaskInfo(const NoteSection& note) {
    return note.type() == NoteType::TASK_INFO &&
           note.name.find(CoreDumpFormat::TASK_INFO_NAME) != std::string::npos;
}
