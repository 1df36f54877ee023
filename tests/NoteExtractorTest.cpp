/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "NoteExtractor.h"
#include <gtest/gtest.h>
#include "CoreDumpExceptions.h"

namespace {

NoteSection makeNote(const std::string& name, NoteType type, std::vector<uint8_t> payload) {
    NoteSection note;
    note.name = name;
    note.raw_type = static_cast<uint32_t>(type);
    note.payload = std::move(payload);
    return note;
}

std::vector<uint8_t> le32(std::initializer_list<uint32_t> values) {
    std::vector<uint8_t> out;
    for (uint32_t value : values) {
        for (int i = 0; i < 4; ++i) {
            out.push_back(static_cast<uint8_t>(value >> (8 * i)));
        }
    }
    return out;
}

}  // namespace

TEST(NoteExtractorTest, DecodesRegisterSnapshotWords) {
    std::vector<NoteSection> notes = {makeNote("EXTRA_INFO", NoteType::EXTRA_INFO, le32({0x3FFB5A10, 232, 28}))};

    auto snapshot = NoteExtractor::extractRegisterSnapshot(notes);
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->words, (std::vector<uint32_t>{0x3FFB5A10, 232, 28}));
    EXPECT_EQ(snapshot->marker(), 0x3FFB5A10u);
    EXPECT_FALSE(snapshot->crashedTaskSkipped());
}

TEST(NoteExtractorTest, TrailingPartialWordIsDropped) {
    std::vector<uint8_t> payload = le32({CoreDumpFormat::CURR_TASK_MARKER});
    payload.push_back(0xAA);
    payload.push_back(0xBB);

    auto snapshot = NoteExtractor::extractRegisterSnapshot(
        {makeNote("ESP_EXTRA_INFO", NoteType::EXTRA_INFO, payload)});
    ASSERT_TRUE(snapshot.has_value());
    ASSERT_EQ(snapshot->words.size(), 1u);
    EXPECT_TRUE(snapshot->crashedTaskSkipped());
}

TEST(NoteExtractorTest, FirstMatchingExtraInfoWins) {
    auto snapshot = NoteExtractor::extractRegisterSnapshot(
        {makeNote("CORE", NoteType::EXTRA_INFO, le32({1})),
         makeNote("EXTRA_INFO", NoteType::EXTRA_INFO, le32({2})),
         makeNote("EXTRA_INFO", NoteType::EXTRA_INFO, le32({3}))});

    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->marker(), 2u);
}

TEST(NoteExtractorTest, MissingNotesAreNotErrors) {
    NoteDiagnostics diagnostics =
        NoteExtractor::extract({makeNote("CORE", NoteType::OTHER, le32({1, 2, 3}))});

    EXPECT_FALSE(diagnostics.register_snapshot.has_value());
    EXPECT_TRUE(diagnostics.task_status.empty());
    EXPECT_FALSE(diagnostics.chip_version.has_value());
}

TEST(NoteExtractorTest, DecodesTaskStatusInEncounterOrder) {
    auto records = NoteExtractor::extractTaskStatus(
        {makeNote("TASK_INFO", NoteType::TASK_INFO, le32({0, 0, 0x3FFB5A10, 0x3FFB4000})),
         makeNote("CORE", NoteType::OTHER, {}),
         makeNote("TASK_INFO", NoteType::TASK_INFO, le32({1, 3, 0x3FFB6000, 0x3FFB5F00}))});

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].task_index, 0u);
    EXPECT_EQ(records[0].tcb_address, 0x3FFB5A10u);
    EXPECT_EQ(records[0].stack_start_address, 0x3FFB4000u);
    EXPECT_FALSE(records[0].isCorrupted());

    EXPECT_EQ(records[1].task_index, 1u);
    EXPECT_TRUE(records[1].isTcbCorrupted());
    EXPECT_TRUE(records[1].isStackCorrupted());
}

TEST(NoteExtractorTest, TaskInfoNameMustMatch) {
    auto records = NoteExtractor::extractTaskStatus(
        {makeNote("OTHER", NoteType::TASK_INFO, le32({0, 0, 1, 2}))});
    EXPECT_TRUE(records.empty());
}

TEST(NoteExtractorTest, WrongSizedTaskInfoThrows) {
    auto bad = makeNote("TASK_INFO", NoteType::TASK_INFO, le32({0, 0, 1}));
    EXPECT_THROW(NoteExtractor::extractTaskStatus({bad}), CoreDumpExceptions::NoteDecodeError);

    auto longer = makeNote("TASK_INFO", NoteType::TASK_INFO, le32({0, 0, 1, 2, 3}));
    EXPECT_THROW(NoteExtractor::decodeTaskStatus(longer), CoreDumpExceptions::NoteDecodeError);
}

TEST(NoteExtractorTest, ChipVersionComesFromBytesTwoAndThree) {
    // Format version 0x0002, chip code 9 (ESP32-S3)
    auto version = NoteExtractor::extractChipVersion(
        {makeNote("ESP_CORE_DUMP_INFO", NoteType::CHIP_VERSION_INFO, {0x02, 0x00, 0x09, 0x00})});

    ASSERT_TRUE(version.has_value());
    EXPECT_EQ(*version, static_cast<uint32_t>(ChipVersion::ESP32S3));

    auto wide = NoteExtractor::extractChipVersion(
        {makeNote("INFO", NoteType::CHIP_VERSION_INFO, {0x01, 0x00, 0x34, 0x12, 0xFF})});
    EXPECT_EQ(*wide, 0x1234u);
}

TEST(NoteExtractorTest, ShortChipVersionThrows) {
    EXPECT_THROW(NoteExtractor::extractChipVersion(
                     {makeNote("INFO", NoteType::CHIP_VERSION_INFO, {0x01, 0x00, 0x05})}),
                 CoreDumpExceptions::NoteDecodeError);
}
