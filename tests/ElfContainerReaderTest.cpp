/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "ElfContainerReader.h"
#include <gtest/gtest.h>
#include <fstream>
#include "CoreDumpExceptions.h"
#include "TestElfBuilder.h"

TEST(ElfContainerReaderTest, ReadsAllocatedSectionsInOrder) {
    TempDir dir;
    std::string path = TestElfBuilder(EM_XTENSA)
                           .addSection(".iram0.text", 0x40080000, 0x100, SHF_ALLOC | SHF_EXECINSTR)
                           .addSection(".comment", 0, 0x20, 0)
                           .addSection(".dram0.bss", 0x3ffb0000, 0x80, SHF_ALLOC | SHF_WRITE, true)
                           .addSection(".empty", 0x3ffc0000, 0, SHF_ALLOC)
                           .writeTo(dir.file("app.elf"));

    ElfContainerReader reader(path);
    EXPECT_EQ(reader.machine(), EM_XTENSA);
    EXPECT_TRUE(reader.is32Bit());
    EXPECT_TRUE(reader.loadSegments().empty());

    const auto& sections = reader.sections();
    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0].name, ".iram0.text");
    EXPECT_EQ(sections[0].start_address, 0x40080000u);
    EXPECT_EQ(sections[0].byte_length, 0x100u);
    EXPECT_EQ(sections[0].attributeString(), "R X");
    EXPECT_EQ(sections[1].name, ".dram0.bss");
    EXPECT_EQ(sections[1].attributeString(), "RW ");

    EXPECT_EQ(reader.sectionAddress(".dram0.bss"), std::optional<uint64_t>(0x3ffb0000));
    EXPECT_FALSE(reader.sectionAddress(".comment").has_value());
}

TEST(ElfContainerReaderTest, ReadsLoadSegmentsAndNotes) {
    TempDir dir;
    std::vector<uint8_t> notes = TestElfBuilder::note("CORE", 1, std::vector<uint8_t>(8, 0xAB));
    auto extra = TestElfBuilder::note("EXTRA_INFO", 677, TestElfBuilder::words({0x3ffb5a10}));
    notes.insert(notes.end(), extra.begin(), extra.end());

    std::string path = TestElfBuilder(EM_XTENSA)
                           .addLoadSegment(0x3ffb5a10, {1, 2, 3, 4, 5, 6, 7, 8}, PF_R | PF_W)
                           .addNoteSegment(notes)
                           .addLoadSegment(0x40080000, std::vector<uint8_t>(16, 0), PF_R | PF_X)
                           .writeTo(dir.file("core.elf"));

    ElfContainerReader reader(path);

    const auto& segments = reader.loadSegments();
    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(segments[0].start_address, 0x3ffb5a10u);
    EXPECT_EQ(segments[0].byte_length, 8u);
    EXPECT_EQ(segments[0].raw_bytes, (std::vector<uint8_t>{1, 2, 3, 4, 5, 6, 7, 8}));
    EXPECT_FALSE(segments[0].isExecutable());
    EXPECT_TRUE(segments[1].isExecutable());

    const auto& parsed = reader.noteSections();
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[0].name, "CORE");
    EXPECT_EQ(parsed[0].raw_type, 1u);
    EXPECT_EQ(parsed[0].payload.size(), 8u);
    EXPECT_EQ(parsed[1].name, "EXTRA_INFO");
    EXPECT_EQ(parsed[1].type(), NoteType::EXTRA_INFO);
    EXPECT_EQ(parsed[1].payload, TestElfBuilder::words({0x3ffb5a10}));
}

TEST(ElfContainerReaderTest, MissingFile) {
    TempDir dir;
    try {
        ElfContainerReader reader(dir.file("absent.elf"));
        FAIL() << "expected ContainerError";
    } catch (const CoreDumpExceptions::ContainerError& e) {
        EXPECT_EQ(e.getErrorType(), CoreDumpExceptions::ContainerError::ErrorType::FileNotFound);
    }
}

TEST(ElfContainerReaderTest, NonElfInput) {
    TempDir dir;
    std::string path = dir.file("core.b64");
    std::ofstream(path) << "f0VMRgEBAQAAAAAAAAAAAAQAXgABAAAAAAAAADQAAAA=\n";

    try {
        ElfContainerReader reader(path);
        FAIL() << "expected ContainerError";
    } catch (const CoreDumpExceptions::ContainerError& e) {
        EXPECT_EQ(e.getErrorType(), CoreDumpExceptions::ContainerError::ErrorType::InvalidFormat);
    }
}

TEST(ElfContainerReaderTest, NoteRunningPastSegmentEnd) {
    std::vector<uint8_t> body = TestElfBuilder::note("TASK_INFO", 678,
                                                     TestElfBuilder::words({0, 0, 1, 2}));
    body.resize(body.size() - 8);

    EXPECT_THROW(ElfContainerReader::parseNotes(body.data(), body.size(), false, "core.elf"),
                 CoreDumpExceptions::ContainerError);
}

TEST(ElfContainerReaderTest, BigEndianNoteHeaders) {
    std::vector<uint8_t> body = {0, 0, 0, 5, 0, 0, 0, 4, 0, 0, 0x20, 0x4a,
                                 'I', 'N', 'F', 'O', 0, 0, 0, 0,
                                 1, 0, 9, 0};

    auto notes = ElfContainerReader::parseNotes(body.data(), body.size(), true, "core.elf");
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_EQ(notes[0].name, "INFO");
    EXPECT_EQ(notes[0].type(), NoteType::CHIP_VERSION_INFO);
    EXPECT_EQ(notes[0].payload, (std::vector<uint8_t>{1, 0, 9, 0}));
}
