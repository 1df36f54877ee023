/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "RegionReconciler.h"
#include <gtest/gtest.h>
#include <limits>
#include "CoreDumpExceptions.h"

namespace {

ExecutableSection section(const std::string& name, uint64_t address, uint64_t length,
                          uint64_t flags = static_cast<uint64_t>(SectionFlags::SHF_ALLOC)) {
    ExecutableSection s;
    s.name = name;
    s.start_address = address;
    s.byte_length = length;
    s.attribute_flags = flags;
    return s;
}

CoreSegment segment(uint64_t address, uint64_t length, uint32_t flags) {
    CoreSegment s;
    s.start_address = address;
    s.byte_length = length;
    s.flags = flags;
    s.raw_bytes.assign(static_cast<size_t>(length), 0);
    return s;
}

const uint32_t RX = static_cast<uint32_t>(SegmentFlags::PF_R) |
                    static_cast<uint32_t>(SegmentFlags::PF_X);
const uint32_t RW = static_cast<uint32_t>(SegmentFlags::PF_R) |
                    static_cast<uint32_t>(SegmentFlags::PF_W);
const uint64_t TEXT_FLAGS = static_cast<uint64_t>(SectionFlags::SHF_ALLOC) |
                            static_cast<uint64_t>(SectionFlags::SHF_EXECINSTR);
const uint64_t DATA_FLAGS = static_cast<uint64_t>(SectionFlags::SHF_ALLOC) |
                            static_cast<uint64_t>(SectionFlags::SHF_WRITE);

}  // namespace

TEST(RegionReconcilerTest, SegmentInsideSectionMergesToSectionSpan) {
    auto result = RegionReconciler::reconcile({section(".text", 0x3F400000, 0x1000, TEXT_FLAGS)},
                                              {segment(0x3F400000, 0x800, RX)});

    ASSERT_EQ(result.section_regions.size(), 1u);
    const MergedRegion& text = result.section_regions[0];
    EXPECT_EQ(text.name, ".text");
    EXPECT_EQ(text.start_address, 0x3F400000u);
    EXPECT_EQ(text.byte_length, 0x1000u);
    EXPECT_EQ(text.attribute_string, "R X");
    EXPECT_TRUE(text.is_merged);
    EXPECT_TRUE(result.core_only_regions.empty());
    ASSERT_TRUE(result.claimed_segment[0].has_value());
    EXPECT_EQ(*result.claimed_segment[0], 0u);
}

TEST(RegionReconcilerTest, DisjointRangesStayUnmerged) {
    auto result = RegionReconciler::reconcile({section(".bss", 0x3FFB0000, 0x2000, DATA_FLAGS)},
                                              {segment(0x3FFE0000, 0x100, RW)});

    ASSERT_EQ(result.section_regions.size(), 1u);
    EXPECT_EQ(result.section_regions[0].name, ".bss");
    EXPECT_EQ(result.section_regions[0].byte_length, 0x2000u);
    EXPECT_FALSE(result.section_regions[0].is_merged);
    EXPECT_FALSE(result.claimed_segment[0].has_value());

    ASSERT_EQ(result.core_only_regions.size(), 1u);
    EXPECT_EQ(result.core_only_regions[0].name, "tasks.data");
    EXPECT_EQ(result.core_only_regions[0].start_address, 0x3FFE0000u);
    EXPECT_EQ(result.core_only_regions[0].byte_length, 0x100u);
    EXPECT_EQ(result.core_only_regions[0].attribute_string, "RW ");
}

TEST(RegionReconcilerTest, ExecutableCoreOnlySegmentIsRomText) {
    auto result = RegionReconciler::reconcile({}, {segment(0x40000000, 0x400, RX)});

    ASSERT_EQ(result.core_only_regions.size(), 1u);
    EXPECT_EQ(result.core_only_regions[0].name, "rom.text");
    EXPECT_EQ(result.core_only_regions[0].attribute_string, "R X");
}

TEST(RegionReconcilerTest, MergedSpanIsUnionOfPartialOverlap) {
    // Segment starts inside the section and extends past its end
    auto result = RegionReconciler::reconcile({section(".data", 0x1000, 0x100, DATA_FLAGS)},
                                              {segment(0x1080, 0x200, RW)});

    const MergedRegion& data = result.section_regions[0];
    EXPECT_TRUE(data.is_merged);
    EXPECT_EQ(data.start_address, 0x1000u);
    EXPECT_EQ(data.endAddress(), 0x1280u);

    // Section starts inside the segment
    result = RegionReconciler::reconcile({section(".data", 0x1080, 0x100, DATA_FLAGS)},
                                         {segment(0x1000, 0x100, RW)});
    EXPECT_TRUE(result.section_regions[0].is_merged);
    EXPECT_EQ(result.section_regions[0].start_address, 0x1000u);
    EXPECT_EQ(result.section_regions[0].endAddress(), 0x1180u);
}

TEST(RegionReconcilerTest, TouchingRangesCountAsOverlap) {
    ExecutableSection sec = section(".iram0.text", 0x1000, 0x100, TEXT_FLAGS);
    CoreSegment after = segment(0x1100, 0x10, RX);
    CoreSegment before = segment(0x0F00, 0x100, RX);

    EXPECT_TRUE(RegionReconciler::overlaps(sec, after));
    EXPECT_TRUE(RegionReconciler::overlaps(sec, before));
    EXPECT_FALSE(RegionReconciler::overlaps(sec, segment(0x1101, 0x10, RX)));
    EXPECT_FALSE(RegionReconciler::overlaps(sec, segment(0x0E00, 0x100, RX)));

    MergedRegion merged = RegionReconciler::mergePair(sec, after);
    EXPECT_EQ(merged.start_address, 0x1000u);
    EXPECT_EQ(merged.byte_length, 0x110u);
}

TEST(RegionReconcilerTest, FirstSectionClaimsSharedSegment) {
    auto result = RegionReconciler::reconcile(
        {section(".dram0.data", 0x3FFB0000, 0x100, DATA_FLAGS),
         section(".dram0.bss", 0x3FFB0100, 0x100, DATA_FLAGS)},
        {segment(0x3FFB0000, 0x200, RW)});

    ASSERT_EQ(result.section_regions.size(), 2u);
    EXPECT_TRUE(result.section_regions[0].is_merged);
    EXPECT_EQ(result.section_regions[0].byte_length, 0x200u);
    EXPECT_FALSE(result.section_regions[1].is_merged);
    EXPECT_TRUE(result.core_only_regions.empty());

    ASSERT_EQ(result.contested_sections.size(), 1u);
    EXPECT_EQ(result.contested_sections[0], ".dram0.bss");
}

TEST(RegionReconcilerTest, FirstUnclaimedOverlappingSegmentWins) {
    auto result = RegionReconciler::reconcile(
        {section(".flash.rodata", 0x3F400000, 0x1000, DATA_FLAGS)},
        {segment(0x3F400000, 0x100, RW), segment(0x3F400800, 0x100, RW)});

    EXPECT_EQ(*result.claimed_segment[0], 0u);
    ASSERT_EQ(result.core_only_regions.size(), 1u);
    EXPECT_EQ(result.core_only_regions[0].start_address, 0x3F400800u);
    EXPECT_TRUE(result.contested_sections.empty());
}

TEST(RegionReconcilerTest, DisjointInputsPreserveCountsAndOrder) {
    std::vector<ExecutableSection> sections = {section(".b", 0x2000, 0x10),
                                               section(".a", 0x1000, 0x10)};
    std::vector<CoreSegment> segments = {segment(0x9000, 0x10, RW), segment(0x8000, 0x10, RX)};

    auto result = RegionReconciler::reconcile(sections, segments);
    auto all = result.allRegions();

    ASSERT_EQ(all.size(), sections.size() + segments.size());
    EXPECT_EQ(all[0].name, ".b");
    EXPECT_EQ(all[1].name, ".a");
    EXPECT_EQ(all[2].name, "tasks.data");
    EXPECT_EQ(all[3].name, "rom.text");
    uint64_t total = 0;
    for (const auto& region : all) {
        EXPECT_FALSE(region.is_merged);
        total += region.byte_length;
    }
    EXPECT_EQ(total, 0x40u);
}

TEST(RegionReconcilerTest, ReconciliationIsDeterministic) {
    std::vector<ExecutableSection> sections = {
        section(".iram0.text", 0x40080000, 0x2000, TEXT_FLAGS),
        section(".dram0.data", 0x3FFB0000, 0x400, DATA_FLAGS)};
    std::vector<CoreSegment> segments = {segment(0x3FFB0000, 0x400, RW),
                                         segment(0x3FFE1000, 0x180, RW),
                                         segment(0x40080000, 0x100, RX)};

    auto first = RegionReconciler::reconcile(sections, segments);
    auto second = RegionReconciler::reconcile(sections, segments);
    EXPECT_EQ(first.allRegions(), second.allRegions());
    EXPECT_EQ(first.claimed_segment, second.claimed_segment);
}

TEST(RegionReconcilerTest, RejectsZeroLengthSection) {
    EXPECT_THROW(RegionReconciler::reconcile({section(".empty", 0x1000, 0)}, {}),
                 CoreDumpExceptions::RegionValidationError);
}

TEST(RegionReconcilerTest, RejectsWrappingSegment) {
    uint64_t top = std::numeric_limits<uint64_t>::max() - 0x10;
    EXPECT_THROW(RegionReconciler::reconcile({}, {segment(top, 0x100, RW)}),
                 CoreDumpExceptions::RegionValidationError);
}
