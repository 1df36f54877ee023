/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "RegionReconciler.h"
#include <algorithm>
#include "CoreMemoryValidator.h"

using CoreDumpUtils::RegionValidator;

ReconciliationResult RegionReconciler::reconcile(const std::vector<ExecutableSection>& sections,
                                                 const std::vector<CoreSegment>& segments) {
    RegionValidator::validateSections(sections);
    RegionValidator::validateSegments(segments);

    std::vector<SegmentSlot> arena;
    arena.reserve(segments.size());
    for (const auto& segment : segments) {
        arena.push_back({&segment, false});
    }

    ReconciliationResult result;
    result.section_regions.reserve(sections.size());
    result.claimed_segment.reserve(sections.size());

    for (const auto& section : sections) {
        std::optional<size_t> claimed;
        bool lostToEarlierSection = false;

        for (size_t i = 0; i < arena.size(); ++i) {
            if (!overlaps(section, *arena[i].segment)) {
                continue;
            }
            if (arena[i].claimed) {
                lostToEarlierSection = true;
                continue;
            }
            claimed = i;
            break;
        }

        if (claimed) {
            arena[*claimed].claimed = true;
            result.section_regions.push_back(mergePair(section, *arena[*claimed].segment));
        } else {
            MergedRegion region;
            region.name = section.name;
            region.start_address = section.start_address;
            region.byte_length = section.byte_length;
            region.attribute_string = section.attributeString();
            region.is_merged = false;
            result.section_regions.push_back(region);

            if (lostToEarlierSection) {
                result.contested_sections.push_back(section.name);
            }
        }
        result.claimed_segment.push_back(claimed);
    }

    for (const auto& slot : arena) {
        if (slot.claimed) {
            continue;
        }
        MergedRegion region;
        region.name = classifyCoreOnly(*slot.segment);
        region.start_address = slot.segment->start_address;
        region.byte_length = slot.segment->byte_length;
        region.attribute_string = slot.segment->attributeString();
        region.is_merged = false;
        result.core_only_regions.push_back(region);
    }

    return result;
}

bool RegionReconciler::overlaps(const ExecutableSection& section, const CoreSegment& segment) {
    // sec:      |XXXXXXXXXX|
    // seg:   |...XXX...........|
    bool sectionStartsInSegment = segment.start_address <= section.start_address &&
                                  section.start_address <= segment.endAddress();
    // sec:   |XXXXXXXXXX|
    // seg:      |...XXX...........|
    bool segmentStartsInSection = section.start_address <= segment.start_address &&
                                  segment.start_address <= section.endAddress();
    return sectionStartsInSegment || segmentStartsInSection;
}

MergedRegion RegionReconciler::mergePair(const ExecutableSection& section,
                                         const CoreSegment& segment) {
    uint64_t start = std::min(section.start_address, segment.start_address);
    uint64_t end = std::max(section.endAddress(), segment.endAddress());

    MergedRegion region;
    region.name = section.name;
    region.start_address = start;
    region.byte_length = end - start;
    region.attribute_string = section.attributeString();
    region.is_merged = true;
    return region;
}

std::string RegionReconciler::classifyCoreOnly(const CoreSegment& segment) {
    // Executable core segments come from ROM, the rest are task TCBs and stacks
    return segment.isExecutable() ? CoreDumpFormat::CORE_ONLY_CODE_NAME
                                  : CoreDumpFormat::CORE_ONLY_DATA_NAME;
}
