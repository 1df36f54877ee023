/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "CoreStructures.h"

/**
 * @file RegionReconciler.h
 * @brief Merges executable sections and core dump segments into one memory map
 *
 * The executable knows named sections but nothing about what was captured;
 * the core dump knows captured address ranges but no names. The reconciler
 * attributes each captured range to the section it overlaps so that every
 * byte is reported once.
 */

/**
 * @brief Result of one reconciliation run
 */
struct ReconciliationResult {
    /// One region per executable section, in section order (merged or not)
    std::vector<MergedRegion> section_regions;

    /// One region per unclaimed core segment, in segment order
    std::vector<MergedRegion> core_only_regions;

    /// For each entry of section_regions, the index of the claimed segment
    std::vector<std::optional<size_t>> claimed_segment;

    /// Sections that overlapped a segment already claimed by an earlier section
    std::vector<std::string> contested_sections;

    /**
     * @brief All regions, section regions first, then core-only regions
     */
    std::vector<MergedRegion> allRegions() const {
        std::vector<MergedRegion> regions = section_regions;
        regions.insert(regions.end(), core_only_regions.begin(), core_only_regions.end());
        return regions;
    }
};

/**
 * @class RegionReconciler
 * @brief Reconciles executable sections against captured core segments
 *
 * ## Algorithm:
 * 1. Validate every section and segment (non-zero length, no wraparound)
 * 2. For each section in container order, claim the first unclaimed segment
 *    that overlaps it. Overlap is tested on closed intervals: either the
 *    section starts inside the segment or the segment starts inside the
 *    section, touching ends included.
 * 3. A claimed pair yields one merged region spanning the union of both
 *    ranges; a section without a segment yields an unmerged region
 * 4. Every segment left unclaimed becomes a core-only region named
 *    rom.text (executable) or tasks.data (anything else)
 *
 * ## Segment Ownership:
 * Segments live in an arena with a claimed flag per entry. A segment is
 * claimed by at most one section and never reconsidered afterwards, so a
 * segment spanning two adjacent sections is attributed to whichever section
 * comes first. A later section left unmerged because of this is listed in
 * contested_sections.
 *
 * ## Usage:
 * ```cpp
 * ReconciliationResult result = RegionReconciler::reconcile(exe.sections(), core.loadSegments());
 * for (const auto& region : result.allRegions()) {
 *     std::cout << region.name << " 0x" << std::hex << region.start_address << "\n";
 * }
 * ```
 */
class RegionReconciler {
public:
    /**
     * @brief Reconcile sections against segments
     * @param sections Executable sections in container order
     * @param segments Core dump load segments in container order
     * @return Reconciled regions; the function is deterministic for equal inputs
     * @throws CoreDumpExceptions::RegionValidationError on malformed input ranges
     */
    static ReconciliationResult reconcile(const std::vector<ExecutableSection>& sections,
                                          const std::vector<CoreSegment>& segments);

    /**
     * @brief Check whether a section and a segment overlap (closed intervals)
     */
    static bool overlaps(const ExecutableSection& section, const CoreSegment& segment);

    /**
     * @brief Build the merged region of an overlapping pair: the union of both ranges
     */
    static MergedRegion mergePair(const ExecutableSection& section, const CoreSegment& segment);

    /**
     * @brief Name a core-only segment by its execute permission
     * @return "rom.text" for executable segments, "tasks.data" otherwise
     */
    static std::string classifyCoreOnly(const CoreSegment& segment);

private:
    /// One arena slot per core segment
    struct SegmentSlot {
        const CoreSegment* segment;
        bool claimed;
    };
};
