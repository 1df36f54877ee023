/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "CoreStructures.h"

/**
 * @file ElfContainerReader.h
 * @brief Reads sections, load segments and notes from ELF containers via libelf
 *
 * Both the program's executable and the core dump are ELF files. This reader
 * loads the parts of each that the analysis needs into plain structures and
 * releases the libelf handle before returning.
 */

/**
 * @class ElfContainerReader
 * @brief libelf-backed loader for executable and core dump ELF files
 *
 * ## Loaded Data:
 * - **sections()**: allocated sections (SHF_ALLOC) with non-zero size, in
 *   section header order
 * - **loadSegments()**: PT_LOAD program headers with captured bytes, in
 *   program header order
 * - **noteSections()**: every note of every PT_NOTE segment, in file order
 * - **machine()**: e_machine of the ELF header
 *
 * ## Usage:
 * ```cpp
 * ElfContainerReader exe(config.programFile);
 * ElfContainerReader core(config.coreFile);
 * if (exe.machine() != core.machine()) {
 *     // refuse to reconcile
 * }
 * ```
 *
 * @throws CoreDumpExceptions::ContainerError from the constructor if the file
 *         cannot be opened or is not a readable ELF file
 */
class ElfContainerReader {
public:
    explicit ElfContainerReader(const std::string& filename);

    ElfContainerReader(const ElfContainerReader&) = delete;
    ElfContainerReader& operator=(const ElfContainerReader&) = delete;
    ElfContainerReader(ElfContainerReader&&) = default;
    ElfContainerReader& operator=(ElfContainerReader&&) = default;

    const std::string& filename() const { return filename_; }
    uint16_t machine() const { return machine_; }
    bool is32Bit() const { return is_32bit_; }

    const std::vector<ExecutableSection>& sections() const { return sections_; }
    const std::vector<CoreSegment>& loadSegments() const { return load_segments_; }
    const std::vector<NoteSection>& noteSections() const { return note_sections_; }

    /**
     * @brief Address of the first section with the given name
     * @return Section address, or std::nullopt if no such section exists
     */
    std::optional<uint64_t> sectionAddress(const std::string& name) const;

    /**
     * @brief Split a PT_NOTE segment body into notes
     *
     * Each note is a namesz/descsz/type header followed by the name and the
     * descriptor, both padded to 4 bytes.
     *
     * @param data Segment bytes
     * @param size Segment size in bytes
     * @param bigEndian Byte order of the header words
     * @param filename File name for error reporting
     * @throws CoreDumpExceptions::ContainerError if a note runs past the segment end
     */
    static std::vector<NoteSection> parseNotes(const uint8_t* data, size_t size, bool bigEndian,
                                               const std::string& filename);

private:
    std::string filename_;
    uint16_t machine_ = 0;
    bool is_32bit_ = true;
    std::vector<ExecutableSection> sections_;
    std::vector<CoreSegment> load_segments_;
    std::vector<NoteSection> note_sections_;
};
