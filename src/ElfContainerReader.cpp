/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "ElfContainerReader.h"
#include <fcntl.h>
#include <libelf/gelf.h>
#include <libelf/libelf.h>
#include <unistd.h>
#include <algorithm>
#include <utility>
#include "CoreDumpExceptions.h"
#include "CoreMemoryValidator.h"

using CoreDumpExceptions::ContainerError;

namespace {

/**
 * @brief Owns the file descriptor and libelf descriptor of one ELF file
 */
class LibelfFile {
private:
    int fd_;
    Elf* elf_;

public:
    explicit LibelfFile(const std::string& filename) : fd_(-1), elf_(nullptr) {
        if (elf_version(EV_CURRENT) == EV_NONE) {
            throw ContainerError::readError("libelf initialization failed", filename);
        }

        fd_ = open(filename.c_str(), O_RDONLY);
        if (fd_ < 0) {
            throw ContainerError::fileNotFound(filename);
        }

        elf_ = elf_begin(fd_, ELF_C_READ, nullptr);
        if (!elf_) {
            std::string message = std::string("elf_begin failed: ") + elf_errmsg(-1);
            close(fd_);
            throw ContainerError::readError(message, filename);
        }

        if (elf_kind(elf_) != ELF_K_ELF) {
            elf_end(elf_);
            close(fd_);
            throw ContainerError::invalidFormat(filename);
        }
    }

    ~LibelfFile() {
        if (elf_) {
            elf_end(elf_);
        }
        if (fd_ >= 0) {
            close(fd_);
        }
    }

    LibelfFile(const LibelfFile&) = delete;
    LibelfFile& operator=(const LibelfFile&) = delete;

    Elf* get() const { return elf_; }
};

uint32_t readWord(const uint8_t* p, bool bigEndian) {
    if (bigEndian) {
        return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
    }
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

size_t alignNote(size_t value) {
    return (value + 3) & ~static_cast<size_t>(3);
}

}  // namespace

ElfContainerReader::ElfContainerReader(const std::string& filename) : filename_(filename) {
    LibelfFile file(filename);
    Elf* elf = file.get();

    GElf_Ehdr ehdr;
    if (!gelf_getehdr(elf, &ehdr)) {
        throw ContainerError::invalidFormat(filename);
    }
    machine_ = ehdr.e_machine;
    is_32bit_ = ehdr.e_ident[EI_CLASS] == ELFCLASS32;
    bool bigEndian = ehdr.e_ident[EI_DATA] == ELFDATA2MSB;

    size_t rawSize = 0;
    const uint8_t* raw = reinterpret_cast<const uint8_t*>(elf_rawfile(elf, &rawSize));
    if (!raw) {
        throw ContainerError::readError(std::string("elf_rawfile failed: ") + elf_errmsg(-1),
                                        filename);
    }

    // Sections
    Elf_Scn* scn = nullptr;
    while ((scn = elf_nextscn(elf, scn)) != nullptr) {
        GElf_Shdr shdr;
        if (!gelf_getshdr(scn, &shdr)) {
            throw ContainerError::readError("Cannot read section header", filename);
        }
        if ((shdr.sh_flags & SHF_ALLOC) == 0 || shdr.sh_size == 0) {
            continue;
        }

        const char* name = elf_strptr(elf, ehdr.e_shstrndx, shdr.sh_name);

        ExecutableSection section;
        section.name = name ? name : "";
        section.start_address = shdr.sh_addr;
        section.byte_length = shdr.sh_size;
        section.attribute_flags = shdr.sh_flags;
        sections_.push_back(section);
    }

    // Program headers
    for (size_t i = 0; i < ehdr.e_phnum; ++i) {
        GElf_Phdr phdr;
        if (!gelf_getphdr(elf, static_cast<int>(i), &phdr)) {
            throw ContainerError::readError("Cannot read program header " + std::to_string(i),
                                            filename);
        }
        if (phdr.p_type != PT_LOAD && phdr.p_type != PT_NOTE) {
            continue;
        }
        if (phdr.p_filesz == 0) {
            continue;
        }
        if (CoreDumpUtils::SafeArithmetic::addOverflows(phdr.p_offset, phdr.p_filesz) ||
            phdr.p_offset + phdr.p_filesz > rawSize) {
            throw ContainerError::readError(
                "Program header " + std::to_string(i) + " exceeds file bounds", filename);
        }
        const uint8_t* body = raw + phdr.p_offset;

        if (phdr.p_type == PT_LOAD) {
            CoreSegment segment;
            segment.start_address = phdr.p_vaddr;
            segment.byte_length = phdr.p_filesz;
            segment.flags = phdr.p_flags;
            segment.raw_bytes.assign(body, body + phdr.p_filesz);
            load_segments_.push_back(std::move(segment));
        } else {
            auto notes = parseNotes(body, static_cast<size_t>(phdr.p_filesz), bigEndian, filename);
            note_sections_.insert(note_sections_.end(), notes.begin(), notes.end());
        }
    }
}

std::optional<uint64_t> ElfContainerReader::sectionAddress(const std::string& name) const {
    for (const auto& section : sections_) {
        if (section.name == name) {
            return section.start_address;
        }
    }
    return std::nullopt;
}

std::vector<NoteSection> ElfContainerReader::parseNotes(const uint8_t* data, size_t size,
                                                        bool bigEndian,
                                                        const std::string& filename) {
    constexpr size_t NOTE_HEADER_SIZE = 12;
    std::vector<NoteSection> notes;
    size_t offset = 0;

    while (offset + NOTE_HEADER_SIZE <= size) {
        uint32_t nameSize = readWord(data + offset, bigEndian);
        uint32_t descSize = readWord(data + offset + 4, bigEndian);
        uint32_t type = readWord(data + offset + 8, bigEndian);
        offset += NOTE_HEADER_SIZE;

        size_t nameSpan = alignNote(nameSize);
        size_t descSpan = alignNote(descSize);
        if (nameSpan > size - offset || descSize > size - offset - nameSpan) {
            throw ContainerError::readError("Note at offset " + std::to_string(offset) +
                                                " runs past the end of its segment",
                                            filename);
        }

        NoteSection note;
        note.raw_type = type;
        // Name is NUL terminated inside namesz
        size_t nameLength = 0;
        while (nameLength < nameSize && data[offset + nameLength] != '\0') {
            ++nameLength;
        }
        note.name.assign(reinterpret_cast<const char*>(data + offset), nameLength);
        offset += nameSpan;

        note.payload.assign(data + offset, data + offset + descSize);
        // Padding of the last descriptor may be cut off at the segment end
        offset += std::min(descSpan, size - offset);

        notes.push_back(std::move(note));
    }

    return notes;
}
