/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file CoreMemoryValidator.h
 * @brief Bounds-checked decoding and address range validation
 *
 * This file provides the single points where untrusted input is checked:
 * - PayloadReader decodes little-endian fields from note payloads and rejects
 *   short payloads with NoteDecodeError
 * - RegionValidator rejects zero-length and wrapping section/segment ranges
 *   with RegionValidationError before reconciliation starts
 *
 * Key Features:
 * - Protection against integer overflow in address calculations
 * - Explicit little-endian decoding independent of host byte order
 */

#ifndef CORE_MEMORY_VALIDATOR_H
#define CORE_MEMORY_VALIDATOR_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>
#include "CoreDumpExceptions.h"
#include "CoreStructures.h"

namespace CoreDumpUtils {

/**
 * @brief Safe arithmetic operations with overflow checking
 */
class SafeArithmetic {
public:
    /**
     * @brief Check whether a + b fits in 64 bits
     */
    static bool addOverflows(uint64_t a, uint64_t b) {
        return a > std::numeric_limits<uint64_t>::max() - b;
    }

    /**
     * @brief Safe addition with overflow checking
     * @throws RegionValidationError if overflow would occur
     */
    static uint64_t safeAdd(uint64_t a, uint64_t b, const std::string& context = "") {
        if (addOverflows(a, b)) {
            throw CoreDumpExceptions::RegionValidationError("Address range wraps around", context,
                                                            a, b);
        }
        return a + b;
    }
};

/**
 * @brief Little-endian field reader over a note payload
 *
 * Every read is bounds checked against the payload; a read past the end throws
 * NoteDecodeError naming the note, so malformed input is rejected here and
 * nowhere else.
 */
class PayloadReader {
private:
    const std::vector<uint8_t>& data_;
    std::string noteName_;

public:
    PayloadReader(const std::vector<uint8_t>& data, const std::string& noteName)
        : data_(data), noteName_(noteName) {}

    size_t size() const { return data_.size(); }

    /**
     * @brief Require an exact payload size
     * @throws NoteDecodeError if the payload size differs
     */
    void requireSize(size_t expected, const std::string& recordKind) const {
        if (data_.size() != expected) {
            throw CoreDumpExceptions::NoteDecodeError(
                "Malformed " + recordKind + " note: expected " + std::to_string(expected) +
                    " bytes",
                noteName_, data_.size());
        }
    }

    /**
     * @brief Require a minimum payload size
     * @throws NoteDecodeError if the payload is shorter
     */
    void requireAtLeast(size_t minimum, const std::string& recordKind) const {
        if (data_.size() < minimum) {
            throw CoreDumpExceptions::NoteDecodeError(
                "Malformed " + recordKind + " note: expected at least " +
                    std::to_string(minimum) + " bytes",
                noteName_, data_.size());
        }
    }

    uint8_t readU8(size_t offset) const {
        checkRead(offset, 1);
        return data_[offset];
    }

    uint16_t readU16LE(size_t offset) const {
        checkRead(offset, 2);
        return static_cast<uint16_t>(data_[offset] | (data_[offset + 1] << 8));
    }

    uint32_t readU32LE(size_t offset) const {
        checkRead(offset, 4);
        return static_cast<uint32_t>(data_[offset]) |
               (static_cast<uint32_t>(data_[offset + 1]) << 8) |
               (static_cast<uint32_t>(data_[offset + 2]) << 16) |
               (static_cast<uint32_t>(data_[offset + 3]) << 24);
    }

    /**
     * @brief Decode the payload as packed u32 words, dropping a trailing partial word
     */
    std::vector<uint32_t> readU32Array() const {
        std::vector<uint32_t> words;
        size_t count = data_.size() / 4;
        words.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            words.push_back(readU32LE(i * 4));
        }
        return words;
    }

private:
    void checkRead(size_t offset, size_t width) const {
        if (offset > data_.size() || width > data_.size() - offset) {
            throw CoreDumpExceptions::NoteDecodeError(
                "Read past end of note payload at offset " + std::to_string(offset), noteName_,
                data_.size());
        }
    }
};

/**
 * @brief Address range validation for reconciliation inputs
 */
class RegionValidator {
public:
    static void validateRange(uint64_t address, uint64_t length, const std::string& name) {
        if (length == 0) {
            throw CoreDumpExceptions::RegionValidationError("Zero-length region", name, address,
                                                            length);
        }
        if (SafeArithmetic::addOverflows(address, length)) {
            throw CoreDumpExceptions::RegionValidationError("Address range wraps around", name,
                                                            address, length);
        }
    }

    /**
     * @brief Validate all executable sections
     * @throws RegionValidationError on the first invalid section
     */
    static void validateSections(const std::vector<ExecutableSection>& sections) {
        for (const auto& section : sections) {
            validateRange(section.start_address, section.byte_length, section.name);
        }
    }

    /**
     * @brief Validate all core segments
     * @throws RegionValidationError on the first invalid segment
     */
    static void validateSegments(const std::vector<CoreSegment>& segments) {
        for (size_t i = 0; i < segments.size(); ++i) {
            validateRange(segments[i].start_address, segments[i].byte_length,
                          "core segment " + std::to_string(i));
        }
    }
};

}  // namespace CoreDumpUtils

#endif  // CORE_MEMORY_VALIDATOR_H
