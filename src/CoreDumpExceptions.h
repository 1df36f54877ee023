/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file CoreDumpExceptions.h
 * @brief Exception hierarchy for core dump analysis errors
 *
 * Each exception type carries context and a suggestion for resolving the
 * problem. All of them are fatal for the current analysis run; only
 * TargetResolutionError is meant to be shown to the operator as guidance.
 *
 * Exception Hierarchy:
 * - CoreDumpError (base)
 *   - ContainerError (file access and ELF validation)
 *   - ArchitectureMismatchError (executable and core disagree on e_machine)
 *   - NoteDecodeError (malformed note payload)
 *   - RegionValidationError (zero length or wrapping address range)
 *   - TargetResolutionError (chip type could not be determined)
 *   - TransportError (serial chip detection failed)
 *   - DebuggerError (GDB could not be launched or talked to)
 *
 * Usage Examples:
 * @code
 * try {
 *     CoreDumpAnalyzer analyzer(config);
 *     analyzer.infoCorefile();
 * } catch (const TargetResolutionError& e) {
 *     std::cout << e.what() << std::endl;
 * } catch (const CoreDumpError& e) {
 *     std::cerr << "Core Dump Error: " << e.getDetailedMessage() << std::endl;
 * }
 * @endcode
 */

#ifndef CORE_DUMP_EXCEPTIONS_H
#define CORE_DUMP_EXCEPTIONS_H

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace CoreDumpExceptions {

/**
 * @brief Base exception class for all core dump analysis errors
 */
class CoreDumpError : public std::runtime_error {
public:
    explicit CoreDumpError(const std::string& message)
        : std::runtime_error(message), context_("") {}

    /**
     * @brief Construct exception with error message and context
     * @param message Descriptive error message
     * @param context Additional context information (file name, note name, ...)
     */
    CoreDumpError(const std::string& message, const std::string& context)
        : std::runtime_error(message), context_(context) {}

    CoreDumpError(const CoreDumpError&) = default;
    CoreDumpError& operator=(const CoreDumpError&) = default;
    CoreDumpError(CoreDumpError&&) noexcept = default;
    CoreDumpError& operator=(CoreDumpError&&) noexcept = default;

    const std::string& getContext() const noexcept { return context_; }

    /**
     * @brief Get formatted error message with context
     * @return Complete error description including context
     */
    virtual std::string getDetailedMessage() const {
        if (context_.empty()) {
            return what();
        }
        return std::string(what()) + " (Context: " + context_ + ")";
    }

protected:
    std::string context_;  ///< Additional context information
};

/**
 * @brief File access and ELF container validation errors
 */
class ContainerError : public CoreDumpError {
public:
    enum class ErrorType {
        FileNotFound,    ///< File does not exist or cannot be opened
        InvalidFormat,   ///< File is not a valid ELF container
        ReadError        ///< libelf failed while reading headers or data
    };

    ContainerError(ErrorType type, const std::string& message, const std::string& filename = "")
        : CoreDumpError(message, filename), errorType_(type) {}

    ErrorType getErrorType() const noexcept { return errorType_; }

    std::string getSuggestion() const noexcept {
        switch (errorType_) {
            case ErrorType::FileNotFound:
                return "Check that the file path is correct and the file exists";
            case ErrorType::InvalidFormat:
                return "Core dumps must be in ELF format (CONFIG_ESP_COREDUMP_DATA_FORMAT_ELF)";
            case ErrorType::ReadError:
                return "The file may be truncated; capture the core dump again";
            default:
                return "Contact support with the error details";
        }
    }

    std::string getDetailedMessage() const override {
        return CoreDumpError::getDetailedMessage() + "\nSuggestion: " + getSuggestion();
    }

    static ContainerError fileNotFound(const std::string& filename) {
        return ContainerError(ErrorType::FileNotFound, "Cannot open file: " + filename, filename);
    }

    static ContainerError invalidFormat(const std::string& filename) {
        return ContainerError(ErrorType::InvalidFormat, "Invalid ELF format: " + filename, filename);
    }

    static ContainerError readError(const std::string& what, const std::string& filename) {
        return ContainerError(ErrorType::ReadError, what, filename);
    }

private:
    ErrorType errorType_;
};

/**
 * @brief Executable and core dump were built for different machines
 */
class ArchitectureMismatchError : public CoreDumpError {
public:
    ArchitectureMismatchError(uint16_t exeMachine, uint16_t coreMachine)
        : CoreDumpError("The arch should be the same between core elf and exe elf"),
          exeMachine_(exeMachine), coreMachine_(coreMachine) {}

    uint16_t getExecutableMachine() const noexcept { return exeMachine_; }
    uint16_t getCoreMachine() const noexcept { return coreMachine_; }

    std::string getDetailedMessage() const override {
        std::ostringstream oss;
        oss << what() << " (executable e_machine 0x" << std::hex << exeMachine_
            << ", core e_machine 0x" << coreMachine_ << ")"
            << "\nSuggestion: Pass the executable the core dump was produced from";
        return oss.str();
    }

private:
    uint16_t exeMachine_;
    uint16_t coreMachine_;
};

/**
 * @brief Malformed note payload (wrong length for its record type)
 */
class NoteDecodeError : public CoreDumpError {
public:
    NoteDecodeError(const std::string& message, const std::string& noteName, size_t payloadSize)
        : CoreDumpError(message, noteName), payloadSize_(payloadSize) {}

    size_t getPayloadSize() const noexcept { return payloadSize_; }

    std::string getDetailedMessage() const override {
        return CoreDumpError::getDetailedMessage() + " payload size " +
               std::to_string(payloadSize_) +
               "\nSuggestion: Core dump may be corrupted or written by an incompatible ESP-IDF version";
    }

private:
    size_t payloadSize_;
};

/**
 * @brief Section or segment with an invalid address range
 */
class RegionValidationError : public CoreDumpError {
public:
    RegionValidationError(const std::string& message, const std::string& regionName,
                          uint64_t address, uint64_t length)
        : CoreDumpError(message, regionName), address_(address), length_(length) {}

    uint64_t getAddress() const noexcept { return address_; }
    uint64_t getLength() const noexcept { return length_; }

    std::string getDetailedMessage() const override {
        std::ostringstream oss;
        oss << CoreDumpError::getDetailedMessage() << " at 0x" << std::hex << address_
            << " length 0x" << length_ << "\nSuggestion: Input container is malformed";
        return oss.str();
    }

private:
    uint64_t address_;
    uint64_t length_;
};

/**
 * @brief The chip type could not be determined by any means
 *
 * what() is the operator-facing guidance; it is printed as-is.
 */
class TargetResolutionError : public CoreDumpError {
public:
    explicit TargetResolutionError(const std::string& transportDetail = "")
        : CoreDumpError(
              "Unable to identify the chip type. Please use the --chip option to specify the chip "
              "type or connect the board and provide the --port option to have the chip type "
              "determined automatically.",
              transportDetail) {}
};

/**
 * @brief Serial transport failure during live chip detection
 */
class TransportError : public CoreDumpError {
public:
    TransportError(const std::string& message, const std::string& port)
        : CoreDumpError(message, port) {}
};

/**
 * @brief GDB could not be launched or its session broke down
 */
class DebuggerError : public CoreDumpError {
public:
    DebuggerError(const std::string& message, const std::string& gdbPath)
        : CoreDumpError(message, gdbPath) {}

    std::string getDetailedMessage() const override {
        return CoreDumpError::getDetailedMessage() +
               "\nSuggestion: Check that the toolchain GDB is installed or pass --gdb";
    }
};

}  // namespace CoreDumpExceptions

#endif  // CORE_DUMP_EXCEPTIONS_H
