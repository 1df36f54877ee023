/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "ChipDetector.h"

/**
 * @file TargetResolver.h
 * @brief Decides which ESP chip a core dump belongs to
 */

/**
 * @brief Target names and per-target tool selection
 */
namespace TargetInfo {
/** @brief Placeholder for "determine the chip automatically" */
constexpr const char* AUTO_TARGET = "auto";

const std::vector<std::string>& supportedTargets();
const std::vector<std::string>& xtensaTargets();
const std::vector<std::string>& riscvTargets();

bool isXtensaTarget(const std::string& target);
bool isRiscvTarget(const std::string& target);

/**
 * @brief Map a PT_INFO chip version code to a target name
 * @return Target name, or std::nullopt for unknown codes
 */
std::optional<std::string> targetForChipVersion(uint32_t chipVersion);

/**
 * @brief Select the GDB executable for a target
 * @param target Resolved target name
 * @param gdbOverride Value of --gdb, used verbatim when non-empty
 * @throws std::invalid_argument for targets without a known toolchain
 */
std::string gdbPathFor(const std::string& target, const std::string& gdbOverride);

/**
 * @brief Select the ROM ELF path for a target
 * @return romElfOverride when non-empty, otherwise "<target>_rom.elf"
 */
std::string romElfPathFor(const std::string& target, const std::string& romElfOverride);
}  // namespace TargetInfo

/**
 * @brief Inputs to target resolution, taken from Config
 */
struct TargetResolverOptions {
    std::string chip = TargetInfo::AUTO_TARGET;  ///< --chip value ("auto" or a target)
    std::string port;                            ///< Serial port for live detection
    int baud = 115200;                           ///< Baud rate for live detection
};

/**
 * @class TargetResolver
 * @brief Resolves the target chip with a strict priority order
 *
 * ## Resolution Order:
 * 1. An explicit, non-"auto" chip from the options is returned verbatim
 * 2. A chip version recovered from the PT_INFO note is mapped to a target;
 *    unknown codes fall through
 * 3. The ChipDetector is asked to detect the chip on the serial port; a
 *    transport failure ends resolution with TargetResolutionError
 *
 * Resolution runs at most once; later calls return the cached target.
 *
 * ## Usage:
 * ```cpp
 * EsptoolChipDetector detector;
 * TargetResolver resolver(options, detector);
 * std::string target = resolver.resolve(diagnostics.chip_version);
 * ```
 */
class TargetResolver {
public:
    TargetResolver(TargetResolverOptions options, ChipDetector& detector);

    /**
     * @brief Resolve the target, or return the cached result
     * @param chipVersion Chip version from the PT_INFO note, if any
     * @throws CoreDumpExceptions::TargetResolutionError when detection fails
     */
    const std::string& resolve(const std::optional<uint32_t>& chipVersion);

    /**
     * @brief Cached target of a previous resolve() call
     */
    const std::optional<std::string>& resolvedTarget() const { return resolved_; }

private:
    TargetResolverOptions options_;
    ChipDetector& detector_;
    std::optional<std::string> resolved_;

    std::string resolveOnce(const std::optional<uint32_t>& chipVersion);
};
