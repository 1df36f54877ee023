/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "TargetResolver.h"
#include <algorithm>
#include <stdexcept>
#include <utility>
#include "CoreDumpExceptions.h"
#include "CoreStructures.h"

namespace TargetInfo {

const std::vector<std::string>& supportedTargets() {
    static const std::vector<std::string> targets = {"esp32", "esp32s2", "esp32s3", "esp32c3"};
    return targets;
}

const std::vector<std::string>& xtensaTargets() {
    static const std::vector<std::string> targets = {"esp32", "esp32s2", "esp32s3"};
    return targets;
}

const std::vector<std::string>& riscvTargets() {
    static const std::vector<std::string> targets = {"esp32c3"};
    return targets;
}

bool isXtensaTarget(const std::string& target) {
    const auto& targets = xtensaTargets();
    return std::find(targets.begin(), targets.end(), target) != targets.end();
}

bool isRiscvTarget(const std::string& target) {
    const auto& targets = riscvTargets();
    return std::find(targets.begin(), targets.end(), target) != targets.end();
}

std::optional<std::string> targetForChipVersion(uint32_t chipVersion) {
    switch (static_cast<ChipVersion>(chipVersion)) {
        case ChipVersion::ESP32:
            return std::string("esp32");
        case ChipVersion::ESP32S2:
            return std::string("esp32s2");
        case ChipVersion::ESP32S3:
            return std::string("esp32s3");
        case ChipVersion::ESP32C3:
            return std::string("esp32c3");
    }
    return std::nullopt;
}

std::string gdbPathFor(const std::string& target, const std::string& gdbOverride) {
    if (!gdbOverride.empty()) {
        return gdbOverride;
    }
    // xtensa-esp32s2-elf-gdb misreads S2 dumps, the ESP32 GDB handles all Xtensa targets
    if (isXtensaTarget(target)) {
        return "xtensa-esp32-elf-gdb";
    }
    if (isRiscvTarget(target)) {
        return "riscv32-esp-elf-gdb";
    }

    std::string supported;
    for (const auto& t : supportedTargets()) {
        if (!supported.empty()) {
            supported += ", ";
        }
        supported += t;
    }
    throw std::invalid_argument("Invalid value: " + target + ". For now we only support " +
                                supported);
}

std::string romElfPathFor(const std::string& target, const std::string& romElfOverride) {
    if (!romElfOverride.empty()) {
        return romElfOverride;
    }
    return target + "_rom.elf";
}

}  // namespace TargetInfo

TargetResolver::TargetResolver(TargetResolverOptions options, ChipDetector& detector)
    : options_(std::move(options)), detector_(detector) {}

const std::string& TargetResolver::resolve(const std::optional<uint32_t>& chipVersion) {
    if (!resolved_) {
        resolved_ = resolveOnce(chipVersion);
    }
    return *resolved_;
}

std::string TargetResolver::resolveOnce(const std::optional<uint32_t>& chipVersion) {
    if (options_.chip != TargetInfo::AUTO_TARGET && !options_.chip.empty()) {
        return options_.chip;
    }

    if (chipVersion) {
        auto target = TargetInfo::targetForChipVersion(*chipVersion);
        if (target) {
            return *target;
        }
    }

    try {
        return detector_.detectChip(options_.port, options_.baud);
    } catch (const CoreDumpExceptions::TransportError& e) {
        throw CoreDumpExceptions::TargetResolutionError(e.getDetailedMessage());
    }
}
