/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "CoreStructures.h"

/**
 * @file XtensaExceptionInfo.h
 * @brief Exception registers of the crashed Xtensa task
 *
 * The EXTRA_INFO snapshot of an Xtensa dump is laid out as:
 * @code
 * [0]    crashed task handle (or CURR_TASK_MARKER)
 * [1..2] EXCCAUSE register id, value
 * [3..4] EXCVADDR register id, value
 * [5..]  (register id, value) pairs for EPC1..EPC7 and EPS2..EPS7
 * @endcode
 */

/**
 * @brief Xtensa special register numbers used in EXTRA_INFO
 */
namespace XtensaRegisters {
constexpr uint32_t EPC1 = 177;
constexpr uint32_t EPC7 = 183;
constexpr uint32_t EPS2 = 194;
constexpr uint32_t EPS7 = 199;

/** @brief EXCCAUSE placeholder when the crashed task was skipped */
constexpr uint32_t INVALID_CAUSE_VALUE = 0xFFFF;

/** @brief First ESP panic pseudo cause, past the hardware causes */
constexpr uint32_t XCHAL_EXCCAUSE_NUM = 64;
}  // namespace XtensaRegisters

/**
 * @brief Decoded exception registers
 */
struct XtensaExceptionRegisters {
    uint32_t exccause = 0;
    uint32_t excvaddr = 0;
    std::vector<std::pair<int, uint32_t>> epc;  ///< (n, value) for EPCn
    std::vector<std::pair<int, uint32_t>> eps;  ///< (n, value) for EPSn
};

/**
 * @class XtensaExceptionInfo
 * @brief Decodes and describes Xtensa exception registers
 */
class XtensaExceptionInfo {
public:
    /**
     * @brief Decode the exception registers from a register snapshot
     * @return Registers, or std::nullopt if the snapshot is too short to hold
     *         EXCCAUSE and EXCVADDR
     */
    static std::optional<XtensaExceptionRegisters> decode(const RegisterSnapshot& snapshot);

    /**
     * @brief Short name of an EXCCAUSE value (e.g. "LoadProhibitedCause")
     * @return "Invalid EXCCAUSE code" for unknown values
     */
    static std::string causeName(uint32_t exccause);

    /**
     * @brief Long description of an EXCCAUSE value
     */
    static std::string causeDescription(uint32_t exccause);

    /**
     * @brief Render the registers the way the report prints them
     */
    static std::string format(const XtensaExceptionRegisters& registers);
};
