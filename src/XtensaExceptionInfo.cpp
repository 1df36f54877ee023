/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "XtensaExceptionInfo.h"
#include <iomanip>
#include <map>
#include <sstream>

namespace {

struct CauseText {
    const char* name;
    const char* description;
};

// Xtensa ISA Reference Manual, table 4-64 "Exception Causes", plus ESP panic reasons
const std::map<uint32_t, CauseText>& causeTable() {
    using namespace XtensaRegisters;
    static const std::map<uint32_t, CauseText> table = {
        {0, {"IllegalInstructionCause", "Illegal instruction"}},
        {1, {"SyscallCause", "SYSCALL instruction"}},
        {2, {"InstructionFetchErrorCause",
             "Processor internal physical address or data error during instruction fetch"}},
        {3, {"LoadStoreErrorCause",
             "Processor internal physical address or data error during load or store"}},
        {4, {"Level1InterruptCause",
             "Level-1 interrupt as indicated by set level-1 bits in the INTERRUPT register"}},
        {5, {"AllocaCause", "MOVSP instruction, if caller's registers are not in the register file"}},
        {6, {"IntegerDivideByZeroCause", "QUOS, QUOU, REMS, or REMU divisor operand is zero"}},
        {8, {"PrivilegedCause", "Attempt to execute a privileged operation when CRING != 0"}},
        {9, {"LoadStoreAlignmentCause", "Load or store to an unaligned address"}},
        {12, {"InstrPIFDataErrorCause", "PIF data error during instruction fetch"}},
        {13, {"LoadStorePIFDataErrorCause", "Synchronous PIF data error during LoadStore access"}},
        {14, {"InstrPIFAddrErrorCause", "PIF address error during instruction fetch"}},
        {15, {"LoadStorePIFAddrErrorCause",
              "Synchronous PIF address error during LoadStore access"}},
        {16, {"InstTLBMissCause", "Error during Instruction TLB refill"}},
        {17, {"InstTLBMultiHitCause", "Multiple instruction TLB entries matched"}},
        {18, {"InstFetchPrivilegeCause",
              "An instruction fetch referenced a virtual address at a ring level less than CRING"}},
        {20, {"InstFetchProhibitedCause",
              "An instruction fetch referenced a page mapped with an attribute that does not "
              "permit instruction fetch"}},
        {24, {"LoadStoreTLBMissCause", "Error during TLB refill for a load or store"}},
        {25, {"LoadStoreTLBMultiHitCause", "Multiple TLB entries matched for a load or store"}},
        {26, {"LoadStorePrivilegeCause",
              "A load or store referenced a virtual address at a ring level less than CRING"}},
        {28, {"LoadProhibitedCause",
              "A load referenced a page mapped with an attribute that does not permit loads"}},
        {29, {"StoreProhibitedCause",
              "A store referenced a page mapped with an attribute that does not permit stores"}},
        {32, {"Coprocessor0Disabled", "Coprocessor 0 instruction when cp0 disabled"}},
        {33, {"Coprocessor1Disabled", "Coprocessor 1 instruction when cp1 disabled"}},
        {34, {"Coprocessor2Disabled", "Coprocessor 2 instruction when cp2 disabled"}},
        {35, {"Coprocessor3Disabled", "Coprocessor 3 instruction when cp3 disabled"}},
        {36, {"Coprocessor4Disabled", "Coprocessor 4 instruction when cp4 disabled"}},
        {37, {"Coprocessor5Disabled", "Coprocessor 5 instruction when cp5 disabled"}},
        {38, {"Coprocessor6Disabled", "Coprocessor 6 instruction when cp6 disabled"}},
        {39, {"Coprocessor7Disabled", "Coprocessor 7 instruction when cp7 disabled"}},
        {INVALID_CAUSE_VALUE,
         {"InvalidCauseRegister",
          "Invalid EXCCAUSE register value or current task is broken and was skipped"}},
        {XCHAL_EXCCAUSE_NUM + 0, {"UnknownException", "Unknown exception"}},
        {XCHAL_EXCCAUSE_NUM + 1, {"DebugException", "Unhandled debug exception"}},
        {XCHAL_EXCCAUSE_NUM + 2, {"DoubleException", "Double exception"}},
        {XCHAL_EXCCAUSE_NUM + 3, {"KernelException", "Unhandled kernel exception"}},
        {XCHAL_EXCCAUSE_NUM + 4, {"CoprocessorException", "Coprocessor exception"}},
        {XCHAL_EXCCAUSE_NUM + 5, {"InterruptWDTException", "Interrupt wdt timeout on CPU0 / CPU1"}},
        {XCHAL_EXCCAUSE_NUM + 6, {"IllegalInstructionException", "Illegal instruction"}},
        {XCHAL_EXCCAUSE_NUM + 7, {"UnknownException", "Unknown exception"}},
    };
    return table;
}

// Snapshot indices of the fixed EXCCAUSE and EXCVADDR values
constexpr size_t EXCCAUSE_VALUE_INDEX = 2;
constexpr size_t EXCVADDR_VALUE_INDEX = 4;
constexpr size_t FIRST_PAIR_INDEX = 5;

}  // namespace

std::optional<XtensaExceptionRegisters> XtensaExceptionInfo::decode(
    const RegisterSnapshot& snapshot) {
    const auto& words = snapshot.words;
    if (words.size() <= EXCVADDR_VALUE_INDEX) {
        return std::nullopt;
    }

    XtensaExceptionRegisters registers;
    registers.exccause = words[EXCCAUSE_VALUE_INDEX];
    registers.excvaddr = words[EXCVADDR_VALUE_INDEX];

    for (size_t i = FIRST_PAIR_INDEX; i + 1 < words.size(); i += 2) {
        uint32_t id = words[i];
        uint32_t value = words[i + 1];
        if (id >= XtensaRegisters::EPC1 && id <= XtensaRegisters::EPC7) {
            registers.epc.emplace_back(static_cast<int>(id - XtensaRegisters::EPC1 + 1), value);
        } else if (id >= XtensaRegisters::EPS2 && id <= XtensaRegisters::EPS7) {
            registers.eps.emplace_back(static_cast<int>(id - XtensaRegisters::EPS2 + 2), value);
        }
    }
    return registers;
}

std::string XtensaExceptionInfo::causeName(uint32_t exccause) {
    auto it = causeTable().find(exccause);
    return it != causeTable().end() ? it->second.name : "Invalid EXCCAUSE code";
}

std::string XtensaExceptionInfo::causeDescription(uint32_t exccause) {
    auto it = causeTable().find(exccause);
    return it != causeTable().end() ? it->second.description
                                    : "Invalid EXCAUSE description or not found.";
}

std::string XtensaExceptionInfo::format(const XtensaExceptionRegisters& registers) {
    std::ostringstream oss;
    oss << std::left << std::setw(15) << "exccause" << "0x" << std::hex << registers.exccause
        << " (" << causeName(registers.exccause) << ")\n";
    oss << std::setw(15) << "excvaddr" << "0x" << registers.excvaddr << "\n";
    for (const auto& epc : registers.epc) {
        oss << std::setw(15) << ("epc" + std::to_string(epc.first)) << "0x" << epc.second << "\n";
    }
    for (const auto& eps : registers.eps) {
        oss << std::setw(15) << ("eps" + std::to_string(eps.first)) << "0x" << eps.second << "\n";
    }
    return oss.str();
}
