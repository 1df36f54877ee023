/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "cli/ConfigValidator.h"
#include <gtest/gtest.h>
#include <fstream>
#include "TestElfBuilder.h"

namespace {

class ConfigValidatorTest : public ::testing::Test {
protected:
    TempDir dir_;
    Config config_;

    void SetUp() override {
        config_.command = "info_corefile";
        config_.programFile = TestElfBuilder(EM_XTENSA).writeTo(dir_.file("app.elf"));
        config_.coreFile = TestElfBuilder(EM_XTENSA).writeTo(dir_.file("core.elf"));
    }
};

}  // namespace

TEST_F(ConfigValidatorTest, DefaultsAreValid) {
    auto result = ConfigValidator::validate(config_);
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(ConfigValidatorTest, PrintMemoryConflictsWithJson) {
    config_.printMemory = true;
    config_.format = "json";

    auto result = ConfigValidator::validate(config_);
    EXPECT_FALSE(result.is_valid);
    EXPECT_NE(result.error_message.find("--print-mem"), std::string::npos);
}

TEST_F(ConfigValidatorTest, MissingCoreFile) {
    config_.coreFile = dir_.file("absent.elf");

    auto result = ConfigValidator::validate(config_);
    EXPECT_FALSE(result.is_valid);
    EXPECT_NE(result.error_message.find("core dump"), std::string::npos);
}

TEST_F(ConfigValidatorTest, EmptyProgramFile) {
    config_.programFile = dir_.file("empty.elf");
    std::ofstream(config_.programFile).close();

    auto result = ConfigValidator::validate(config_);
    EXPECT_FALSE(result.is_valid);
    EXPECT_NE(result.error_message.find("empty"), std::string::npos);
}

TEST_F(ConfigValidatorTest, SaveCoreMustNotOverwriteInput) {
    config_.saveCore = config_.coreFile;
    EXPECT_FALSE(ConfigValidator::validate(config_).is_valid);

    config_.saveCore = dir_.file("./core.elf");
    EXPECT_FALSE(ConfigValidator::validate(config_).is_valid);

    config_.saveCore = dir_.file("copy.elf");
    EXPECT_TRUE(ConfigValidator::validate(config_).is_valid);
}

TEST_F(ConfigValidatorTest, TimeoutMustBePositive) {
    config_.gdbTimeoutSec = 0;
    EXPECT_FALSE(ConfigValidator::validate(config_).is_valid);
}

TEST_F(ConfigValidatorTest, WarnsAboutIgnoredOptions) {
    config_.chip = "esp32";
    config_.portGiven = true;
    config_.format = "json";
    config_.gdbPath = "/opt/gdb";

    auto result = ConfigValidator::validate(config_);
    EXPECT_TRUE(result.is_valid);
    ASSERT_EQ(result.warnings.size(), 2u);
    EXPECT_NE(result.warnings[0].find("--port"), std::string::npos);
    EXPECT_NE(result.warnings[1].find("--gdb"), std::string::npos);
}
