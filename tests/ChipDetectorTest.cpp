/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "ChipDetector.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "CoreDumpExceptions.h"
#include "TestElfBuilder.h"

namespace {

std::string writeScript(const TempDir& dir, const std::string& body) {
    std::string path = dir.file("esptool.sh");
    std::ofstream script(path);
    script << "#!/bin/sh\n" << body;
    script.close();
    std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    return path;
}

}  // namespace

TEST(ChipDetectorTest, NormalizesChipNames) {
    EXPECT_EQ(EsptoolChipDetector::normalizeChipName("ESP32-S3"), "esp32s3");
    EXPECT_EQ(EsptoolChipDetector::normalizeChipName(" ESP32 "), "esp32");
    EXPECT_EQ(EsptoolChipDetector::normalizeChipName("esp32-c3"), "esp32c3");
}

TEST(ChipDetectorTest, UsesLastDetectingLine) {
    std::string output =
        "esptool.py v4.5\n"
        "Serial port /dev/ttyUSB0\n"
        "Connecting....\n"
        "Detecting chip type... Unsupported detection protocol, switching and trying again...\n"
        "Detecting chip type... ESP32-S2\n"
        "Chip is ESP32-S2FNR2 (revision v0.0)\n";
    EXPECT_EQ(EsptoolChipDetector::parseChipName(output), "esp32s2");
}

TEST(ChipDetectorTest, FallsBackToChipIsLine) {
    std::string output =
        "Connecting....\n"
        "Chip is ESP32-D0WD-V3 (revision v3.0)\n"
        "Features: WiFi, BT, Dual Core\n";
    EXPECT_EQ(EsptoolChipDetector::parseChipName(output), "esp32d0wdv3");
}

TEST(ChipDetectorTest, NoChipInOutput) {
    EXPECT_EQ(EsptoolChipDetector::parseChipName(""), "");
    EXPECT_EQ(EsptoolChipDetector::parseChipName(
                  "A fatal error occurred: Could not open /dev/ttyUSB9, the port doesn't exist\n"),
              "");
}

TEST(ChipDetectorTest, DetectsChipFromToolOutput) {
    TempDir dir;
    std::string tool = writeScript(dir,
                                   "echo \"Serial port $2\"\n"
                                   "echo 'Detecting chip type... ESP32-C3'\n");

    EsptoolChipDetector detector(tool);
    EXPECT_EQ(detector.detectChip("/dev/ttyACM0", 460800), "esp32c3");
}

TEST(ChipDetectorTest, UnreachableBoardIsTransportError) {
    TempDir dir;
    std::string tool = writeScript(dir,
                                   "echo 'A fatal error occurred: Could not open port'\n"
                                   "exit 2\n");

    EsptoolChipDetector detector(tool);
    try {
        detector.detectChip("/dev/ttyUSB9", 115200);
        FAIL() << "expected TransportError";
    } catch (const CoreDumpExceptions::TransportError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("exit status 2"), std::string::npos);
        EXPECT_NE(message.find("Could not open port"), std::string::npos);
        EXPECT_EQ(e.getContext(), "/dev/ttyUSB9");
    }
}
