/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <string>
#include <vector>

/**
 * @file ChipDetector.h
 * @brief Live chip type detection over the serial port
 */

/**
 * @class ChipDetector
 * @brief Interface for detecting the chip type of a connected board
 */
class ChipDetector {
public:
    virtual ~ChipDetector() = default;

    /**
     * @brief Detect the chip connected to a serial port
     * @param port Serial port device (e.g. /dev/ttyUSB0)
     * @param baud Baud rate used for the detection handshake
     * @return Normalized chip name ("esp32", "esp32s3", ...)
     * @throws CoreDumpExceptions::TransportError if the board cannot be reached
     */
    virtual std::string detectChip(const std::string& port, int baud) = 0;
};

/**
 * @class EsptoolChipDetector
 * @brief Detects the chip by running esptool's chip_id command
 *
 * The esptool executable defaults to "esptool.py" and can be overridden with
 * the ESPTOOL environment variable.
 */
class EsptoolChipDetector : public ChipDetector {
public:
    EsptoolChipDetector();
    explicit EsptoolChipDetector(std::string esptoolPath);

    std::string detectChip(const std::string& port, int baud) override;

    /**
     * @brief Find the chip name in esptool output
     *
     * Uses the last "Detecting chip type... NAME" line that names a chip, or
     * falls back to "Chip is NAME (...)".
     *
     * @return Normalized chip name, or an empty string if none was found
     */
    static std::string parseChipName(const std::string& output);

    /**
     * @brief Normalize an esptool chip name: lowercase, '-' removed
     * @return e.g. "ESP32-S3" becomes "esp32s3"
     */
    static std::string normalizeChipName(const std::string& chipName);

private:
    std::string esptoolPath_;

    static std::string runCommand(const std::vector<std::string>& args, int& exitStatus);
    static std::string shellQuote(const std::string& s);
};
