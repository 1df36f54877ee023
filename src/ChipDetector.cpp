/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "ChipDetector.h"
#include <sys/wait.h>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <utility>
#include "CoreDumpExceptions.h"

using CoreDumpExceptions::TransportError;

namespace {
const char* const DETECTING_PREFIX = "Detecting chip type...";
const char* const CHIP_IS_PREFIX = "Chip is ";

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool namesChip(const std::string& candidate) {
    return candidate.size() >= 3 && (candidate.compare(0, 3, "ESP") == 0 ||
                                      candidate.compare(0, 3, "esp") == 0);
}
}  // namespace

EsptoolChipDetector::EsptoolChipDetector() {
    const char* env = std::getenv("ESPTOOL");
    esptoolPath_ = (env && *env) ? env : "esptool.py";
}

EsptoolChipDetector::EsptoolChipDetector(std::string esptoolPath)
    : esptoolPath_(std::move(esptoolPath)) {}

std::string EsptoolChipDetector::detectChip(const std::string& port, int baud) {
    int exitStatus = 0;
    std::string output = runCommand(
        {esptoolPath_, "--port", port, "--baud", std::to_string(baud), "chip_id"}, exitStatus);

    std::string chip = parseChipName(output);
    if (!chip.empty()) {
        return chip;
    }

    // Report the last line esptool printed, usually the serial exception text
    std::istringstream lines(output);
    std::string line;
    std::string lastLine;
    while (std::getline(lines, line)) {
        if (!trim(line).empty()) {
            lastLine = trim(line);
        }
    }
    std::string message = "Chip detection failed (exit status " + std::to_string(exitStatus) + ")";
    if (!lastLine.empty()) {
        message += ": " + lastLine;
    }
    throw TransportError(message, port);
}

std::string EsptoolChipDetector::parseChipName(const std::string& output) {
    std::istringstream lines(output);
    std::string line;
    std::string detected;
    std::string chipIs;

    while (std::getline(lines, line)) {
        line = trim(line);
        size_t pos = line.find(DETECTING_PREFIX);
        if (pos != std::string::npos) {
            std::string rest = trim(line.substr(pos + std::strlen(DETECTING_PREFIX)));
            if (namesChip(rest)) {
                detected = rest;
            }
            continue;
        }
        if (chipIs.empty() && line.compare(0, std::strlen(CHIP_IS_PREFIX), CHIP_IS_PREFIX) == 0) {
            std::string rest = line.substr(std::strlen(CHIP_IS_PREFIX));
            // "ESP32-S3 (revision v0.1)" -> "ESP32-S3"
            rest = trim(rest.substr(0, rest.find('(')));
            if (namesChip(rest)) {
                chipIs = rest;
            }
        }
    }

    if (!detected.empty()) {
        return normalizeChipName(detected);
    }
    if (!chipIs.empty()) {
        return normalizeChipName(chipIs);
    }
    return "";
}

std::string EsptoolChipDetector::normalizeChipName(const std::string& chipName) {
    std::string normalized;
    for (char c : trim(chipName)) {
        if (c == '-') {
            continue;
        }
        normalized += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return normalized;
}

std::string EsptoolChipDetector::shellQuote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        out += (c == '\'' ? "'\\''" : std::string(1, c));
    }
    out += "'";
    return out;
}

std::string EsptoolChipDetector::runCommand(const std::vector<std::string>& args,
                                            int& exitStatus) {
    std::string cmd;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i) {
            cmd.push_back(' ');
        }
        cmd += shellQuote(args[i]);
    }
    cmd += " 2>&1";

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        throw TransportError("Cannot run esptool: " + std::string(std::strerror(errno)),
                             args.front());
    }

    std::array<char, 4096> buf{};
    std::string out;
    while (true) {
        size_t n = fread(buf.data(), 1, buf.size(), pipe);
        if (n == 0) {
            break;
        }
        out.append(buf.data(), n);
    }

    int status = pclose(pipe);
    exitStatus = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    return out;
}
