/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "CoreDumpAnalyzer.h"
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>
#include "CoreDumpExceptions.h"
#include "NoteExtractor.h"
#include "RegionReconciler.h"
#include "TargetResolver.h"

using CoreDumpExceptions::ArchitectureMismatchError;
using CoreDumpExceptions::ContainerError;
using CoreDumpExceptions::DebuggerError;

CoreDumpAnalyzer::CoreDumpAnalyzer(const Config& config)
    : config_(config),
      ownedDetector_(std::make_unique<EsptoolChipDetector>()),
      detector_(*ownedDetector_),
      debuggerFactory_([](const GdbLaunchOptions& options) -> std::unique_ptr<DebuggerSession> {
          return std::make_unique<GdbMiSession>(options);
      }) {}

CoreDumpAnalyzer::CoreDumpAnalyzer(const Config& config,
                                   ChipDetector& detector,
                                   DebuggerFactory debuggerFactory)
    : config_(config), detector_(detector), debuggerFactory_(std::move(debuggerFactory)) {}

int CoreDumpAnalyzer::run(std::ostream& out) {
    if (config_.command == "dbg_corefile") {
        return dbgCorefile(out);
    }
    infoCorefile(out);
    return 0;
}

CoreDumpAnalyzer::LoadedDump CoreDumpAnalyzer::load() {
    ElfContainerReader program(config_.programFile);
    ElfContainerReader core(config_.coreFile);

    if (config_.verbosity > 0) {
        std::cerr << "Loaded executable: " << program.filename() << " ("
                  << program.sections().size() << " allocated sections)\n";
        std::cerr << "Loaded core dump: " << core.filename() << " ("
                  << core.loadSegments().size() << " load segments, "
                  << core.noteSections().size() << " notes)\n";
    }

    if (program.machine() != core.machine()) {
        throw ArchitectureMismatchError(program.machine(), core.machine());
    }

    if (!config_.saveCore.empty()) {
        saveCoreCopy();
    }

    NoteDiagnostics diagnostics = NoteExtractor::extract(core.noteSections());
    if (config_.verbosity > 1) {
        std::cerr << "Task records: " << diagnostics.task_status.size() << "\n";
        if (diagnostics.chip_version) {
            std::cerr << "Chip version from PT_INFO: " << *diagnostics.chip_version << "\n";
        }
    }

    TargetResolverOptions options;
    options.chip = config_.chip;
    options.port = config_.port;
    options.baud = config_.baud;
    TargetResolver resolver(options, detector_);
    std::string target = resolver.resolve(diagnostics.chip_version);

    if (config_.verbosity > 0) {
        std::cerr << "Target: " << target << "\n";
    }

    return LoadedDump{std::move(program), std::move(core), std::move(diagnostics), target};
}

void CoreDumpAnalyzer::saveCoreCopy() const {
    std::error_code ec;
    std::filesystem::copy_file(config_.coreFile,
                               config_.saveCore,
                               std::filesystem::copy_options::overwrite_existing,
                               ec);
    if (ec) {
        throw ContainerError::readError("Cannot save core dump to '" + config_.saveCore +
                                            "': " + ec.message(),
                                        config_.coreFile);
    }
    if (config_.verbosity > 0) {
        std::cerr << "Core dump saved to " << config_.saveCore << "\n";
    }
}

std::string CoreDumpAnalyzer::romSymbolCommand(const std::string& target) const {
    std::string romPath = TargetInfo::romElfPathFor(target, config_.romElf);

    std::error_code ec;
    if (!std::filesystem::exists(romPath, ec)) {
        if (config_.verbosity > 0) {
            std::cerr << "Warning: ROM ELF '" << romPath
                      << "' not found, ROM functions will have no symbols\n";
        }
        return "";
    }

    ElfContainerReader rom(romPath);
    auto textAddress = rom.sectionAddress(".text");
    if (!textAddress) {
        if (config_.verbosity > 0) {
            std::cerr << "Warning: ROM ELF '" << romPath << "' has no .text section\n";
        }
        return "";
    }

    std::ostringstream command;
    command << "add-symbol-file " << romPath << " 0x" << std::hex << *textAddress;
    return command.str();
}

GdbLaunchOptions CoreDumpAnalyzer::launchOptions(const std::string& target) const {
    GdbLaunchOptions options;
    options.gdbPath = TargetInfo::gdbPathFor(target, config_.gdbPath);
    options.programFile = config_.programFile;
    options.coreFile = config_.coreFile;
    options.initCommands.push_back(romSymbolCommand(target));
    options.timeoutSec = config_.gdbTimeoutSec;
    return options;
}

void CoreDumpAnalyzer::infoCorefile(std::ostream& out) {
    LoadedDump dump = load();

    ReportData data;
    data.target = dump.target;
    data.machine = dump.program.machine();
    data.diagnostics = dump.diagnostics;
    data.regions = RegionReconciler::reconcile(dump.program.sections(), dump.core.loadSegments());

    if (config_.verbosity > 0) {
        for (const auto& name : data.regions.contested_sections) {
            std::cerr << "Warning: section '" << name
                      << "' overlaps a core segment already merged into an earlier section\n";
        }
    }
    if (config_.verbosity > 1) {
        for (size_t i = 0; i < data.regions.section_regions.size(); ++i) {
            if (data.regions.claimed_segment[i]) {
                std::cerr << "Section " << data.regions.section_regions[i].name
                          << " merged with core segment " << *data.regions.claimed_segment[i]
                          << "\n";
            }
        }
    }

    if (config_.format == "json") {
        ReportComposer::composeJson(out, data);
        return;
    }

    GdbLaunchOptions options = launchOptions(dump.target);
    if (config_.verbosity > 0) {
        std::cerr << "Starting " << options.gdbPath << "\n";
    }
    {
        std::unique_ptr<DebuggerSession> debugger = debuggerFactory_(options);
        ReportComposer composer(out, *debugger);
        composer.composeTextReport(data, config_.printMemory);
    }
    out << "Done!\n";
}

int CoreDumpAnalyzer::dbgCorefile(std::ostream& out) {
    LoadedDump dump = load();
    int status = launchInteractiveGdb(launchOptions(dump.target));
    out << "Done!\n";
    return status;
}

int CoreDumpAnalyzer::launchInteractiveGdb(const GdbLaunchOptions& options) const {
    std::vector<std::string> args = {options.gdbPath, "--nw", "--core=" + options.coreFile};
    for (const auto& command : options.initCommands) {
        if (!command.empty()) {
            args.push_back("-ex");
            args.push_back(command);
        }
    }
    args.push_back(options.programFile);

    if (config_.verbosity > 0) {
        std::cerr << "Running";
        for (const auto& arg : args) {
            std::cerr << " " << arg;
        }
        std::cerr << "\n";
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        throw DebuggerError(std::string("fork failed: ") + std::strerror(errno), options.gdbPath);
    }
    if (pid == 0) {
        std::vector<char*> argv;
        argv.reserve(args.size() + 1U);
        for (auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);
        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw DebuggerError(std::string("waitpid failed: ") + std::strerror(errno),
                                options.gdbPath);
        }
    }

    if (WIFEXITED(status)) {
        if (WEXITSTATUS(status) == 127) {
            throw DebuggerError("Cannot launch GDB", options.gdbPath);
        }
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}
