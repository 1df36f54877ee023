/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "GdbMiSession.h"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>
#include <utility>
#include "../CoreDumpExceptions.h"

using CoreDumpExceptions::DebuggerError;

GdbMiSession::GdbMiSession(GdbLaunchOptions options) : options_(std::move(options)) {
    spawn();
    try {
        readUntilPrompt("");
        execute("-gdb-set confirm off");
        for (const auto& command : options_.initCommands) {
            if (!command.empty()) {
                runCommand(command);
            }
        }
    } catch (const DebuggerError&) {
        shutdown();
        throw;
    }
}

GdbMiSession::~GdbMiSession() {
    shutdown();
}

void GdbMiSession::spawn() {
    int toChild[2];
    int fromChild[2];
    if (::pipe(toChild) != 0) {
        throw DebuggerError(std::string("Cannot create pipe: ") + std::strerror(errno),
                            options_.gdbPath);
    }
    if (::pipe(fromChild) != 0) {
        int savedErrno = errno;
        ::close(toChild[0]);
        ::close(toChild[1]);
        throw DebuggerError(std::string("Cannot create pipe: ") + std::strerror(savedErrno),
                            options_.gdbPath);
    }

    std::vector<std::string> args = {options_.gdbPath,
                                     "--nx",
                                     "--quiet",
                                     "--interpreter=mi2",
                                     "--core=" + options_.coreFile,
                                     options_.programFile};

    pid_t pid = ::fork();
    if (pid < 0) {
        int savedErrno = errno;
        ::close(toChild[0]);
        ::close(toChild[1]);
        ::close(fromChild[0]);
        ::close(fromChild[1]);
        throw DebuggerError(std::string("fork failed: ") + std::strerror(savedErrno),
                            options_.gdbPath);
    }

    if (pid == 0) {
        if (::dup2(toChild[0], STDIN_FILENO) < 0 || ::dup2(fromChild[1], STDOUT_FILENO) < 0) {
            _exit(127);
        }
        // MI reports errors on stdout, stderr only carries terminal noise
        int devNull = ::open("/dev/null", O_WRONLY);
        if (devNull < 0 || ::dup2(devNull, STDERR_FILENO) < 0) {
            _exit(127);
        }
        ::close(devNull);
        ::close(toChild[0]);
        ::close(toChild[1]);
        ::close(fromChild[0]);
        ::close(fromChild[1]);

        std::vector<char*> argv;
        argv.reserve(args.size() + 1U);
        for (auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    ::close(toChild[0]);
    ::close(fromChild[1]);
    pid_ = pid;
    toGdb_ = toChild[1];
    fromGdb_ = fromChild[0];
}

void GdbMiSession::shutdown() {
    if (pid_ < 0) {
        return;
    }

    bool exitRequested = false;
    if (toGdb_ >= 0) {
        static const char EXIT_COMMAND[] = "-gdb-exit\n";
        exitRequested = ::write(toGdb_, EXIT_COMMAND, sizeof(EXIT_COMMAND) - 1) > 0;
        ::close(toGdb_);
        toGdb_ = -1;
    }
    if (fromGdb_ >= 0) {
        ::close(fromGdb_);
        fromGdb_ = -1;
    }

    int status = 0;
    if (exitRequested) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(options_.timeoutSec);
        while (std::chrono::steady_clock::now() < deadline) {
            pid_t reaped = ::waitpid(pid_, &status, WNOHANG);
            if (reaped == pid_ || (reaped < 0 && errno != EINTR)) {
                pid_ = -1;
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }

    ::kill(pid_, SIGKILL);
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    pid_ = -1;
}

void GdbMiSession::writeLine(const std::string& line) {
    std::string data = line + "\n";
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(toGdb_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw DebuggerError(std::string("Cannot send command to GDB: ") + std::strerror(errno),
                                options_.gdbPath);
        }
        written += static_cast<size_t>(n);
    }
}

std::vector<MiRecord> GdbMiSession::readUntilPrompt(const std::string& token) {
    using Clock = std::chrono::steady_clock;
    auto deadline = Clock::now() + std::chrono::seconds(options_.timeoutSec);

    std::vector<MiRecord> records;
    bool resultSeen = token.empty();

    while (true) {
        size_t newline;
        while ((newline = pending_.find('\n')) != std::string::npos) {
            MiRecord record = MiParser::parseLine(pending_.substr(0, newline));
            pending_.erase(0, newline + 1);

            if (record.type == MiRecord::Type::Prompt) {
                if (resultSeen) {
                    return records;
                }
                continue;
            }
            if (record.type == MiRecord::Type::Result) {
                if (record.token != token) {
                    // Late answer to a command that timed out earlier
                    records.clear();
                    continue;
                }
                resultSeen = true;
            }
            records.push_back(std::move(record));
        }

        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (remaining <= 0) {
            return records;
        }

        struct pollfd pfd = {fromGdb_, POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw DebuggerError(std::string("poll failed: ") + std::strerror(errno),
                                options_.gdbPath);
        }
        if (ready == 0) {
            return records;
        }

        char buffer[4096];
        ssize_t n = ::read(fromGdb_, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw DebuggerError(std::string("Cannot read from GDB: ") + std::strerror(errno),
                                options_.gdbPath);
        }
        if (n == 0) {
            throw DebuggerError("GDB exited unexpectedly", options_.gdbPath);
        }
        pending_.append(buffer, static_cast<size_t>(n));
    }
}

std::vector<MiRecord> GdbMiSession::execute(const std::string& miCommand) {
    std::string token = std::to_string(++nextToken_);
    writeLine(token + miCommand);
    return readUntilPrompt(token);
}

std::string GdbMiSession::runCommand(const std::string& command) {
    std::string output;
    for (const auto& record : execute("-interpreter-exec console " + MiParser::quote(command))) {
        if (record.type == MiRecord::Type::Console || record.type == MiRecord::Type::Target) {
            output += record.stream_text;
        } else if (record.type == MiRecord::Type::Result && record.result_class == "error") {
            output += record.results.get("msg");
        }
    }

    size_t first = output.find_first_not_of('\n');
    if (first == std::string::npos) {
        return "";
    }
    size_t last = output.find_last_not_of('\n');
    return output.substr(first, last - first + 1);
}

std::vector<DebuggerThread> GdbMiSession::threads() {
    std::vector<DebuggerThread> result;
    for (const auto& record : execute("-thread-info")) {
        if (record.type != MiRecord::Type::Result || record.result_class != "done") {
            continue;
        }
        const MiValue* list = record.results.find("threads");
        if (!list) {
            continue;
        }
        for (const auto& entry : list->values) {
            std::string id = entry.get("id");
            char* end = nullptr;
            long number = std::strtol(id.c_str(), &end, 10);
            if (id.empty() || *end != '\0') {
                continue;
            }
            DebuggerThread thread;
            thread.id = static_cast<int>(number);
            thread.target_id = entry.get("target-id");
            result.push_back(thread);
        }
    }
    return result;
}

void GdbMiSession::selectThread(int id) {
    for (const auto& record : execute("-thread-select " + std::to_string(id))) {
        if (record.type == MiRecord::Type::Result && record.result_class == "error") {
            throw DebuggerError("Cannot select thread " + std::to_string(id) + ": " +
                                    record.results.get("msg"),
                                options_.gdbPath);
        }
    }
}

std::string GdbMiSession::taskName(uint32_t tcbAddress) {
    std::ostringstream expression;
    expression << "(char*)((TCB_t *)0x" << std::hex << tcbAddress << ")->pcTaskName";

    for (const auto& record :
         execute("-data-evaluate-expression " + MiParser::quote(expression.str()))) {
        if (record.type == MiRecord::Type::Result && record.result_class == "done") {
            return parseTaskNameValue(record.results.get("value"));
        }
    }
    return "";
}

std::string GdbMiSession::parseTaskNameValue(const std::string& value) {
    size_t open = value.find('"');
    if (open == std::string::npos) {
        return "";
    }
    size_t close = value.find('"', open + 1);
    if (close == std::string::npos) {
        return "";
    }
    return value.substr(open + 1, close - open - 1);
}
