/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "debugger/GdbMiSession.h"
#include <gtest/gtest.h>
#include <csignal>
#include <filesystem>
#include <fstream>
#include "CoreDumpExceptions.h"
#include "TestElfBuilder.h"

namespace {

// Answers the handful of MI commands coretk sends, like GDB would
const char* const FAKE_GDB = R"(#!/bin/sh
echo '=thread-group-added,id="i1"'
echo '(gdb)'
while IFS= read -r line; do
    token=${line%%[!0-9]*}
    case "$line" in
        *-gdb-exit*)
            printf '%s^exit\n' "$token"
            exit 0 ;;
        *-thread-info*)
            printf '%s^done,threads=[{id="1",target-id="process 1073462788"},{id="2",target-id="process 1073460000"}],current-thread-id="1"\n(gdb)\n' "$token" ;;
        *"-thread-select 7"*)
            printf '%s^error,msg="Invalid thread id: 7"\n(gdb)\n' "$token" ;;
        *-thread-select*)
            printf '%s^done\n(gdb)\n' "$token" ;;
        *-data-evaluate-expression*)
            printf '%s^done,value="0x3ffb5f4c \\"main\\""\n(gdb)\n' "$token" ;;
        *hang*)
            ;;
        *quit-now*)
            exit 0 ;;
        *console*\"bt\"*)
            printf '~"\\n#0  0x400d1234 in app_main ()\\n"\n~"#1  0x400d2000 in main_task ()\\n"\n%s^done\n(gdb)\n' "$token" ;;
        *console*)
            printf '%s^error,msg="Undefined command"\n(gdb)\n' "$token" ;;
        *)
            printf '%s^done\n(gdb)\n' "$token" ;;
    esac
done
)";

class GdbMiSessionTest : public ::testing::Test {
protected:
    TempDir dir_;

    // Same as main(): a GDB that already exited must not kill the process
    void SetUp() override { std::signal(SIGPIPE, SIG_IGN); }

    GdbLaunchOptions fakeOptions() {
        std::string path = dir_.file("fake-gdb.sh");
        std::ofstream script(path);
        script << FAKE_GDB;
        script.close();
        std::filesystem::permissions(path, std::filesystem::perms::owner_all);

        GdbLaunchOptions options;
        options.gdbPath = path;
        options.programFile = "app.elf";
        options.coreFile = "core.elf";
        options.timeoutSec = 1;
        return options;
    }
};

}  // namespace

TEST_F(GdbMiSessionTest, MissingGdbIsDebuggerError) {
    GdbLaunchOptions options;
    options.gdbPath = dir_.file("no-such-gdb");
    options.programFile = "app.elf";
    options.coreFile = "core.elf";
    options.timeoutSec = 1;

    EXPECT_THROW(GdbMiSession session(options), CoreDumpExceptions::DebuggerError);
}

TEST_F(GdbMiSessionTest, ConsoleOutputIsCollectedAndTrimmed) {
    GdbMiSession session(fakeOptions());
    EXPECT_EQ(session.runCommand("bt"),
              "#0  0x400d1234 in app_main ()\n#1  0x400d2000 in main_task ()");
}

TEST_F(GdbMiSessionTest, ErrorMessageIsCommandOutput) {
    GdbMiSession session(fakeOptions());
    EXPECT_EQ(session.runCommand("frobnicate"), "Undefined command");
}

TEST_F(GdbMiSessionTest, ListsThreads) {
    GdbMiSession session(fakeOptions());
    auto threads = session.threads();

    ASSERT_EQ(threads.size(), 2u);
    EXPECT_EQ(threads[0].id, 1);
    EXPECT_EQ(threads[0].target_id, "process 1073462788");
    EXPECT_EQ(DebuggerSession::tcbFromTargetId(threads[0].target_id), 1073462788u);
    EXPECT_EQ(threads[1].id, 2);
}

TEST_F(GdbMiSessionTest, SelectThread) {
    GdbMiSession session(fakeOptions());
    EXPECT_NO_THROW(session.selectThread(2));
    EXPECT_THROW(session.selectThread(7), CoreDumpExceptions::DebuggerError);
}

TEST_F(GdbMiSessionTest, ReadsTaskName) {
    GdbMiSession session(fakeOptions());
    EXPECT_EQ(session.taskName(0x3ffb5a10), "main");
}

TEST_F(GdbMiSessionTest, TimeoutReturnsPartialOutput) {
    GdbMiSession session(fakeOptions());
    EXPECT_EQ(session.runCommand("hang"), "");
    EXPECT_EQ(session.runCommand("bt"),
              "#0  0x400d1234 in app_main ()\n#1  0x400d2000 in main_task ()");
}

TEST_F(GdbMiSessionTest, InitCommandsRunAtStartup) {
    GdbLaunchOptions options = fakeOptions();
    options.initCommands = {"", "add-symbol-file esp32_rom.elf 0x40000400"};
    GdbMiSession session(options);
    EXPECT_EQ(session.threads().size(), 2u);
}

TEST_F(GdbMiSessionTest, GdbExitIsDebuggerError) {
    GdbMiSession session(fakeOptions());
    EXPECT_THROW(session.runCommand("quit-now"), CoreDumpExceptions::DebuggerError);
}

TEST(GdbMiSessionValueTest, ParsesTaskNameValue) {
    EXPECT_EQ(GdbMiSession::parseTaskNameValue("0x3ffb5f4c \"IDLE0\""), "IDLE0");
    EXPECT_EQ(GdbMiSession::parseTaskNameValue("0x0"), "");
    EXPECT_EQ(GdbMiSession::parseTaskNameValue("0x3ffb5f4c \"unterminated"), "");
}

TEST(GdbMiSessionValueTest, TcbFromTargetId) {
    EXPECT_EQ(DebuggerSession::tcbFromTargetId("process 1073462788"), 1073462788u);
    EXPECT_EQ(DebuggerSession::tcbFromTargetId("process 0x3ffb5a10"), 0x3ffb5a10u);
    EXPECT_EQ(DebuggerSession::tcbFromTargetId("Thread 12"), 0u);
    EXPECT_EQ(DebuggerSession::tcbFromTargetId("process abc"), 0u);
}
