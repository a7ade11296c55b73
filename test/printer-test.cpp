/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  printer-test
 *
 *      What the log printer makes of each kind of event.
 */
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <type_traits>
#include <unistd.h>
#include <gtest/gtest.h>

#include "printer.hpp"

using std::string;
using std::vector;

static bool contains(const string& haystack, const string& needle)
{
    return haystack.find(needle) != string::npos;
}

static ExecEvent make_exec(int error)
{
    ExecEvent event;
    event.tracee = TraceeKey{100, 1};
    event.syscall = SYSCALL_EXECVE;
    event.comm = "sh";
    event.parents = {AncestorInfo{TraceeKey{50, 1}, "make"}};
    event.filename = string("/bin/true");
    event.resolvedPath = string("/bin/true");
    event.argv = vector<string>{"true", "--flag"};
    event.envp = vector<string>{"A=1"};
    event.error = error;

    FdTable before;
    before[0] = classify_fd_link(0, "/dev/null");
    before[4] = classify_fd_link(4, "pipe:[77]");
    before[4].cloexec = true;
    event.fds = before;

    EnvDiff diff;
    diff.added.emplace_back("NEW", "x y");
    diff.removed.push_back("OLD");
    diff.changed.push_back(EnvChange{"PATH", "/bin", "/usr/bin"});
    event.envDiff = diff;

    if (error == 0)
    {
        FdTable after;
        after[0] = before[0];
        event.postFds = after;
        event.newComm = "true";
        event.fdDiff = compute_fd_diff(before, after);
    }
    return event;
}

TEST(LogPrinter, ExecHeaderLine)
{
    LogPrinter printer(stderr, LogPrinter::Options());
    string text = printer.render(make_exec(0));
    EXPECT_EQ(text, "100: execve(\"/bin/true\", [\"true\", \"--flag\"]) = 0\n");

    string failed = printer.render(make_exec(ENOENT));
    EXPECT_TRUE(contains(failed, "= -1 ENOENT")) << failed;
}

TEST(LogPrinter, ExecDetails)
{
    LogPrinter::Options options;
    options.showEnv = true;
    options.showFds = true;
    options.showParents = true;
    options.showInterpreter = true;
    LogPrinter printer(stderr, options);

    string text = printer.render(make_exec(0));
    EXPECT_TRUE(contains(text, "    parents: make(50)\n")) << text;
    EXPECT_TRUE(contains(text, "    path: /bin/true\n")) << text;
    EXPECT_TRUE(contains(text, "    +NEW=\"x y\"\n")) << text;
    EXPECT_TRUE(contains(text, "    -OLD\n")) << text;
    EXPECT_TRUE(contains(text, "    ~PATH: /bin -> /usr/bin\n")) << text;
    EXPECT_TRUE(contains(text, "    closed 4 pipe pipe:[77] (cloexec)\n"))
        << text;
    EXPECT_TRUE(contains(text, "    kept 0 file /dev/null\n")) << text;
    // no escape codes unless asked for
    EXPECT_FALSE(contains(text, "\x1b[")) << text;
}

TEST(LogPrinter, FailedExecListsFdsInstead)
{
    LogPrinter::Options options;
    options.showFds = true;
    LogPrinter printer(stderr, options);
    string text = printer.render(make_exec(EACCES));
    EXPECT_TRUE(contains(text, "    fd 0 file /dev/null\n")) << text;
    EXPECT_FALSE(contains(text, "closed")) << text;
}

TEST(LogPrinter, UnavailableFields)
{
    LogPrinter::Options options;
    options.showEnv = true;
    LogPrinter printer(stderr, options);

    ExecEvent event = make_exec(0);
    event.argv = Field<vector<string>>::unavailable(EFAULT);
    event.envp = Field<vector<string>>::unavailable(ESRCH);
    string text = printer.render(event);
    EXPECT_TRUE(contains(text, "<unavailable: ")) << text;
    EXPECT_TRUE(contains(text, "    env: <unavailable: ")) << text;

    event = make_exec(0);
    event.envDiff.reset();
    EXPECT_TRUE(contains(printer.render(event), "no baseline (1 variables)"));

    event.envDiff = EnvDiff();
    EXPECT_TRUE(contains(printer.render(event), "env: unchanged"));
}

TEST(LogPrinter, OtherEvents)
{
    LogPrinter printer(stderr, LogPrinter::Options());
    TraceeKey key{100, 1};

    EXPECT_EQ(printer.render(ExitEvent(key, 0, "sh")),
        "100: sh exited with status 0\n");
    EXPECT_EQ(printer.render(ExitEvent(key, SIGKILL, "sh")),
        "100: sh killed by SIGKILL\n");
    EXPECT_EQ(printer.render(SignalEvent(key, SIGINT, 0)),
        "100: received SIGINT\n");
    EXPECT_EQ(printer.render(NewChildEvent(key, TraceeKey{101, 2},
        CloneKind::PROCESS)), "100: new child 101#2\n");
    EXPECT_EQ(printer.render(MessageEvent(EventCategory::WARNING, "hmm")),
        "warning: hmm\n");
}

TEST(LogPrinter, Colour)
{
    LogPrinter::Options options;
    options.colour = true;
    LogPrinter printer(stderr, options);
    string text = printer.render(MessageEvent(EventCategory::ERROR, "bad"));
    EXPECT_TRUE(contains(text, "\x1b[")) << text;
    EXPECT_TRUE(contains(text, "error: bad")) << text;
}

TEST(LogPrinter, WritesToFile)
{
    char path[] = "/tmp/exectrace-printer-XXXXXX";
    int fd = mkstemp(path);
    ASSERT_NE(fd, -1);
    close(fd);
    {
        auto printer = std::make_shared<LogPrinter>(string(path),
            LogPrinter::Options());
        printer->on_event(std::make_shared<ExitEvent>(TraceeKey{7, 1}, 0,
            "true"));
        printer->on_close();
    }
    FILE* file = fopen(path, "r");
    ASSERT_NE(file, nullptr);
    char line[128] = {};
    ASSERT_NE(fgets(line, sizeof(line), file), nullptr);
    fclose(file);
    unlink(path);
    EXPECT_STREQ(line, "7: true exited with status 0\n");

    EXPECT_THROW(LogPrinter("/nonexistent/dir/log", LogPrinter::Options()),
        SystemError);
}

TEST(LogPrinter, OwnsItsFileSoItCantBeCopied)
{
    static_assert(!std::is_copy_constructible_v<LogPrinter>);
    static_assert(!std::is_copy_assignable_v<LogPrinter>);
}
