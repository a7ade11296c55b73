/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  trace-test
 *
 *      Traces real programs from start to finish. These need ptrace to be
 *      allowed, which it is for our own children unless something like a
 *      seccomp sandbox around the test run says otherwise.
 */
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <mutex>
#include <thread>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <gtest/gtest.h>

#include "tracer.hpp"

using std::string;
using std::vector;
using std::optional;
using std::shared_ptr;
using std::make_shared;

#ifndef GETPID_LOOP_PATH
#error "GETPID_LOOP_PATH must point at the getpid-loop helper"
#endif
#ifndef FORK_EXEC_PATH
#error "FORK_EXEC_PATH must point at the fork-exec helper"
#endif
#ifndef THREAD_EXEC_PATH
#error "THREAD_EXEC_PATH must point at the thread-exec helper"
#endif
#ifndef FD_EXEC_PATH
#error "FD_EXEC_PATH must point at the fd-exec helper"
#endif

class CollectingSink : public EventSink
{
public:
    vector<EventPtr> events;
    void on_event(const EventPtr& event) { events.push_back(event); }
};

/* Runs the command through a tracer and keeps everything it emitted. */
class TraceTest : public ::testing::Test
{
protected:
    Tracer::Options _options;
    shared_ptr<CollectingSink> _sink;
    optional<int> _status;
    Tracer::Stats _stats;
    bool _filterInstalled = false;
    pid_t _root = -1;
    string _policy;

    void SetUp() override
    {
        // Tracer::cancel interrupts waitpid with this.
        struct sigaction sa = {};
        sa.sa_handler = [](int) { };
        sigemptyset(&sa.sa_mask);
        sigaction(SIGUSR1, &sa, nullptr);

        _options.stdio = StdioMode::NULL_DEVICE;
        _options.filter.showAll = true;
    }

    void trace(vector<string> command)
    {
        _options.command = std::move(command);
        _sink = make_shared<CollectingSink>();
        EventStream stream;
        stream.subscribe(_sink);
        {
            Tracer tracer(_options, stream);
            tracer.start();
            _root = tracer.root();
            _status = tracer.run();
            _stats = tracer.stats();
            _filterInstalled = tracer.filter_installed();
            _policy = string(tracer.policy_name());
        }
        stream.close();
    }

    vector<const ExecEvent*> execs() const
    {
        vector<const ExecEvent*> result;
        for (const EventPtr& event : _sink->events)
        {
            if (auto exec = dynamic_cast<const ExecEvent*>(event.get()))
            {
                result.push_back(exec);
            }
        }
        return result;
    }

    vector<const ExitEvent*> exits() const
    {
        vector<const ExitEvent*> result;
        for (const EventPtr& event : _sink->events)
        {
            if (auto exit = dynamic_cast<const ExitEvent*>(event.get()))
            {
                result.push_back(exit);
            }
        }
        return result;
    }

    vector<const NewChildEvent*> children() const
    {
        vector<const NewChildEvent*> result;
        for (const EventPtr& event : _sink->events)
        {
            if (auto child = dynamic_cast<const NewChildEvent*>(event.get()))
            {
                result.push_back(child);
            }
        }
        return result;
    }

    bool said(EventCategory level, const string& text) const
    {
        for (const EventPtr& event : _sink->events)
        {
            auto message = dynamic_cast<const MessageEvent*>(event.get());
            if (message && message->level == level
                && message->message.find(text) != string::npos)
            {
                return true;
            }
        }
        return false;
    }

    size_t count(EventCategory category) const
    {
        size_t n = 0;
        for (const EventPtr& event : _sink->events)
        {
            n += event->category() == category ? 1 : 0;
        }
        return n;
    }

    /* Everything the tracer said, for failure messages. */
    string dump() const
    {
        string text;
        for (const EventPtr& event : _sink->events)
        {
            text += event->to_string() + '\n';
        }
        return text;
    }
};

TEST_F(TraceTest, ShellRunningABuiltin)
{
    trace({"sh", "-c", "true"});

    ASSERT_TRUE(_status.has_value()) << dump();
    EXPECT_TRUE(WIFEXITED(_status.value()));
    EXPECT_EQ(WEXITSTATUS(_status.value()), 0);
    EXPECT_EQ(count(EventCategory::ERROR), 0u) << dump();

    vector<const ExecEvent*> all = execs();
    ASSERT_EQ(all.size(), 1u) << dump();
    const ExecEvent& exec = *all[0];
    EXPECT_TRUE(exec.succeeded());
    EXPECT_FALSE(exec.partial);
    ASSERT_TRUE(exec.argv.available());
    EXPECT_EQ(*exec.argv, (vector<string>{"sh", "-c", "true"}));
    EXPECT_TRUE(exec.newComm.has_value());
    EXPECT_TRUE(exec.postFds.has_value());
    // It got exactly our environment, which is its baseline.
    ASSERT_TRUE(exec.envDiff.has_value());
    EXPECT_TRUE(exec.envDiff->empty());
    EXPECT_EQ(_stats.execEvents, 1u);

    vector<const ExitEvent*> ended = exits();
    ASSERT_EQ(ended.size(), 1u) << dump();
    EXPECT_EQ(ended[0]->status, 0);
    EXPECT_EQ(ended[0]->tracee, exec.tracee);
}

TEST_F(TraceTest, MissingProgram)
{
    trace({"/nonexistent/exectrace-test-program"});

    ASSERT_TRUE(_status.has_value());
    EXPECT_EQ(wait_status_to_exit_code(_status.value()), 127);

    vector<const ExecEvent*> all = execs();
    ASSERT_EQ(all.size(), 1u) << dump();
    const ExecEvent& exec = *all[0];
    EXPECT_FALSE(exec.succeeded());
    EXPECT_EQ(exec.error, ENOENT);
    EXPECT_EQ(exec.category(), EventCategory::EXEC_FAILURE);
    EXPECT_FALSE(exec.newComm.has_value());
    EXPECT_FALSE(exec.postFds.has_value());
    EXPECT_TRUE(exec.fdDiff.closed.empty());
    EXPECT_TRUE(exec.fdDiff.unchanged.empty());
    EXPECT_TRUE(exec.fdDiff.opened.empty());
    ASSERT_TRUE(exec.filename.available());
    EXPECT_EQ(*exec.filename, "/nonexistent/exectrace-test-program");
}

TEST_F(TraceTest, ChildDiffIsAgainstItsParent)
{
    trace({FORK_EXEC_PATH, "/bin/true"});

    ASSERT_TRUE(_status.has_value());
    EXPECT_EQ(wait_status_to_exit_code(_status.value()), 0);
    EXPECT_EQ(count(EventCategory::NEW_CHILD), 1u) << dump();

    vector<const ExecEvent*> all = execs();
    ASSERT_EQ(all.size(), 2u) << dump();
    const ExecEvent& parent = *all[0];
    const ExecEvent& child = *all[1];
    EXPECT_TRUE(parent.succeeded());
    EXPECT_TRUE(child.succeeded());
    EXPECT_NE(parent.tracee, child.tracee);

    ASSERT_FALSE(child.parents.empty());
    EXPECT_EQ(child.parents[0].key, parent.tracee.value());

    // The only difference between the parent's environment and the child's
    // is what it changed between the fork and the exec.
    ASSERT_TRUE(child.envDiff.has_value());
    ASSERT_EQ(child.envDiff->added.size(), 1u);
    EXPECT_EQ(child.envDiff->added[0].first, "EXECTRACE_TEST_CHILD");
    EXPECT_EQ(child.envDiff->added[0].second, "1");
    EXPECT_TRUE(child.envDiff->removed.empty());
    EXPECT_TRUE(child.envDiff->changed.empty());

    EXPECT_EQ(exits().size(), 2u) << dump();
}

TEST_F(TraceTest, FilterKeepsSyscallsQuiet)
{
    _options.filterMode = FilterMode::ON;
    trace({GETPID_LOOP_PATH, "2000"});
    if (!_filterInstalled)
    {
        GTEST_SKIP() << "no seccomp-bpf filter on this machine";
    }

    ASSERT_TRUE(_status.has_value());
    EXPECT_EQ(wait_status_to_exit_code(_status.value()), 0);
    EXPECT_EQ(execs().size(), 1u) << dump();
    EXPECT_EQ(_stats.execEvents, 1u);
    EXPECT_EQ(_stats.syscallStops, 0u);
    EXPECT_GE(_stats.seccompStops, 1u);
}

TEST_F(TraceTest, SyscallStopsWithoutFilter)
{
    _options.filterMode = FilterMode::OFF;
    trace({GETPID_LOOP_PATH, "100"});

    ASSERT_TRUE(_status.has_value());
    EXPECT_EQ(wait_status_to_exit_code(_status.value()), 0);
    EXPECT_FALSE(_filterInstalled);
    EXPECT_EQ(execs().size(), 1u) << dump();
    EXPECT_EQ(_stats.seccompStops, 0u);
    EXPECT_GE(_stats.syscallStops, 200u); // entry and exit of each getpid
}

TEST_F(TraceTest, ExitCodeComesThrough)
{
    trace({"sh", "-c", "exit 7"});
    ASSERT_TRUE(_status.has_value());
    EXPECT_EQ(wait_status_to_exit_code(_status.value()), 7);
}

TEST_F(TraceTest, SignalsAreReported)
{
    _options.filterMode = FilterMode::OFF;
    trace({"sh", "-c", "kill -USR2 $$; exit 3"});

    ASSERT_TRUE(_status.has_value());
    // USR2 kills sh before it gets to the exit.
    ASSERT_TRUE(WIFSIGNALED(_status.value()));
    EXPECT_EQ(WTERMSIG(_status.value()), SIGUSR2);
    EXPECT_GE(count(EventCategory::OTHER_SIGNAL), 1u) << dump();
}

TEST_F(TraceTest, CancelWithKill)
{
    _options.teardown = Teardown::KILL;
    _options.command = {"sleep", "30"};
    _sink = make_shared<CollectingSink>();
    EventStream stream;
    stream.subscribe(_sink);

    Tracer tracer(_options, stream);
    tracer.start();
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        tracer.cancel();
    });
    auto started = std::chrono::steady_clock::now();
    _status = tracer.run();
    canceller.join();
    stream.close();

    EXPECT_LT(std::chrono::steady_clock::now() - started,
        std::chrono::seconds(10));
    ASSERT_TRUE(_status.has_value()) << dump();
    ASSERT_TRUE(WIFSIGNALED(_status.value()));
    EXPECT_EQ(WTERMSIG(_status.value()), SIGKILL);
}

TEST_F(TraceTest, CancelWithDetachLeavesItRunning)
{
    _options.filterMode = FilterMode::OFF;
    _options.command = {"sleep", "30"};
    _sink = make_shared<CollectingSink>();
    EventStream stream;
    stream.subscribe(_sink);

    Tracer tracer(_options, stream);
    tracer.start();
    pid_t root = tracer.root();
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        tracer.cancel();
    });
    _status = tracer.run();
    canceller.join();
    stream.close();

    EXPECT_FALSE(_status.has_value());
    EXPECT_EQ(kill(root, 0), 0); // still alive, just not ours anymore

    kill(root, SIGKILL);
    int status;
    EXPECT_EQ(waitpid(root, &status, 0), root);
}

TEST_F(TraceTest, DetachedTraceesCanStillExec)
{
    char tmpl[] = "/tmp/exectrace-test-XXXXXX";
    ASSERT_NE(mkdtemp(tmpl), nullptr);
    string dir = tmpl;
    string result = dir + "/result";

    _options.filterMode = FilterMode::OFF;
    _options.command = {"sh", "-c", "sleep 1; /bin/true; echo $? > " + result};
    _sink = make_shared<CollectingSink>();
    EventStream stream;
    stream.subscribe(_sink);

    Tracer tracer(_options, stream);
    tracer.start();
    pid_t root = tracer.root();
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        tracer.cancel();
    });
    _status = tracer.run();
    canceller.join();
    stream.close();
    EXPECT_FALSE(_status.has_value());

    // It's still our child even though we're not tracing it anymore.
    int status;
    ASSERT_EQ(waitpid(root, &status, 0), root);
    EXPECT_EQ(wait_status_to_exit_code(status), 0);

    std::ifstream file(result);
    string contents((std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>());
    EXPECT_EQ(contents, "0\n");
    unlink(result.c_str());
    rmdir(dir.c_str());
}

TEST_F(TraceTest, CancelWithDetachTerminatesFilteredTracees)
{
    _options.filterMode = FilterMode::ON;
    _options.command = {"sleep", "30"};
    _sink = make_shared<CollectingSink>();
    EventStream stream;
    stream.subscribe(_sink);

    Tracer tracer(_options, stream);
    tracer.start();
    if (!tracer.filter_installed())
    {
        kill(tracer.root(), SIGKILL);
        tracer.run();
        stream.close();
        GTEST_SKIP() << "no seccomp-bpf filter on this machine";
    }
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        tracer.cancel();
    });
    _status = tracer.run();
    canceller.join();
    stream.close();

    ASSERT_TRUE(_status.has_value()) << dump();
    ASSERT_TRUE(WIFSIGNALED(_status.value()));
    EXPECT_EQ(WTERMSIG(_status.value()), SIGTERM);
    EXPECT_TRUE(said(EventCategory::WARNING, "can't detach")) << dump();
}

TEST_F(TraceTest, CancelIsNeverLost)
{
    _options.teardown = Teardown::KILL;
    for (int i = 0; i < 20; ++i)
    {
        SCOPED_TRACE(i);
        _options.command = {"sleep", "30"};
        _sink = make_shared<CollectingSink>();
        EventStream stream;
        stream.subscribe(_sink);

        Tracer tracer(_options, stream);
        tracer.start();
        // Land the cancel anywhere from before run() starts waiting to well
        // after it has.
        std::thread canceller([&] {
            std::this_thread::sleep_for(std::chrono::microseconds(i * 250));
            tracer.cancel();
        });
        auto started = std::chrono::steady_clock::now();
        _status = tracer.run();
        canceller.join();
        stream.close();

        EXPECT_LT(std::chrono::steady_clock::now() - started,
            std::chrono::seconds(10));
        ASSERT_TRUE(_status.has_value()) << dump();
        EXPECT_TRUE(WIFSIGNALED(_status.value()));
    }
}

TEST_F(TraceTest, ExecFromAThread)
{
    for (FilterMode mode : {FilterMode::OFF, FilterMode::AUTO})
    {
        SCOPED_TRACE(mode == FilterMode::OFF ? "without filter" : "with filter");
        _options.filterMode = mode;
        trace({THREAD_EXEC_PATH, "/bin/true"});

        ASSERT_TRUE(_status.has_value()) << dump();
        EXPECT_EQ(wait_status_to_exit_code(_status.value()), 0);
        EXPECT_EQ(count(EventCategory::ERROR), 0u) << dump();

        vector<const NewChildEvent*> spawned = children();
        ASSERT_EQ(spawned.size(), 1u) << dump();
        EXPECT_EQ(spawned[0]->kind, CloneKind::THREAD);

        vector<const ExecEvent*> all = execs();
        ASSERT_EQ(all.size(), 2u) << dump();
        const ExecEvent& exec = *all[1];
        EXPECT_TRUE(exec.succeeded());
        ASSERT_TRUE(exec.tracee.has_value());
        // The thread took over the leader's pid but is still its own tracee.
        EXPECT_EQ(exec.tracee->pid, _root);
        EXPECT_EQ(exec.tracee->generation, spawned[0]->child.generation);
        ASSERT_TRUE(exec.argv.available());
        EXPECT_EQ(*exec.argv, (vector<string>{"/bin/true"}));

        vector<const ExitEvent*> ended = exits();
        ASSERT_EQ(ended.size(), 1u) << dump();
        EXPECT_EQ(ended[0]->tracee, exec.tracee);
    }
}

TEST_F(TraceTest, CloseOnExecFdsShowAsClosed)
{
    trace({FD_EXEC_PATH, "/bin/true"});

    ASSERT_TRUE(_status.has_value()) << dump();
    EXPECT_EQ(wait_status_to_exit_code(_status.value()), 0);
    vector<const ExecEvent*> all = execs();
    ASSERT_EQ(all.size(), 2u) << dump();
    const FdDiff& diff = all[1]->fdDiff;

    vector<int> closed;
    for (const FdInfo& info : diff.closed)
    {
        closed.push_back(info.fd);
        EXPECT_EQ(info.kind, FdKind::PIPE) << "fd " << info.fd;
        EXPECT_TRUE(info.cloexec) << "fd " << info.fd;
    }
    EXPECT_EQ(closed, (vector<int>{20, 21}));

    bool kept = false;
    for (const FdInfo& info : diff.unchanged)
    {
        if (info.fd == 22)
        {
            kept = true;
            EXPECT_EQ(info.kind, FdKind::FILE);
            EXPECT_EQ(info.target, "/dev/null");
            EXPECT_FALSE(info.cloexec);
        }
    }
    EXPECT_TRUE(kept);
    EXPECT_TRUE(diff.opened.empty());
}

/* Runs a setuid copy of getpid-loop. Needs root (to hand out the setuid bit
 * and to keep it under ptrace) and a file system that honours it. */
TEST_F(TraceTest, SetuidExecSwitchesToSyscallStops)
{
    if (geteuid() != 0)
    {
        GTEST_SKIP() << "needs root";
    }
    char tmpl[] = "exectrace-setuid-XXXXXX";
    ASSERT_NE(mkdtemp(tmpl), nullptr);
    string dir = tmpl;
    string program = dir + "/getpid-loop";
    {
        std::ifstream in(GETPID_LOOP_PATH, std::ios::binary);
        std::ofstream out(program, std::ios::binary);
        out << in.rdbuf();
    }
    ASSERT_EQ(chmod(dir.c_str(), 0755), 0);
    ASSERT_EQ(chown(program.c_str(), 65534, 65534), 0);
    ASSERT_EQ(chmod(program.c_str(), 04755), 0);

    _options.filterMode = FilterMode::ON;
    trace({program, "100"});
    unlink(program.c_str());
    rmdir(dir.c_str());

    if (!_filterInstalled)
    {
        GTEST_SKIP() << "no seccomp-bpf filter on this machine";
    }
    vector<const ExecEvent*> all = execs();
    ASSERT_EQ(all.size(), 1u) << dump();
    if (!all[0]->credentialsChanged)
    {
        GTEST_SKIP() << "the setuid bit wasn't honoured here";
    }

    ASSERT_TRUE(_status.has_value());
    EXPECT_EQ(wait_status_to_exit_code(_status.value()), 0);
    EXPECT_TRUE(said(EventCategory::WARNING, "credentials changed")) << dump();
    EXPECT_EQ(_policy, "syscall-stop");
    EXPECT_GE(_stats.syscallStops, 200u);
}

TEST_F(TraceTest, Pty)
{
    std::mutex lock;
    string output;
    _options.stdio = StdioMode::PTY;
    _options.terminalOutput = [&](std::string_view data) {
        std::scoped_lock<std::mutex> guard(lock);
        output.append(data.data(), data.size());
    };
    trace({"sh", "-c", "if [ -t 1 ]; then echo on-a-tty; fi"});

    ASSERT_TRUE(_status.has_value());
    EXPECT_EQ(wait_status_to_exit_code(_status.value()), 0);
    std::scoped_lock<std::mutex> guard(lock);
    EXPECT_NE(output.find("on-a-tty"), string::npos) << output;
}

TEST_F(TraceTest, PtyInput)
{
    std::mutex lock;
    string output;
    _options.stdio = StdioMode::PTY;
    _options.terminalOutput = [&](std::string_view data) {
        std::scoped_lock<std::mutex> guard(lock);
        output.append(data.data(), data.size());
    };
    _options.command = {"sh", "-c", "read line; echo \"got $line\""};
    _sink = make_shared<CollectingSink>();
    EventStream stream;
    stream.subscribe(_sink);
    {
        Tracer tracer(_options, stream);
        tracer.start();
        ASSERT_NE(tracer.terminal(), nullptr);
        EXPECT_TRUE(tracer.terminal()->write_input("hello\n"));
        _status = tracer.run();
    }
    stream.close();

    ASSERT_TRUE(_status.has_value());
    EXPECT_EQ(wait_status_to_exit_code(_status.value()), 0);
    std::scoped_lock<std::mutex> guard(lock);
    EXPECT_NE(output.find("got hello"), string::npos) << output;
}

TEST_F(TraceTest, StartWithoutCommandThrows)
{
    EventStream stream;
    Tracer tracer(_options, stream);
    EXPECT_THROW(tracer.start(), std::runtime_error);
}

TEST(DeferredSignals, GoBackInArrivalOrder)
{
    DeferredSignals deferred;
    EXPECT_TRUE(deferred.empty());
    EXPECT_EQ(deferred.release([](int) { return true; }), 0);

    deferred.hold(SIGCHLD);
    deferred.hold(SIGUSR2);
    deferred.hold(SIGTERM);
    EXPECT_FALSE(deferred.empty());

    vector<int> raised;
    int injected = deferred.release([&](int signal) {
        raised.push_back(signal);
        return true;
    });
    EXPECT_EQ(injected, SIGCHLD);
    EXPECT_EQ(raised, (vector<int>{SIGUSR2, SIGTERM}));
    EXPECT_TRUE(deferred.empty());
}

TEST(DeferredSignals, RaisedAgainOnlyOnce)
{
    DeferredSignals deferred;
    deferred.hold(SIGINT);
    deferred.hold(SIGUSR2);
    deferred.hold(SIGHUP);
    // SIGHUP couldn't be raised, so it'll never come back.
    deferred.release([](int signal) { return signal != SIGHUP; });

    EXPECT_FALSE(deferred.consume_reraised(SIGINT)); // injected, not raised
    EXPECT_FALSE(deferred.consume_reraised(SIGHUP));
    EXPECT_TRUE(deferred.consume_reraised(SIGUSR2));
    EXPECT_FALSE(deferred.consume_reraised(SIGUSR2));
}
