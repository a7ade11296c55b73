/*  Copyright (C) 2020  Henry Harvey --- See LICENSE file
 *
 *  tracer
 *
 *      The supervisor. Launches the root tracee, runs the wait loop for the
 *      whole tree and decides what every tracee does next. Events come out
 *      through the EventStream, everything else (the process tree, the
 *      pending execs) stays private to the thread that calls run().
 */
#ifndef EXECTRACE_TRACER_HPP
#define EXECTRACE_TRACER_HPP

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <pthread.h>
#include <unistd.h>

#include "exec.hpp"
#include "filter.hpp"
#include "policy.hpp"
#include "process.hpp"
#include "ptrace.hpp"
#include "pty.hpp"
#include "seccomp.hpp"
#include "stream.hpp"

/* The tracer will raise this exception when an event appears to occur out-of-
 * order or at a strange time. It's caught by the wait loop, which reports it
 * as an error event and lets the tracee carry on. This could happen pretty
 * much due to three reasons:
 *
 *  (a) Someone steps in while the trace is happening and changes something
 *      or interferes with the tracer/tracee in a way that cause a ptrace call
 *      to fail or events to come in an unexpected sequence.
 *
 *  (b) Kernel bugs.
 *
 *  (c) Bugs in this program, likely due to not carefully enough implementing
 *      the ptrace semantics for some type of scenario.
 */
class BadTraceError : public std::exception
{
private:
    pid_t _pid;
    std::string _message;

public:
    /* Call this when a weird event occurs. */
    BadTraceError(pid_t pid, std::string_view message);

    const char* what() const noexcept { return _message.c_str(); }
    pid_t pid() const noexcept { return _pid; }
};

/* What happens to the tracees that are still around when the session ends
 * (the root exited or we were cancelled). */
enum class Teardown
{
    DETACH,     // leave them running (or drain them after the root exits)
    TERMINATE,  // SIGTERM
    KILL,       // SIGKILL
};

std::string_view get_teardown_name(Teardown teardown);

/* Signals that showed up while a tracee was in an exec. They go back in once
 * the exec is done, in the order they arrived: the first is injected when the
 * tracee is resumed and the rest are raised again. */
class DeferredSignals
{
private:
    std::deque<int> _held;
    std::vector<int> _reraised;

public:
    void hold(int signal) { _held.push_back(signal); }
    bool empty() const { return _held.empty(); }

    /* Hands back the signal to inject (0 if there's nothing held) and calls
     * raise for each of the others. raise returns false if it couldn't. */
    int release(const std::function<bool(int)>& raise);

    /* True (once per raise) if this signal is one that release raised again,
     * so it has already been reported. */
    bool consume_reraised(int signal);
};

/* Used for book-keeping by the Tracer class. One per traced pid/tid. */
struct Tracee
{
    enum State
    {
        ATTACHED,           // waiting for the initial SIGSTOP
        RUNNING,
        EXEC_ENTRY,         // inside an exec that hasn't committed yet
        EXEC_EXIT,          // the exec committed, waiting for the exit stop
        SIGNAL_DELIVERED,   // resumed with a signal to deliver
        EXITED,
    };

    pid_t pid;
    State state;
    bool stopped;       // in a ptrace-stop, i.e., we owe it a resume
    bool inSyscall;     // toggled at syscall stops (for old kernels)
    int signal;         // to be injected when next resumed

    DeferredSignals deferred;

    explicit Tracee(pid_t pid)
        : pid(pid), state(ATTACHED), stopped(false), inSyscall(false),
        signal(0) { }

    bool awaiting_exec() const
    {
        return state == EXEC_ENTRY || state == EXEC_EXIT;
    }
};

class Tracer
{
public:
    struct Options
    {
        std::vector<std::string> command;   // program and its arguments
        FilterMode filterMode = FilterMode::AUTO;
        EventFilter::Config filter;
        std::optional<std::string> user;    // run as this user (root only)
        std::optional<std::string> cwd;
        StdioMode stdio = StdioMode::INHERIT;
        Teardown teardown = Teardown::DETACH;

        /* Only used with StdioMode::PTY. Output defaults to our stdout. */
        TerminalRelay::OutputCallback terminalOutput;
        int terminalInput = -1;
    };

    struct Stats
    {
        uint64_t stops = 0;         // every ptrace-stop
        uint64_t syscallStops = 0;  // syscall-stops for anything but an exec
        uint64_t seccompStops = 0;
        uint64_t execEvents = 0;    // exec events emitted
    };

private:
    Options _options;
    EventFilter _filter;
    EventStream& _stream;

    ProcessTree _tree;
    ExecReconstructor _reconstructor;
    std::unique_ptr<StopPolicy> _policy;
    std::unordered_map<pid_t, Tracee> _tracees;

    /* Wait statuses for pids that we don't know about yet, i.e., a new child
     * that got to its first stop before its parent's fork event showed up. */
    std::unordered_map<pid_t, std::vector<int>> _parked;

    std::unique_ptr<PseudoTerminal> _pty;
    std::unique_ptr<TerminalRelay> _relay;

    pid_t _root;
    std::optional<int> _rootStatus;
    bool _filterInstalled;
    bool _downgraded;
    bool _tearingDown;
    Stats _stats;

    pthread_t _thread;
    std::atomic<bool> _running;
    std::atomic<int> _cancels;
    std::atomic<int> _cancelsHandled;

    /* Private functions, described in source file */
    void emit(std::unique_ptr<TraceEvent> event);
    void emit_message(EventCategory level,
                      std::string message,
                      std::optional<TraceeKey> key = {});
    void emit_exec(std::unique_ptr<ExecEvent> event);
    std::optional<TraceeKey> key_of(pid_t pid) const;
    Tracee& add_tracee(pid_t pid);
    bool resume(Tracee& tracee);
    void release_deferred(Tracee& tracee);
    void vanished(Tracee& tracee);
    void handle_status(pid_t pid, int status);
    void handle_exit(Tracee& tracee, int status);
    void handle_stopped(Tracee& tracee, int status);
    void handle_syscall_stop(Tracee& tracee, bool seccompStop);
    void handle_exec_entry(Tracee& tracee, long syscall, const size_t args[]);
    void handle_exec_exit(Tracee& tracee, long retval);
    void handle_new_child(Tracee& tracee, int status);
    void handle_exec_event(Tracee& tracee);
    void handle_signal_stop(Tracee& tracee, int signal);
    void handle_cancel();
    void wait_loop();
    void recover(pid_t pid);
    void signal_all(int signal);
    void detach_all();

public:
    Tracer(Options options, EventStream& stream);
    ~Tracer();

    Tracer(const Tracer&) = delete;
    Tracer(Tracer&&) = delete;

    /* Launches the root tracee and gets everything ready for run(). Throws a
     * SystemError or runtime_error if the tracee couldn't be started. The
     * root's exec failing isn't an error here, that shows up as an event. */
    void start();

    /* Runs the wait loop until no tracees are left. Returns the root's wait
     * status, or nothing if we detached before finding it out. */
    std::optional<int> run();

    /* Ends the session using the teardown policy. Safe to call from any
     * thread (and from more than once: the second time escalates a
     * detach/terminate to a kill). Returns once run() has acted on it or
     * returned. A detach becomes a terminate while the seccomp-bpf filter
     * is installed. */
    void cancel();

    /* Only meaningful once run() has returned (or from the run() thread). */
    const Stats& stats() const { return _stats; }
    bool filter_installed() const { return _filterInstalled; }
    std::string_view policy_name() const;
    pid_t root() const { return _root; }

    /* nullptr unless the tracee runs on a pty. */
    TerminalRelay* terminal() { return _relay.get(); }
};

#endif /* EXECTRACE_TRACER_HPP */
