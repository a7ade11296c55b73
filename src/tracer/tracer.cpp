/*  Copyright (C) 2020  Henry Harvey --- See LICENSE file
 *
 *  tracer
 *
 *      The supervisor. Launches the root tracee, runs the wait loop for the
 *      whole tree and decides what every tracee does next.
 *
 *      Every tracee that comes out of waitpid in a ptrace-stop is resumed
 *      before we go back to waiting, unless it disappeared underneath us.
 *      That's what keeps a tracee from ever getting past an exec before
 *      we've read what we need out of it.
 */
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <grp.h>
#include <pwd.h>
#include <signal.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <fmt/core.h>

#include "tracer.hpp"
#include "log.hpp"
#include "system.hpp"
#include "util.hpp"

using std::string;
using std::string_view;
using std::vector;
using std::optional;
using std::unique_ptr;
using std::make_unique;
using std::runtime_error;
using fmt::format;

/******************************************************************************
 * ERROR HANDLING
 *****************************************************************************/

BadTraceError::BadTraceError(pid_t pid, string_view msg) : _pid(pid)
{
    _message = format("BadTraceError (pid={}): {}", pid, msg);
}

/* Builds an error that describes a weird wait(2) status. Will probe around
 * in the tracee for information if possible. Just throw this error. */
static BadTraceError diagnose_bad_event(const Tracee& tracee,
                                        int status,
                                        string msg)
{
    msg += format(" ({})", diagnose_wait_status(status));
    if (WIFSTOPPED(status) && IS_SYSCALL_EVENT(status))
    {
        try
        {
            long syscall;
            if (which_syscall(tracee.pid, syscall, nullptr))
            {
                // Could be anything if this is actually an exit stop.
                msg += format(" (reg={})", get_syscall_name(syscall));
            }
            else
            {
                msg += " (got ESRCH when probing further)";
            }
        }
        catch (const SystemError& e)
        {
            msg += format(" (got error when probing further: {})", e.what());
        }
    }
    return BadTraceError(tracee.pid, msg);
}

string_view get_teardown_name(Teardown teardown)
{
    switch (teardown)
    {
        case Teardown::DETACH:      return "detach";
        case Teardown::TERMINATE:   return "terminate";
        case Teardown::KILL:        return "kill";
        default:                    return "?????";
    }
}

/******************************************************************************
 * SETUP
 *****************************************************************************/

/* Looks up everything the child needs for switching to another user. The
 * child can't do this itself (NSS isn't async-signal-safe). */
static UserIdentity resolve_user(const string& name)
{
    if (geteuid() != 0)
    {
        throw runtime_error("Only root can run the tracee as another user.");
    }

    long size = sysconf(_SC_GETPW_R_SIZE_MAX);
    vector<char> buffer(size > 0 ? size : 16384);
    struct passwd pwd;
    struct passwd* found = nullptr;
    int err = getpwnam_r(name.c_str(), &pwd, buffer.data(), buffer.size(),
        &found);
    if (err != 0)
    {
        throw SystemError(err, "getpwnam_r");
    }
    if (found == nullptr)
    {
        throw runtime_error(format("There's no user called '{}'.", name));
    }

    UserIdentity user;
    user.name = name;
    user.uid = pwd.pw_uid;
    user.gid = pwd.pw_gid;

    int count = 32;
    user.groups.resize(count);
    while (getgrouplist(name.c_str(), pwd.pw_gid, user.groups.data(),
            &count) == -1)
    {
        // count is now the number that's needed (on glibc anyway)
        if ((size_t)count <= user.groups.size())
        {
            count = user.groups.size() * 2;
        }
        user.groups.resize(count);
    }
    user.groups.resize(count);
    verbose("running as {} (uid={} gid={}, {} groups)", name, user.uid,
        user.gid, count);
    return user;
}

/* The default for where the output of the pty goes. */
static void write_to_stdout(string_view data)
{
    while (!data.empty())
    {
        ssize_t n = write(STDOUT_FILENO, data.data(), data.size());
        if (n == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return; // nowhere to complain to
        }
        data.remove_prefix(n);
    }
}

Tracer::Tracer(Options options, EventStream& stream)
    : _options(std::move(options)), _filter(_options.filter), _stream(stream),
    _reconstructor(_tree), _root(-1), _filterInstalled(false),
    _downgraded(false), _tearingDown(false), _running(false), _cancels(0),
    _cancelsHandled(0)
{
    vector<string> shown;
    for (EventCategory category : _filter.enabled())
    {
        shown.emplace_back(get_category_name(category));
    }
    verbose("showing {}", shown.empty() ? "nothing" : join(shown, ','));
}

Tracer::~Tracer()
{
    if (_relay)
    {
        _relay->stop();
    }
}

string_view Tracer::policy_name() const
{
    return _policy ? _policy->name() : "none";
}

void Tracer::start()
{
    if (_options.command.empty())
    {
        throw runtime_error("There's no command to trace.");
    }
    if (_root != -1)
    {
        throw runtime_error("The tracer has already been started.");
    }

    LaunchOptions launch;
    launch.argv = _options.command;
    launch.program = resolve_program(_options.command[0]);
    launch.cwd = _options.cwd;
    launch.stdio = _options.stdio;
    if (_options.user.has_value())
    {
        launch.user = resolve_user(_options.user.value());
    }

    FilterProbe probe = FilterProbe::detect(launch.user.has_value());
    FilterBuild build = build_exec_filter(_options.filterMode, probe);
    if (build.supported())
    {
        launch.filter = &build.program;
    }
    else if (_options.filterMode == FilterMode::ON)
    {
        emit_message(EventCategory::WARNING, format("seccomp-bpf filter was "
            "requested but is unavailable: {}", build.reason));
    }
    else
    {
        emit_message(EventCategory::INFO, format("not using a seccomp-bpf "
            "filter: {}", build.reason));
    }

    if (_options.stdio == StdioMode::PTY)
    {
        _pty = make_unique<PseudoTerminal>();
        launch.ttySlave = _pty->slave();
    }

    LaunchResult result = start_tracee(launch); // may throw
    _root = result.pid;
    log("started {} as {}", quoted_string(launch.program), _root);

    if (_pty)
    {
        _pty->close_slave();
        TerminalRelay::OutputCallback output = write_to_stdout;
        if (_options.terminalOutput)
        {
            output = _options.terminalOutput;
        }
        _relay = make_unique<TerminalRelay>(_pty->master(), std::move(output),
            _options.terminalInput);
    }

    if (launch.filter != nullptr && !result.filterInstalled)
    {
        emit_message(EventCategory::WARNING, format("couldn't install the "
            "seccomp-bpf filter ({}), stopping at every syscall instead",
            strerror_s(result.filterError)));
    }
    _filterInstalled = result.filterInstalled;
    _policy = make_stop_policy(_filterInstalled);
    verbose("using the {} policy", _policy->name());

    // The root is about to exec with our environment, so that's what its
    // first exec gets compared against.
    Baseline baseline;
    vector<string> env;
    for (char** var = environ; *var != nullptr; ++var)
    {
        env.emplace_back(*var);
    }
    baseline.env = parse_environment(env);
    baseline.envKnown = true;
    Field<FdTable> fds = read_fd_table(_root);
    if (fds.available())
    {
        baseline.fds = *fds;
        baseline.fdsKnown = true;
    }

    ProcessState& state = _tree.on_attach(_root, std::move(baseline));
    Field<string> comm = read_comm(_root);
    Field<string> cwd = read_cwd(_root);
    state.comm = comm.available() ? *comm : string(program_name());
    if (cwd.available())
    {
        state.cwd = *cwd;
    }

    // start_tracee leaves it in a SIGSTOP, which we swallow here.
    Tracee& tracee = add_tracee(_root);
    tracee.state = Tracee::RUNNING;
    tracee.stopped = true;
    if (!resume(tracee))
    {
        throw runtime_error("The tracee disappeared before it could exec.");
    }
}

/******************************************************************************
 * EVENTS
 *****************************************************************************/

void Tracer::emit(unique_ptr<TraceEvent> event)
{
    if (_filter.emit(event->category()))
    {
        _stream.publish(std::move(event));
    }
}

void Tracer::emit_message(EventCategory level,
                          string message,
                          optional<TraceeKey> key)
{
    debug("event: {}", message);
    emit(make_unique<MessageEvent>(level, std::move(message), key));
}

void Tracer::emit_exec(unique_ptr<ExecEvent> event)
{
    _stats.execEvents++;
    optional<TraceeKey> key = event->tracee;
    bool downgrade = _policy->filtered() && event->credentialsChanged;
    emit(std::move(event));

    if (downgrade && !_downgraded)
    {
        // The filter was installed with our credentials in mind. Don't rely
        // on it for a tracee that has changed its own.
        _downgraded = true;
        _policy = make_unique<SyscallStopPolicy>();
        emit_message(EventCategory::WARNING, "credentials changed across an "
            "exec, switching to syscall-stop tracing", key);
        log("switched to the {} policy", _policy->name());
    }
}

optional<TraceeKey> Tracer::key_of(pid_t pid) const
{
    if (const ProcessState* state = _tree.lookup(pid))
    {
        return state->key;
    }
    return std::nullopt;
}

/******************************************************************************
 * TRACEE BOOK-KEEPING
 *****************************************************************************/

Tracee& Tracer::add_tracee(pid_t pid)
{
    auto [it, inserted] = _tracees.emplace(pid, Tracee(pid));
    if (!inserted)
    {
        debug("replacing stale tracee record for {}", pid);
        it->second = Tracee(pid);
    }
    return it->second;
}

/* Resumes a stopped tracee with whatever the policy wants, delivering its
 * pending signal if it has one. Returns false if the tracee is gone, in
 * which case its exit status is still on the way. */
bool Tracer::resume(Tracee& tracee)
{
    if (!tracee.stopped)
    {
        return true;
    }
    int request = _policy->resume_request(tracee.awaiting_exec());
    int signal = tracee.signal;
    tracee.signal = 0;
    tracee.stopped = false;
    if (!resume_tracee(tracee.pid, request, signal))
    {
        debug("{} vanished before it could be resumed", tracee.pid);
        return false;
    }
    return true;
}

/* The tracee got killed while we were looking at it (ESRCH). There's nothing
 * to resume, the exit status shows up on its own. */
void Tracer::vanished(Tracee& tracee)
{
    debug("{} vanished, waiting for its exit status", tracee.pid);
    tracee.stopped = false;
}

int DeferredSignals::release(const std::function<bool(int)>& raise)
{
    if (_held.empty())
    {
        return 0;
    }
    int first = _held.front();
    _held.pop_front();
    for (int signal : _held)
    {
        if (raise(signal))
        {
            _reraised.push_back(signal);
        }
    }
    _held.clear();
    return first;
}

bool DeferredSignals::consume_reraised(int signal)
{
    auto it = std::find(_reraised.begin(), _reraised.end(), signal);
    if (it == _reraised.end())
    {
        return false;
    }
    _reraised.erase(it);
    return true;
}

/* Gives back the signals that were held onto during an exec. */
void Tracer::release_deferred(Tracee& tracee)
{
    if (tracee.deferred.empty())
    {
        return;
    }
    Field<pid_t> tgid = read_tgid(tracee.pid);
    pid_t group = tgid.available() ? *tgid : tracee.pid;
    pid_t tid = tracee.pid;
    tracee.signal = tracee.deferred.release([group, tid](int signal)
    {
        if (syscall(SYS_tgkill, group, tid, signal) == -1)
        {
            warning("couldn't raise {} again in {}: {}",
                get_signal_name(signal), tid, strerror_s(errno));
            return false;
        }
        return true;
    });
}

/******************************************************************************
 * STOP HANDLING
 *****************************************************************************/

void Tracer::handle_exec_entry(Tracee& tracee,
                               long syscall,
                               const size_t args[])
{
    if (tracee.awaiting_exec())
    {
        // With the filter still installed after a downgrade, the same exec
        // stops us twice (syscall-entry-stop and then seccomp-stop).
        debug("{} is already in an exec", tracee.pid);
        return;
    }
    if (!_reconstructor.on_entry(tracee.pid, syscall, args))
    {
        vanished(tracee);
        return;
    }
    tracee.state = Tracee::EXEC_ENTRY;
}

void Tracer::handle_exec_exit(Tracee& tracee, long retval)
{
    unique_ptr<ExecEvent> event = _reconstructor.on_exit(tracee.pid, retval);
    tracee.state = Tracee::RUNNING;
    if (event)
    {
        emit_exec(std::move(event));
    }
    release_deferred(tracee);
}

void Tracer::handle_syscall_stop(Tracee& tracee, bool seccompStop)
{
    SyscallInfo info;
    if (!get_syscall_info(tracee.pid, info))
    {
        vanished(tracee);
        return;
    }
    SyscallInfo::Op op = info.op;
    if (seccompStop)
    {
        op = SyscallInfo::SECCOMP;
    }
    else if (op == SyscallInfo::UNKNOWN)
    {
        op = tracee.inSyscall ? SyscallInfo::EXIT : SyscallInfo::ENTRY;
    }
    else if (op == SyscallInfo::NONE)
    {
        throw BadTraceError(tracee.pid, "Syscall-stop that isn't at the "
            "entry or exit of a syscall.");
    }
    tracee.inSyscall = op != SyscallInfo::EXIT;

    StopClass stop = _policy->classify(seccompStop, op, info.nr,
        tracee.awaiting_exec());
    switch (stop)
    {
        case StopClass::EXEC_ENTRY:
            handle_exec_entry(tracee, info.nr, info.args);
            break;
        case StopClass::EXEC_EXIT:
            handle_exec_exit(tracee, info.retval);
            break;
        case StopClass::OTHER_ENTRY:
        case StopClass::OTHER_EXIT:
            _stats.syscallStops++;
            break;
    }
    resume(tracee);
}

void Tracer::handle_new_child(Tracee& tracee, int status)
{
    unsigned long msg;
    if (!get_event_msg(tracee.pid, msg))
    {
        vanished(tracee);
        return;
    }
    pid_t child = (pid_t)msg;

    // A clone could be either. The tgid tells us which.
    CloneKind kind = CloneKind::PROCESS;
    if (IS_CLONE_EVENT(status))
    {
        Field<pid_t> tgid = read_tgid(child);
        if (tgid.available() && *tgid != child)
        {
            kind = CloneKind::THREAD;
        }
    }

    if (const ProcessState* stale = _tree.lookup(child))
    {
        emit_message(EventCategory::WARNING, format("pid {} was reused before "
            "its previous owner was seen exiting", child), stale->key);
    }
    TraceeKey childKey = _tree.on_fork(tracee.pid, child, kind).key;
    TraceeKey parentKey = _tree.lookup(tracee.pid)->key;
    verbose("{} -> new {} {}", parentKey.to_string(),
        kind == CloneKind::THREAD ? "thread" : "child", childKey.to_string());
    emit(make_unique<NewChildEvent>(parentKey, childKey, kind));

    add_tracee(child);
    resume(tracee);

    // The child may have gotten to its first stop before we got here.
    auto parked = _parked.find(child);
    if (parked != _parked.end())
    {
        vector<int> statuses = std::move(parked->second);
        _parked.erase(parked);
        for (int early : statuses)
        {
            handle_status(child, early);
        }
    }
}

void Tracer::handle_exec_event(Tracee& reported)
{
    pid_t pid = reported.pid;
    unsigned long msg;
    if (!get_event_msg(pid, msg))
    {
        vanished(reported);
        return;
    }
    pid_t former = (pid_t)msg;

    Tracee* tracee = &reported;
    if (former != pid)
    {
        // A thread other than the leader exec'd and now has the leader's pid.
        // The leader is gone without a word from the kernel.
        if (unique_ptr<ExecEvent> event = _reconstructor.abandon(pid))
        {
            emit_exec(std::move(event));
        }
        optional<TraceeKey> oldKey = key_of(former);
        TraceeKey newKey = _tree.on_exec_pid_change(former, pid);
        if (oldKey.has_value())
        {
            _reconstructor.rekey(oldKey.value(), newKey);
        }

        auto it = _tracees.find(former);
        Tracee moved = it != _tracees.end() ? std::move(it->second)
                                            : Tracee(former);
        if (it != _tracees.end())
        {
            _tracees.erase(it);
        }
        moved.pid = pid;
        moved.stopped = true;
        _tracees.erase(pid);
        tracee = &_tracees.emplace(pid, std::move(moved)).first->second;
        verbose("{} exec'd and took over pid {}", former, pid);
    }

    if (_reconstructor.is_pending(pid))
    {
        _reconstructor.on_committed(pid);
        tracee->state = Tracee::EXEC_EXIT;
    }
    else
    {
        emit_message(EventCategory::WARNING, "exec that was never seen "
            "entering the kernel (e.g., a 32-bit exec)", key_of(pid));
        tracee->state = Tracee::RUNNING;
        emit_exec(_reconstructor.on_unannounced(pid));
        release_deferred(*tracee);
    }
    resume(*tracee);
}

void Tracer::handle_signal_stop(Tracee& tracee, int signal)
{
    if (tracee.state == Tracee::ATTACHED)
    {
        tracee.state = Tracee::RUNNING;
        if (signal == SIGSTOP)
        {
            // The stop that every new child starts with.
            resume(tracee);
            return;
        }
        warning("{} started with {} instead of SIGSTOP", tracee.pid,
            get_signal_name(signal));
    }

    siginfo_t info;
    bool groupStop = false;
    if (!get_signal_info(tracee.pid, info, groupStop))
    {
        vanished(tracee);
        return;
    }
    if (groupStop)
    {
        debug("{} group-stop ({})", tracee.pid, get_signal_name(signal));
        resume(tracee);
        return;
    }

    // A deferred signal that we raised again was reported when it first
    // arrived.
    bool reported = info.si_pid == getpid()
        && tracee.deferred.consume_reraised(signal);
    if (!reported)
    {
        optional<TraceeKey> key = key_of(tracee.pid);
        if (key.has_value())
        {
            emit(make_unique<SignalEvent>(key.value(), signal, info.si_pid));
        }
    }

    if (tracee.awaiting_exec())
    {
        verbose("{} got {} during an exec, holding onto it", tracee.pid,
            get_signal_name(signal));
        tracee.deferred.hold(signal);
        resume(tracee);
        return;
    }
    tracee.signal = signal;
    tracee.state = Tracee::SIGNAL_DELIVERED;
    resume(tracee);
}

void Tracer::handle_stopped(Tracee& tracee, int status)
{
    _stats.stops++;
    if (tracee.state == Tracee::SIGNAL_DELIVERED)
    {
        tracee.state = Tracee::RUNNING;
    }

    if (IS_SECCOMP_EVENT(status))
    {
        _stats.seccompStops++;
        handle_syscall_stop(tracee, true);
    }
    else if (IS_SYSCALL_EVENT(status))
    {
        handle_syscall_stop(tracee, false);
    }
    else if (IS_FORK_EVENT(status)
        || IS_VFORK_EVENT(status)
        || IS_CLONE_EVENT(status))
    {
        handle_new_child(tracee, status);
    }
    else if (IS_EXEC_EVENT(status))
    {
        handle_exec_event(tracee);
    }
    else if (WSTOPSIG(status) == SIGTRAP && (status >> 16) != 0)
    {
        // Some event that we never asked for.
        resume(tracee);
        throw diagnose_bad_event(tracee, status, "Got an unexpected event.");
    }
    else
    {
        handle_signal_stop(tracee, WSTOPSIG(status));
    }
}

void Tracer::handle_exit(Tracee& tracee, int status)
{
    pid_t pid = tracee.pid;
    optional<TraceeKey> key = key_of(pid);

    if (tracee.awaiting_exec())
    {
        if (unique_ptr<ExecEvent> event = _reconstructor.abandon(pid))
        {
            emit_exec(std::move(event));
        }
        else
        {
            emit_message(EventCategory::WARNING, format("died during an exec "
                "({})", diagnose_wait_status(status)), key);
        }
    }

    const ProcessState* state = _tree.lookup(pid);
    if (state && state->leader)
    {
        emit(make_unique<ExitEvent>(state->key, status, state->comm));
    }
    _tree.on_exit(pid, status);
    tracee.state = Tracee::EXITED;
    _tracees.erase(pid); // `tracee` is gone now
    _parked.erase(pid);

    if (pid == _root)
    {
        _rootStatus = status;
        log("root {} ended ({}), {} tracees left", pid,
            diagnose_wait_status(status), _tracees.size());
        if (!_tracees.empty() && !_tearingDown)
        {
            if (_options.teardown == Teardown::TERMINATE)
            {
                _tearingDown = true;
                signal_all(SIGTERM);
            }
            else if (_options.teardown == Teardown::KILL)
            {
                _tearingDown = true;
                signal_all(SIGKILL);
            }
        }
    }
}

void Tracer::handle_status(pid_t pid, int status)
{
    auto it = _tracees.find(pid);
    if (it == _tracees.end())
    {
        debug("parking \"{}\" for unknown pid {}", diagnose_wait_status(status),
            pid);
        _parked[pid].push_back(status);
        return;
    }
    Tracee& tracee = it->second;

    if (WIFEXITED(status) || WIFSIGNALED(status))
    {
        handle_exit(tracee, status);
        return;
    }
    if (!WIFSTOPPED(status))
    {
        throw diagnose_bad_event(tracee, status,
            "Tracee hasn't ended but also hasn't stopped...");
    }
    debug("{}: {}", pid, diagnose_wait_status(status));
    tracee.stopped = true;
    handle_stopped(tracee, status);
}

/******************************************************************************
 * TEARDOWN
 *****************************************************************************/

void Tracer::signal_all(int signal)
{
    for (const auto& [pid, tracee] : _tracees)
    {
        if (kill(pid, signal) == -1 && errno != ESRCH)
        {
            warning("kill({}, {}): {}", pid, get_signal_name(signal),
                strerror_s(errno));
        }
    }
}

/* Brings each tracee to a stop and lets go of it without leaving it stopped
 * (or dead, PTRACE_O_EXITKILL would take care of that when we exit). */
void Tracer::detach_all()
{
    vector<pid_t> pids;
    for (const auto& [pid, tracee] : _tracees)
    {
        pids.push_back(pid);
    }
    // Children whose fork event we haven't seen are ours too.
    for (const auto& [pid, statuses] : _parked)
    {
        if (!statuses.empty() && WIFSTOPPED(statuses.back()))
        {
            add_tracee(pid).stopped = true;
            pids.push_back(pid);
        }
    }
    _parked.clear();

    vector<pid_t> detached;
    for (size_t i = 0; i < pids.size(); ++i)
    {
        pid_t pid = pids[i];
        auto it = _tracees.find(pid);
        if (it == _tracees.end())
        {
            continue;
        }
        if (!it->second.stopped)
        {
            if (syscall(SYS_tkill, pid, SIGSTOP) == -1)
            {
                debug("tkill({}, SIGSTOP): {}", pid, strerror_s(errno));
            }
            int status;
            pid_t waited;
            do
            {
                waited = waitpid(pid, &status, __WALL);
            }
            while (waited == -1 && errno == EINTR);
            if (waited == -1)
            {
                debug("waitpid({}): {}", pid, strerror_s(errno));
                _tree.forget(pid);
                _tracees.erase(pid);
                continue;
            }
            if (!WIFSTOPPED(status))
            {
                handle_exit(it->second, status);
                continue;
            }
            if (IS_FORK_EVENT(status)
                || IS_VFORK_EVENT(status)
                || IS_CLONE_EVENT(status))
            {
                unsigned long child;
                if (get_event_msg(pid, child) && !_tracees.count(child))
                {
                    add_tracee(child);
                    pids.push_back(child);
                }
            }
        }

        if (unique_ptr<ExecEvent> event = _reconstructor.abandon(pid))
        {
            emit_exec(std::move(event));
        }
        if (detach_tracee(pid, 0))
        {
            detached.push_back(pid);
        }
        _tree.forget(pid);
        _tracees.erase(pid);
    }

    // If it stopped for some other reason first, the SIGSTOP is still
    // pending. SIGCONT gets rid of it.
    for (pid_t pid : detached)
    {
        if (kill(pid, SIGCONT) == -1 && errno != ESRCH)
        {
            warning("kill({}, SIGCONT): {}", pid, strerror_s(errno));
        }
    }
    log("detached from {} tracees", detached.size());
}

void Tracer::handle_cancel()
{
    int seen = _cancels.load();
    bool again = _cancelsHandled.load() > 0;
    Teardown teardown = again ? Teardown::KILL : _options.teardown;
    if (teardown == Teardown::DETACH && _filterInstalled)
    {
        // The filter stays behind after a detach, and with nobody tracing
        // them SECCOMP_RET_TRACE makes every exec fail with ENOSYS.
        emit_message(EventCategory::WARNING, "can't detach from tracees that "
            "have the seccomp-bpf filter installed (their execs would fail), "
            "terminating them instead");
        teardown = Teardown::TERMINATE;
    }
    log("cancelled, tearing down ({})", get_teardown_name(teardown));
    _tearingDown = true;

    switch (teardown)
    {
        case Teardown::DETACH:
            detach_all();
            break;
        case Teardown::TERMINATE:
            signal_all(SIGTERM);
            break;
        case Teardown::KILL:
            signal_all(SIGKILL);
            break;
    }
    _cancelsHandled = seen;
}

void Tracer::cancel()
{
    int wanted = ++_cancels;
    if (!_running || pthread_equal(pthread_self(), _thread))
    {
        return; // run() checks _cancels before it waits
    }
    // Interrupts waitpid (the handler is installed without SA_RESTART). The
    // signal can land just before run() gets into waitpid, so keep sending
    // it until the cancel has been picked up.
    while (_running && _cancelsHandled.load() < wanted)
    {
        pthread_kill(_thread, SIGUSR1);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

/******************************************************************************
 * WAIT LOOP
 *****************************************************************************/

/* Waits for and handles stops until there are no tracees left. */
void Tracer::wait_loop()
{
    while (!_tracees.empty())
    {
        if (_cancels.load() > _cancelsHandled.load())
        {
            handle_cancel();
            continue;
        }

        int status;
        pid_t pid = waitpid(-1, &status, __WALL);
        if (pid == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            if (errno == ECHILD)
            {
                warning("no children left but {} tracees were expected",
                    _tracees.size());
                for (const auto& [tid, tracee] : _tracees)
                {
                    _tree.forget(tid);
                }
                _tracees.clear();
                break;
            }
            throw SystemError(errno, "waitpid");
        }

        try
        {
            handle_status(pid, status);
        }
        catch (const BadTraceError& e)
        {
            emit_message(EventCategory::ERROR, e.what(), key_of(e.pid()));
            recover(e.pid());
        }
        catch (const ProcessTreeError& e)
        {
            emit_message(EventCategory::ERROR, e.what(), key_of(pid));
            recover(pid);
        }
        catch (const SystemError& e)
        {
            emit_message(EventCategory::ERROR, e.what(), key_of(pid));
            recover(pid);
        }
    }
}

optional<int> Tracer::run()
{
    if (_root == -1)
    {
        throw runtime_error("The tracer hasn't been started.");
    }
    _thread = pthread_self();
    _running = true;
    try
    {
        wait_loop();
    }
    catch (...)
    {
        _running = false; // cancel() waits on this
        throw;
    }
    _running = false;

    if (_relay)
    {
        _relay->stop();
    }
    verbose("{} stops ({} syscall-stops, {} seccomp-stops), {} exec events",
        _stats.stops, _stats.syscallStops, _stats.seccompStops,
        _stats.execEvents);
    return _rootStatus;
}

/* After a failure in the middle of handling a stop, make sure the tracee
 * isn't left frozen. */
void Tracer::recover(pid_t pid)
{
    auto it = _tracees.find(pid);
    if (it == _tracees.end() || !it->second.stopped)
    {
        return;
    }
    try
    {
        resume(it->second);
    }
    catch (const SystemError& e)
    {
        error("couldn't resume {} after an error: {}", pid, e.what());
        it->second.stopped = false;
    }
}
