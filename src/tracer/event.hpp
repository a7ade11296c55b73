/*  Copyright (C) 2020  Henry Harvey --- See LICENSE file
 *
 *  event
 *
 *      The events that come out of a trace. Each one is built once by the
 *      tracer and then never touched again, sinks get them as shared
 *      pointers to const.
 */
#ifndef EXECTRACE_EVENT_HPP
#define EXECTRACE_EVENT_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "process.hpp"
#include "procfs.hpp"
#include "system.hpp"

/* What an event is about. The filter decides which of these get shown. */
enum class EventCategory
{
    WARNING,
    ERROR,
    EXEC_SUCCESS,
    EXEC_FAILURE,
    TRACEE_EXIT,
    OTHER_SIGNAL,
    INFO,           // informational messages from the tracer
    NEW_CHILD,      // forks and clones
    NUM_CATEGORIES, // must be the last item in the list.
};

/* e.g., "exec-success". These are also the names that --filter takes. */
std::string_view get_category_name(EventCategory category);

struct EnvChange
{
    std::string name;
    std::string before;
    std::string after;
};

/* How the environment passed to an exec differs from the baseline. */
struct EnvDiff
{
    Environment added;
    std::vector<std::string> removed;
    std::vector<EnvChange> changed;

    bool empty() const
    {
        return added.empty() && removed.empty() && changed.empty();
    }
};

/* Compares two environments by name (order doesn't matter). If a name shows
 * up more than once, then its first occurrence is the one that counts, which
 * is what getenv(3) does. */
EnvDiff compute_env_diff(const Environment& before, const Environment& after);

/* How the fd table after an exec differs from the one before it. */
struct FdDiff
{
    std::vector<FdInfo> closed;     // present before, absent after
    std::vector<FdInfo> unchanged;  // present in both (as they are after)
    std::vector<FdInfo> opened;     // absent before, present after
};

/* Compares two fd tables by fd number. */
FdDiff compute_fd_diff(const FdTable& before, const FdTable& after);

/* The base of everything that goes through the event stream. */
struct TraceEvent
{
    uint64_t sequence = 0;              // stamped by the EventStream
    std::optional<TraceeKey> tracee;    // none for session-wide messages

    virtual ~TraceEvent() { }

    virtual EventCategory category() const = 0;
    virtual std::string to_string() const = 0;
};

/* Warnings, errors and informational messages from the tracer itself. */
struct MessageEvent : TraceEvent
{
    EventCategory level;    // WARNING, ERROR or INFO
    std::string message;

    MessageEvent(EventCategory level, std::string message,
            std::optional<TraceeKey> tracee = {});

    virtual EventCategory category() const { return level; }
    virtual std::string to_string() const;
};

/* A tracee forked/cloned a new traced child. */
struct NewChildEvent : TraceEvent
{
    TraceeKey child;
    CloneKind kind;

    NewChildEvent(TraceeKey parent, TraceeKey child, CloneKind kind);

    virtual EventCategory category() const { return EventCategory::NEW_CHILD; }
    virtual std::string to_string() const;
};

/* One completed exec attempt (successful or not). */
struct ExecEvent : TraceEvent
{
    long syscall;                       // SYSCALL_EXECVE or SYSCALL_EXECVEAT
    std::vector<AncestorInfo> parents;  // parent first, root last
    std::string comm;                   // before the exec

    /* What the tracee handed to the kernel. */
    Field<std::string> filename;
    Field<std::string> resolvedPath;
    std::vector<Interpreter> interpreters;
    Field<std::vector<std::string>> argv;
    Field<std::vector<std::string>> envp;

    /* The tracee's state at the moment of the call. */
    Field<FdTable> fds;
    Field<std::string> cwd;

    /* Outcome */
    int error;                              // 0 on success, errno otherwise
    std::optional<std::string> newComm;     // success only
    std::optional<FdTable> postFds;         // success only
    std::optional<EnvDiff> envDiff;         // none if there was no baseline
    FdDiff fdDiff;                          // empty on failure

    /* The exec changed our effective ids (e.g., a setuid binary). */
    bool credentialsChanged;

    /* Set when some part of the exec wasn't observed (e.g., the tracee died
     * in the middle of it, or we never saw it enter the syscall). */
    bool partial;

    ExecEvent()
        : syscall(SYSCALL_NONE), error(0), credentialsChanged(false),
        partial(false) { }

    bool succeeded() const { return error == 0; }

    virtual EventCategory category() const
    {
        return succeeded()
            ? EventCategory::EXEC_SUCCESS
            : EventCategory::EXEC_FAILURE;
    }
    virtual std::string to_string() const;
};

/* A tracee exited or got killed. */
struct ExitEvent : TraceEvent
{
    int status;         // from wait(2)
    std::string comm;

    ExitEvent(TraceeKey tracee, int status, std::string comm);

    virtual EventCategory category() const
    {
        return EventCategory::TRACEE_EXIT;
    }
    virtual std::string to_string() const;
};

/* A signal (that isn't part of the trace machinery) was delivered. */
struct SignalEvent : TraceEvent
{
    int signal;
    pid_t sender;       // 0 if it came from the kernel or is unknown

    SignalEvent(TraceeKey tracee, int signal, pid_t sender);

    virtual EventCategory category() const
    {
        return EventCategory::OTHER_SIGNAL;
    }
    virtual std::string to_string() const;
};

/* Renders an unavailable field as "<unavailable: reason>". */
std::string describe_unavailable(int error);

#endif /* EXECTRACE_EVENT_HPP */
