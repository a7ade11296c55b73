/*  Copyright (C) 2020  Henry Harvey --- See LICENSE file
 *
 *  event
 *
 *      The events that come out of a trace. Each one is built once by the
 *      tracer and then never touched again, sinks get them as shared
 *      pointers to const.
 */
#include <unordered_map>
#include <unordered_set>
#include <sys/wait.h>
#include <fmt/core.h>

#include "event.hpp"
#include "system.hpp"
#include "util.hpp"

using std::string;
using std::string_view;
using std::vector;
using std::optional;
using fmt::format;

string_view get_category_name(EventCategory category)
{
    switch (category)
    {
        case EventCategory::WARNING:        return "warning";
        case EventCategory::ERROR:          return "error";
        case EventCategory::EXEC_SUCCESS:   return "exec-success";
        case EventCategory::EXEC_FAILURE:   return "exec-failure";
        case EventCategory::TRACEE_EXIT:    return "tracee-exit";
        case EventCategory::OTHER_SIGNAL:   return "other-signal";
        case EventCategory::INFO:           return "info";
        case EventCategory::NEW_CHILD:      return "new-child";
        default:                            return "?????";
    }
}

/******************************************************************************
 * DIFFS
 *****************************************************************************/

EnvDiff compute_env_diff(const Environment& before, const Environment& after)
{
    // name -> value, first occurrence wins
    std::unordered_map<string_view, string_view> old, now;
    for (const auto& [name, value] : before)
    {
        old.emplace(name, value);
    }
    for (const auto& [name, value] : after)
    {
        now.emplace(name, value);
    }

    EnvDiff diff;
    std::unordered_set<string_view> seen;
    for (const auto& [name, value] : after)
    {
        if (!seen.insert(name).second)
        {
            continue; // a later duplicate
        }
        auto it = old.find(name);
        if (it == old.end())
        {
            diff.added.emplace_back(name, value);
        }
        else if (it->second != value)
        {
            diff.changed.push_back(
                EnvChange{string(name), string(it->second), string(value)});
        }
    }
    seen.clear();
    for (const auto& [name, value] : before)
    {
        if (seen.insert(name).second && now.find(name) == now.end())
        {
            diff.removed.emplace_back(name);
        }
    }
    return diff;
}

FdDiff compute_fd_diff(const FdTable& before, const FdTable& after)
{
    FdDiff diff;
    for (const auto& [fd, info] : before)
    {
        auto it = after.find(fd);
        if (it == after.end())
        {
            diff.closed.push_back(info);
        }
        else
        {
            diff.unchanged.push_back(it->second);
        }
    }
    for (const auto& [fd, info] : after)
    {
        if (before.find(fd) == before.end())
        {
            diff.opened.push_back(info);
        }
    }
    return diff;
}

/******************************************************************************
 * EVENTS
 *****************************************************************************/

string describe_unavailable(int error)
{
    return format("<unavailable: {}>", strerror_s(error));
}

/* The "1234: " that goes in front of most events. */
static string prefix(const optional<TraceeKey>& key)
{
    return key.has_value() ? format("{}: ", key->to_string()) : "";
}

MessageEvent::MessageEvent(EventCategory level,
                           string message,
                           optional<TraceeKey> key)
    : level(level), message(std::move(message))
{
    tracee = key;
}

string MessageEvent::to_string() const
{
    return format("{}{}: {}", prefix(tracee), get_category_name(level),
        message);
}

NewChildEvent::NewChildEvent(TraceeKey parent, TraceeKey child, CloneKind kind)
    : child(child), kind(kind)
{
    tracee = parent;
}

string NewChildEvent::to_string() const
{
    return format("{}new {} {}", prefix(tracee),
        kind == CloneKind::THREAD ? "thread" : "child", child.to_string());
}

string ExecEvent::to_string() const
{
    string file = filename.available()
        ? quoted_string(*filename)
        : describe_unavailable(filename.error);
    string args = argv.available()
        ? quoted_list(*argv)
        : describe_unavailable(argv.error);
    string result = succeeded()
        ? "0"
        : format("-1 {} ({})", get_errno_name(error), strerror_s(error));
    return format("{}{}({}, {}) = {}{}", prefix(tracee),
        get_syscall_name(syscall), file, args, result,
        partial ? " (partial)" : "");
}

ExitEvent::ExitEvent(TraceeKey key, int status, string comm)
    : status(status), comm(std::move(comm))
{
    tracee = key;
}

string ExitEvent::to_string() const
{
    if (WIFSIGNALED(status))
    {
        return format("{}{} killed by {}{}", prefix(tracee), comm,
            get_signal_name(WTERMSIG(status)),
            WCOREDUMP(status) ? " (core dumped)" : "");
    }
    return format("{}{} exited with status {}", prefix(tracee), comm,
        WEXITSTATUS(status));
}

SignalEvent::SignalEvent(TraceeKey key, int signal, pid_t sender)
    : signal(signal), sender(sender)
{
    tracee = key;
}

string SignalEvent::to_string() const
{
    if (sender > 0)
    {
        return format("{}received {} from {}", prefix(tracee),
            get_signal_name(signal), sender);
    }
    return format("{}received {}", prefix(tracee), get_signal_name(signal));
}
