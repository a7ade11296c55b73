/*  Copyright (C) 2020  Henry Harvey --- See LICENSE file
 *
 *  system
 *
 *      Syscall numbers, signal and errno names and a few helpers for making
 *      sense of the statuses that wait(2) hands back to us.
 */
#include <cerrno>
#include <sys/wait.h>
#include <fmt/core.h>

#include "system.hpp"
#include "util.hpp"
#include "ptrace.hpp"

using std::string;
using std::string_view;
using fmt::format;

static const string_view signals[] = {
    "None",
    "SIGHUP",
    "SIGINT",
    "SIGQUIT",
    "SIGILL",
    "SIGTRAP",
    "SIGABRT",
    "SIGBUS",
    "SIGFPE",
    "SIGKILL",
    "SIGUSR1",
    "SIGSEGV",
    "SIGUSR2",
    "SIGPIPE",
    "SIGALRM",
    "SIGTERM",
    "SIGSTKFLT",
    "SIGCHLD",
    "SIGCONT",
    "SIGSTOP",
    "SIGTSTP",
    "SIGTTIN",
    "SIGTTOU",
    "SIGURG",
    "SIGXCPU",
    "SIGXFSZ",
    "SIGVTALRM",
    "SIGPROF",
    "SIGWINCH",
    "SIGIO",
    "SIGPWR",
    "SIGSYS",
};

struct ErrnoName
{
    int value;
    string_view name;
};

/* Only the ones that execve(2) and friends are documented to fail with, plus
 * a few that come up when poking at dying processes. */
static const ErrnoName errnoNames[] = {
    {EPERM, "EPERM"},
    {ENOENT, "ENOENT"},
    {ESRCH, "ESRCH"},
    {EINTR, "EINTR"},
    {EIO, "EIO"},
    {E2BIG, "E2BIG"},
    {ENOEXEC, "ENOEXEC"},
    {EBADF, "EBADF"},
    {ECHILD, "ECHILD"},
    {EAGAIN, "EAGAIN"},
    {ENOMEM, "ENOMEM"},
    {EACCES, "EACCES"},
    {EFAULT, "EFAULT"},
    {EBUSY, "EBUSY"},
    {EEXIST, "EEXIST"},
    {ENOTDIR, "ENOTDIR"},
    {EISDIR, "EISDIR"},
    {EINVAL, "EINVAL"},
    {ENFILE, "ENFILE"},
    {EMFILE, "EMFILE"},
    {ETXTBSY, "ETXTBSY"},
    {ENOSYS, "ENOSYS"},
    {ELOOP, "ELOOP"},
    {ENAMETOOLONG, "ENAMETOOLONG"},
    {ELIBBAD, "ELIBBAD"},
    {ERESTARTSYS, "ERESTARTSYS"},
    {ERESTARTNOINTR, "ERESTARTNOINTR"},
};

SystemError::SystemError(int err, string_view cause) : _code(err)
{
    _msg = format("{}: {} (errno={})", cause, strerror_s(err), err);
}

string_view get_signal_name(int signal)
{
    if (0 <= signal && (size_t)signal < ARRAY_SIZE(signals))
    {
        return signals[signal];
    }
    return "?????";
}

string get_syscall_name(long syscall)
{
    switch (syscall)
    {
        case SYSCALL_CLONE:         return "clone";
        case SYSCALL_FORK:          return "fork";
        case SYSCALL_VFORK:         return "vfork";
        case SYSCALL_EXECVE:        return "execve";
        case SYSCALL_EXIT:          return "exit";
        case SYSCALL_EXIT_GROUP:    return "exit_group";
        case SYSCALL_EXECVEAT:      return "execveat";
        case SYSCALL_CLONE3:        return "clone3";
        default:                    return format("syscall_{}", syscall);
    }
}

string get_errno_name(int errnoVal)
{
    for (const ErrnoName& entry : errnoNames)
    {
        if (entry.value == errnoVal)
        {
            return string(entry.name);
        }
    }
    return format("E{}", errnoVal);
}

string diagnose_wait_status(int status)
{
    if (WIFEXITED(status))
    {
        return format("exited with {}", WEXITSTATUS(status));
    }
    else if (WIFSIGNALED(status))
    {
        return format("killed by {} ({})",
            get_signal_name(WTERMSIG(status)), WTERMSIG(status));
    }
    else if (WIFSTOPPED(status))
    {
        if (IS_FORK_EVENT(status))
        {
            return "fork event";
        }
        else if (IS_VFORK_EVENT(status))
        {
            return "vfork event";
        }
        else if (IS_EXEC_EVENT(status))
        {
            return "exec event";
        }
        else if (IS_CLONE_EVENT(status))
        {
            return "clone event";
        }
        else if (IS_EXIT_EVENT(status))
        {
            return "exit event";
        }
        else if (IS_SECCOMP_EVENT(status))
        {
            return "seccomp event";
        }
        else if (IS_SYSCALL_EVENT(status))
        {
            return "syscall event";
        }
        else
        {
            return format("stopped by {} ({})",
                get_signal_name(WSTOPSIG(status)), WSTOPSIG(status));
        }
    }
    return format("unknown status {}", status);
}

int wait_status_to_exit_code(int status)
{
    if (WIFEXITED(status))
    {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status))
    {
        return 128 + WTERMSIG(status);
    }
    return 1;
}
