/*  Copyright (C) 2020  Henry Harvey --- See LICENSE file
 *
 *  ptrace
 *
 *      Functions that do all the tracing for us. I try to keep all the ptrace
 *      nastiness contained in this file.
 *
 *      Reading the tracee's memory just uses PTRACE_PEEKDATA. It's a context
 *      switch per word, but we only ever read argv and envp at an exec, so
 *      it isn't worth the hassle of process_vm_readv.
 */
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <grp.h>
#include <termios.h>
#include <sys/ioctl.h>
#include <sys/ptrace.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <sys/user.h>
#include <fmt/core.h>

#include "ptrace.hpp"
#include "seccomp.hpp"
#include "system.hpp"
#include "util.hpp"

using std::string;
using std::string_view;
using std::vector;
using std::runtime_error;
using fmt::format;

constexpr size_t WORD_SIZE = sizeof(size_t); // shrug

/* Stops a tracee from feeding us an unterminated argv forever. */
constexpr size_t MAX_ARRAY_ITEMS = 1 << 17;

int tracer_options(bool withSeccomp)
{
    int options = PTRACE_O_EXITKILL
                | PTRACE_O_TRACESYSGOOD
                | PTRACE_O_TRACEEXEC
                | PTRACE_O_TRACEFORK
                | PTRACE_O_TRACEVFORK
                | PTRACE_O_TRACECLONE;
    if (withSeccomp)
    {
        options |= PTRACE_O_TRACESECCOMP;
    }
    return options;
}

string resolve_program(string_view name)
{
    if (name.empty() || name.find('/') != string_view::npos)
    {
        return string(name);
    }
    const char* path = getenv("PATH");
    if (!path)
    {
        path = "/usr/local/bin:/usr/bin:/bin";
    }
    for (string_view dir : split_views(path, ':', false))
    {
        string candidate = join_path(dir.empty() ? "." : dir, name);
        struct stat info;
        if (stat(candidate.c_str(), &info) == 0
            && S_ISREG(info.st_mode)
            && access(candidate.c_str(), X_OK) == 0)
        {
            return candidate;
        }
    }
    return string(name);
}

/******************************************************************************
 * LAUNCHING THE TRACEE
 *****************************************************************************/

/* Which step of setting up the child failed. The child sends one of these
 * back to us along with an errno. */
enum SetupStage : int
{
    STAGE_READY,
    STAGE_TRACEME,
    STAGE_CHDIR,
    STAGE_STDIO,
    STAGE_TTY,
    STAGE_GROUPS,
    STAGE_SETGID,
    STAGE_SETUID,
};

struct SetupReport
{
    int stage;
    int err;
    int filterErr;
};

static string_view stage_name(int stage)
{
    switch (stage)
    {
        case STAGE_TRACEME: return "ptrace(PTRACE_TRACEME)";
        case STAGE_CHDIR:   return "chdir";
        case STAGE_STDIO:   return "dup2";
        case STAGE_TTY:     return "ioctl(TIOCSCTTY)";
        case STAGE_GROUPS:  return "setgroups";
        case STAGE_SETGID:  return "setgid";
        case STAGE_SETUID:  return "setuid";
        default:            return "setup";
    }
}

/* Only async-signal-safe stuff from here until the exec: the parent may have
 * other threads going (e.g., the event sinks), so malloc could be holding a
 * lock that nobody in this process will ever release. */
static void report_to_parent(int fd, int stage, int err, int filterErr)
{
    SetupReport report = {stage, err, filterErr};
    ssize_t n;
    do
    {
        n = write(fd, &report, sizeof(report));
    }
    while (n == -1 && errno == EINTR);
}

[[noreturn]] static void fail_child(int fd, int stage)
{
    report_to_parent(fd, stage, errno, 0);
    _exit(127);
}

/* Points stdin, stdout and stderr at fd. */
static bool redirect_stdio(int fd)
{
    for (int target = 0; target <= 2; ++target)
    {
        if (fd != target && dup2(fd, target) == -1)
        {
            return false;
        }
    }
    if (fd > 2)
    {
        close(fd);
    }
    return true;
}

[[noreturn]] static void setup_child(const LaunchOptions& opts,
                                     char* const* argv,
                                     int reportFd)
{
    // don't want children to inherit our blocked signals
    sigset_t set;
    sigfillset(&set);
    pthread_sigmask(SIG_UNBLOCK, &set, nullptr);

    if (ptrace(PTRACE_TRACEME, 0, 0, 0) == -1)
    {
        fail_child(reportFd, STAGE_TRACEME);
    }

    // sync up with tracer so that it can set the ptrace options
    raise(SIGSTOP);

    if (opts.cwd.has_value() && chdir(opts.cwd->c_str()) == -1)
    {
        fail_child(reportFd, STAGE_CHDIR);
    }

    if (opts.stdio == StdioMode::NULL_DEVICE)
    {
        int fd = open("/dev/null", O_RDWR);
        if (fd == -1 || !redirect_stdio(fd))
        {
            fail_child(reportFd, STAGE_STDIO);
        }
    }
    else if (opts.stdio == StdioMode::PTY)
    {
        // New session so that the pty can become our controlling terminal.
        if (setsid() == -1 || ioctl(opts.ttySlave, TIOCSCTTY, 0) == -1)
        {
            fail_child(reportFd, STAGE_TTY);
        }
        if (!redirect_stdio(opts.ttySlave))
        {
            fail_child(reportFd, STAGE_STDIO);
        }
    }

    if (opts.user.has_value())
    {
        const UserIdentity& user = opts.user.value();
        if (setgroups(user.groups.size(), user.groups.data()) == -1)
        {
            fail_child(reportFd, STAGE_GROUPS);
        }
        if (setgid(user.gid) == -1)
        {
            fail_child(reportFd, STAGE_SETGID);
        }
        if (setuid(user.uid) == -1)
        {
            fail_child(reportFd, STAGE_SETUID);
        }
    }

    // A filter that won't install isn't fatal, the tracer just falls back
    // to stopping at every syscall.
    int filterErr = 0;
    if (opts.filter != nullptr)
    {
        filterErr = install_filter(*opts.filter);
    }

    report_to_parent(reportFd, STAGE_READY, 0, filterErr);

    // sync up with tracer again so it can pick the resume request
    raise(SIGSTOP);

    execve(opts.program.c_str(), argv, environ);

    // The tracer will learn of the cause of failure via ptrace
    _exit(127);
}

/* Kill the specified PID with SIGKILL and reap it so that it's not a zombie.
 * If the PID is not our child, then this function fails silently. If some
 * other error occurs, then a SystemError is thrown. PRESERVES ERRNO!!!!. */
static void kill_and_reap(pid_t pid)
{
    int e = errno;

    if (kill(pid, SIGKILL) == -1 && errno != ESRCH)
    {
        throw SystemError(errno, "kill");
    }

    // Just keep looping until process disappears (causing waitpid to fail).
    while (waitpid(pid, nullptr, __WALL) != -1) { }

    errno = e;
}

/* Reads the child's report. Returns false if it never sent one. */
static bool read_report(int fd, SetupReport& report)
{
    ssize_t n;
    do
    {
        n = read(fd, &report, sizeof(report));
    }
    while (n == -1 && errno == EINTR);
    return n == (ssize_t)sizeof(report);
}

/* Helper function for start_tracee. Called when the tracee did not stop with
 * SIGSTOP as expected. If the child told us which step failed, then that is
 * what gets thrown. Otherwise we describe the wait status. */
[[noreturn]] static void throw_failed_start(pid_t pid, int status, int fd)
{
    if (WIFSTOPPED(status))
    {
        kill_and_reap(pid);
    }
    SetupReport report;
    bool gotReport = read_report(fd, report);
    close(fd);
    if (gotReport && report.stage != STAGE_READY)
    {
        throw SystemError(report.err, stage_name(report.stage));
    }
    if (WIFEXITED(status))
    {
        throw runtime_error(format("Tracee exited with {} during setup.",
            WEXITSTATUS(status)));
    }
    if (WIFSIGNALED(status))
    {
        throw runtime_error(format("Tracee killed by {} during setup.",
            get_signal_name(WTERMSIG(status))));
    }
    throw runtime_error(format("Tracee {} during setup.",
        diagnose_wait_status(status)));
}

/* Waits for the child's next SIGSTOP, throwing if anything else happened. */
static void expect_sigstop(pid_t pid, int fd)
{
    int status;
    if (waitpid(pid, &status, __WALL) == -1)
    {
        int e = errno;
        close(fd);
        throw SystemError(e, "waitpid");
    }
    if (!WIFSTOPPED(status) || WSTOPSIG(status) != SIGSTOP)
    {
        throw_failed_start(pid, status, fd);
    }
}

LaunchResult start_tracee(const LaunchOptions& options)
{
    if (options.argv.empty())
    {
        throw runtime_error("Can't start a tracee without any arguments.");
    }

    // Everything the child needs has to be ready before the fork.
    vector<char*> argv;
    for (const string& arg : options.argv)
    {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1)
    {
        throw SystemError(errno, "pipe2");
    }

    pid_t pid = fork();
    if (pid < 0)
    {
        int e = errno;
        close(fds[0]);
        close(fds[1]);
        throw SystemError(e, "fork");
    }
    if (pid == 0)
    {
        close(fds[0]);
        setup_child(options, argv.data(), fds[1]);
        /* NOTREACHED */
    }
    close(fds[1]);

    // First stop: PTRACE_TRACEME worked, so set up the options.
    expect_sigstop(pid, fds[0]);
    int ptraceOptions = tracer_options(options.filter != nullptr);
    if (ptrace(PTRACE_SETOPTIONS, pid, 0, ptraceOptions) == -1)
    {
        kill_and_reap(pid); // preserves errno
        int e = errno;
        close(fds[0]);
        throw SystemError(e, "ptrace(PTRACE_SETOPTIONS)");
    }
    if (ptrace(PTRACE_CONT, pid, 0, 0) == -1)
    {
        kill_and_reap(pid);
        int e = errno;
        close(fds[0]);
        throw SystemError(e, "ptrace(PTRACE_CONT)");
    }

    // Second stop: the launch options have all been applied.
    expect_sigstop(pid, fds[0]);
    SetupReport report;
    if (!read_report(fds[0], report) || report.stage != STAGE_READY)
    {
        close(fds[0]);
        kill_and_reap(pid);
        throw runtime_error("Tracee stopped without finishing its setup.");
    }
    close(fds[0]);

    LaunchResult result;
    result.pid = pid;
    result.filterError = report.filterErr;
    result.filterInstalled = options.filter != nullptr && report.filterErr == 0;
    return result;
}

/******************************************************************************
 * PTRACE REQUESTS
 *****************************************************************************/

bool resume_tracee(pid_t pid, int request, int signal)
{
    if (ptrace((__ptrace_request)request, pid, 0, signal) == -1)
    {
        if (errno == ESRCH)
        {
            return false;
        }
        throw SystemError(errno, request == PTRACE_CONT
            ? "ptrace(PTRACE_CONT)" : "ptrace(PTRACE_SYSCALL)");
    }
    return true;
}

bool detach_tracee(pid_t pid, int signal)
{
    if (ptrace(PTRACE_DETACH, pid, 0, signal) == -1)
    {
        if (errno == ESRCH)
        {
            return false;
        }
        throw SystemError(errno, "ptrace(PTRACE_DETACH)");
    }
    return true;
}

bool get_event_msg(pid_t pid, unsigned long& msg)
{
    if (ptrace(PTRACE_GETEVENTMSG, pid, 0, &msg) == -1)
    {
        if (errno == ESRCH)
        {
            return false;
        }
        throw SystemError(errno, "ptrace(PTRACE_GETEVENTMSG)");
    }
    return true;
}

bool get_signal_info(pid_t pid, siginfo_t& info, bool& groupStop)
{
    groupStop = false;
    if (ptrace(PTRACE_GETSIGINFO, pid, 0, &info) == -1)
    {
        if (errno == ESRCH)
        {
            return false;
        }
        if (errno == EINVAL)
        {
            groupStop = true;
            return true;
        }
        throw SystemError(errno, "ptrace(PTRACE_GETSIGINFO)");
    }
    return true;
}

static bool get_regs(pid_t pid, struct user_regs_struct& regs)
{
    if (ptrace(PTRACE_GETREGS, pid, 0, (void*)&regs) == -1)
    {
        if (errno == ESRCH)
        {
            return false;
        }
        throw SystemError(errno, "ptrace(PTRACE_GETREGS)");
    }
    return true;
}

bool which_syscall(pid_t pid, long& syscall, size_t args[SYS_ARG_MAX])
{
    struct user_regs_struct regs;
    if (!get_regs(pid, regs))
    {
        return false;
    }
    syscall = (long)regs.orig_rax;
    if (args != nullptr)
    {
        args[0] = regs.rdi;
        args[1] = regs.rsi;
        args[2] = regs.rdx;
        args[3] = regs.r10;
        args[4] = regs.r8;
        args[5] = regs.r9;
    }
    return true;
}

bool get_syscall_ret(pid_t pid, long& retval)
{
    struct user_regs_struct regs;
    if (!get_regs(pid, regs))
    {
        return false;
    }
    retval = (long)regs.rax;
    return true;
}

bool get_syscall_info(pid_t pid, SyscallInfo& info)
{
    struct __ptrace_syscall_info raw;
    memset(&raw, 0, sizeof(raw));
    if (ptrace(PTRACE_GET_SYSCALL_INFO, pid, (void*)sizeof(raw), &raw) == -1)
    {
        if (errno == ESRCH)
        {
            return false;
        }
        if (errno != EIO && errno != EINVAL)
        {
            throw SystemError(errno, "ptrace(PTRACE_GET_SYSCALL_INFO)");
        }
        // Old kernel. Fall back to the registers.
        info.op = SyscallInfo::UNKNOWN;
        info.arch = 0;
        return which_syscall(pid, info.nr, info.args)
            && get_syscall_ret(pid, info.retval);
    }

    info.arch = raw.arch;
    info.nr = -1;
    info.retval = 0;
    memset(info.args, 0, sizeof(info.args));
    switch (raw.op)
    {
        case PTRACE_SYSCALL_INFO_ENTRY:
            info.op = SyscallInfo::ENTRY;
            info.nr = (long)raw.entry.nr;
            memcpy(info.args, raw.entry.args, sizeof(info.args));
            break;
        case PTRACE_SYSCALL_INFO_SECCOMP:
            info.op = SyscallInfo::SECCOMP;
            info.nr = (long)raw.seccomp.nr;
            memcpy(info.args, raw.seccomp.args, sizeof(info.args));
            break;
        case PTRACE_SYSCALL_INFO_EXIT:
            info.op = SyscallInfo::EXIT;
            info.retval = (long)raw.exit.rval;
            // The exit info doesn't include the number, but orig_rax does.
            return which_syscall(pid, info.nr, nullptr);
        default:
            info.op = SyscallInfo::NONE;
            break;
    }
    return true;
}

/******************************************************************************
 * READING TRACEE MEMORY
 *****************************************************************************/

/* Reads one word out of the tracee. Returns false on ESRCH. */
static bool peek_word(pid_t pid, size_t addr, size_t& word)
{
    errno = 0;
    word = ptrace(PTRACE_PEEKDATA, pid, (void*)addr, 0);
    if (errno == ESRCH)
    {
        return false;
    }
    if (errno != 0)
    {
        throw SystemError(errno, "ptrace(PTRACE_PEEKDATA)");
    }
    return true;
}

bool copy_string_from_tracee(pid_t pid,
                             size_t src,
                             string& result,
                             size_t maxLen)
{
    result.clear();
    size_t addr = src;
    for (;;)
    {
        size_t word;
        if (!peek_word(pid, addr, word))
        {
            return false;
        }

        const char* ch = (const char*)&word;
        for (size_t i = 0; i < WORD_SIZE; ++i)
        {
            if (ch[i] == '\0')
            {
                return true;
            }
            result.push_back(ch[i]);
        }
        if (result.size() > maxLen)
        {
            throw SystemError(E2BIG, "copy_string_from_tracee");
        }
        addr += WORD_SIZE;
    }
}

bool copy_string_array_from_tracee(pid_t pid,
                                   size_t array,
                                   vector<string>& items)
{
    items.clear();
    if (array == 0)
    {
        return true; // Linux treats a null argv/envp as an empty one
    }
    for (;;)
    {
        size_t item;
        if (!peek_word(pid, array + items.size() * WORD_SIZE, item))
        {
            return false;
        }
        if (item == 0)
        {
            return true; // we hit the NULL terminator of the array
        }
        if (items.size() >= MAX_ARRAY_ITEMS)
        {
            throw SystemError(E2BIG, "copy_string_array_from_tracee");
        }

        items.emplace_back();
        if (!copy_string_from_tracee(pid, item, items.back()))
        {
            return false;
        }
    }
}
