/*  Copyright (C) 2020  Henry Harvey --- See LICENSE file
 *
 *  ptrace
 *
 *      Functions that do all the tracing for us. I try to keep all the ptrace
 *      nastiness contained in this file.
 */
#ifndef EXECTRACE_PTRACE_HPP
#define EXECTRACE_PTRACE_HPP

#include <cstdint>
#include <vector>
#include <string>
#include <optional>
#include <unistd.h>
#include <signal.h>
#include <sys/ptrace.h>
#include <linux/filter.h>

#include "system.hpp"

/* See ptrace(2) man page for where these come from. These macros help us
 * diagnose the wait(2) statuses that we get when the tracee is stopped (so
 * you should check for WIFSTOPPED(status) first. These macros rely on the
 * ptrace options set by start_tracee.
 */
#define IS_EVENT(status, event) (((status) >> 8) == (SIGTRAP | ((event) << 8)))
#define IS_FORK_EVENT(status) IS_EVENT(status, PTRACE_EVENT_FORK)
#define IS_VFORK_EVENT(status) IS_EVENT(status, PTRACE_EVENT_VFORK)
#define IS_EXEC_EVENT(status) IS_EVENT(status, PTRACE_EVENT_EXEC)
#define IS_CLONE_EVENT(status) IS_EVENT(status, PTRACE_EVENT_CLONE)
#define IS_EXIT_EVENT(status) IS_EVENT(status, PTRACE_EVENT_EXIT)
#define IS_SECCOMP_EVENT(status) IS_EVENT(status, PTRACE_EVENT_SECCOMP)
#define IS_SYSCALL_EVENT(status) (WSTOPSIG(status) == (SIGTRAP | 0x80))

/* What the launched tracee gets as its stdin/stdout/stderr. */
enum class StdioMode
{
    INHERIT,        // same as ours
    NULL_DEVICE,    // all three point at /dev/null
    PTY,            // the slave side of a pseudo-terminal (see pty.hpp)
};

/* The identity to switch to before exec'ing (needs root). Everything here is
 * resolved in the parent since the child can't safely call into NSS. */
struct UserIdentity
{
    std::string name;
    uid_t uid;
    gid_t gid;
    std::vector<gid_t> groups;
};

/* Everything start_tracee needs to know to get the tracee going. */
struct LaunchOptions
{
    std::vector<std::string> argv;      // argv[0] is what the tracee sees
    std::string program;                // the path handed to execve
    std::optional<std::string> cwd;
    std::optional<UserIdentity> user;
    StdioMode stdio = StdioMode::INHERIT;
    int ttySlave = -1;                  // only used with StdioMode::PTY
    const std::vector<sock_filter>* filter = nullptr; // null if not wanted
};

struct LaunchResult
{
    pid_t pid;
    bool filterInstalled;
    int filterError;    // errno from installing the filter (0 if fine)
};

/* The options that every tracee is configured with. Children inherit these
 * from their parent through the fork/clone auto-attach:
 *
 *      - PTRACE_O_EXITKILL: If we end, then the tracee gets SIGKILL'ed.
 *      - PTRACE_O_TRACESYSGOOD: Helps disambiguate syscalls from other events.
 *      - PTRACE_O_TRACEEXEC: Stop at every successful exec.
 *      - PTRACE_O_TRACEFORK/VFORK/CLONE: Automatically trace new children.
 *      - PTRACE_O_TRACESECCOMP: Only when a filter is requested. Without it a
 *        SECCOMP_RET_TRACE makes the syscall fail with ENOSYS.
 */
int tracer_options(bool withSeccomp);

/* Searches $PATH for the program the same way execvp(3) would, except that we
 * don't try anything, we just look. Names containing a slash come back as is,
 * as do names that aren't found anywhere (so that the exec fails with ENOENT
 * in the tracee, where we can see it). */
std::string resolve_program(std::string_view name);

/* Starts the tracee. The sequence is:
 *
 *  (1) fork, then PTRACE_TRACEME and SIGSTOP in the child so that we can set
 *      the ptrace options.
 *  (2) the child applies the launch options (cwd, stdio, user, filter) and
 *      reports back over a close-on-exec pipe, then stops itself again.
 *
 * The function returns with the tracee sitting in that second SIGSTOP (a
 * signal-delivery-stop). Resume it with signal 0 to get it to exec. Throws a
 * SystemError if some step of the setup failed (the errno is the tracee's)
 * or a runtime_error if something weird happened. The tracee is reaped
 * before we throw. */
LaunchResult start_tracee(const LaunchOptions& options);

/* Resumes the traced process with the given ptrace request (PTRACE_SYSCALL or
 * PTRACE_CONT). If signal != 0, then the specified signal will be delivered.
 * Returns false if the tracee could not be found (ESRCH), throws SystemError
 * on any other failure. */
bool resume_tracee(pid_t pid, int request, int signal = 0);

/* Detaches from a stopped tracee. Same error conventions as resume_tracee. */
bool detach_tracee(pid_t pid, int signal = 0);

/* PTRACE_GETEVENTMSG. For fork events this is the new child's pid and for
 * exec events this is the tracee's former thread id. */
bool get_event_msg(pid_t pid, unsigned long& msg);

/* PTRACE_GETSIGINFO for a signal-delivery-stop. If this fails with EINVAL,
 * then the stop is a group-stop and groupStop is set instead. */
bool get_signal_info(pid_t pid, siginfo_t& info, bool& groupStop);

/* What PTRACE_GET_SYSCALL_INFO tells us about the current syscall stop. */
struct SyscallInfo
{
    enum Op
    {
        NONE,
        ENTRY,
        EXIT,
        SECCOMP,
        UNKNOWN,    // the kernel doesn't have PTRACE_GET_SYSCALL_INFO
    };

    Op op;
    uint32_t arch;
    long nr;
    size_t args[SYS_ARG_MAX];
    long retval;
};

/* Fills in info for the current syscall-stop or seccomp-stop. On kernels that
 * predate PTRACE_GET_SYSCALL_INFO (< 5.3) op comes back as UNKNOWN and the
 * number and arguments are read from the registers instead, so the caller
 * has to work out entry vs exit itself. */
bool get_syscall_info(pid_t pid, SyscallInfo& info);

/* Find out the syscall number and arguments from the registers. Only makes
 * sense in a syscall-entry-stop or seccomp-stop. */
bool which_syscall(pid_t pid, long& syscall, size_t args[SYS_ARG_MAX]);

/* Get the return value of the syscall when in a syscall-exit-stop. */
bool get_syscall_ret(pid_t pid, long& retval);

/* Copies a null-termianted string from the address space of the tracee to
 * our own address space. Throws a SystemError on failure (e.g., EIO) and
 * returns false if the tracee doesn't exist anymore. Gives up with E2BIG
 * past maxLen bytes. */
bool copy_string_from_tracee(pid_t tracee,
                             size_t src,
                             std::string& result,
                             size_t maxLen = 1 << 20);

/* Copies a null-terminated string array (such as the argv or envp arrays)
 * from the address space of the tracee and stores the result in a vector.
 * Same error conventions as copy_string_from_tracee. */
bool copy_string_array_from_tracee(pid_t tracee,
                                   size_t traceeAddr,
                                   std::vector<std::string>& result);

#endif /* EXECTRACE_PTRACE_HPP */
