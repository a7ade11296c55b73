/*  Copyright (C) 2020  Henry Harvey --- See LICENSE file
 *
 *  system
 *
 *      Syscall numbers, signal and errno names and a few helpers for making
 *      sense of the statuses that wait(2) hands back to us.
 */
#ifndef EXECTRACE_SYSTEM_HPP
#define EXECTRACE_SYSTEM_HPP

#include <string>
#include <string_view>

/* The register layout in ptrace.cpp, the syscall numbers below and the audit
 * architecture baked into the seccomp filter are all x86_64 specific. Porting
 * to another Linux architecture means touching all three. */
#if !defined(__x86_64__) || !defined(__linux__)
#error "exectrace only supports x86_64 Linux."
#endif

/* Throw this to describe a errno error. A bit nicer than std::system_error. */
class SystemError : public std::exception
{
private:
    std::string _msg;
    int _code;
public:
    /* The cause should be a function name or something similar. */
    SystemError(int err, std::string_view cause);
    const char* what() const noexcept { return _msg.c_str(); }
    int code() const noexcept { return _code; }
};

/* The syscalls that we care about. Numbers are from:
 *
 *  https://github.com/strace/strace/blob/master/linux/x86_64/syscallent.h
 */
enum SystemCall : int
{
    SYSCALL_CLONE = 56,
    SYSCALL_FORK = 57,
    SYSCALL_VFORK = 58,
    SYSCALL_EXECVE = 59,
    SYSCALL_EXIT = 60,
    SYSCALL_EXIT_GROUP = 231,
    SYSCALL_EXECVEAT = 322,
    SYSCALL_CLONE3 = 435,
    SYSCALL_NONE = -1,      // sentinel value
};

/* True for execve and execveat. */
inline bool is_exec_syscall(long syscall)
{
    return syscall == SYSCALL_EXECVE || syscall == SYSCALL_EXECVEAT;
}

/* No Linux syscall has more than 6 arguments. */
constexpr size_t SYS_ARG_MAX = 6;

/* Linux-internal error codes that are only visible to tracers (they show up
 * as syscall return values when a syscall is interrupted by a signal). */
constexpr int ERESTARTSYS = 512;
constexpr int ERESTARTNOINTR = 513;

/* Get the name corresponding to a syscall number. Only the syscalls listed in
 * the SystemCall enum have names, anything else comes back as "syscall_N". */
std::string get_syscall_name(long syscall);

/* Get the name corresponding to a signal number (or "?????" if none) */
std::string_view get_signal_name(int signal);

/* Returns the symbolic name of an errno value, e.g., "ENOENT". Unknown values
 * are returned as "E<number>". */
std::string get_errno_name(int errnoVal);

/* Returns a string describing the provided wait(2) child status. This will
 * include events like ptrace(2) events (see ptrace.hpp). If the event was
 * unknown, a string describing the raw number is returned. */
std::string diagnose_wait_status(int status);

/* Turns a wait status of a process that has ended into a shell-style exit
 * code (the exit status, or 128 + the number of the killing signal). */
int wait_status_to_exit_code(int status);

#endif /* EXECTRACE_SYSTEM_HPP */
