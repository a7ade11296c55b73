/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  seccomp
 *
 *      Builds the seccomp-BPF program that makes only execve and execveat
 *      stop the tracee. Everything else runs without us ever hearing
 *      about it, which is what makes tracing a busy build bearable.
 */
#ifndef EXECTRACE_SECCOMP_HPP
#define EXECTRACE_SECCOMP_HPP

#include <string>
#include <string_view>
#include <vector>
#include <linux/filter.h>

/* --seccomp-bpf=auto|on|off */
enum class FilterMode
{
    AUTO,
    ON,
    OFF,
};

std::string_view get_filter_mode_name(FilterMode mode);

/* What we know about the machine when deciding whether to use a filter. */
struct FilterProbe
{
    std::string kernelRelease;  // uname -r
    bool kernelSupported;       // seccomp filters + post-4.8 stop ordering
    bool privileged;            // we can skip PR_SET_NO_NEW_PRIVS
    bool userSwitch;            // the tracee is going to change its uid/gid

    /* Looks at the running kernel and our own credentials. */
    static FilterProbe detect(bool userSwitch);
};

/* Returns true if a kernel release string such as "5.15.0-91-generic" is at
 * least 4.8. Before 4.8 the seccomp-stop came before the syscall-entry-stop
 * and resuming it with PTRACE_SYSCALL didn't give us the exit. */
bool kernel_supports_seccomp_stops(std::string_view release);

/* Result of build_exec_filter. Either there is a program, or there's a reason
 * why not. */
struct FilterBuild
{
    std::vector<sock_filter> program;
    std::string reason;

    bool supported() const { return !program.empty(); }
};

/* Compiles the filter for the given mode. Pure: nothing gets installed. The
 * program is:
 *
 *      arch != AUDIT_ARCH_X86_64       -> allow
 *      nr has the x32 bit set          -> allow
 *      nr == execve || nr == execveat  -> trace
 *      otherwise                       -> allow
 */
FilterBuild build_exec_filter(FilterMode mode, const FilterProbe& probe);

/* Installs the program on the calling thread (and its future children). Sets
 * PR_SET_NO_NEW_PRIVS first when we aren't root, which the kernel insists on.
 * Async-signal-safe, so it's fine between fork and exec. Returns 0 or an
 * errno value. */
int install_filter(const std::vector<sock_filter>& program);

#endif /* EXECTRACE_SECCOMP_HPP */
