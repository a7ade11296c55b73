/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  seccomp
 *
 *      Builds the seccomp-BPF program that makes only execve and execveat
 *      stop the tracee. Everything else runs without us ever hearing
 *      about it, which is what makes tracing a busy build bearable.
 */
#include <cctype>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <sys/utsname.h>
#include <linux/audit.h>
#include <linux/seccomp.h>
#include <fmt/core.h>

#include "seccomp.hpp"
#include "system.hpp"
#include "parse.hpp"
#include "util.hpp"

using std::string;
using std::string_view;
using std::vector;
using fmt::format;

/* Syscall numbers with this bit set belong to the x32 ABI. */
constexpr uint32_t X32_SYSCALL_BIT = 0x40000000;

string_view get_filter_mode_name(FilterMode mode)
{
    switch (mode)
    {
        case FilterMode::AUTO:  return "auto";
        case FilterMode::ON:    return "on";
        case FilterMode::OFF:   return "off";
        default:                return "?????";
    }
}

bool kernel_supports_seccomp_stops(string_view release)
{
    vector<string_view> parts = split_views(release, '.');
    if (parts.size() < 2)
    {
        return false;
    }
    // The minor number may have junk after it, e.g., "8-arch1".
    string_view minorStr = parts[1];
    size_t end = 0;
    while (end < minorStr.size() && isdigit((unsigned char)minorStr[end]))
    {
        end++;
    }
    try
    {
        unsigned major = parse_number<unsigned>(parts[0]);
        unsigned minor = parse_number<unsigned>(minorStr.substr(0, end));
        return major > 4 || (major == 4 && minor >= 8);
    }
    catch (const ParseError&)
    {
        return false;
    }
}

FilterProbe FilterProbe::detect(bool userSwitch)
{
    FilterProbe probe;
    probe.userSwitch = userSwitch;
    probe.privileged = geteuid() == 0;

    struct utsname name;
    if (uname(&name) == 0)
    {
        probe.kernelRelease = name.release;
    }
    // PR_GET_SECCOMP fails with EINVAL when the kernel was built without it.
    bool hasSeccomp = prctl(PR_GET_SECCOMP, 0, 0, 0, 0) != -1;
    probe.kernelSupported = hasSeccomp
        && kernel_supports_seccomp_stops(probe.kernelRelease);
    return probe;
}

FilterBuild build_exec_filter(FilterMode mode, const FilterProbe& probe)
{
    FilterBuild build;
    if (mode == FilterMode::OFF)
    {
        build.reason = "disabled with --seccomp-bpf=off";
        return build;
    }
    if (probe.userSwitch)
    {
        build.reason = "the tracee changes user, which the filter would "
            "have to be installed across";
        return build;
    }
    if (!probe.kernelSupported)
    {
        build.reason = format("kernel {} doesn't support seccomp-stops "
            "(needs 4.8 or newer)", probe.kernelRelease.empty()
                ? "?" : probe.kernelRelease);
        return build;
    }

    const uint32_t archOffset = offsetof(struct seccomp_data, arch);
    const uint32_t nrOffset = offsetof(struct seccomp_data, nr);

    // BPF_JUMP(code, k, jt, jf): pc += (A op k) ? jt : jf
    build.program = {
        /* 0 */ BPF_STMT(BPF_LD | BPF_W | BPF_ABS, archOffset),
        /* 1 */ BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, AUDIT_ARCH_X86_64, 0, 4),
        /* 2 */ BPF_STMT(BPF_LD | BPF_W | BPF_ABS, nrOffset),
        /* 3 */ BPF_JUMP(BPF_JMP | BPF_JGE | BPF_K, X32_SYSCALL_BIT, 2, 0),
        /* 4 */ BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, SYSCALL_EXECVE, 2, 0),
        /* 5 */ BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, SYSCALL_EXECVEAT, 1, 0),
        /* 6 */ BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_ALLOW),
        /* 7 */ BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_TRACE),
    };
    return build;
}

int install_filter(const vector<sock_filter>& program)
{
    struct sock_fprog prog;
    prog.len = (unsigned short)program.size();
    prog.filter = const_cast<sock_filter*>(program.data());

    if (geteuid() != 0 && prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1)
    {
        return errno;
    }
    if (syscall(SYS_seccomp, SECCOMP_SET_MODE_FILTER, 0, &prog) == -1)
    {
        return errno;
    }
    return 0;
}
