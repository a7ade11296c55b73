/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  seccomp-test
 *
 *      Runs the exec filter through a small classic-BPF interpreter, so the
 *      program can be checked without installing it.
 */
#include <cstring>
#include <stdexcept>
#include <linux/audit.h>
#include <linux/seccomp.h>
#include <gtest/gtest.h>

#include "seccomp.hpp"
#include "system.hpp"

using std::vector;

/* Only knows the instructions that the exec filter uses. */
static uint32_t run_filter(const vector<sock_filter>& program,
                           const seccomp_data& data)
{
    uint32_t acc = 0;
    size_t pc = 0;
    while (pc < program.size())
    {
        const sock_filter& insn = program[pc];
        switch (insn.code)
        {
            case BPF_LD | BPF_W | BPF_ABS:
                if (insn.k + sizeof(uint32_t) > sizeof(data))
                {
                    throw std::runtime_error("load out of bounds");
                }
                memcpy(&acc, reinterpret_cast<const char*>(&data) + insn.k,
                    sizeof(acc));
                pc++;
                break;
            case BPF_JMP | BPF_JEQ | BPF_K:
                pc += 1 + (acc == insn.k ? insn.jt : insn.jf);
                break;
            case BPF_JMP | BPF_JGE | BPF_K:
                pc += 1 + (acc >= insn.k ? insn.jt : insn.jf);
                break;
            case BPF_RET | BPF_K:
                return insn.k;
            default:
                throw std::runtime_error("unexpected instruction");
        }
    }
    throw std::runtime_error("fell off the end of the program");
}

static seccomp_data make_data(uint32_t arch, int nr)
{
    seccomp_data data;
    memset(&data, 0, sizeof(data));
    data.arch = arch;
    data.nr = nr;
    return data;
}

static FilterProbe good_probe()
{
    FilterProbe probe;
    probe.kernelRelease = "5.15.0";
    probe.kernelSupported = true;
    probe.privileged = false;
    probe.userSwitch = false;
    return probe;
}

TEST(ExecFilter, TracesOnlyExecs)
{
    FilterBuild build = build_exec_filter(FilterMode::AUTO, good_probe());
    ASSERT_TRUE(build.supported()) << build.reason;

    for (int nr = 0; nr < 450; ++nr)
    {
        uint32_t action = run_filter(build.program,
            make_data(AUDIT_ARCH_X86_64, nr));
        if (is_exec_syscall(nr))
        {
            EXPECT_EQ(action, (uint32_t)SECCOMP_RET_TRACE) << nr;
        }
        else
        {
            EXPECT_EQ(action, (uint32_t)SECCOMP_RET_ALLOW) << nr;
        }
    }
}

TEST(ExecFilter, ForeignArchitecturesPassThrough)
{
    FilterBuild build = build_exec_filter(FilterMode::ON, good_probe());
    ASSERT_TRUE(build.supported());
    EXPECT_EQ(run_filter(build.program, make_data(AUDIT_ARCH_I386, 11)),
        (uint32_t)SECCOMP_RET_ALLOW);
    // x32 execve
    EXPECT_EQ(run_filter(build.program,
        make_data(AUDIT_ARCH_X86_64, 0x40000000 | 520)),
        (uint32_t)SECCOMP_RET_ALLOW);
    EXPECT_EQ(run_filter(build.program,
        make_data(AUDIT_ARCH_X86_64, 0x40000000 | SYSCALL_EXECVE)),
        (uint32_t)SECCOMP_RET_ALLOW);
}

TEST(ExecFilter, UnsupportedCases)
{
    FilterProbe probe = good_probe();
    FilterBuild off = build_exec_filter(FilterMode::OFF, probe);
    EXPECT_FALSE(off.supported());
    EXPECT_FALSE(off.reason.empty());

    probe.userSwitch = true;
    EXPECT_FALSE(build_exec_filter(FilterMode::ON, probe).supported());

    probe = good_probe();
    probe.kernelSupported = false;
    FilterBuild old = build_exec_filter(FilterMode::AUTO, probe);
    EXPECT_FALSE(old.supported());
    EXPECT_NE(old.reason.find("5.15.0"), std::string::npos);
}

TEST(ExecFilter, KernelVersions)
{
    EXPECT_TRUE(kernel_supports_seccomp_stops("4.8.0"));
    EXPECT_TRUE(kernel_supports_seccomp_stops("4.19.0-6-amd64"));
    EXPECT_TRUE(kernel_supports_seccomp_stops("5.4.0-91-generic"));
    EXPECT_TRUE(kernel_supports_seccomp_stops("6.1"));
    EXPECT_TRUE(kernel_supports_seccomp_stops("4.10-arch1"));
    EXPECT_FALSE(kernel_supports_seccomp_stops("4.7.10"));
    EXPECT_FALSE(kernel_supports_seccomp_stops("3.10.0-1160.el7.x86_64"));
    EXPECT_FALSE(kernel_supports_seccomp_stops("garbage"));
    EXPECT_FALSE(kernel_supports_seccomp_stops(""));
}

TEST(ExecFilter, ModeNames)
{
    EXPECT_EQ(get_filter_mode_name(FilterMode::AUTO), "auto");
    EXPECT_EQ(get_filter_mode_name(FilterMode::ON), "on");
    EXPECT_EQ(get_filter_mode_name(FilterMode::OFF), "off");
}
