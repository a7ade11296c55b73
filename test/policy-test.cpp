/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  policy-test
 *
 *      Stop classification and resume requests for both stop policies.
 */
#include <gtest/gtest.h>

#include "policy.hpp"

TEST(StopPolicy, Factory)
{
    EXPECT_TRUE(make_stop_policy(true)->filtered());
    EXPECT_EQ(make_stop_policy(true)->name(), "seccomp-bpf");
    EXPECT_FALSE(make_stop_policy(false)->filtered());
    EXPECT_EQ(make_stop_policy(false)->name(), "syscall-stop");
}

TEST(StopPolicy, ResumeRequests)
{
    SeccompStopPolicy seccomp;
    EXPECT_EQ(seccomp.resume_request(false), PTRACE_CONT);
    EXPECT_EQ(seccomp.resume_request(true), PTRACE_SYSCALL);

    SyscallStopPolicy syscall;
    EXPECT_EQ(syscall.resume_request(false), PTRACE_SYSCALL);
    EXPECT_EQ(syscall.resume_request(true), PTRACE_SYSCALL);
}

TEST(StopPolicy, ClassifiesTheSameForBothPolicies)
{
    SeccompStopPolicy seccomp;
    SyscallStopPolicy syscall;
    for (const StopPolicy* policy : {(const StopPolicy*)&seccomp,
                                     (const StopPolicy*)&syscall})
    {
        EXPECT_EQ(policy->classify(true, SyscallInfo::SECCOMP, SYSCALL_EXECVE,
            false), StopClass::EXEC_ENTRY);
        EXPECT_EQ(policy->classify(false, SyscallInfo::ENTRY, SYSCALL_EXECVEAT,
            false), StopClass::EXEC_ENTRY);
        EXPECT_EQ(policy->classify(false, SyscallInfo::ENTRY, 39, false),
            StopClass::OTHER_ENTRY);
        EXPECT_EQ(policy->classify(true, SyscallInfo::SECCOMP, 39, false),
            StopClass::OTHER_ENTRY);

        // Exit stops are told apart by whether an exec is pending.
        EXPECT_EQ(policy->classify(false, SyscallInfo::EXIT, SYSCALL_NONE,
            true), StopClass::EXEC_EXIT);
        EXPECT_EQ(policy->classify(false, SyscallInfo::EXIT, SYSCALL_EXECVE,
            false), StopClass::OTHER_EXIT);
    }
}
