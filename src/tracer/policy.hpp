/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  policy
 *
 *      How tracees get resumed, which depends on whether the seccomp filter
 *      is doing the work of picking out the execs for us. The wait loop
 *      doesn't care which one it's got.
 */
#ifndef EXECTRACE_POLICY_HPP
#define EXECTRACE_POLICY_HPP

#include <memory>
#include <string_view>

#include "ptrace.hpp"

/* What a syscall-stop or seccomp-stop turned out to be. */
enum class StopClass
{
    EXEC_ENTRY,
    EXEC_EXIT,
    OTHER_ENTRY,
    OTHER_EXIT,
};

class StopPolicy
{
public:
    virtual ~StopPolicy() { }

    virtual std::string_view name() const = 0;

    /* True if the tracees run under the seccomp filter, i.e., we only stop
     * at execs. */
    virtual bool filtered() const = 0;

    /* The ptrace request to resume a tracee with. awaitingExecExit is true
     * between an exec entry and its exit, when we always need the exit. */
    virtual int resume_request(bool awaitingExecExit) const = 0;

    /* Works out what kind of stop this is. `op` is what
     * PTRACE_GET_SYSCALL_INFO said, except that UNKNOWN must already have
     * been turned into ENTRY or EXIT by the caller (from its own record of
     * whether the tracee is in a syscall). Exit stops don't come with a
     * syscall number, so it's awaitingExecExit that makes one an exec exit. */
    StopClass classify(bool seccompStop,
                       SyscallInfo::Op op,
                       long syscall,
                       bool awaitingExecExit) const;
};

/* Tracees run with PTRACE_CONT and the filter stops them at execs. */
class SeccompStopPolicy : public StopPolicy
{
public:
    std::string_view name() const { return "seccomp-bpf"; }
    bool filtered() const { return true; }
    int resume_request(bool awaitingExecExit) const
    {
        return awaitingExecExit ? PTRACE_SYSCALL : PTRACE_CONT;
    }
};

/* Every syscall stops the tracee twice. Slow, but works everywhere. */
class SyscallStopPolicy : public StopPolicy
{
public:
    std::string_view name() const { return "syscall-stop"; }
    bool filtered() const { return false; }
    int resume_request(bool) const { return PTRACE_SYSCALL; }
};

/* SeccompStopPolicy if a filter got installed, otherwise SyscallStopPolicy. */
std::unique_ptr<StopPolicy> make_stop_policy(bool filterInstalled);

#endif /* EXECTRACE_POLICY_HPP */
