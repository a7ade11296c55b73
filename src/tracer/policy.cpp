/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  policy
 *
 *      How tracees get resumed, which depends on whether the seccomp filter
 *      is doing the work of picking out the execs for us. The wait loop
 *      doesn't care which one it's got.
 */
#include "policy.hpp"
#include "system.hpp"

StopClass StopPolicy::classify(bool seccompStop,
                               SyscallInfo::Op op,
                               long syscall,
                               bool awaitingExecExit) const
{
    // A seccomp-stop is always at the entry of a syscall. The filter only
    // traces execs, but be careful in case something else installed one.
    if (seccompStop || op == SyscallInfo::SECCOMP)
    {
        return is_exec_syscall(syscall)
            ? StopClass::EXEC_ENTRY
            : StopClass::OTHER_ENTRY;
    }
    if (op == SyscallInfo::EXIT)
    {
        return awaitingExecExit ? StopClass::EXEC_EXIT : StopClass::OTHER_EXIT;
    }
    return is_exec_syscall(syscall)
        ? StopClass::EXEC_ENTRY
        : StopClass::OTHER_ENTRY;
}

std::unique_ptr<StopPolicy> make_stop_policy(bool filterInstalled)
{
    if (filterInstalled)
    {
        return std::make_unique<SeccompStopPolicy>();
    }
    return std::make_unique<SyscallStopPolicy>();
}
