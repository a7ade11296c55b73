/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  exec
 *
 *      Puts together an ExecEvent from the two halves of an exec. Everything
 *      that has to be read before the old address space disappears is read
 *      at the entry, the outcome and the post-exec state at the exit.
 */
#ifndef EXECTRACE_EXEC_HPP
#define EXECTRACE_EXEC_HPP

#include <map>
#include <memory>
#include <unistd.h>

#include "event.hpp"
#include "process.hpp"
#include "procfs.hpp"
#include "system.hpp"

class ExecReconstructor
{
private:
    /* An exec that has entered the kernel but whose outcome we don't know. */
    struct PendingExec
    {
        std::unique_ptr<ExecEvent> event;
        Field<Credentials> credentials; // before the exec
        bool committed = false;         // PTRACE_EVENT_EXEC has been seen
    };

    ProcessTree& _tree;
    std::map<TraceeKey, PendingExec> _pending;

    /* Private functions, described in source file */
    PendingExec* find_pending(pid_t pid);
    std::unique_ptr<ExecEvent> finish_success(pid_t pid, PendingExec& pending);

public:
    explicit ExecReconstructor(ProcessTree& tree) : _tree(tree) { }

    ExecReconstructor(const ExecReconstructor&) = delete;

    /* Call at the syscall-entry-stop (or seccomp-stop) of execve/execveat.
     * Reads the arguments out of the tracee's memory and the rest out of
     * /proc, and tells the tracker that an exec is pending. Returns false if
     * the tracee disappeared while we were looking at it. Calling this again
     * for an exec that is already pending does nothing. */
    bool on_entry(pid_t pid, long syscall, const size_t args[SYS_ARG_MAX]);

    /* Call at PTRACE_EVENT_EXEC. The exec is now certain to succeed. */
    void on_committed(pid_t pid);

    /* Call at the syscall-exit-stop. Returns the finished event, or nullptr if
     * there was no pending exec for this tracee. */
    std::unique_ptr<ExecEvent> on_exit(pid_t pid, long retval);

    /* An exec that we never saw enter (e.g., a 32-bit exec that the seccomp
     * filter let through). Builds what it can out of /proc. Call with the
     * tracee stopped at PTRACE_EVENT_EXEC. */
    std::unique_ptr<ExecEvent> on_unannounced(pid_t pid);

    /* The tracee died in the middle of an exec. Returns a partial event if
     * the exec had already committed, otherwise nullptr. Either way, the
     * pending exec is gone afterwards. */
    std::unique_ptr<ExecEvent> abandon(pid_t pid);

    /* Moves a pending exec over after ProcessTree::on_exec_pid_change. */
    void rekey(const TraceeKey& from, const TraceeKey& to);

    bool is_pending(pid_t pid);
    size_t pending_count() const { return _pending.size(); }
};

#endif /* EXECTRACE_EXEC_HPP */
