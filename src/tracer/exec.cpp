/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  exec
 *
 *      Puts together an ExecEvent from the two halves of an exec. Everything
 *      that has to be read before the old address space disappears is read
 *      at the entry, the outcome and the post-exec state at the exit.
 */
#include <cerrno>
#include <fcntl.h>
#include <fmt/core.h>

#include "exec.hpp"
#include "ptrace.hpp"
#include "log.hpp"
#include "util.hpp"

using std::string;
using std::vector;
using std::unique_ptr;
using std::make_unique;
using fmt::format;

/* Reads a string out of the tracee into a Field. Returns false if the tracee
 * is gone. A bad address (EFAULT/EIO) just makes the field unavailable, the
 * exec itself will fail the same way. */
static bool read_string_field(pid_t pid, size_t addr, Field<string>& field)
{
    if (addr == 0)
    {
        field = Field<string>::unavailable(EFAULT);
        return true;
    }
    string str;
    try
    {
        if (!copy_string_from_tracee(pid, addr, str))
        {
            return false;
        }
        field = Field<string>(std::move(str));
    }
    catch (const SystemError& e)
    {
        field = Field<string>::unavailable(e.code());
    }
    return true;
}

/* Same as read_string_field but for argv/envp. */
static bool read_array_field(pid_t pid,
                             size_t addr,
                             Field<vector<string>>& field)
{
    vector<string> items;
    try
    {
        if (!copy_string_array_from_tracee(pid, addr, items))
        {
            return false;
        }
        field = Field<vector<string>>(std::move(items));
    }
    catch (const SystemError& e)
    {
        field = Field<vector<string>>::unavailable(e.code());
    }
    return true;
}

ExecReconstructor::PendingExec* ExecReconstructor::find_pending(pid_t pid)
{
    const ProcessState* state = _tree.lookup(pid);
    if (!state)
    {
        return nullptr;
    }
    auto it = _pending.find(state->key);
    return it == _pending.end() ? nullptr : &it->second;
}

bool ExecReconstructor::is_pending(pid_t pid)
{
    return find_pending(pid) != nullptr;
}

bool ExecReconstructor::on_entry(pid_t pid,
                                 long syscall,
                                 const size_t args[SYS_ARG_MAX])
{
    const ProcessState* state = _tree.lookup(pid);
    if (!state)
    {
        warning("exec entry for untracked pid {}", pid);
        return true;
    }
    if (_pending.find(state->key) != _pending.end())
    {
        debug("{} already has a pending exec", state->key.to_string());
        return true;
    }

    auto event = make_unique<ExecEvent>();
    event->tracee = state->key;
    event->syscall = syscall;
    event->parents = _tree.parent_chain(state->key);
    event->comm = state->comm;

    int dirfd = AT_FDCWD;
    int flags = 0;
    size_t pathAddr, argvAddr, envpAddr;
    if (syscall == SYSCALL_EXECVEAT)
    {
        dirfd = (int)args[0];
        pathAddr = args[1];
        argvAddr = args[2];
        envpAddr = args[3];
        flags = (int)args[4];
    }
    else
    {
        pathAddr = args[0];
        argvAddr = args[1];
        envpAddr = args[2];
    }

    if (!read_string_field(pid, pathAddr, event->filename)
        || !read_array_field(pid, argvAddr, event->argv)
        || !read_array_field(pid, envpAddr, event->envp))
    {
        return false;
    }

    event->cwd = read_cwd(pid);
    event->fds = read_fd_table(pid);
    if (event->filename.available())
    {
        event->resolvedPath = resolve_exec_path(pid, dirfd,
            *event->filename, flags);
    }
    else
    {
        event->resolvedPath = Field<string>::unavailable(event->filename.error);
    }
    if (event->resolvedPath.available())
    {
        event->interpreters = resolve_interpreters(*event->resolvedPath,
            event->cwd.available() ? *event->cwd : "/");
    }

    // The diff is against the baseline as it stands before the exec, so it
    // can be worked out now (failed execs get one too).
    if (state->baseline && state->baseline->envKnown
        && event->envp.available())
    {
        event->envDiff = compute_env_diff(state->baseline->env,
            parse_environment(*event->envp));
    }

    PendingExec pending;
    pending.credentials = read_credentials(pid);
    pending.event = std::move(event);

    ExecBoundary boundary;
    boundary.phase = ExecBoundary::ENTRY;
    if (pending.event->fds.available())
    {
        boundary.fds = *pending.event->fds;
    }
    if (pending.event->cwd.available())
    {
        boundary.cwd = *pending.event->cwd;
    }
    TraceeKey key = state->key;
    _tree.on_exec_boundary(pid, boundary);

    verbose("{} entered {}({})", key.to_string(), get_syscall_name(syscall),
        pending.event->filename.available()
            ? quoted_string(*pending.event->filename) : "?");
    _pending.emplace(key, std::move(pending));
    return true;
}

void ExecReconstructor::on_committed(pid_t pid)
{
    if (PendingExec* pending = find_pending(pid))
    {
        pending->committed = true;
    }
}

/* Reads the post-exec state, updates the tracker and hands back the event.
 * The pending exec is erased (if it was ever stored). */
unique_ptr<ExecEvent> ExecReconstructor::finish_success(pid_t pid,
                                                        PendingExec& pending)
{
    unique_ptr<ExecEvent> event = std::move(pending.event);
    event->error = 0;

    Field<string> comm = read_comm(pid);
    Field<string> cwd = read_cwd(pid);
    Field<FdTable> fds = read_fd_table(pid);
    Field<Credentials> creds = read_credentials(pid);

    if (comm.available())
    {
        event->newComm = *comm;
    }
    if (fds.available())
    {
        event->postFds = *fds;
        if (event->fds.available())
        {
            event->fdDiff = compute_fd_diff(*event->fds, *fds);
        }
    }
    if (creds.available())
    {
        event->credentialsChanged = exec_changed_credentials(
            pending.credentials, *creds);
    }

    ExecBoundary boundary;
    boundary.phase = ExecBoundary::EXIT;
    boundary.success = true;
    if (fds.available())
    {
        boundary.fds = *fds;
    }
    if (event->envp.available())
    {
        boundary.env = parse_environment(*event->envp);
    }
    if (comm.available())
    {
        boundary.comm = *comm;
    }
    if (cwd.available())
    {
        boundary.cwd = *cwd;
    }
    _tree.on_exec_boundary(pid, boundary);

    if (event->tracee.has_value())
    {
        _pending.erase(event->tracee.value()); // `pending` is gone now
    }
    return event;
}

unique_ptr<ExecEvent> ExecReconstructor::on_exit(pid_t pid, long retval)
{
    PendingExec* pending = find_pending(pid);
    if (!pending)
    {
        return nullptr;
    }
    if (pending->committed || retval == 0)
    {
        return finish_success(pid, *pending);
    }

    unique_ptr<ExecEvent> event = std::move(pending->event);
    // A failed exec always returns -errno. Anything else means we've lost
    // track of which stop this is, so don't make up an errno for it.
    event->error = retval < 0 ? (int)-retval : EINVAL;
    if (retval > 0)
    {
        event->partial = true;
    }

    ExecBoundary boundary;
    boundary.phase = ExecBoundary::EXIT;
    boundary.success = false;
    _tree.on_exec_boundary(pid, boundary);

    _pending.erase(event->tracee.value());
    return event;
}

unique_ptr<ExecEvent> ExecReconstructor::on_unannounced(pid_t pid)
{
    auto event = make_unique<ExecEvent>();
    event->partial = true;
    event->syscall = SYSCALL_EXECVE; // we can't tell which one it was

    if (const ProcessState* state = _tree.lookup(pid))
    {
        event->tracee = state->key;
        event->parents = _tree.parent_chain(state->key);
        event->comm = state->comm;
    }
    else
    {
        event->tracee = TraceeKey{pid, 0};
    }

    event->filename = read_exe(pid);
    event->resolvedPath = event->filename;
    event->argv = read_cmdline(pid);
    event->envp = read_environ(pid);
    event->cwd = read_cwd(pid);

    if (const ProcessState* state = _tree.lookup(pid))
    {
        if (state->baseline && state->baseline->envKnown
            && event->envp.available())
        {
            event->envDiff = compute_env_diff(state->baseline->env,
                parse_environment(*event->envp));
        }
    }

    PendingExec pending;
    pending.event = std::move(event);
    pending.committed = true;
    return finish_success(pid, pending);
}

unique_ptr<ExecEvent> ExecReconstructor::abandon(pid_t pid)
{
    PendingExec* pending = find_pending(pid);
    if (!pending)
    {
        return nullptr;
    }

    ExecBoundary boundary;
    boundary.phase = ExecBoundary::EXIT;
    boundary.success = false;
    _tree.on_exec_boundary(pid, boundary);

    unique_ptr<ExecEvent> event = std::move(pending->event);
    bool committed = pending->committed;
    _pending.erase(event->tracee.value());
    if (!committed)
    {
        return nullptr;
    }
    event->error = 0;
    event->partial = true;
    return event;
}

void ExecReconstructor::rekey(const TraceeKey& from, const TraceeKey& to)
{
    auto it = _pending.find(from);
    if (it == _pending.end() || from == to)
    {
        return;
    }
    PendingExec pending = std::move(it->second);
    _pending.erase(it);
    pending.event->tracee = to;
    _pending[to] = std::move(pending);
}
