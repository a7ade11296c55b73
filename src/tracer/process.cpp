/*  Copyright (C) 2020  Henry Harvey --- See LICENSE file
 *
 *  process
 *
 *      The process tree tracker. Keeps one ProcessState for every live
 *      tracee (process or thread) along with the baseline environment and
 *      fd table that the next exec gets compared against. Dead tracees are
 *      retired into a history so that parent chains can still be shown.
 */
#include <algorithm>
#include <set>
#include <fmt/core.h>

#include "process.hpp"
#include "log.hpp"
#include "system.hpp"

using std::string;
using std::string_view;
using std::vector;
using std::optional;
using std::shared_ptr;
using std::make_shared;
using fmt::format;

/* A helper function that throws a ProcessTreeError with a message formatted
 * using format if a certain condition wasn't met. */
template<typename ...Args>
static void process_assert(bool cond, string_view fmtStr, const Args&... args)
{
    if (!cond)
    {
        throw ProcessTreeError(format_message(fmtStr, args...));
    }
}

string TraceeKey::to_string() const
{
    if (generation <= 1)
    {
        return format("{}", pid);
    }
    return format("{}#{}", pid, generation);
}

Environment parse_environment(const vector<string>& envp)
{
    Environment env;
    env.reserve(envp.size());
    for (const string& item : envp)
    {
        size_t eq = item.find('=');
        if (eq == string::npos)
        {
            env.emplace_back(item, "");
        }
        else
        {
            env.emplace_back(item.substr(0, eq), item.substr(eq + 1));
        }
    }
    return env;
}

/* Makes a brand new record for the pid (which must not be live). */
ProcessState& ProcessTree::insert(pid_t pid)
{
    ProcessState state;
    state.key = TraceeKey{pid, _nextGeneration++};
    state.baseline = make_shared<Baseline>();
    auto [it, inserted] = _live.emplace(pid, std::move(state));
    process_assert(inserted, "insert({}) called on a live pid", pid);
    return it->second;
}

/* Moves the record to the history. Doesn't erase it from _live. */
void ProcessTree::retire(ProcessState& state)
{
    RetiredProcess retired;
    retired.key = state.key;
    retired.parent = state.parent;
    retired.comm = state.comm;
    _retired[state.key] = std::move(retired);
    if (_retired.size() > _pruneAt)
    {
        prune_retired();
    }
}

/* Drops the retired records that no live tracee's parent chain goes through.
 * The one being retired right now is still in _live, so its ancestors stay. */
void ProcessTree::prune_retired()
{
    std::set<TraceeKey> reachable;
    for (const auto& [pid, state] : _live)
    {
        optional<TraceeKey> current = state.parent;
        while (current.has_value())
        {
            // Stop at a live parent (its own entry walks the rest) or at one
            // that's already been walked.
            auto it = _retired.find(current.value());
            if (it == _retired.end() || !reachable.insert(it->first).second)
            {
                break;
            }
            current = it->second.parent;
        }
    }

    size_t before = _retired.size();
    for (auto it = _retired.begin(); it != _retired.end(); )
    {
        if (reachable.count(it->first))
        {
            ++it;
        }
        else
        {
            it = _retired.erase(it);
        }
    }
    _pruneAt = std::max(_retiredLimit, 2 * _retired.size());
    debug("pruned {} retired records, {} left", before - _retired.size(),
        _retired.size());
}

/* Copy-on-write for the baseline. Returns a baseline that only `state` sees,
 * copying the shared one first if needed. */
Baseline& ProcessTree::own_baseline(ProcessState& state)
{
    if (!state.baseline || state.baseline.use_count() > 1)
    {
        state.baseline = state.baseline
            ? make_shared<Baseline>(*state.baseline)
            : make_shared<Baseline>();
    }
    // Only we hold this pointer, so it's fine to write through it.
    return const_cast<Baseline&>(*state.baseline);
}

ProcessState& ProcessTree::on_attach(pid_t pid, Baseline baseline)
{
    if (ProcessState* old = lookup(pid))
    {
        warning("pid {} attached again while still tracked", pid);
        retire(*old);
        _live.erase(pid);
    }
    ProcessState& state = insert(pid);
    state.baseline = make_shared<Baseline>(std::move(baseline));
    debug("tracking root {}", state.key.to_string());
    return state;
}

ProcessState& ProcessTree::on_fork(pid_t parentPid, pid_t childPid, CloneKind kind)
{
    ProcessState* parent = lookup(parentPid);
    process_assert(parent != nullptr, "on_fork({}, {}) from an unknown parent",
        parentPid, childPid);

    if (ProcessState* old = lookup(childPid))
    {
        warning("pid {} was reused before its previous tracee ({}) ended",
            childPid, old->key.to_string());
        retire(*old);
        _live.erase(childPid);
        parent = lookup(parentPid); // the erase may have invalidated it
    }

    // Copy what we need out of the parent before inserting, since insert can
    // rehash the map.
    TraceeKey parentKey = parent->key;
    string cwd = parent->cwd;
    string comm = parent->comm;
    shared_ptr<const Baseline> baseline = parent->baseline;

    ProcessState& child = insert(childPid);
    child.parent = parentKey;
    child.cwd = std::move(cwd);
    child.comm = std::move(comm);
    if (kind == CloneKind::THREAD)
    {
        child.leader = false;
        child.baseline = std::move(baseline);
    }
    else
    {
        child.leader = true;
        child.baseline = make_shared<Baseline>(*baseline);
    }
    debug("tracking {} {} (parent {})",
        kind == CloneKind::THREAD ? "thread" : "process",
        child.key.to_string(), parentKey.to_string());
    return child;
}

bool ProcessTree::on_exec_boundary(pid_t pid, const ExecBoundary& boundary)
{
    ProcessState* state = lookup(pid);
    if (!state)
    {
        return false;
    }

    if (boundary.phase == ExecBoundary::ENTRY)
    {
        state->pendingExec = true;
        if (boundary.fds.has_value())
        {
            Baseline& baseline = own_baseline(*state);
            baseline.fds = boundary.fds.value();
            baseline.fdsKnown = true;
        }
        if (boundary.cwd.has_value())
        {
            state->cwd = boundary.cwd.value();
        }
        return true;
    }

    state->pendingExec = false;
    if (!boundary.success)
    {
        return true;
    }

    // The exec replaced the whole address space, so this is a fresh baseline
    // that no other thread shares.
    auto baseline = make_shared<Baseline>();
    if (boundary.env.has_value())
    {
        baseline->env = boundary.env.value();
        baseline->envKnown = true;
    }
    if (boundary.fds.has_value())
    {
        baseline->fds = boundary.fds.value();
        baseline->fdsKnown = true;
    }
    state->baseline = std::move(baseline);
    if (boundary.comm.has_value())
    {
        state->comm = boundary.comm.value();
    }
    if (boundary.cwd.has_value())
    {
        state->cwd = boundary.cwd.value();
    }
    return true;
}

TraceeKey ProcessTree::on_exec_pid_change(pid_t former, pid_t leader)
{
    auto it = _live.find(former);
    process_assert(it != _live.end(), "on_exec_pid_change({}, {}) for an "
        "unknown thread", former, leader);
    if (former == leader)
    {
        return it->second.key;
    }

    // Keep a record under the old key too so that children that were created
    // by this thread can still find their parent.
    retire(it->second);
    ProcessState state = std::move(it->second);
    _live.erase(it);

    auto leaderIt = _live.find(leader);
    if (leaderIt != _live.end())
    {
        // The kernel never reports the old leader's death, this is it.
        retire(leaderIt->second);
        _live.erase(leaderIt);
    }

    debug("thread {} took over leader pid {}", state.key.to_string(), leader);
    state.key.pid = leader;
    state.leader = true;
    TraceeKey key = state.key;
    _live.emplace(leader, std::move(state));
    return key;
}

bool ProcessTree::on_exit(pid_t pid, int status)
{
    auto it = _live.find(pid);
    if (it == _live.end())
    {
        return false;
    }
    it->second.pendingExec = false;
    debug("{} ended ({})", it->second.key.to_string(),
        diagnose_wait_status(status));
    retire(it->second);
    _live.erase(it);
    return true;
}

bool ProcessTree::forget(pid_t pid)
{
    auto it = _live.find(pid);
    if (it == _live.end())
    {
        return false;
    }
    retire(it->second);
    _live.erase(it);
    return true;
}

ProcessState* ProcessTree::lookup(pid_t pid)
{
    auto it = _live.find(pid);
    return it == _live.end() ? nullptr : &it->second;
}

const ProcessState* ProcessTree::lookup(pid_t pid) const
{
    auto it = _live.find(pid);
    return it == _live.end() ? nullptr : &it->second;
}

optional<AncestorInfo> ProcessTree::find(const TraceeKey& key) const
{
    auto live = _live.find(key.pid);
    if (live != _live.end() && live->second.key == key)
    {
        return AncestorInfo{key, live->second.comm};
    }
    auto retired = _retired.find(key);
    if (retired != _retired.end())
    {
        return AncestorInfo{key, retired->second.comm};
    }
    return {};
}

/* Returns the parent of whatever record `key` refers to. */
static optional<TraceeKey> parent_of(
        const std::unordered_map<pid_t, ProcessState>& live,
        const std::map<TraceeKey, RetiredProcess>& retired,
        const TraceeKey& key)
{
    auto l = live.find(key.pid);
    if (l != live.end() && l->second.key == key)
    {
        return l->second.parent;
    }
    auto r = retired.find(key);
    if (r != retired.end())
    {
        return r->second.parent;
    }
    return {};
}

vector<AncestorInfo> ProcessTree::parent_chain(const TraceeKey& key) const
{
    vector<AncestorInfo> chain;
    // Generations only go up as we go down the tree, but a record that moved
    // pids on exec keeps its generation, so bound the walk anyway.
    size_t limit = _live.size() + _retired.size();
    optional<TraceeKey> current = parent_of(_live, _retired, key);
    while (current.has_value() && chain.size() < limit)
    {
        optional<AncestorInfo> info = find(current.value());
        if (!info.has_value())
        {
            break;
        }
        chain.push_back(std::move(info.value()));
        current = parent_of(_live, _retired, chain.back().key);
    }
    return chain;
}
