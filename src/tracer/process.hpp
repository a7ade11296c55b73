/*  Copyright (C) 2020  Henry Harvey --- See LICENSE file
 *
 *  process
 *
 *      The process tree tracker. Keeps one ProcessState for every live
 *      tracee (process or thread) along with the baseline environment and
 *      fd table that the next exec gets compared against. Dead tracees are
 *      retired into a history so that parent chains can still be shown.
 */
#ifndef EXECTRACE_PROCESS_HPP
#define EXECTRACE_PROCESS_HPP

#include <unistd.h>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "procfs.hpp"

/* This is thrown by the ProcessTree whenever operations are done on the
 * process tree that don't make sense or aren't allowed. Why make this an
 * exception instead of using assert()? assert() shouldn't be used on stuff
 * that can depend on user input. The way that this process tree is modified
 * is according to "external input" from ptrace. */
class ProcessTreeError : public std::exception
{
private:
    std::string _msg;
public:
    ProcessTreeError(std::string_view msg) : _msg(msg) { }
    const char* what() const noexcept { return _msg.c_str(); }
};

/* Identifies a tracee. Kernel ids get recycled, so every new tracee also gets
 * a generation number from a counter that only ever goes up. */
struct TraceeKey
{
    pid_t pid;
    uint64_t generation;

    bool operator==(const TraceeKey& other) const
    {
        return pid == other.pid && generation == other.generation;
    }
    bool operator!=(const TraceeKey& other) const { return !(*this == other); }
    bool operator<(const TraceeKey& other) const
    {
        return pid < other.pid
            || (pid == other.pid && generation < other.generation);
    }

    /* "1234" for the first generation of a pid, "1234#2" after that. */
    std::string to_string() const;
};

/* Environment variables in the order that they appear in envp. */
using Environment = std::vector<std::pair<std::string, std::string>>;

/* Splits each NAME=value string at the first '='. Strings without an '=' get
 * an empty value. */
Environment parse_environment(const std::vector<std::string>& envp);

/* The state that the next exec of a process gets compared against. */
struct Baseline
{
    Environment env;
    FdTable fds;
    bool envKnown = false;
    bool fdsKnown = false;
};

/* One per live pid. */
struct ProcessState
{
    TraceeKey key;
    std::optional<TraceeKey> parent;    // none for the root
    bool leader = true;                 // thread group leader
    std::string cwd;
    std::string comm;

    /* Threads share this with the thread that created them until one of them
     * execs. Processes get their own copy when they're forked. */
    std::shared_ptr<const Baseline> baseline;

    bool pendingExec = false;
};

/* What's left of a tracee after it's gone. */
struct RetiredProcess
{
    TraceeKey key;
    std::optional<TraceeKey> parent;
    std::string comm;
};

/* An entry of a parent chain. */
struct AncestorInfo
{
    TraceeKey key;
    std::string comm;
};

enum class CloneKind
{
    PROCESS,    // fork, vfork, clone without CLONE_THREAD
    THREAD,     // clone with CLONE_THREAD
};

/* What the tracker is told at either side of an exec. */
struct ExecBoundary
{
    enum Phase
    {
        ENTRY,
        EXIT,
    };

    Phase phase;
    bool success = false;               // EXIT only
    std::optional<FdTable> fds;         // pre-exec at ENTRY, post-exec at EXIT
    std::optional<Environment> env;     // the envp of a successful exec
    std::optional<std::string> comm;
    std::optional<std::string> cwd;
};

class ProcessTree
{
private:
    uint64_t _nextGeneration;
    std::unordered_map<pid_t, ProcessState> _live;
    std::map<TraceeKey, RetiredProcess> _retired;
    size_t _retiredLimit;
    size_t _pruneAt;    // prune once _retired grows past this

    /* Private functions, described in source file */
    ProcessState& insert(pid_t pid);
    void retire(ProcessState& state);
    void prune_retired();
    Baseline& own_baseline(ProcessState& state);

public:
    /* Retired records are only kept while some live tracee has them as an
     * ancestor. They're pruned whenever there are more than retiredLimit of
     * them (and the limit then grows with the number that survive). */
    explicit ProcessTree(size_t retiredLimit = 4096)
        : _nextGeneration(1), _retiredLimit(retiredLimit),
        _pruneAt(retiredLimit) { }

    ProcessTree(const ProcessTree&) = delete;
    ProcessTree(ProcessTree&&) = delete;

    /* Starts tracking a tracee that has no traced parent (the root). The
     * baseline is whatever we know about it before its first exec. */
    ProcessState& on_attach(pid_t pid, Baseline baseline = Baseline());

    /* Starts tracking a new child of `parent`. Throws ProcessTreeError if the
     * parent isn't being tracked. If `child` is somehow still live (the pid
     * got recycled before we saw the old one die), then the old record is
     * retired first. */
    ProcessState& on_fork(pid_t parent, pid_t child, CloneKind kind);

    /* Updates the tracker at an exec entry or exit. Returns false if the pid
     * isn't being tracked. */
    bool on_exec_boundary(pid_t pid, const ExecBoundary& boundary);

    /* A thread that wasn't the leader exec'd, which makes the kernel give it
     * the leader's pid. The leader's record is retired and the thread's record
     * moves to the leader pid. Returns the thread's new key. Throws
     * ProcessTreeError if `former` isn't being tracked. */
    TraceeKey on_exec_pid_change(pid_t former, pid_t leader);

    /* Retires a tracee that has ended. `status` is the wait(2) status. Returns
     * false if the pid isn't being tracked. */
    bool on_exit(pid_t pid, int status);

    /* Retires a tracee that we stopped tracing without seeing it end (e.g.,
     * after detaching from it). */
    bool forget(pid_t pid);

    /* Returns nullptr if the pid isn't live. Not finding a pid is normal
     * (e.g., a tracee that got killed in between two stops) so this doesn't
     * throw. The pointer is invalidated by any non-const call. */
    ProcessState* lookup(pid_t pid);
    const ProcessState* lookup(pid_t pid) const;

    /* Looks through both the live and retired records. */
    std::optional<AncestorInfo> find(const TraceeKey& key) const;

    /* The ancestors of a tracee, starting with its parent and ending with the
     * root. Stops early if an ancestor has been forgotten. */
    std::vector<AncestorInfo> parent_chain(const TraceeKey& key) const;

    size_t live_count() const { return _live.size(); }
    size_t retired_count() const { return _retired.size(); }
};

#endif /* EXECTRACE_PROCESS_HPP */
