/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  procfs
 *
 *      Reads what we need to know about a tracee out of /proc. The tracee
 *      can die at any moment while we're doing this, so every read hands
 *      back its own Field that is either a value or the errno that stopped
 *      us from getting one.
 */
#ifndef EXECTRACE_PROCFS_HPP
#define EXECTRACE_PROCFS_HPP

#include <cerrno>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <unistd.h>
#include <sys/types.h>

/* The result of reading a single thing about a tracee. */
template<class T>
struct Field
{
    std::optional<T> value;
    int error = 0;  // errno for why value is missing

    Field() : error(ENODATA) { }
    Field(T v) : value(std::move(v)) { }

    static Field<T> unavailable(int err)
    {
        Field<T> field;
        field.error = err;
        return field;
    }

    bool available() const { return value.has_value(); }
    const T& operator*() const { return *value; }
    const T* operator->() const { return &*value; }
};

enum class FdKind
{
    FILE,
    PIPE,
    SOCKET,
    OTHER,
};

std::string_view get_fd_kind_name(FdKind kind);

/* What one open file descriptor of a tracee points at. */
struct FdInfo
{
    int fd = -1;
    FdKind kind = FdKind::OTHER;
    std::string target;     // path for files, the readlink text otherwise
    int flags = 0;          // open flags from fdinfo
    bool cloexec = false;
    long long pos = 0;

    bool operator==(const FdInfo& other) const;
};

using FdTable = std::map<int, FdInfo>;

struct Credentials
{
    uid_t realUid, effectiveUid;
    gid_t realGid, effectiveGid;

    bool operator==(const Credentials& other) const;
    bool operator!=(const Credentials& other) const { return !(*this == other); }

    /* setuid/setgid binaries leave real and effective ids different. */
    bool elevated() const;
};

/* Whether an exec changed what the process is allowed to do: the effective
 * ids moved, or it came out setuid/setgid. before is what was read at the
 * entry, if anything. */
bool exec_changed_credentials(const Field<Credentials>& before,
                              const Credentials& after);

/* Parsers for the bits of /proc that aren't one-liners. These don't touch the
 * file system, they're just separated out so that they can be tested. */
FdInfo classify_fd_link(int fd, std::string_view link);
bool parse_fdinfo(std::string_view text, FdInfo& info);
std::optional<Credentials> parse_status_credentials(std::string_view status);
std::optional<pid_t> parse_status_tgid(std::string_view status);
std::vector<std::string> split_nul_separated(std::string_view data);

/* Reads a whole file. /proc files can't be stat'ed for their size, so this
 * just reads until EOF. Retries once before giving up. */
Field<std::string> read_proc_file(const std::string& path);

Field<std::string> read_comm(pid_t pid);
Field<std::string> read_cwd(pid_t pid);
Field<std::string> read_exe(pid_t pid);
Field<std::vector<std::string>> read_cmdline(pid_t pid);
Field<std::vector<std::string>> read_environ(pid_t pid);
Field<Credentials> read_credentials(pid_t pid);
Field<pid_t> read_tgid(pid_t pid);

/* /proc/<pid>/fd plus the flags from /proc/<pid>/fdinfo. An fd that closes
 * while we're looking at it is left out rather than failing the table. */
Field<FdTable> read_fd_table(pid_t pid);

/* Works out the file that an exec of `path` would load, from the point of
 * view of the tracee. dirfd and flags are execveat's (AT_FDCWD and 0 for a
 * plain execve). */
Field<std::string> resolve_exec_path(pid_t pid,
                                     int dirfd,
                                     const std::string& path,
                                     int flags);

/* One level of a #! interpreter chain. */
struct Interpreter
{
    enum Kind
    {
        SHEBANG,        // the file names an interpreter
        NOT_A_SCRIPT,   // the file isn't a script (the chain ends here)
        INACCESSIBLE,   // couldn't open or read the file
        ERROR,          // the chain is broken (e.g., too deep)
    };

    Kind kind;
    std::string path;       // the interpreter (SHEBANG only)
    std::string argument;   // its single optional argument
    int error = 0;          // errno for INACCESSIBLE
    std::string message;    // for ERROR

    std::string to_string() const;
};

/* The kernel gives up on nested interpreters after this many levels. */
constexpr int MAX_INTERPRETER_DEPTH = 4;

/* Parses the first line of a script (without the trailing newline), e.g.,
 * "#!/usr/bin/env python3". Returns false if it doesn't start with "#!" or
 * names no interpreter. Like the kernel, everything after the first run of
 * whitespace following the interpreter is one single argument. */
bool parse_shebang(std::string_view line, Interpreter& result);

/* Looks at the first line of a file. */
Interpreter read_interpreter(const std::string& path);

/* Follows the #! chain starting from `path`. Only SHEBANG entries and a final
 * INACCESSIBLE/ERROR entry end up in the list, a file that isn't a script
 * simply ends the chain. Relative interpreter paths are resolved against
 * `cwd`. */
std::vector<Interpreter> resolve_interpreters(const std::string& path,
                                              const std::string& cwd);

#endif /* EXECTRACE_PROCFS_HPP */
