/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  procfs
 *
 *      Reads what we need to know about a tracee out of /proc. The tracee
 *      can die at any moment while we're doing this, so every read hands
 *      back its own Field that is either a value or the errno that stopped
 *      us from getting one.
 */
#include <cerrno>
#include <cstring>
#include <memory>
#include <fcntl.h>
#include <dirent.h>
#include <unistd.h>
#include <fmt/core.h>

#include "procfs.hpp"
#include "parse.hpp"
#include "util.hpp"
#include "log.hpp"

using std::string;
using std::string_view;
using std::vector;
using std::optional;
using fmt::format;

/* How much of a script's first line the kernel looks at. */
constexpr size_t SHEBANG_MAX = 256;

string_view get_fd_kind_name(FdKind kind)
{
    switch (kind)
    {
        case FdKind::FILE:      return "file";
        case FdKind::PIPE:      return "pipe";
        case FdKind::SOCKET:    return "socket";
        default:                return "other";
    }
}

bool FdInfo::operator==(const FdInfo& other) const
{
    return fd == other.fd
        && kind == other.kind
        && target == other.target
        && flags == other.flags
        && cloexec == other.cloexec
        && pos == other.pos;
}

bool Credentials::operator==(const Credentials& other) const
{
    return realUid == other.realUid
        && effectiveUid == other.effectiveUid
        && realGid == other.realGid
        && effectiveGid == other.effectiveGid;
}

bool Credentials::elevated() const
{
    return realUid != effectiveUid || realGid != effectiveGid;
}

bool exec_changed_credentials(const Field<Credentials>& before,
                              const Credentials& after)
{
    if (after.elevated())
    {
        return true;
    }
    return before.available()
        && (before->effectiveUid != after.effectiveUid
            || before->effectiveGid != after.effectiveGid);
}

/******************************************************************************
 * PARSERS
 *****************************************************************************/

FdInfo classify_fd_link(int fd, string_view link)
{
    FdInfo info;
    info.fd = fd;
    info.target = string(link);
    if (starts_with(link, "pipe:["))
    {
        info.kind = FdKind::PIPE;
    }
    else if (starts_with(link, "socket:["))
    {
        info.kind = FdKind::SOCKET;
    }
    else if (starts_with(link, "/"))
    {
        info.kind = FdKind::FILE;
    }
    else
    {
        info.kind = FdKind::OTHER; // anon_inode:[eventfd] and friends
    }
    return info;
}

/* Splits "key:   value" into its two halves. */
static bool split_key_value(string_view line, string_view& key, string& value)
{
    size_t colon = line.find(':');
    if (colon == string_view::npos)
    {
        return false;
    }
    key = line.substr(0, colon);
    value = string(line.substr(colon + 1));
    strip(value);
    return true;
}

bool parse_fdinfo(string_view text, FdInfo& info)
{
    bool gotFlags = false;
    for (string_view line : split_views(text, '\n'))
    {
        string_view key;
        string value;
        if (!split_key_value(line, key, value))
        {
            continue;
        }
        try
        {
            if (key == "flags")
            {
                // fdinfo prints the flags in octal.
                info.flags = (int)std::stoul(value, nullptr, 8);
                info.cloexec = (info.flags & O_CLOEXEC) != 0;
                gotFlags = true;
            }
            else if (key == "pos")
            {
                info.pos = parse_number<long long>(value);
            }
        }
        catch (const std::exception&)
        {
            return false; // std::stoul's or ours, either way it's garbage
        }
    }
    return gotFlags;
}

/* Parses the first two columns (real and effective) of a Uid:/Gid: line. */
static bool parse_id_pair(const string& value, unsigned& real, unsigned& eff)
{
    vector<string> ids = split(value, '\t');
    if (ids.size() < 2)
    {
        ids = split(value, ' ');
    }
    if (ids.size() < 2)
    {
        return false;
    }
    real = parse_number<unsigned>(ids[0]);
    eff = parse_number<unsigned>(ids[1]);
    return true;
}

optional<Credentials> parse_status_credentials(string_view status)
{
    Credentials creds;
    bool gotUid = false, gotGid = false;
    try
    {
        for (string_view line : split_views(status, '\n'))
        {
            string_view key;
            string value;
            if (!split_key_value(line, key, value))
            {
                continue;
            }
            unsigned real, eff;
            if (key == "Uid" && parse_id_pair(value, real, eff))
            {
                creds.realUid = real;
                creds.effectiveUid = eff;
                gotUid = true;
            }
            else if (key == "Gid" && parse_id_pair(value, real, eff))
            {
                creds.realGid = real;
                creds.effectiveGid = eff;
                gotGid = true;
            }
        }
    }
    catch (const ParseError&)
    {
        return {};
    }
    if (!gotUid || !gotGid)
    {
        return {};
    }
    return creds;
}

optional<pid_t> parse_status_tgid(string_view status)
{
    for (string_view line : split_views(status, '\n'))
    {
        string_view key;
        string value;
        if (split_key_value(line, key, value) && key == "Tgid")
        {
            try
            {
                return parse_number<pid_t>(value);
            }
            catch (const ParseError&)
            {
                return {};
            }
        }
    }
    return {};
}

vector<string> split_nul_separated(string_view data)
{
    vector<string> items = split(data, '\0', false);
    // The data is terminated (not separated) by NULs, which leaves an empty
    // item on the end.
    if (!items.empty() && items.back().empty())
    {
        items.pop_back();
    }
    return items;
}

/******************************************************************************
 * READING /proc
 *****************************************************************************/

/* Reads a whole file in one attempt. Returns an errno value on failure. */
static int read_whole_file(const string& path, string& data, size_t limit)
{
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1)
    {
        return errno;
    }
    data.clear();
    char buf[4096];
    for (;;)
    {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            int e = errno;
            close(fd);
            return e;
        }
        if (n == 0 || data.size() >= limit)
        {
            break;
        }
        data.append(buf, n);
    }
    close(fd);
    return 0;
}

/* readlink(2) without the guesswork about buffer sizes. */
static int read_link(const string& path, string& target)
{
    vector<char> buf(256);
    for (;;)
    {
        ssize_t n = readlink(path.c_str(), buf.data(), buf.size());
        if (n == -1)
        {
            return errno;
        }
        if ((size_t)n < buf.size())
        {
            target.assign(buf.data(), n);
            return 0;
        }
        buf.resize(buf.size() * 2);
    }
}

/* Runs one of the above twice before giving up. */
template<class Reader>
static Field<string> with_retry(const string& path, Reader reader)
{
    string result;
    int err = reader(path, result);
    if (err != 0)
    {
        debug("retrying {}: {}", path, strerror_s(err));
        err = reader(path, result);
    }
    if (err != 0)
    {
        return Field<string>::unavailable(err);
    }
    return Field<string>(std::move(result));
}

Field<string> read_proc_file(const string& path)
{
    return with_retry(path, [](const string& p, string& out) {
        return read_whole_file(p, out, 1 << 24);
    });
}

static Field<string> read_proc_link(const string& path)
{
    return with_retry(path, read_link);
}

static string proc_path(pid_t pid, string_view what)
{
    return format("/proc/{}/{}", pid, what);
}

Field<string> read_comm(pid_t pid)
{
    Field<string> comm = read_proc_file(proc_path(pid, "comm"));
    if (comm.available() && !comm.value->empty()
        && comm.value->back() == '\n')
    {
        comm.value->pop_back();
    }
    return comm;
}

Field<string> read_cwd(pid_t pid)
{
    return read_proc_link(proc_path(pid, "cwd"));
}

Field<string> read_exe(pid_t pid)
{
    return read_proc_link(proc_path(pid, "exe"));
}

static Field<vector<string>> read_nul_separated(const string& path)
{
    Field<string> data = read_proc_file(path);
    if (!data.available())
    {
        return Field<vector<string>>::unavailable(data.error);
    }
    return Field<vector<string>>(split_nul_separated(*data));
}

Field<vector<string>> read_cmdline(pid_t pid)
{
    return read_nul_separated(proc_path(pid, "cmdline"));
}

Field<vector<string>> read_environ(pid_t pid)
{
    return read_nul_separated(proc_path(pid, "environ"));
}

Field<Credentials> read_credentials(pid_t pid)
{
    Field<string> status = read_proc_file(proc_path(pid, "status"));
    if (!status.available())
    {
        return Field<Credentials>::unavailable(status.error);
    }
    optional<Credentials> creds = parse_status_credentials(*status);
    if (!creds.has_value())
    {
        return Field<Credentials>::unavailable(EINVAL);
    }
    return Field<Credentials>(creds.value());
}

Field<pid_t> read_tgid(pid_t pid)
{
    Field<string> status = read_proc_file(proc_path(pid, "status"));
    if (!status.available())
    {
        return Field<pid_t>::unavailable(status.error);
    }
    optional<pid_t> tgid = parse_status_tgid(*status);
    if (!tgid.has_value())
    {
        return Field<pid_t>::unavailable(EINVAL);
    }
    return Field<pid_t>(tgid.value());
}

/* Owns a DIR* so that every way out of read_fd_table closes it. */
struct DirCloser
{
    void operator()(DIR* dir) const { closedir(dir); }
};

Field<FdTable> read_fd_table(pid_t pid)
{
    string dirPath = proc_path(pid, "fd");
    std::unique_ptr<DIR, DirCloser> dir(opendir(dirPath.c_str()));
    if (!dir)
    {
        dir.reset(opendir(dirPath.c_str()));
    }
    if (!dir)
    {
        return Field<FdTable>::unavailable(errno);
    }

    FdTable table;
    errno = 0;
    struct dirent* entry;
    while ((entry = readdir(dir.get())) != nullptr)
    {
        int fd;
        try
        {
            fd = parse_number<int>(entry->d_name);
        }
        catch (const ParseError&)
        {
            continue; // "." and ".."
        }

        string link;
        if (read_link(dirPath + '/' + entry->d_name, link) != 0)
        {
            continue; // closed in the meantime
        }
        FdInfo info = classify_fd_link(fd, link);

        string fdinfo;
        string fdinfoPath = format("/proc/{}/fdinfo/{}", pid, fd);
        if (read_whole_file(fdinfoPath, fdinfo, 1 << 16) == 0)
        {
            parse_fdinfo(fdinfo, info);
        }
        table.emplace(fd, std::move(info));
    }
    return Field<FdTable>(std::move(table));
}

Field<string> resolve_exec_path(pid_t pid,
                                int dirfd,
                                const string& path,
                                int flags)
{
    if (path.empty())
    {
        if ((flags & AT_EMPTY_PATH) && dirfd != AT_FDCWD)
        {
            return read_proc_link(format("/proc/{}/fd/{}", pid, dirfd));
        }
        return Field<string>::unavailable(ENOENT);
    }
    if (starts_with(path, "/"))
    {
        return Field<string>(path);
    }

    Field<string> base = dirfd == AT_FDCWD
        ? read_cwd(pid)
        : read_proc_link(format("/proc/{}/fd/{}", pid, dirfd));
    if (!base.available())
    {
        return base;
    }
    return Field<string>(join_path(*base, path));
}

/******************************************************************************
 * INTERPRETERS
 *****************************************************************************/

string Interpreter::to_string() const
{
    switch (kind)
    {
        case SHEBANG:
            return argument.empty() ? path : format("{} {}", path, argument);
        case NOT_A_SCRIPT:
            return "(not a script)";
        case INACCESSIBLE:
            return format("(inaccessible: {})", strerror_s(error));
        default:
            return format("(error: {})", message);
    }
}

static bool is_blank(char c)
{
    return c == ' ' || c == '\t';
}

bool parse_shebang(string_view line, Interpreter& result)
{
    if (!starts_with(line, "#!"))
    {
        return false;
    }
    line.remove_prefix(2);
    while (!line.empty() && is_blank(line.front()))
    {
        line.remove_prefix(1);
    }
    while (!line.empty() && (is_blank(line.back()) || line.back() == '\r'))
    {
        line.remove_suffix(1);
    }
    size_t end = 0;
    while (end < line.size() && !is_blank(line[end]))
    {
        end++;
    }
    if (end == 0)
    {
        return false;
    }

    result.kind = Interpreter::SHEBANG;
    result.path = string(line.substr(0, end));
    line.remove_prefix(end);
    while (!line.empty() && is_blank(line.front()))
    {
        line.remove_prefix(1);
    }
    result.argument = string(line);
    return true;
}

Interpreter read_interpreter(const string& path)
{
    Interpreter result;
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1)
    {
        result.kind = Interpreter::INACCESSIBLE;
        result.error = errno;
        return result;
    }
    char buf[SHEBANG_MAX];
    ssize_t n;
    do
    {
        n = read(fd, buf, sizeof(buf));
    }
    while (n == -1 && errno == EINTR);
    int err = errno;
    close(fd);
    if (n == -1)
    {
        result.kind = Interpreter::INACCESSIBLE;
        result.error = err;
        return result;
    }

    string_view head(buf, n);
    if (!starts_with(head, "#!"))
    {
        result.kind = Interpreter::NOT_A_SCRIPT;
        return result;
    }
    head = head.substr(0, head.find('\n'));
    if (!parse_shebang(head, result))
    {
        result.kind = Interpreter::ERROR;
        result.message = "#! line names no interpreter";
    }
    return result;
}

vector<Interpreter> resolve_interpreters(const string& path, const string& cwd)
{
    vector<Interpreter> chain;
    string current = path;
    for (int depth = 0; ; ++depth)
    {
        Interpreter interp = read_interpreter(join_path(cwd, current));
        if (interp.kind == Interpreter::NOT_A_SCRIPT)
        {
            break;
        }
        if (interp.kind != Interpreter::SHEBANG)
        {
            chain.push_back(std::move(interp));
            break;
        }
        if (depth >= MAX_INTERPRETER_DEPTH)
        {
            Interpreter tooDeep;
            tooDeep.kind = Interpreter::ERROR;
            tooDeep.message = format("more than {} levels of interpreters",
                MAX_INTERPRETER_DEPTH);
            chain.push_back(std::move(tooDeep));
            break;
        }
        current = interp.path;
        chain.push_back(std::move(interp));
    }
    return chain;
}
