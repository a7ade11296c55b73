/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  printer
 *
 *      An event sink that writes each event as a line of text (plus a few
 *      indented detail lines if asked for them).
 */
#include <cerrno>
#include <fmt/core.h>
#include <fmt/format.h>

#include "printer.hpp"
#include "system.hpp"
#include "util.hpp"

using std::string;
using std::string_view;
using fmt::format;

LogPrinter::LogPrinter(FILE* file, Options options)
    : _file(file), _ownsFile(false), _options(options) { }

LogPrinter::LogPrinter(const string& path, Options options)
    : _file(nullptr), _ownsFile(false), _options(options)
{
    if (path == "-")
    {
        _file = stdout;
        return;
    }
    _file = fopen(path.c_str(), "w");
    if (_file == nullptr)
    {
        throw SystemError(errno, format("fopen({})", path));
    }
    _ownsFile = true;
}

LogPrinter::~LogPrinter()
{
    if (_ownsFile)
    {
        fclose(_file);
    }
}

string LogPrinter::paint(Colour c, string_view str) const
{
    return _options.colour ? apply_colour(c, str) : string(str);
}

static Colour category_colour(EventCategory category)
{
    switch (category)
    {
        case EventCategory::EXEC_SUCCESS:   return Colour::BLUE | Colour::BOLD;
        case EventCategory::EXEC_FAILURE:   return Colour::RED;
        case EventCategory::WARNING:        return Colour::YELLOW;
        case EventCategory::ERROR:          return Colour::RED | Colour::BOLD;
        case EventCategory::TRACEE_EXIT:    return Colour::GREEN;
        case EventCategory::OTHER_SIGNAL:   return Colour::MAGENTA;
        default:                            return Colour::GREY;
    }
}

static string describe_fd(const FdInfo& info)
{
    return format("{} {} {}{}", info.fd, get_fd_kind_name(info.kind),
        escaped_string(info.target), info.cloexec ? " (cloexec)" : "");
}

void LogPrinter::print_exec(const ExecEvent& event, string& out) const
{
    const char* indent = "    ";

    if (_options.showParents && !event.parents.empty())
    {
        string chain;
        for (const AncestorInfo& ancestor : event.parents)
        {
            if (!chain.empty())
            {
                chain += " <- ";
            }
            chain += format("{}({})", ancestor.comm, ancestor.key.to_string());
        }
        out += format("{}parents: {}\n", indent, chain);
    }

    if (_options.showInterpreter)
    {
        if (event.resolvedPath.available())
        {
            out += format("{}path: {}\n", indent,
                escaped_string(*event.resolvedPath));
        }
        for (const Interpreter& interp : event.interpreters)
        {
            out += format("{}interpreter: {}\n", indent, interp.to_string());
        }
    }

    if (_options.showEnv)
    {
        if (!event.envp.available())
        {
            out += format("{}env: {}\n", indent,
                describe_unavailable(event.envp.error));
        }
        else if (!event.envDiff.has_value())
        {
            out += format("{}env: no baseline ({} variables)\n", indent,
                event.envp->size());
        }
        else if (event.envDiff->empty())
        {
            out += format("{}env: unchanged\n", indent);
        }
        else
        {
            for (const auto& [name, value] : event.envDiff->added)
            {
                out += indent;
                out += paint(Colour::GREEN,
                    format("+{}={}", name, escaped_string(value)));
                out += '\n';
            }
            for (const string& name : event.envDiff->removed)
            {
                out += indent;
                out += paint(Colour::RED, format("-{}", name));
                out += '\n';
            }
            for (const EnvChange& change : event.envDiff->changed)
            {
                out += indent;
                out += paint(Colour::YELLOW, format("~{}: {} -> {}",
                    change.name, escaped_string(change.before),
                    escaped_string(change.after)));
                out += '\n';
            }
        }
    }

    if (_options.showFds)
    {
        if (!event.fds.available())
        {
            out += format("{}fds: {}\n", indent,
                describe_unavailable(event.fds.error));
        }
        else if (!event.succeeded())
        {
            for (const auto& [fd, info] : *event.fds)
            {
                out += format("{}fd {}\n", indent, describe_fd(info));
            }
        }
        else
        {
            for (const FdInfo& info : event.fdDiff.closed)
            {
                out += indent;
                out += paint(Colour::RED,
                    format("closed {}", describe_fd(info)));
                out += '\n';
            }
            for (const FdInfo& info : event.fdDiff.unchanged)
            {
                out += format("{}kept {}\n", indent, describe_fd(info));
            }
            for (const FdInfo& info : event.fdDiff.opened)
            {
                out += indent;
                out += paint(Colour::GREEN,
                    format("opened {}", describe_fd(info)));
                out += '\n';
            }
        }
    }
}

string LogPrinter::render(const TraceEvent& event) const
{
    string out = paint(category_colour(event.category()), event.to_string());
    out += '\n';
    if (auto exec = dynamic_cast<const ExecEvent*>(&event))
    {
        print_exec(*exec, out);
    }
    return out;
}

void LogPrinter::on_event(const EventPtr& event)
{
    string text = render(*event);
    fmt::print(_file, "{}", text);
    fflush(_file);
}

void LogPrinter::on_close()
{
    fflush(_file);
}
