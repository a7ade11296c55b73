/*  Copyright (C) 2020  Henry Harvey --- See LICENSE file
 *
 *  main
 *
 *      Basically just parsing for command line options. Once we've done all of
 *      that, we just pass everything over to run_session() in session.cpp.
 */
#include <cctype>
#include <iostream>
#include <cassert>
#include <functional>
#include <algorithm>
#include <optional>
#include <memory>
#include <unistd.h>

#include "util.hpp"
#include "log.hpp"
#include "session.hpp"
#include "terminal.hpp"
#include "filter.hpp"
#include "parse.hpp"
#include "system.hpp"

using std::string;
using std::string_view;
using std::vector;
using std::function;
using std::optional;
using std::unique_ptr;
using fmt::format;

/******************************************************************************
 * OPTION CLASSES (these represent command-line options)
 *****************************************************************************/

/* The callbacks for options can throw this if they encounter an error that
 * should cause parsing to stop and the program to exit with an error. */
class OptionError : public std::exception
{
private:
    string _msg;
public:
    OptionError(string_view msg) : _msg(msg) { }
    const char* what() const noexcept { return _msg.c_str(); }

    /* Helper constructor that accepts a fmt::format string and args */
    template<typename ...Args>
    OptionError(string_view fmt, const Args&... args)
        : _msg(format_message(fmt, args...)) { }
};

struct Option
{
    /* Called by the ArgParser when this option is encountered. If a value is
     * provided for the option, it is passed - otherwise nullopt is passed.
     * This function should throw a std::exception to indicate an error. */
    virtual void parse(optional<string> param) const = 0;

    string name;    // Long form name. Doesn't include double dashes.
    char shortName; // == '\0' if there's no short form.
    string param;   // name of arguments, empty string if not applicable
    string help;

    Option(string_view name,
           char shortName,
           string_view param,
           string_view help)
        : name(name), shortName(shortName), param(param), help(help) { }

    virtual ~Option() { }
};

/* A command-line option that takes no parameter. */
struct Option0 : Option
{
    void parse(optional<string> param) const;

    function<void()> handler; // callback for this option

    Option0(string_view name,
            char shortName,
            string_view param,
            string_view help,
            function<void()> handler)
        : Option(name, shortName, param, help), handler(handler) { }
};

/* A command-line option that takes a string parameter (however, this parameter
 * could be a list of multiple items separated by commas or something). */
struct Option1 : Option
{
    void parse(optional<string> param) const;

    function<void(string)> handler; // callback for this option

    Option1(string_view name,
            char shortName,
            string_view param,
            string_view help,
            function<void(string)> handler)
        : Option(name, shortName, param, help), handler(handler) { }
};

void Option0::parse(optional<string> param) const
{
    if (param.has_value())
    {
        throw OptionError("Option \"--{}\" expects no value.", name);
    }
    handler();
}

void Option1::parse(optional<string> param) const
{
    if (!param.has_value())
    {
        throw OptionError("Option \"--{}\" expects a value.", name);
    }
    handler(std::move(param.value()));
}

/* Describes a group of command line options. Used internally by ArgParser. */
struct OptionGroup
{
    string name;
    vector<unique_ptr<Option>> options;

    OptionGroup(string_view name) : name(name) { }
};

/******************************************************************************
 * ARGPARSER CLASS
 *****************************************************************************/

/* Provides a nice way to parse command line options automatically. Allows us
 * to register our options with it via callbacks and whatnot.
 * The parser also hardcodes the options for help (-h and --help). */
class ArgParser
{
private:
    /* Our list of options (split into groups). */
    vector<OptionGroup> _groups;
    /* Should we exit the program after parsing the arguments (e.g., help flag) */
    bool _doExit;
    /* Excludes argv[0]. */
    vector<string> _args;
    size_t _pos; // index of current argument within the vector

    /* Helps us move along the arguments list. current() returns the current
     * one and next() moves us to the next one (and returns it). Both of these
     * return nullopt if the end of the list of arguments has been passed. */
    optional<string> current() const;
    optional<string> next();

    /* Helps us find options using different names. Returns null if none. */
    const Option* find(string_view name) const;
    const Option* find(char shortName) const;

    /* Prints out the help for all of the program options. */
    void print_help() const;

    /* Internal parsing functions */
    bool parse_long_flag(string flag);
    bool parse_short_flags(string flags);
    bool parse_flag(string flag);

    /* Internal version of parse() that does all the work. This assumes that
     * _args and _pos have been set up and that _args is non-empty. */
    bool parse_internal();

    void add(unique_ptr<Option> option);

public:
    ArgParser();

    /* All the options added after this (until the next start_new_group call)
     * will be placed under the provided group name. */
    void start_new_group(string_view groupName);

    /* Add a command-line option that either does or doesn't take a param and
     * that either does or doesn't have a shortName. */
    void add(string_view name,
             char shortName,
             string_view param,
             string_view help,
             function<void()> handler);

    void add(string_view name,
             string_view param,
             string_view help,
             function<void()> handler);

    void add(string_view name,
             char shortName,
             string_view param,
             string_view help,
             function<void(string)> handler);

    void add(string_view name,
             string_view param,
             string_view help,
             function<void(string)> handler);

    /* Parses the provided argv array (a null-terminated array of arguments,
     * including argv[0]). argv must contain >= 1 arguments. When done parsing,
     * the function returns false if there was an error parsing the arguments.
     * Left-over arguments are stored in the provided vector (that's the
     * command to trace). */
    bool parse(const char* argv[], vector<string>& remainingArgs);

    /* Returns true if the program should exit */
    bool should_exit() { return _doExit; }

    /* Option callbacks can call this if they don't want the program to run. */
    void schedule_exit() { _doExit = true; }
};

ArgParser::ArgParser() : _doExit(false), _pos(0)
{
    start_new_group("");
    add("help", 'h', "", "displays this help message",
        [&]{ print_help(); schedule_exit(); });
}

optional<string> ArgParser::current() const
{
    return _pos >= _args.size()
        ? optional<string>() : optional<string>(_args[_pos]);
}

optional<string> ArgParser::next()
{
    _pos++;
    return current();
}

const Option* ArgParser::find(string_view name) const
{
    for (const OptionGroup& group : _groups)
    {
        for (const unique_ptr<Option>& option : group.options)
        {
            if (option->name == name)
            {
                return option.get();
            }
        }
    }
    return nullptr;
}

const Option* ArgParser::find(char shortName) const
{
    for (const OptionGroup& group : _groups)
    {
        for (const unique_ptr<Option>& option : group.options)
        {
            if (option->shortName != '\0' && option->shortName == shortName)
            {
                return option.get();
            }
        }
    }
    return nullptr;
}

static bool is_valid_name(string_view name)
{
    auto isBad = [](char c) { return !isalnum(c) && c != '_' && c != '-'; };
    return std::find_if(name.begin(), name.end(), isBad) == name.end();
}

void ArgParser::start_new_group(string_view groupName)
{
    _groups.emplace_back(groupName);
}

/* Registering options is all hardcoded, so the asserts only ever fire on a
 * typo in register_options. */
void ArgParser::add(unique_ptr<Option> option)
{
    assert(is_valid_name(option->name));
    assert(!find(option->name));
    assert(option->shortName == '\0' || !find(option->shortName));
    assert(!_groups.empty());
    vector<unique_ptr<Option>>& options = _groups.back().options;
    options.push_back(std::move(option));
    std::sort(options.begin(), options.end(),
        [](unique_ptr<Option>& a, unique_ptr<Option>& b) {
            return a->name.compare(b->name) < 0; });
}

void ArgParser::add(string_view name,
                    char shortName,
                    string_view param,
                    string_view help,
                    function<void()> handler)
{
    add(std::make_unique<Option0>(name, shortName, param, help, handler));
}

void ArgParser::add(string_view name,
                    string_view param,
                    string_view help,
                    function<void()> handler)
{
    add(name, '\0', param, help, handler);
}

void ArgParser::add(string_view name,
                    char shortName,
                    string_view param,
                    string_view help,
                    function<void(string)> handler)
{
    add(std::make_unique<Option1>(name, shortName, param, help, handler));
}

void ArgParser::add(string_view name,
                    string_view param,
                    string_view help,
                    function<void(string)> handler)
{
    add(name, '\0', param, help, handler);
}

void ArgParser::print_help() const
{
    string_view me = program_name();
    std::cerr
        << "Trace every exec of a program and its descendants:\n"
        << "  " << me << " [OPTIONS...] [--] program [ARGS...]\n"
        << "\n"
        << "Use '--' to force " << me << " to stop parsing flags.\n"
        << "Event categories: warning, error, exec-success, exec-failure,\n"
        << "tracee-exit, other-signal, info, new-child (and exec for both\n"
        << "exec categories).\n"
        << "\n";

    unsigned short width = 0, height = 0;
    get_terminal_size(STDERR_FILENO, width, height); // this could fail

    for (const OptionGroup& group : _groups)
    {
        // Calculate padding we'll need to line up the help messages for each
        // command in this category nicely :-)
        size_t padding = 0;
        for (const unique_ptr<Option>& opt : group.options)
        {
            size_t optWidth = 2 + opt->name.size();
            if (!opt->param.empty())
            {
                optWidth += 1 + opt->param.size();
            }
            if (opt->shortName != '\0')
            {
                optWidth += 3;
            }
            padding = std::max(padding, optWidth);
        }
        padding += 2;

        if (!group.name.empty())
        {
            std::cerr << group.name << '\n';
        }
        for (const unique_ptr<Option>& opt : group.options)
        {
            string line;
            if (opt->shortName != '\0')
            {
                line += colour(Colour::BOLD, format("-{} ", opt->shortName));
            }
            line += colour(Colour::BOLD, format("--{}", opt->name));
            if (!opt->param.empty())
            {
                line += '=' + opt->param;
            }
            line = "  " + pad(line, padding); // ensures trailing space

            // Too wide for the terminal? Put the help on a line of its own.
            if (width != 0 && 2 + padding + opt->help.size() > width)
            {
                std::cerr << line << "\n      " << opt->help << '\n';
            }
            else
            {
                std::cerr << line << opt->help << '\n';
            }
        }
        std::cerr << '\n';
    }
}

bool ArgParser::parse_long_flag(string flag)
{
    flag = flag.substr(2);

    optional<string> value;
    size_t equalsPos = flag.find('=');
    if (equalsPos != string::npos)
    {
        value = {flag.substr(equalsPos + 1)};
        flag = flag.substr(0, equalsPos);
    }

    const Option* opt = find(flag);
    if (!opt)
    {
        error("The \"--{}\" flag doesn't exist.", flag);
        return false;
    }
    // "--output file" as well as "--output=file"
    if (!value.has_value() && dynamic_cast<const Option1*>(opt))
    {
        value = next();
    }
    opt->parse(value);
    return true;
}

bool ArgParser::parse_short_flags(string flags)
{
    for (size_t i = 1; i < flags.size(); ++i)
    {
        const Option* opt = find(flags[i]);
        if (!opt)
        {
            error("The '-{}' flag doesn't exist.", flags[i]);
            return false;
        }
        if (dynamic_cast<const Option1*>(opt))
        {
            // The value is the rest of this argument ("-ofile", "-o=file") or
            // else the next argument ("-o file").
            string value = flags.substr(i + 1);
            if (starts_with(value, "="))
            {
                value = value.substr(1);
            }
            if (value.empty())
            {
                opt->parse(next());
                return true;
            }
            opt->parse({value});
            return true;
        }
        opt->parse({});
    }
    return true;
}

bool ArgParser::parse_flag(string flag)
{
    try
    {
        if (starts_with(flag, "--"))
        {
            return parse_long_flag(std::move(flag));
        }
        else if (flag.size() > 1)
        {
            return parse_short_flags(std::move(flag));
        }
        else
        {
            error("Invalid argument '-'.");
            return false;
        }
    }
    catch (const std::exception& e)
    {
        error("{}", e.what());
        return false;
    }
}

/* This function assumes _args is non-empty and _pos has been set to 0. */
bool ArgParser::parse_internal()
{
    do
    {
        string arg = current().value();
        // The separator forces us to stop parsing command line options.
        if (arg == "--")
        {
            next(); // skip the separator
            return true;
        }

        if (starts_with(arg, "-"))
        {
            if (!parse_flag(std::move(arg)))
            {
                return false; // invalid option
            }
        }
        else
        {
            return true; // not a flag - stop parsing here
        }
    }
    while (next());
    return true;
}

bool ArgParser::parse(const char* argv[], vector<string>& remainingArgs)
{
    _doExit = false;
    _args.clear();
    _pos = 0;

    for (const char** argp = &argv[1]; *argp != nullptr; ++argp)
    {
        _args.emplace_back(*argp);
    }
    if (_args.empty())
    {
        return true;
    }

    bool success = parse_internal();

    // Erase all the arguments up to where we finished parsing so that
    // we can return those leftover arguments to the caller.
    _pos = std::min(_pos, _args.size());
    _args.erase(_args.begin(), _args.begin() + _pos);
    remainingArgs = std::move(_args);

    return success;
}

/******************************************************************************
 * COMMAND LINE OPTIONS & MAIN()
 *****************************************************************************/

/* This feature is useful for debugging */
static void diagnose_status(int wstatus)
{
    std::cerr << diagnose_wait_status(wstatus) << '\n';
}

static void append(vector<EventCategory>& list, string_view input)
{
    vector<EventCategory> parsed = parse_category_list(input);
    list.insert(list.end(), parsed.begin(), parsed.end());
}

/* Registers all of our command line options with the argparser. */
static void register_options(ArgParser& parser, SessionOptions& opts)
{
    Tracer::Options& tracer = opts.tracer;
    EventFilter::Config& filter = opts.tracer.filter;

    parser.add("status", "STATUS", "diagnose a wait(2) child status",
        [&](string s) {
            diagnose_status(parse_number<int>(s));
            parser.schedule_exit();
        }
    );

    parser.start_new_group("Tracing options");

    parser.add("seccomp-bpf", "auto|on|off",
        "only stop tracees at execs using a seccomp-bpf filter (default auto)",
        [&](string s) { tracer.filterMode = parse_filter_mode(s); }
    );
    parser.add("user", 'u', "USER", "run the program as USER (needs root)",
        [&](string s) { tracer.user = std::move(s); }
    );
    parser.add("cwd", 'C', "DIR", "run the program in DIR",
        [&](string s) { tracer.cwd = std::move(s); }
    );
    parser.add("tty", 't', "", "run the program on a pseudo-terminal",
        [&]{
            tracer.stdio = StdioMode::PTY;
            tracer.terminalInput = STDIN_FILENO;
        }
    );
    parser.add("null-stdio", "", "point the program's stdio at /dev/null",
        [&]{ tracer.stdio = StdioMode::NULL_DEVICE; }
    );
    parser.add("teardown", "detach|terminate|kill",
        "what to do with tracees that are left over (default detach)",
        [&](string s) { tracer.teardown = parse_teardown(s); }
    );

    parser.start_new_group("Event options");

    parser.add("successful-only", "", "hide failed execs",
        [&]{ filter.successfulOnly = true; }
    );
    parser.add("show-all", "", "show every category of event",
        [&]{ filter.showAll = true; }
    );
    parser.add("filter", "LIST", "show only these categories of events",
        [&](string s) { filter.defaults = parse_category_list(s); }
    );
    parser.add("filter-include", "LIST", "show these categories too",
        [&](string s) { append(filter.include, s); }
    );
    parser.add("filter-exclude", "LIST", "hide these categories",
        [&](string s) { append(filter.exclude, s); }
    );

    parser.start_new_group("Output options");

    parser.add("output", 'o', "FILE", "write events to FILE ('-' for stdout)",
        [&](string s) { opts.output = std::move(s); }
    );
    parser.add("colour", "auto|always|never", "colour the output",
        [&](string s) { opts.colour = parse_colour_mode(s); }
    );
    parser.add("show-env", "", "show how the environment changed at execs",
        [&]{ opts.printer.showEnv = true; }
    );
    parser.add("show-fds", "", "show how the open fds changed at execs",
        [&]{ opts.printer.showFds = true; }
    );
    parser.add("show-interpreter", "", "show the #! interpreters of scripts",
        [&]{ opts.printer.showInterpreter = true; }
    );
    parser.add("show-parents", "", "show the ancestors of exec'ing tracees",
        [&]{ opts.printer.showParents = true; }
    );

    parser.start_new_group("Logging options");

    parser.add("verbose", 'v', "", "shows more information than usual",
        []{ set_log_category_enabled(Log::VERB, true); }
    );
    parser.add("debug", 'd', "", "shows debugging log messages",
        []{ set_log_category_enabled(Log::DBG, true); }
    );
    parser.add("no-log", 'l', "", "disable general log messages",
        []{ set_log_category_enabled(Log::LOG, false); }
    );
}

int main(int argc, const char** argv)
{
    try
    {
        if (!init_log(argv[0])) // makes sure argv[0] isn't null :-)
        {
            return 1;
        }

        SessionOptions opts;
        ArgParser parser;
        register_options(parser, opts);

        vector<string> remainingArgs;
        if (!parser.parse(argv, remainingArgs))
        {
            return 1;
        }
        if (parser.should_exit())
        {
            return 0;
        }
        set_colour_enabled(should_use_colour(opts.colour, STDERR_FILENO));
        if (remainingArgs.empty())
        {
            error("No program to trace. Try '{} --help'.", program_name());
            return 1;
        }
        opts.tracer.command = std::move(remainingArgs);
        return run_session(std::move(opts));
    }
    catch (const std::exception& e)
    {
        error("Fatal! Got unhandled exception: {}", e.what());
        return 1;
    }
}
