/*  Copyright (C) 2020  Henry Harvey --- See LICENSE file
 *
 *  parse
 *
 *      Parsers for the values of command-line options.
 */
#include <algorithm>
#include <cctype>

#include "parse.hpp"
#include "seccomp.hpp"
#include "terminal.hpp"
#include "tracer.hpp"

using std::string;
using std::string_view;
using fmt::format;

static string to_lower(string_view input)
{
    string str(input);
    std::transform(str.begin(), str.end(), str.begin(), ::tolower);
    return str;
}

bool parse_bool(string_view input)
{
    string str = to_lower(input);
    if (str == "yes" || str == "1" || str == "on" || str == "enabled"
        || str == "enable" || str == "true")
    {
        return true;
    }
    if (str == "no" || str == "0" || str == "off" || str == "disabled"
        || str == "disable" || str == "false")
    {
        return false;
    }
    throw ParseError(format("'{}' is not a valid boolean.", input));
}

FilterMode parse_filter_mode(string_view input)
{
    if (to_lower(input) == "auto")
    {
        return FilterMode::AUTO;
    }
    try
    {
        return parse_bool(input) ? FilterMode::ON : FilterMode::OFF;
    }
    catch (const ParseError&)
    {
        throw ParseError(format("'{}' is not one of auto, on or off.", input));
    }
}

Teardown parse_teardown(string_view input)
{
    string str = to_lower(input);
    if (str == "detach")
    {
        return Teardown::DETACH;
    }
    if (str == "terminate" || str == "term")
    {
        return Teardown::TERMINATE;
    }
    if (str == "kill")
    {
        return Teardown::KILL;
    }
    throw ParseError(format("'{}' is not one of detach, terminate or kill.",
        input));
}

ColourMode parse_colour_mode(string_view input)
{
    string str = to_lower(input);
    if (str == "auto")
    {
        return ColourMode::AUTO;
    }
    if (str == "always")
    {
        return ColourMode::ALWAYS;
    }
    if (str == "never")
    {
        return ColourMode::NEVER;
    }
    throw ParseError(format("'{}' is not one of auto, always or never.",
        input));
}
