/*  Copyright (C) 2020  Henry Harvey --- See LICENSE file
 *
 *  parse
 *
 *      Parsers for the values of command-line options.
 */
#ifndef EXECTRACE_PARSE_HPP
#define EXECTRACE_PARSE_HPP

#include <string>
#include <string_view>
#include <charconv>
#include <fmt/core.h>

enum class FilterMode;  // defined in seccomp.hpp
enum class Teardown;    // defined in tracer.hpp
enum class ColourMode;  // defined in terminal.hpp

/* The parse functions will throw this error whenever they fail. */
class ParseError : public std::exception
{
private:
    std::string _msg;
public:
    ParseError(std::string_view msg) : _msg(msg) { }
    const char* what() const noexcept { return _msg.c_str(); }
};

/* Parses a boolean argument and throws an exception if the argument is not
 * valid. Accepts things like enabled/disabled, yes/no, true/false, 0/1 */
bool parse_bool(std::string_view input);

/* Helper function to parse arbitrary integer argments. The entire string must
 * be a valid integer, otherwise an exception will be thrown. */
template<class T>
T parse_number(std::string_view input)
{
    T value;
    const auto result = std::from_chars(input.data(),
            input.data() + input.size(), value);
    if (result.ptr == input.data()
        || result.ptr != input.data() + input.size()
        || result.ec != std::errc())
    {
        throw ParseError(fmt::format("'{}' is not a valid number.", input));
    }
    return value;
}

/* auto, on or off (also accepts the parse_bool spellings for on/off). */
FilterMode parse_filter_mode(std::string_view input);

/* detach, terminate or kill */
Teardown parse_teardown(std::string_view input);

/* auto, always or never */
ColourMode parse_colour_mode(std::string_view input);

#endif /* EXECTRACE_PARSE_HPP */
