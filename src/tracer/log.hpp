/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  log
 *
 *      A whole bunch of nifty logging functions. These are for diagnostics
 *      about exectrace itself, the events we see in tracees go through the
 *      event stream instead (see stream.hpp).
 */
#ifndef EXECTRACE_LOG_HPP
#define EXECTRACE_LOG_HPP

#include <string>
#include <string_view>
#include <fmt/core.h>
#include <fmt/format.h>

/* Describes types of log messages. We can ask the logger to filter these out
 * by their type so that we only see certain types of messages. */
enum class Log
{
    ERROR,  // For error messages from exectrace
    WARN,   // Warning messages
    LOG,    // general logging information
    VERB,   // verbose log messages
    DBG,    // debugging stuff (one line per ptrace stop, so very noisy)
    NUM_LOG_CATEGORIES, // must be the last item in the list.
};

/* Should call at the very start of main. Sets the default log categories and
 * stores the program name for us to access. Returns false and prints an error
 * message if there's something wrong. */
bool init_log(const char* argv0);

/* Retrieve the stored program name. */
std::string_view program_name();

/* Sets whether the specified log category is enabled or not. This function is
 * thread-safe despite modifying global state (an atomic store). */
void set_log_category_enabled(Log category, bool enabled);

/* Returns true if the specified log type is enabled, based on the current
 * log options. Will load global state, but is thread safe (it's atomic). */
bool is_log_enabled_for(Log category);

/* Always logs no matter the log level, otherwise the same as message(). Uses
 * the category log level to (maybe) add a coloured prefix to the message, such
 * as "error: " or "warning: ". */
void message_always(Log category, std::string_view message);

/* If is_log_enabled_for(level), prints out the message to stderr. Depending on
 * the log type, a different header may or may not be appended to the start of
 * the message. The message can have internal newlines. A newline will be added
 * to the end if there is no trailing newline. Lines from different threads are
 * never interleaved. */
inline void message(Log level, std::string_view message)
{
    if (is_log_enabled_for(level))
    {
        message_always(level, message);
    }
}

/* The format strings that get passed to us aren't compile-time checked, so
 * we go through vformat. */
template <typename ...Args>
inline std::string format_message(std::string_view fmtStr, const Args&... args)
{
    return fmt::vformat(fmtStr, fmt::make_format_args(args...));
}

/* Helper functions that forward a list of variadic arguments to libfmt. The
 * formatting is skipped entirely when the category is disabled. */
template <typename ...Args>
inline void log(std::string_view fmtStr, const Args&... args)
{
    if (is_log_enabled_for(Log::LOG))
    {
        message_always(Log::LOG, format_message(fmtStr, args...));
    }
}

template <typename ...Args>
inline void warning(std::string_view fmtStr, const Args&... args)
{
    if (is_log_enabled_for(Log::WARN))
    {
        message_always(Log::WARN, format_message(fmtStr, args...));
    }
}

template <typename ...Args>
inline void error(std::string_view fmtStr, const Args&... args)
{
    if (is_log_enabled_for(Log::ERROR))
    {
        message_always(Log::ERROR, format_message(fmtStr, args...));
    }
}

template <typename ...Args>
inline void verbose(std::string_view fmtStr, const Args&... args)
{
    if (is_log_enabled_for(Log::VERB))
    {
        message_always(Log::VERB, format_message(fmtStr, args...));
    }
}

template <typename ...Args>
inline void debug(std::string_view fmtStr, const Args&... args)
{
    if (is_log_enabled_for(Log::DBG))
    {
        message_always(Log::DBG, format_message(fmtStr, args...));
    }
}

#endif /* EXECTRACE_LOG_HPP */
