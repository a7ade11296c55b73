/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  log
 *
 *      A whole bunch of nifty logging functions. These are for diagnostics
 *      about exectrace itself, the events we see in tracees go through the
 *      event stream instead (see stream.hpp).
 */
#include <iostream>
#include <atomic>
#include <mutex>

#include "log.hpp"
#include "util.hpp"
#include "terminal.hpp"

using std::string;
using std::string_view;

/* Don't need this to be synchronized since we only write it once at the very
 * start of the program and it's read-only from there-on out. */
static string gProgramName = "exectrace";

/* Stores whether or not each log category is currently enabled or not... */
static std::atomic<bool> gLogCategoryEnabled[size_t(Log::NUM_LOG_CATEGORIES)] = {
    {true}, {true}, {true}, {false}, {false}
};

/* The sink threads log too, so whole lines are written under this. */
static std::mutex gOutputLock;

// Colours other settings for our log messages
constexpr string_view PREFIX = "[exectrace] ";
constexpr Colour PREFIX_COLOUR = Colour::GREY;
constexpr Colour ERROR_COLOUR = Colour::RED | Colour::BOLD;
constexpr Colour WARNING_COLOUR = Colour::PURPLE | Colour::BOLD;
constexpr Colour DEBUG_COLOUR = Colour::GREY | Colour::BOLD;

bool init_log(const char* argv0)
{
    set_log_category_enabled(Log::ERROR, true);
    set_log_category_enabled(Log::WARN, true);
    set_log_category_enabled(Log::LOG, true);
    set_log_category_enabled(Log::VERB, false);
    set_log_category_enabled(Log::DBG, false);

    if (!argv0)
    {
        error("argv[0] is null??? Are you crazy?! Give me a name!");
        return false;
    }
    gProgramName = get_base_name(argv0);
    return true;
}

string_view program_name()
{
    return gProgramName;
}

void set_log_category_enabled(Log category, bool enabled)
{
    if (category < Log::NUM_LOG_CATEGORIES)
    {
        gLogCategoryEnabled[size_t(category)] = enabled;
    }
}

bool is_log_enabled_for(Log category)
{
    if (category >= Log::NUM_LOG_CATEGORIES)
    {
        return false;
    }
    return gLogCategoryEnabled[size_t(category)];
}

void message_always(Log category, string_view message)
{
    string header = colour(PREFIX_COLOUR, PREFIX);
    switch (category)
    {
    case Log::ERROR:
        header += colour(ERROR_COLOUR, "error: ");
        break;
    case Log::WARN:
        header += colour(WARNING_COLOUR, "warning: ");
        break;
    case Log::DBG:
        header += colour(DEBUG_COLOUR, "debug: ");
        break;
    default:
        break;
    }
    // Each line of the message gets its own prefix. We build the whole thing
    // up first so that it goes out in one write.
    string text;
    text.reserve(message.size() + 40);
    size_t pos = 0, next;
    while (next = message.find('\n', pos), next != string::npos)
    {
        text += header;
        text.append(message.substr(pos, next - pos + 1));
        pos = next + 1;
    }
    if (pos < message.size())
    {
        text += header;
        text.append(message.substr(pos));
        text += '\n';
    }

    std::scoped_lock<std::mutex> guard(gOutputLock);
    std::cerr << text;
    std::cerr.flush();
}
