/*  Copyright (C) 2020  Henry Harvey --- See LICENSE file
 *
 *  terminal
 *
 *      Coloured text and figuring out what the terminal we're attached to
 *      can actually do.
 */
#include <unistd.h>
#include <sys/ioctl.h>
#include <cstdlib>
#include <atomic>
#include <mutex>
#include <fmt/core.h>
#include <fmt/color.h>

#include "terminal.hpp"
#include "util.hpp"

// term.h defines a load of lowercase macros (lines, columns, ...), so it goes
// last and stays out of the header.
#include <curses.h>
#include <term.h>

using std::string;
using std::string_view;

/* Affects how colour() behaves. */
static std::atomic<bool> gColourEnabled = true;

void set_colour_enabled(bool enabled)
{
    gColourEnabled = enabled;
}

bool is_colour_enabled()
{
    return gColourEnabled;
}

static fmt::text_style to_text_style(Colour c)
{
    fmt::text_style style;
    switch (c & Colour::COLOUR_MASK)
    {
        case Colour::BLACK:     style = fg(fmt::color::black); break;
        case Colour::GREY:      style = fg(fmt::color::gray); break;
        case Colour::YELLOW:    style = fg(fmt::color::yellow); break;
        case Colour::BLUE:      style = fg(fmt::color::cornflower_blue); break;
        case Colour::CYAN:      style = fg(fmt::color::cyan); break;
        case Colour::GREEN:     style = fg(fmt::color::green); break;
        case Colour::RED:       style = fg(fmt::color::crimson); break;
        case Colour::MAGENTA:   style = fg(fmt::color::magenta); break;
        case Colour::PURPLE:    style = fg(fmt::color::medium_purple); break;
        case Colour::WHITE:     style = fg(fmt::color::white); break;
        default:                style = fg(fmt::color::white); break;
    }
    if ((c & Colour::BOLD) != (Colour)0)
    {
        style |= fmt::emphasis::bold;
    }
    return style;
}

string apply_colour(Colour c, string_view str)
{
    return fmt::format(to_text_style(c), "{}", str);
}

string colour(Colour c, string_view str)
{
    if (!gColourEnabled)
    {
        return string(str);
    }
    return apply_colour(c, str);
}

/* setupterm allocates a new TERMINAL every time it's called, so we only ever
 * ask terminfo once and remember the answer. */
static int terminfo_colour_count(int fd)
{
    static std::once_flag once;
    static int count = -1;
    std::call_once(once, [fd] {
        int err = 0;
        if (setupterm(nullptr, fd, &err) == OK)
        {
            char name[] = "colors";
            count = tigetnum(name);
        }
    });
    return count;
}

bool terminal_supports_colour(int fd)
{
    const char* noColour = getenv("NO_COLOR");
    if (noColour && noColour[0] != '\0')
    {
        return false;
    }
    if (!isatty(fd))
    {
        return false;
    }
    return terminfo_colour_count(fd) >= 8;
}

bool should_use_colour(ColourMode mode, int fd)
{
    switch (mode)
    {
        case ColourMode::ALWAYS:    return true;
        case ColourMode::NEVER:     return false;
        default:                    return terminal_supports_colour(fd);
    }
}

bool get_terminal_size(int fd, unsigned short& width, unsigned short& height)
{
    struct winsize size;
    if (ioctl(fd, TIOCGWINSZ, &size) == -1)
    {
        return false;
    }
    width = size.ws_col;
    height = size.ws_row;
    return true;
}
