/*  Copyright (C) 2020  Henry Harvey --- See LICENSE file
 *
 *  terminal
 *
 *      Coloured text and figuring out what the terminal we're attached to
 *      can actually do.
 */
#ifndef EXECTRACE_TERMINAL_HPP
#define EXECTRACE_TERMINAL_HPP

#include <string>
#include <string_view>
#include <cstdint>
#include <fmt/color.h>

/* Why not just use libfmt's fmt::text_style type? It's huge (20 bytes) and
 * this is a lot less typing. */
enum class Colour : uint8_t
{
    /* Colours (whichever is 0 will be the default colour via DEFAULT but also
     * if you don't specify any colour - e.g., just Colour::BOLD). */
    WHITE   = 0,
    GREY    = 1,
    YELLOW  = 2,
    BLUE    = 3,
    CYAN    = 4,
    GREEN   = 5,
    RED     = 6,
    MAGENTA = 7,
    PURPLE  = 8,
    BLACK   = 9,

    /* Emphasis */
    BOLD    = 0x80,

    /* Other */
    RESET = 0,
    DEFAULT = 0,
    COLOUR_MASK = 0x7F,
};

/* Define operator overloads so that we can use scoped enum like an integer. */
inline constexpr Colour operator|(Colour a, Colour b)
{
    return Colour(uint8_t(a) | uint8_t(b));
}

inline constexpr Colour operator&(Colour a, Colour b)
{
    return Colour(uint8_t(a) & uint8_t(b));
}

/* --colour=auto|always|never */
enum class ColourMode
{
    AUTO,
    ALWAYS,
    NEVER,
};

/* If false, then calls to colour() (below) will not add any colour. Despite
 * modifying global state, this function is thread-safe (atomic store). */
void set_colour_enabled(bool enabled);

/* Returns the current setting from set_colour_enabled. */
bool is_colour_enabled();

/* Takes the string and applies escape codes to it so that terminals will show
 * it with the specified colour. Does nothing if set_colour_enabled(false). */
std::string colour(Colour colour, std::string_view str);

/* Same as colour() but ignores set_colour_enabled. For output that has its own
 * colour setting (e.g., a log file given with --output). */
std::string apply_colour(Colour colour, std::string_view str);

/* Returns true if fd is a terminal and terminfo says that it does colours.
 * Also respects the NO_COLOR convention. */
bool terminal_supports_colour(int fd);

/* Resolves a ColourMode for output going to fd. */
bool should_use_colour(ColourMode mode, int fd);

/* Queries the size of the terminal behind fd. Returns false and sets errno on
 * failure (e.g., fd isn't a terminal). */
bool get_terminal_size(int fd, unsigned short& width, unsigned short& height);

#endif /* EXECTRACE_TERMINAL_HPP */
