/*  Copyright (C) 2020  Henry Harvey --- See LICENSE file
 *
 *  util
 *
 *      Functionality used by the whole project, e.g., string processing,
 *      nifty macros, etc.
 */
#ifndef EXECTRACE_UTIL_HPP
#define EXECTRACE_UTIL_HPP

#include <string>
#include <string_view>
#include <vector>

#define ARRAY_SIZE(a) (sizeof(a) / sizeof((a)[0]))

/* Does the same as strerror, except it's thread-safe. Will also print out
 * messages for the ERESTARTSYS and ERESTARTNOINTR error codes (only visible
 * to tracers). */
std::string strerror_s(int errnoVal);

/* Strips all leading and trailing whitespace from the specified string. */
void strip(std::string& str);

/* Returns true if 'a' starts with 'b'. C++20 introduced this as a method
 * of string and string_view, but I don't want to depend on C++20. */
bool starts_with(std::string_view a, std::string_view b);

/* Pads a string out to some number using spaces. Will ensure that there is at
 * least one space at the end of the returned string. ANSI escape sequences are
 * filtered out before calculating the string length that we pad to. */
std::string pad(std::string s, size_t padding);

/* Joins the provided vector with the separator into a string. The separator
 * will only be placed in between items (not at the start or end). */
std::string join(const std::vector<std::string>& items, char sep = ' ');

/* Splits the provided string into tokens using the provided delimiter. Empty
 * tokens will be ignored if skipEmpty is true. Ignoring empty tokens has the
 * same effect as merging consecutive occurrences of the delimiter. */
std::vector<std::string> split(std::string_view str,
                               char delim,
                               bool skipEmpty = true);

/* Same as split (above) but returns views into `str`, which must outlive the
 * returned vector. */
std::vector<std::string_view> split_views(std::string_view str,
                                          char delim,
                                          bool skipEmpty = true);

/* Strips the directory from the provided path, if present. */
std::string_view get_base_name(std::string_view path);

/* Joins a relative path onto a directory. Absolute paths are returned as is. */
std::string join_path(std::string_view dir, std::string_view path);

/* If str contains spaces or non-printable characters, then it is returned as
 * a double-quoted string with C escape sequences (e.g., a newline is turned
 * into "\\n"). Otherwise, an unchanged string is returned. */
std::string escaped_string(std::string_view str);

/* Same as escaped_string, but always adds the double quotes. */
std::string quoted_string(std::string_view str);

/* Formats a list of strings like ["sh", "-c", "true"]. */
std::string quoted_list(const std::vector<std::string>& items);

#endif /* EXECTRACE_UTIL_HPP */
