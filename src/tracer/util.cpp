/*  Copyright (C) 2020  Henry Harvey --- See LICENSE file
 *
 *  util
 *
 *      Functionality used by the whole project, e.g., string processing,
 *      nifty macros, etc.
 *
 *  dependencies:   nothing
 */
#include <cctype>
#include <algorithm>
#include <cstring>
#include <regex>

#include "system.hpp"
#include "util.hpp"

using std::string;
using std::string_view;
using std::vector;

string strerror_s(int errnoVal)
{
    if (errnoVal == ERESTARTSYS)
    {
        return "ERESTARTSYS";
    }
    else if (errnoVal == ERESTARTNOINTR)
    {
        return "ERESTARTNOINTR";
    }
    // This is the GNU strerror_r, which may or may not use our buffer.
    char buf[128];
    return string(strerror_r(errnoVal, buf, sizeof(buf)));
}

void strip(string& s)
{
    auto notSpace = [](int c) { return !isspace(c); };
    s.erase(s.begin(), find_if(s.begin(), s.end(), notSpace));
    s.erase(find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
}

bool starts_with(string_view a, string_view b)
{
    if (a.size() < b.size() || b.empty())
    {
        return false;
    }
    return strncmp(a.data(), b.data(), b.size()) == 0;
}

string pad(string str, size_t padding)
{
    // Strip ANSI colour escapes so we can calculate length properly
    static const std::regex re("\033\\[[;0-9]*[A-Za-z]");
    string bare = std::regex_replace(str, re, "");
    long deficit = (long)padding - (long)bare.size();
    if (!bare.empty() && bare.back() != ' ' && deficit <= 0)
    {
        deficit = 1;
    }
    if (deficit > 0)
    {
        str.append(deficit, ' ');
    }
    return str;
}

string join(const vector<string>& items, char sep)
{
    size_t total = 0;
    for (auto& str : items)
    {
        total += str.size();
    }
    string s;
    s.reserve(total + items.size()); // don't forget separators
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (i > 0)
        {
            s += sep;
        }
        s += items[i];
    }
    return s;
}

template<typename StrType>
static vector<StrType> split_internal(string_view str,
                                      char delim,
                                      bool ignoreEmpty)
{
    vector<StrType> tokens;
    size_t start = 0; // start of current token
    size_t next; // start of next token
    while (next = str.find(delim, start), next != string::npos)
    {
        if (next > start || !ignoreEmpty)
        {
            tokens.push_back(StrType(str.substr(start, next - start)));
        }
        start = next + 1;
    }
    if (start < str.size() || !ignoreEmpty)
    {
        tokens.push_back(StrType(str.substr(start)));
    }
    return tokens;
}

vector<string> split(string_view str, char delim, bool ignoreEmpty)
{
    return split_internal<string>(str, delim, ignoreEmpty);
}

vector<string_view> split_views(string_view str, char delim, bool ignoreEmpty)
{
    return split_internal<string_view>(str, delim, ignoreEmpty);
}

string_view get_base_name(string_view path)
{
    size_t pos = path.rfind('/');
    if (pos != string::npos)
    {
        path.remove_prefix(pos + 1);
    }
    return path;
}

string join_path(string_view dir, string_view path)
{
    if (starts_with(path, "/") || dir.empty())
    {
        return string(path);
    }
    string result(dir);
    if (result.back() != '/')
    {
        result += '/';
    }
    result += path;
    return result;
}

/* Helper function for escape_string(). */
static bool is_weird_char(char c)
{
    return !isprint((unsigned char)c) || isspace((unsigned char)c);
}

static char hex_digit(int num)
{
    return num < 10 ? '0' + num : 'A' + num - 10;
}

/* Does the escaping for escaped_string and quoted_string. */
static string quote(string_view str)
{
    string str2;
    str2.reserve(str.size() + 2);
    str2 += '"';
    for (char c : str)
    {
        switch (c)
        {
            case '\n':  str2 += "\\n";  continue;
            case '\r':  str2 += "\\r";  continue;
            case '\t':  str2 += "\\t";  continue;
            case '\\':  str2 += "\\\\"; continue;
            case '\0':  str2 += "\\0";  continue;
            case '\v':  str2 += "\\v";  continue;
            case '\b':  str2 += "\\b";  continue;
            case '\f':  str2 += "\\f";  continue;
            case '"':   str2 += "\\\""; continue;
        }

        if (isprint((unsigned char)c))
        {
            str2 += c;
            continue;
        }

        // SUPER weird char - just print it as a hex byte escape
        char x[4] = {'\\', 'x'};
        x[2] = hex_digit((c & 0xF0) >> 4);
        x[3] = hex_digit(c & 0x0F);
        str2.append(x, 4);
    }
    str2 += '"';
    return str2;
}

string escaped_string(string_view str)
{
    if (!str.empty() && std::none_of(str.begin(), str.end(), is_weird_char))
    {
        return string(str);
    }
    return quote(str);
}

string quoted_string(string_view str)
{
    return quote(str);
}

string quoted_list(const vector<string>& items)
{
    string s = "[";
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (i > 0)
        {
            s += ", ";
        }
        s += quote(items[i]);
    }
    s += ']';
    return s;
}
