/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  filter
 *
 *      Decides which categories of events get through to the sinks.
 */
#include <algorithm>
#include <cctype>
#include <fmt/core.h>

#include "filter.hpp"
#include "parse.hpp"
#include "util.hpp"

using std::string;
using std::string_view;
using std::vector;
using fmt::format;

constexpr size_t NUM_CATEGORIES = (size_t)EventCategory::NUM_CATEGORIES;

vector<EventCategory> EventFilter::default_categories()
{
    return {
        EventCategory::WARNING,
        EventCategory::ERROR,
        EventCategory::EXEC_SUCCESS,
        EventCategory::EXEC_FAILURE,
        EventCategory::TRACEE_EXIT,
    };
}

EventFilter::EventFilter(const Config& config) : _mask(0)
{
    if (config.showAll)
    {
        _mask = (1u << NUM_CATEGORIES) - 1;
    }
    else
    {
        for (EventCategory category : config.defaults.has_value()
                ? config.defaults.value() : default_categories())
        {
            _mask |= bit(category);
        }
    }
    for (EventCategory category : config.include)
    {
        _mask |= bit(category);
    }
    for (EventCategory category : config.exclude)
    {
        _mask &= ~bit(category);
    }
    if (config.successfulOnly)
    {
        _mask &= ~bit(EventCategory::EXEC_FAILURE);
    }
}

vector<EventCategory> EventFilter::enabled() const
{
    vector<EventCategory> result;
    for (size_t i = 0; i < NUM_CATEGORIES; ++i)
    {
        if (emit(EventCategory(i)))
        {
            result.push_back(EventCategory(i));
        }
    }
    return result;
}

vector<EventCategory> parse_category(string_view input)
{
    string name(input);
    strip(name);
    std::transform(name.begin(), name.end(), name.begin(), ::tolower);
    std::replace(name.begin(), name.end(), '_', '-');

    if (name == "exec")
    {
        return { EventCategory::EXEC_SUCCESS, EventCategory::EXEC_FAILURE };
    }
    for (size_t i = 0; i < NUM_CATEGORIES; ++i)
    {
        if (get_category_name(EventCategory(i)) == name)
        {
            return { EventCategory(i) };
        }
    }

    vector<string> names;
    for (size_t i = 0; i < NUM_CATEGORIES; ++i)
    {
        names.emplace_back(get_category_name(EventCategory(i)));
    }
    throw ParseError(format("'{}' is not an event category (expected one of "
        "exec, {}).", input, join(names, ',')));
}

vector<EventCategory> parse_category_list(string_view input)
{
    vector<EventCategory> result;
    for (string_view item : split_views(input, ','))
    {
        for (EventCategory category : parse_category(item))
        {
            if (std::find(result.begin(), result.end(), category)
                == result.end())
            {
                result.push_back(category);
            }
        }
    }
    return result;
}
