/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  filter
 *
 *      Decides which categories of events get through to the sinks.
 */
#ifndef EXECTRACE_FILTER_HPP
#define EXECTRACE_FILTER_HPP

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "event.hpp"

class EventFilter
{
public:
    /* Filled in from the command line. Read-only once the session starts. */
    struct Config
    {
        std::optional<std::vector<EventCategory>> defaults; // --filter
        std::vector<EventCategory> include;     // --filter-include
        std::vector<EventCategory> exclude;     // --filter-exclude
        bool showAll = false;                   // --show-all
        bool successfulOnly = false;            // --successful-only
    };

    /* warning, error, exec-success, exec-failure and tracee-exit */
    static std::vector<EventCategory> default_categories();

    EventFilter() : EventFilter(Config()) { }
    explicit EventFilter(const Config& config);

    /* Returns true if events of this category should be emitted. */
    bool emit(EventCategory category) const
    {
        return (_mask & bit(category)) != 0;
    }

    std::vector<EventCategory> enabled() const;

private:
    uint32_t _mask;

    static uint32_t bit(EventCategory category)
    {
        return 1u << static_cast<unsigned>(category);
    }
};

/* Parses a single category name (e.g., "exec-failure"). "exec" is accepted as
 * shorthand for both exec categories, so this returns a list. Throws a
 * ParseError if the name isn't known. */
std::vector<EventCategory> parse_category(std::string_view input);

/* Parses a comma-separated list of category names. */
std::vector<EventCategory> parse_category_list(std::string_view input);

#endif /* EXECTRACE_FILTER_HPP */
