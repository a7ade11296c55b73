/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  filter-test
 *
 *      Event category filtering and the --filter style category lists.
 */
#include <algorithm>
#include <random>
#include <gtest/gtest.h>

#include "filter.hpp"
#include "parse.hpp"

using std::vector;

static vector<EventCategory> all_categories()
{
    vector<EventCategory> all;
    for (int i = 0; i < (int)EventCategory::NUM_CATEGORIES; ++i)
    {
        all.push_back(EventCategory(i));
    }
    return all;
}

TEST(EventFilter, DefaultsShowExecsExitsAndProblems)
{
    EventFilter filter;
    EXPECT_TRUE(filter.emit(EventCategory::WARNING));
    EXPECT_TRUE(filter.emit(EventCategory::ERROR));
    EXPECT_TRUE(filter.emit(EventCategory::EXEC_SUCCESS));
    EXPECT_TRUE(filter.emit(EventCategory::EXEC_FAILURE));
    EXPECT_TRUE(filter.emit(EventCategory::TRACEE_EXIT));
    EXPECT_FALSE(filter.emit(EventCategory::OTHER_SIGNAL));
    EXPECT_FALSE(filter.emit(EventCategory::INFO));
    EXPECT_FALSE(filter.emit(EventCategory::NEW_CHILD));
    EXPECT_EQ(filter.enabled(), EventFilter::default_categories());
}

TEST(EventFilter, IncludeAndExclude)
{
    EventFilter::Config config;
    config.include = {EventCategory::OTHER_SIGNAL};
    config.exclude = {EventCategory::TRACEE_EXIT};
    EventFilter filter(config);
    EXPECT_TRUE(filter.emit(EventCategory::OTHER_SIGNAL));
    EXPECT_FALSE(filter.emit(EventCategory::TRACEE_EXIT));
    EXPECT_TRUE(filter.emit(EventCategory::EXEC_SUCCESS));
}

TEST(EventFilter, ExcludeBeatsInclude)
{
    EventFilter::Config config;
    config.include = {EventCategory::INFO};
    config.exclude = {EventCategory::INFO};
    EXPECT_FALSE(EventFilter(config).emit(EventCategory::INFO));
}

TEST(EventFilter, ShowAllStillHonoursExclude)
{
    EventFilter::Config config;
    config.showAll = true;
    config.exclude = {EventCategory::NEW_CHILD};
    EventFilter filter(config);
    for (EventCategory category : all_categories())
    {
        EXPECT_EQ(filter.emit(category), category != EventCategory::NEW_CHILD)
            << get_category_name(category);
    }
}

TEST(EventFilter, SuccessfulOnlyHidesFailedExecs)
{
    EventFilter::Config config;
    config.successfulOnly = true;
    config.include = {EventCategory::EXEC_FAILURE};
    EventFilter filter(config);
    EXPECT_FALSE(filter.emit(EventCategory::EXEC_FAILURE));
    EXPECT_TRUE(filter.emit(EventCategory::EXEC_SUCCESS));
}

TEST(EventFilter, ReplacedDefaults)
{
    EventFilter::Config config;
    config.defaults = vector<EventCategory>{EventCategory::EXEC_SUCCESS};
    EventFilter filter(config);
    EXPECT_EQ(filter.enabled(), vector<EventCategory>{
        EventCategory::EXEC_SUCCESS});
}

/* The result can't depend on the order that the lists were given in. */
TEST(EventFilter, OrderIndependent)
{
    std::mt19937 rng(1234);
    vector<EventCategory> all = all_categories();
    for (int round = 0; round < 200; ++round)
    {
        EventFilter::Config config;
        for (EventCategory category : all)
        {
            switch (rng() % 3)
            {
                case 0: config.include.push_back(category); break;
                case 1: config.exclude.push_back(category); break;
                default: break;
            }
        }
        config.showAll = rng() % 2;
        config.successfulOnly = rng() % 2;

        EventFilter::Config shuffled = config;
        std::shuffle(shuffled.include.begin(), shuffled.include.end(), rng);
        std::shuffle(shuffled.exclude.begin(), shuffled.exclude.end(), rng);

        EXPECT_EQ(EventFilter(config).enabled(),
            EventFilter(shuffled).enabled());
    }
}

TEST(CategoryList, ParsesNamesAndShorthand)
{
    EXPECT_EQ(parse_category_list("exec"), (vector<EventCategory>{
        EventCategory::EXEC_SUCCESS, EventCategory::EXEC_FAILURE}));
    EXPECT_EQ(parse_category_list("warning, tracee_exit,EXEC-FAILURE"),
        (vector<EventCategory>{EventCategory::WARNING,
        EventCategory::TRACEE_EXIT, EventCategory::EXEC_FAILURE}));
    EXPECT_EQ(parse_category_list("info,info,new-child"),
        (vector<EventCategory>{EventCategory::INFO,
        EventCategory::NEW_CHILD}));
    EXPECT_TRUE(parse_category_list("").empty());
}

TEST(CategoryList, UnknownNameThrows)
{
    EXPECT_THROW(parse_category_list("exec,bogus"), ParseError);
    EXPECT_THROW(parse_category("syscalls"), ParseError);
}

TEST(CategoryList, NamesRoundTrip)
{
    for (EventCategory category : all_categories())
    {
        EXPECT_EQ(parse_category(get_category_name(category)),
            vector<EventCategory>{category});
    }
}
