/*  Copyright (C) 2020  Henry Harvey --- See LICENSE file
 *
 *  parse-test
 *
 *      Option value parsers, string helpers and wait status decoding.
 */
#include <csignal>
#include <sys/wait.h>
#include <gtest/gtest.h>

#include "parse.hpp"
#include "seccomp.hpp"
#include "system.hpp"
#include "terminal.hpp"
#include "tracer.hpp"
#include "util.hpp"

using std::string;
using std::vector;

TEST(Parse, Bools)
{
    EXPECT_TRUE(parse_bool("yes"));
    EXPECT_TRUE(parse_bool("ON"));
    EXPECT_TRUE(parse_bool("1"));
    EXPECT_FALSE(parse_bool("disabled"));
    EXPECT_FALSE(parse_bool("False"));
    EXPECT_THROW(parse_bool("maybe"), ParseError);
}

TEST(Parse, Numbers)
{
    EXPECT_EQ(parse_number<int>("42"), 42);
    EXPECT_EQ(parse_number<int>("-7"), -7);
    EXPECT_THROW(parse_number<int>(""), ParseError);
    EXPECT_THROW(parse_number<int>("12abc"), ParseError);
    EXPECT_THROW(parse_number<unsigned char>("300"), ParseError);
}

TEST(Parse, Modes)
{
    EXPECT_EQ(parse_filter_mode("auto"), FilterMode::AUTO);
    EXPECT_EQ(parse_filter_mode("on"), FilterMode::ON);
    EXPECT_EQ(parse_filter_mode("no"), FilterMode::OFF);
    EXPECT_THROW(parse_filter_mode("sometimes"), ParseError);

    EXPECT_EQ(parse_teardown("detach"), Teardown::DETACH);
    EXPECT_EQ(parse_teardown("TERMINATE"), Teardown::TERMINATE);
    EXPECT_EQ(parse_teardown("kill"), Teardown::KILL);
    EXPECT_THROW(parse_teardown("explode"), ParseError);

    EXPECT_EQ(parse_colour_mode("always"), ColourMode::ALWAYS);
    EXPECT_EQ(parse_colour_mode("never"), ColourMode::NEVER);
    EXPECT_THROW(parse_colour_mode("sometimes"), ParseError);
}

TEST(Util, Strings)
{
    string s = "  \thello world\n ";
    strip(s);
    EXPECT_EQ(s, "hello world");

    EXPECT_TRUE(starts_with("--output", "--"));
    EXPECT_FALSE(starts_with("-", "--"));

    EXPECT_EQ(split("a,,b,", ','), (vector<string>{"a", "b"}));
    EXPECT_EQ(split("a,,b", ',', false), (vector<string>{"a", "", "b"}));
    EXPECT_EQ(join({"a", "b", "c"}, ','), "a,b,c");

    EXPECT_EQ(get_base_name("/usr/bin/env"), "env");
    EXPECT_EQ(join_path("/usr", "bin"), "/usr/bin");
    EXPECT_EQ(join_path("/usr/", "bin"), "/usr/bin");
    EXPECT_EQ(join_path("/usr", "/bin"), "/bin");
}

TEST(Util, Quoting)
{
    EXPECT_EQ(escaped_string("plain"), "plain");
    EXPECT_EQ(escaped_string("has space"), "\"has space\"");
    EXPECT_EQ(escaped_string(""), "\"\"");
    EXPECT_EQ(quoted_string("a\nb"), "\"a\\nb\"");
    EXPECT_EQ(quoted_list({"sh", "-c", "true"}), "[\"sh\", \"-c\", \"true\"]");
}

TEST(System, WaitStatusToExitCode)
{
    EXPECT_EQ(wait_status_to_exit_code(0), 0);
    EXPECT_EQ(wait_status_to_exit_code(3 << 8), 3);
    EXPECT_EQ(wait_status_to_exit_code(SIGKILL), 128 + SIGKILL);
}

TEST(System, Names)
{
    EXPECT_EQ(get_signal_name(SIGINT), "SIGINT");
    EXPECT_EQ(get_errno_name(ENOENT), "ENOENT");
    EXPECT_EQ(get_syscall_name(SYSCALL_EXECVE), "execve");
    EXPECT_EQ(get_syscall_name(SYSCALL_EXECVEAT), "execveat");
    EXPECT_EQ(get_syscall_name(1), "syscall_1");
    EXPECT_TRUE(is_exec_syscall(59));
    EXPECT_FALSE(is_exec_syscall(57));
}

TEST(System, TeardownNames)
{
    EXPECT_EQ(get_teardown_name(Teardown::DETACH), "detach");
    EXPECT_EQ(get_teardown_name(Teardown::KILL), "kill");
}
