/*  Copyright (C) 2020  Henry Harvey --- See LICENSE file
 *
 *  session
 *
 *      Glues a Tracer to a log printer and our own signal handling, so that
 *      main only has to fill in the options.
 */
#ifndef EXECTRACE_SESSION_HPP
#define EXECTRACE_SESSION_HPP

#include <optional>
#include <string>

#include "printer.hpp"
#include "terminal.hpp"
#include "tracer.hpp"

struct SessionOptions
{
    Tracer::Options tracer;
    LogPrinter::Options printer;    // colour is worked out from `colour`
    std::optional<std::string> output;  // none means stderr, "-" stdout
    ColourMode colour = ColourMode::AUTO;
    size_t queueCapacity = 4096;    // per sink
};

/* Runs the command from start to finish. SIGINT and SIGTERM cancel the trace
 * (using the teardown policy). Returns what exectrace should exit with: the
 * root's exit code (or 128 + the signal that killed it), or 1 if the trace
 * couldn't be started or we detached before the root ended. */
int run_session(SessionOptions options);

#endif /* EXECTRACE_SESSION_HPP */
