/*  Copyright (C) 2020  Henry Harvey --- See LICENSE file
 *
 *  session
 *
 *      Glues a Tracer to a log printer and our own signal handling, so that
 *      main only has to fill in the options.
 */
#include <atomic>
#include <cerrno>
#include <memory>
#include <thread>
#include <signal.h>
#include <unistd.h>

#include "session.hpp"
#include "log.hpp"
#include "system.hpp"
#include "util.hpp"

using std::string;
using std::shared_ptr;
using std::make_shared;

/* Tells the signal thread that the SIGINT it just got is from us. */
static std::atomic<bool> gDone = false;

static void register_signals()
{
    struct sigaction sa = {};
    // Tracer::cancel sends this to the tracing thread to interrupt waitpid.
    sa.sa_handler = [](int) { };
    sa.sa_flags = 0; // don't want SA_RESTART here
    sigemptyset(&sa.sa_mask);
    sigaction(SIGUSR1, &sa, nullptr);
}

/* This is where we can assign actions to SIGINT (Ctrl+C) and SIGTERM. For
 * this to work, they must be blocked with pthread_sigmask so that they don't
 * kill us. */
static void signal_thread(Tracer& tracer, sigset_t set)
{
    int sig;
    int err;
    while ((err = sigwait(&set, &sig)) == 0) // wait for the next signal
    {
        if (gDone)
        {
            return;
        }
        log("got {}, ending the trace", get_signal_name(sig));
        tracer.cancel();
    }
    error("sigwait: {}", strerror_s(err));
}

static void join_sigwaiter(std::thread& sigwaiter)
{
    gDone = true;

    // We send SIGINT to this process to cause the signal thread to unblock and
    // exit. Even if the signal thread isn't currently blocking, it will go
    // onto the pending queue and be delivered when ready.
    kill(getpid(), SIGINT);

    sigwaiter.join();
}

static shared_ptr<LogPrinter> make_printer(const SessionOptions& options)
{
    LogPrinter::Options printerOptions = options.printer;
    if (!options.output.has_value())
    {
        printerOptions.colour = should_use_colour(options.colour,
            STDERR_FILENO);
        return make_shared<LogPrinter>(stderr, printerOptions);
    }
    int fd = options.output.value() == "-" ? STDOUT_FILENO : -1;
    printerOptions.colour = should_use_colour(options.colour, fd);
    return make_shared<LogPrinter>(options.output.value(), printerOptions);
}

int run_session(SessionOptions options)
{
    register_signals();

    /* Block SIGINT and SIGTERM so they don't kill us (we want to sigwait
     * them). This has to happen before any other thread is created so that
     * they all inherit it. start_tracee makes sure that the tracee doesn't
     * inherit any of this. */
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    EventStream stream;
    try
    {
        stream.subscribe(make_printer(options), options.queueCapacity);
    }
    catch (const SystemError& e)
    {
        error("Couldn't open the output: {}", e.what());
        return 1;
    }

    Tracer tracer(std::move(options.tracer), stream);
    std::thread sigwaiter(signal_thread, std::ref(tracer), set);

    int code = 1;
    try
    {
        tracer.start();
        std::optional<int> status = tracer.run();
        if (status.has_value())
        {
            code = wait_status_to_exit_code(status.value());
        }
        else
        {
            log("detached before the root ended, its exit status is unknown");
        }
    }
    catch (const std::exception& e)
    {
        error("{}", e.what());
    }

    join_sigwaiter(sigwaiter);
    stream.close(); // flushes whatever the printer hasn't got to yet
    return code;
}
