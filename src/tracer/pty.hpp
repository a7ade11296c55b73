/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  pty
 *
 *      A pseudo-terminal for running the tracee on, and the thread that
 *      shuffles bytes between its master side and whoever is watching.
 */
#ifndef EXECTRACE_PTY_HPP
#define EXECTRACE_PTY_HPP

#include <atomic>
#include <functional>
#include <string>
#include <string_view>
#include <thread>

class PseudoTerminal
{
private:
    int _master;
    int _slave;
    std::string _slaveName;

public:
    /* Opens a new pty pair (both ends close-on-exec). If our stdin is a
     * terminal, then its window size is copied over. Throws a SystemError. */
    PseudoTerminal();
    ~PseudoTerminal();

    PseudoTerminal(const PseudoTerminal&) = delete;

    int master() const { return _master; }
    int slave() const { return _slave; }
    const std::string& slave_name() const { return _slaveName; }

    /* Call once the tracee has its own copy of the slave. Without this, the
     * master would never see EIO after the tracee is gone. */
    void close_slave();
};

/* Relays the output of a pty master to a callback (on its own thread), and
 * optionally copies an input fd (e.g., our stdin) into the master. */
class TerminalRelay
{
public:
    using OutputCallback = std::function<void(std::string_view)>;

private:
    int _master;
    int _inputFd;
    int _wake[2];
    OutputCallback _output;
    std::thread _thread;
    std::atomic<bool> _stopped;

    void run();
    void drain();

public:
    /* Doesn't take ownership of master or inputFd. inputFd can be -1. */
    TerminalRelay(int master, OutputCallback output, int inputFd = -1);
    ~TerminalRelay();

    TerminalRelay(const TerminalRelay&) = delete;

    /* Writes bytes to the master as if they had been typed. Returns false if
     * the write failed (e.g., nobody has the slave open anymore). */
    bool write_input(std::string_view data);

    /* Passes on whatever output is still buffered in the master, then ends
     * the relay thread. Safe to call more than once. */
    void stop();
};

#endif /* EXECTRACE_PTY_HPP */
