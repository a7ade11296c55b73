/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  pty
 *
 *      A pseudo-terminal for running the tracee on, and the thread that
 *      shuffles bytes between its master side and whoever is watching.
 */
#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>
#include <sys/ioctl.h>

#include "pty.hpp"
#include "log.hpp"
#include "system.hpp"
#include "util.hpp"

using std::string;
using std::string_view;

PseudoTerminal::PseudoTerminal() : _master(-1), _slave(-1)
{
    _master = posix_openpt(O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (_master == -1)
    {
        throw SystemError(errno, "posix_openpt");
    }
    char name[128];
    if (grantpt(_master) == -1
        || unlockpt(_master) == -1
        || ptsname_r(_master, name, sizeof(name)) != 0)
    {
        int e = errno;
        close(_master);
        throw SystemError(e, "grantpt/unlockpt/ptsname_r");
    }
    _slaveName = name;

    _slave = open(name, O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (_slave == -1)
    {
        int e = errno;
        close(_master);
        throw SystemError(e, format_message("open({})", _slaveName));
    }

    struct winsize size;
    if (isatty(STDIN_FILENO) && ioctl(STDIN_FILENO, TIOCGWINSZ, &size) == 0)
    {
        if (ioctl(_slave, TIOCSWINSZ, &size) == -1)
        {
            debug("couldn't copy the window size: {}", strerror_s(errno));
        }
    }
    verbose("opened pty {}", _slaveName);
}

PseudoTerminal::~PseudoTerminal()
{
    close_slave();
    if (_master != -1)
    {
        close(_master);
    }
}

void PseudoTerminal::close_slave()
{
    if (_slave != -1)
    {
        close(_slave);
        _slave = -1;
    }
}

/******************************************************************************
 * RELAY
 *****************************************************************************/

/* Keeps writing until everything is out (or the fd breaks). */
static bool write_all(int fd, string_view data)
{
    while (!data.empty())
    {
        ssize_t n = write(fd, data.data(), data.size());
        if (n == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        data.remove_prefix(n);
    }
    return true;
}

TerminalRelay::TerminalRelay(int master, OutputCallback output, int inputFd)
    : _master(master), _inputFd(inputFd), _output(std::move(output)),
    _stopped(false)
{
    if (pipe2(_wake, O_CLOEXEC) == -1)
    {
        throw SystemError(errno, "pipe2");
    }
    _thread = std::thread(&TerminalRelay::run, this);
}

TerminalRelay::~TerminalRelay()
{
    stop();
    close(_wake[0]);
    close(_wake[1]);
}

bool TerminalRelay::write_input(string_view data)
{
    return write_all(_master, data);
}

void TerminalRelay::stop()
{
    if (_stopped.exchange(true))
    {
        return;
    }
    char byte = 0;
    if (write(_wake[1], &byte, 1) == -1)
    {
        warning("couldn't wake up the terminal relay: {}", strerror_s(errno));
    }
    if (_thread.joinable())
    {
        _thread.join();
    }
}

/* Reads whatever the master has right now without blocking. */
void TerminalRelay::drain()
{
    char buffer[4096];
    for (;;)
    {
        struct pollfd pfd = {_master, POLLIN, 0};
        if (poll(&pfd, 1, 0) <= 0 || !(pfd.revents & POLLIN))
        {
            return;
        }
        ssize_t n = read(_master, buffer, sizeof(buffer));
        if (n <= 0)
        {
            return;
        }
        _output(string_view(buffer, n));
    }
}

void TerminalRelay::run()
{
    char buffer[4096];
    int inputFd = _inputFd;
    bool masterOpen = true;

    while (masterOpen || !_stopped)
    {
        struct pollfd fds[3];
        nfds_t count = 0;
        fds[count++] = {_wake[0], POLLIN, 0};
        if (masterOpen)
        {
            fds[count++] = {_master, POLLIN, 0};
        }
        if (inputFd != -1 && masterOpen)
        {
            fds[count++] = {inputFd, POLLIN, 0};
        }

        if (poll(fds, count, -1) == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            error("terminal relay: poll: {}", strerror_s(errno));
            return;
        }
        if (fds[0].revents & POLLIN)
        {
            if (masterOpen)
            {
                drain();
            }
            return;
        }
        if (masterOpen && fds[1].revents)
        {
            ssize_t n = read(_master, buffer, sizeof(buffer));
            if (n > 0)
            {
                _output(string_view(buffer, n));
            }
            else if (n == 0 || errno != EINTR)
            {
                // EIO: every copy of the slave has been closed
                debug("terminal relay: master closed ({})",
                    n == 0 ? "EOF" : get_errno_name(errno));
                masterOpen = false;
            }
        }
        if (count == 3 && fds[2].revents)
        {
            ssize_t n = read(inputFd, buffer, sizeof(buffer));
            if (n > 0)
            {
                if (!write_input(string_view(buffer, n)))
                {
                    inputFd = -1;
                }
            }
            else if (n == 0 || errno != EINTR)
            {
                inputFd = -1;
            }
        }
    }
}
