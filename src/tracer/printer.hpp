/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  printer
 *
 *      An event sink that writes each event as a line of text (plus a few
 *      indented detail lines if asked for them).
 */
#ifndef EXECTRACE_PRINTER_HPP
#define EXECTRACE_PRINTER_HPP

#include <cstdio>
#include <string>

#include "stream.hpp"
#include "terminal.hpp"

class LogPrinter : public EventSink
{
public:
    struct Options
    {
        bool showEnv = false;           // environment diff
        bool showFds = false;           // fd diff
        bool showInterpreter = false;   // #! chain
        bool showParents = false;       // the parent chain
        bool colour = false;
    };

private:
    FILE* _file;
    bool _ownsFile;
    Options _options;

    std::string paint(Colour c, std::string_view str) const;
    void print_exec(const ExecEvent& event, std::string& out) const;

public:
    /* Doesn't take ownership of file. */
    LogPrinter(FILE* file, Options options);

    /* Opens path for writing ("-" means stdout). Throws a SystemError. */
    LogPrinter(const std::string& path, Options options);

    ~LogPrinter();

    LogPrinter(const LogPrinter&) = delete;
    LogPrinter& operator=(const LogPrinter&) = delete;

    void on_event(const EventPtr& event);
    void on_close();

    /* Renders an event the same way on_event does, without printing it. */
    std::string render(const TraceEvent& event) const;

    int fd() const { return fileno(_file); }
};

#endif /* EXECTRACE_PRINTER_HPP */
