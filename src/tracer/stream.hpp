/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  stream
 *
 *      Delivers events to whoever is interested. Every sink gets its own
 *      bounded queue and its own thread, so a slow sink can't hold up the
 *      tracer (or the other sinks). A sink that falls too far behind loses
 *      its backlog and gets told how much it missed.
 */
#ifndef EXECTRACE_STREAM_HPP
#define EXECTRACE_STREAM_HPP

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "event.hpp"

using EventPtr = std::shared_ptr<const TraceEvent>;

/* Implement this to receive events. */
class EventSink
{
public:
    virtual ~EventSink() { }

    /* Called on the sink's own thread, one event at a time. */
    virtual void on_event(const EventPtr& event) = 0;

    /* Called on the sink's thread after the last event. */
    virtual void on_close() { }
};

class EventStream
{
private:
    struct Subscriber
    {
        std::shared_ptr<EventSink> sink;
        size_t capacity;
        std::mutex lock;
        std::condition_variable cond;
        std::deque<EventPtr> queue;
        uint64_t dropped = 0;   // total for this sink
        bool closed = false;
        std::thread thread;
    };

    std::mutex _lock;   // protects everything below
    std::vector<std::unique_ptr<Subscriber>> _subscribers;
    uint64_t _nextSequence;
    bool _closed;

    static void deliver(Subscriber& subscriber);
    void enqueue(Subscriber& subscriber, const EventPtr& event);

public:
    EventStream() : _nextSequence(1), _closed(false) { }
    ~EventStream();

    EventStream(const EventStream&) = delete;

    /* Registers a sink. Can be called at any time, but the sink only sees the
     * events published after it subscribed. A capacity below 2 is bumped up
     * to 2 (room for a drop warning plus the event that caused it). */
    void subscribe(std::shared_ptr<EventSink> sink, size_t capacity = 4096);

    /* Stamps the event with the next sequence number and queues it for every
     * sink. Never blocks on a sink. Events published after close() are
     * discarded. Returns the sequence number (0 if discarded). */
    uint64_t publish(std::unique_ptr<TraceEvent> event);

    /* Lets every sink drain its queue, then joins their threads. */
    void close();

    /* The number of events a sink has lost so far (for tests). */
    uint64_t dropped(size_t subscriber);
};

#endif /* EXECTRACE_STREAM_HPP */
