/*  Copyright (C) 2021  Henry Harvey --- See LICENSE file
 *
 *  stream
 *
 *      Delivers events to whoever is interested. Every sink gets its own
 *      bounded queue and its own thread, so a slow sink can't hold up the
 *      tracer (or the other sinks). A sink that falls too far behind loses
 *      its backlog and gets told how much it missed.
 */
#include <functional>
#include <fmt/core.h>

#include "stream.hpp"
#include "log.hpp"

using std::string;
using std::unique_ptr;
using fmt::format;

EventStream::~EventStream()
{
    close();
}

void EventStream::subscribe(std::shared_ptr<EventSink> sink, size_t capacity)
{
    auto subscriber = std::make_unique<Subscriber>();
    subscriber->sink = std::move(sink);
    subscriber->capacity = capacity < 2 ? 2 : capacity;

    std::scoped_lock<std::mutex> guard(_lock);
    if (_closed)
    {
        warning("subscribed to an event stream that's already closed");
        return;
    }
    Subscriber& ref = *subscriber;
    ref.thread = std::thread(&EventStream::deliver, std::ref(ref));
    _subscribers.push_back(std::move(subscriber));
}

/* The body of each sink's thread. */
void EventStream::deliver(Subscriber& subscriber)
{
    for (;;)
    {
        EventPtr event;
        {
            std::unique_lock<std::mutex> guard(subscriber.lock);
            subscriber.cond.wait(guard, [&] {
                return subscriber.closed || !subscriber.queue.empty();
            });
            if (subscriber.queue.empty())
            {
                break; // closed and drained
            }
            event = std::move(subscriber.queue.front());
            subscriber.queue.pop_front();
        }
        try
        {
            subscriber.sink->on_event(event);
        }
        catch (const std::exception& e)
        {
            error("event sink failed on event {}: {}", event->sequence,
                e.what());
        }
    }
    try
    {
        subscriber.sink->on_close();
    }
    catch (const std::exception& e)
    {
        error("event sink failed while closing: {}", e.what());
    }
}

/* Must be called with _lock held (for the sequence numbers). */
void EventStream::enqueue(Subscriber& subscriber, const EventPtr& event)
{
    std::scoped_lock<std::mutex> guard(subscriber.lock);
    if (subscriber.queue.size() >= subscriber.capacity)
    {
        size_t lost = subscriber.queue.size();
        subscriber.queue.clear();
        subscriber.dropped += lost;

        auto notice = std::make_unique<MessageEvent>(EventCategory::WARNING,
            format("event sink fell behind, dropped {} events", lost));
        notice->sequence = _nextSequence++;
        subscriber.queue.push_back(EventPtr(std::move(notice)));
    }
    subscriber.queue.push_back(event);
    subscriber.cond.notify_one();
}

uint64_t EventStream::publish(unique_ptr<TraceEvent> event)
{
    std::scoped_lock<std::mutex> guard(_lock);
    if (_closed)
    {
        return 0;
    }
    uint64_t sequence = _nextSequence++;
    event->sequence = sequence;
    EventPtr shared(std::move(event));
    for (auto& subscriber : _subscribers)
    {
        enqueue(*subscriber, shared);
    }
    return sequence;
}

void EventStream::close()
{
    {
        std::scoped_lock<std::mutex> guard(_lock);
        if (_closed)
        {
            return;
        }
        _closed = true;
        // Keep the subscribers (the dropped counts are still interesting),
        // but join them without holding _lock.
        for (auto& subscriber : _subscribers)
        {
            std::scoped_lock<std::mutex> subGuard(subscriber->lock);
            subscriber->closed = true;
            subscriber->cond.notify_one();
        }
    }
    for (auto& subscriber : _subscribers)
    {
        if (subscriber->thread.joinable())
        {
            subscriber->thread.join();
        }
    }
}

uint64_t EventStream::dropped(size_t index)
{
    std::scoped_lock<std::mutex> guard(_lock);
    if (index >= _subscribers.size())
    {
        return 0;
    }
    std::scoped_lock<std::mutex> subGuard(_subscribers[index]->lock);
    return _subscribers[index]->dropped;
}
