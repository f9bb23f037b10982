/* Copyright (C) 2016 J.F.Dockes
 *   This program is free software; you can redistribute it and/or modify
 *   it under the terms of the GNU General Public License as published by
 *   the Free Software Foundation; either version 2 of the License, or
 *   (at your option) any later version.
 *
 *   This program is distributed in the hope that it will be useful,
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *   GNU General Public License for more details.
 *
 *   You should have received a copy of the GNU General Public License
 *   along with this program; if not, write to the
 *   Free Software Foundation, Inc.,
 *   59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 */
#ifndef _CDEVENTS_H_INCLUDED_
#define _CDEVENTS_H_INCLUDED_

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

/// Minimum interval between two SystemUpdateID broadcasts (seconds)
#define CD_EVENT_RATE 0.2

/**
 * SystemUpdateID state and change event rate limiting.
 *
 * The revision is the library last scan time. A rescan completion
 * updates it and, if anybody listens, schedules a broadcast. Bursts
 * are coalesced: there is at most one pending broadcast, sent no
 * sooner than the rate interval after the first signal of the burst
 * and after the previous broadcast.
 *
 * Time is passed in by the caller, so that this can be driven by
 * tests. All methods are thread-safe.
 */
class EventNotifier {
public:
    typedef std::chrono::steady_clock Clock;
    typedef Clock::time_point TimePoint;

    EventNotifier(unsigned long initialrev = 0,
                  double ratesecs = CD_EVENT_RATE);

    /// The library was rescanned. Returns true if a broadcast is
    /// now pending (only if there are subscribers).
    bool rescanCompleted(unsigned long revision, TimePoint now);

    /// Add subscriber. Returns the current revision, for the initial
    /// event which is sent immediately.
    unsigned long subscribe();
    void unsubscribe();

    /// Return the time of the pending broadcast, if any.
    bool pending(TimePoint *when) const;

    /// If the pending broadcast is due, clear it, record the
    /// broadcast time, and return true.
    bool takeDue(TimePoint now, unsigned long *revision);

    unsigned long revision() const;
    int subscribers() const;

private:
    mutable std::mutex m_mutex;
    unsigned long m_revision;
    int m_subscribers;
    Clock::duration m_rate;
    bool m_everevented;
    TimePoint m_lastevented;
    bool m_pending;
    // First signal since the last broadcast
    TimePoint m_burststart;
    TimePoint m_sendat;
};

/**
 * Single-slot timer. Runs one task at a given time on a worker
 * thread. Scheduling replaces the pending task, if any.
 */
class DelayedTask {
public:
    DelayedTask();
    ~DelayedTask();

    void schedule(EventNotifier::TimePoint when, std::function<void()> task);
    void cancel();
    bool isPending();

private:
    void worker();

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_thread;
    bool m_exiting;
    bool m_pending;
    EventNotifier::TimePoint m_when;
    std::function<void()> m_task;
};

#endif /* _CDEVENTS_H_INCLUDED_ */
