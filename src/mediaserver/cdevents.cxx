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

#include "cdevents.hxx"

#include "libupnpp/log.hxx"

using namespace std;

EventNotifier::EventNotifier(unsigned long initialrev, double ratesecs)
    : m_revision(initialrev), m_subscribers(0),
      m_rate(chrono::duration_cast<Clock::duration>(
                 chrono::duration<double>(ratesecs))),
      m_everevented(false), m_pending(false)
{
}

bool EventNotifier::rescanCompleted(unsigned long revision, TimePoint now)
{
    unique_lock<mutex> lock(m_mutex);
    if (revision >= m_revision) {
        m_revision = revision;
    } else {
        LOGINF("EventNotifier: library scan time went back from " <<
               m_revision << " to " << revision << ", keeping old\n");
    }
    if (m_subscribers <= 0) {
        return false;
    }

    if (!m_pending) {
        m_burststart = now;
    }
    TimePoint base = m_burststart;
    if (m_everevented && m_lastevented > base) {
        base = m_lastevented;
    }
    TimePoint sendat = base + m_rate;
    if (sendat < now) {
        sendat = now;
    }
    m_sendat = sendat;
    m_pending = true;
    LOGDEB1("EventNotifier::rescanCompleted: rev " << m_revision <<
            " pending broadcast\n");
    return true;
}

unsigned long EventNotifier::subscribe()
{
    unique_lock<mutex> lock(m_mutex);
    m_subscribers++;
    return m_revision;
}

void EventNotifier::unsubscribe()
{
    unique_lock<mutex> lock(m_mutex);
    if (m_subscribers > 0) {
        m_subscribers--;
    }
}

bool EventNotifier::pending(TimePoint *when) const
{
    unique_lock<mutex> lock(m_mutex);
    if (m_pending && when) {
        *when = m_sendat;
    }
    return m_pending;
}

bool EventNotifier::takeDue(TimePoint now, unsigned long *revision)
{
    unique_lock<mutex> lock(m_mutex);
    if (!m_pending || now < m_sendat) {
        return false;
    }
    m_pending = false;
    m_everevented = true;
    m_lastevented = now;
    if (revision) {
        *revision = m_revision;
    }
    return true;
}

unsigned long EventNotifier::revision() const
{
    unique_lock<mutex> lock(m_mutex);
    return m_revision;
}

int EventNotifier::subscribers() const
{
    unique_lock<mutex> lock(m_mutex);
    return m_subscribers;
}


DelayedTask::DelayedTask()
    : m_exiting(false), m_pending(false)
{
    m_thread = std::thread(std::bind(&DelayedTask::worker, this));
}

DelayedTask::~DelayedTask()
{
    {
        unique_lock<mutex> lock(m_mutex);
        m_exiting = true;
        m_cv.notify_all();
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void DelayedTask::schedule(EventNotifier::TimePoint when,
                           std::function<void()> task)
{
    unique_lock<mutex> lock(m_mutex);
    m_when = when;
    m_task = task;
    m_pending = true;
    m_cv.notify_all();
}

void DelayedTask::cancel()
{
    unique_lock<mutex> lock(m_mutex);
    m_pending = false;
    m_task = nullptr;
    m_cv.notify_all();
}

bool DelayedTask::isPending()
{
    unique_lock<mutex> lock(m_mutex);
    return m_pending;
}

void DelayedTask::worker()
{
    unique_lock<mutex> lock(m_mutex);
    for (;;) {
        if (m_exiting) {
            return;
        }
        if (!m_pending) {
            m_cv.wait(lock);
            continue;
        }
        if (m_cv.wait_until(lock, m_when) != std::cv_status::timeout) {
            // Rescheduled, cancelled or exiting: look again
            continue;
        }
        if (!m_pending || m_exiting ||
            EventNotifier::Clock::now() < m_when) {
            continue;
        }
        std::function<void()> task = m_task;
        m_pending = false;
        m_task = nullptr;
        lock.unlock();
        if (task) {
            task();
        }
        lock.lock();
    }
}
