#include "core/runtime/events.h"

RuntimeEvent RuntimeEvent::cycleStart(quint64 cycle, qint64 timeNs)
{
    RuntimeEvent event;
    event.kind = CycleStart;
    event.cycle = cycle;
    event.timeNs = timeNs;
    return event;
}

RuntimeEvent RuntimeEvent::cycleEnd(quint64 cycle, qint64 timeNs)
{
    RuntimeEvent event;
    event.kind = CycleEnd;
    event.cycle = cycle;
    event.timeNs = timeNs;
    return event;
}

RuntimeEvent RuntimeEvent::fault(const QString &error, qint64 timeNs)
{
    RuntimeEvent event;
    event.kind = Fault;
    event.error = error;
    event.timeNs = timeNs;
    return event;
}

QJsonObject RuntimeEvent::toJson() const
{
    QJsonObject obj;
    switch (kind) {
    case CycleStart:
    case CycleEnd:
        obj.insert(QStringLiteral("type"), kind == CycleStart ? QStringLiteral("cycle_start")
                                                             : QStringLiteral("cycle_end"));
        obj.insert(QStringLiteral("cycle"), qint64(cycle));
        break;
    case TaskStart:
    case TaskEnd:
        obj.insert(QStringLiteral("type"), kind == TaskStart ? QStringLiteral("task_start")
                                                            : QStringLiteral("task_end"));
        obj.insert(QStringLiteral("name"), name);
        obj.insert(QStringLiteral("priority"), qint64(priority));
        break;
    case TaskOverrun:
        obj.insert(QStringLiteral("type"), QStringLiteral("task_overrun"));
        obj.insert(QStringLiteral("name"), name);
        obj.insert(QStringLiteral("missed"), qint64(missed));
        break;
    case Fault:
        obj.insert(QStringLiteral("type"), QStringLiteral("fault"));
        obj.insert(QStringLiteral("error"), error);
        break;
    }
    obj.insert(QStringLiteral("time_ns"), timeNs);
    return obj;
}

EventLog::EventLog(int capacity)
    : m_capacity(capacity > 0 ? capacity : DefaultCapacity)
{
}

void EventLog::push(const RuntimeEvent &event)
{
    std::lock_guard<std::mutex> lg(m_mutex);
    m_events.push_back(event);
    while (int(m_events.size()) > m_capacity)
        m_events.pop_front();
}

QVector<RuntimeEvent> EventLog::tail(int limit) const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    QVector<RuntimeEvent> out;
    for (auto it = m_events.rbegin(); it != m_events.rend() && out.size() < limit; ++it)
        out.append(*it);
    return out;
}

int EventLog::size() const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    return int(m_events.size());
}

void EventLog::clear()
{
    std::lock_guard<std::mutex> lg(m_mutex);
    m_events.clear();
}
