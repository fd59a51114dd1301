#ifndef RUNTIME_EVENTS_H
#define RUNTIME_EVENTS_H

#include <deque>
#include <mutex>

#include <QJsonObject>
#include <QString>
#include <QVector>

struct RuntimeEvent {
    enum Kind {
        CycleStart,
        CycleEnd,
        TaskStart,
        TaskEnd,
        TaskOverrun,
        Fault
    } kind = CycleStart;
    quint64 cycle = 0;
    QString name;     // task events
    quint32 priority = 0;
    quint64 missed = 0;
    QString error;    // fault events
    qint64 timeNs = 0;

    static RuntimeEvent cycleStart(quint64 cycle, qint64 timeNs);
    static RuntimeEvent cycleEnd(quint64 cycle, qint64 timeNs);
    static RuntimeEvent fault(const QString &error, qint64 timeNs);

    QJsonObject toJson() const;
};

// Bounded ring of the most recent runtime events. Thread-safe.
class EventLog
{
public:
    static constexpr int DefaultCapacity = 256;

    explicit EventLog(int capacity = DefaultCapacity);

    void push(const RuntimeEvent &event);
    // Newest first, at most limit entries.
    QVector<RuntimeEvent> tail(int limit) const;
    int size() const;
    void clear();

private:
    mutable std::mutex m_mutex;
    std::deque<RuntimeEvent> m_events;
    int m_capacity;
};

#endif
