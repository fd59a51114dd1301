#ifndef CONTROL_AUDIT_H
#define CONTROL_AUDIT_H

#include <condition_variable>
#include <deque>
#include <mutex>

#include <QJsonObject>
#include <QString>

struct ControlAuditEvent {
    qint64 timestampMs = 0;
    quint64 requestId = 0;
    QString requestType;
    bool ok = false;
    QString error;       // empty when ok
    bool authPresent = false;
    QString client;      // empty when unknown

    QJsonObject toJson() const;
};

/* Fire-and-forget queue from the dispatcher to an external audit sink.
 * send() never blocks: when the queue is full the oldest event is dropped. */
class AuditChannel
{
public:
    static constexpr int DefaultCapacity = 1024;

    explicit AuditChannel(int capacity = DefaultCapacity);

    void send(const ControlAuditEvent &event);
    // Waits up to timeoutMs for an event. Returns false on timeout or close.
    bool receive(ControlAuditEvent *out, int timeoutMs);
    void close();

    quint64 dropped() const;
    int pending() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_ready;
    std::deque<ControlAuditEvent> m_queue;
    int m_capacity;
    quint64 m_dropped = 0;
    bool m_closed = false;
};

#endif
