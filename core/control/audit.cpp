#include "core/control/audit.h"

#include <chrono>

#include <QJsonValue>

QJsonObject ControlAuditEvent::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("timestamp_ms"), timestampMs);
    obj.insert(QStringLiteral("request_id"), qint64(requestId));
    obj.insert(QStringLiteral("request_type"), requestType);
    obj.insert(QStringLiteral("ok"), ok);
    obj.insert(QStringLiteral("error"), error.isEmpty() ? QJsonValue() : QJsonValue(error));
    obj.insert(QStringLiteral("auth_present"), authPresent);
    obj.insert(QStringLiteral("client"), client.isEmpty() ? QJsonValue() : QJsonValue(client));
    return obj;
}

AuditChannel::AuditChannel(int capacity)
    : m_capacity(capacity > 0 ? capacity : 1)
{
}

void AuditChannel::send(const ControlAuditEvent &event)
{
    {
        std::lock_guard<std::mutex> lg(m_mutex);
        if (m_closed)
            return;
        if (int(m_queue.size()) >= m_capacity) {
            m_queue.pop_front();
            ++m_dropped;
        }
        m_queue.push_back(event);
    }
    m_ready.notify_one();
}

bool AuditChannel::receive(ControlAuditEvent *out, int timeoutMs)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_ready.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                     [this] { return !m_queue.empty() || m_closed; });
    if (m_queue.empty())
        return false;
    *out = m_queue.front();
    m_queue.pop_front();
    return true;
}

void AuditChannel::close()
{
    {
        std::lock_guard<std::mutex> lg(m_mutex);
        m_closed = true;
    }
    m_ready.notify_all();
}

quint64 AuditChannel::dropped() const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_dropped;
}

int AuditChannel::pending() const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    return int(m_queue.size());
}
