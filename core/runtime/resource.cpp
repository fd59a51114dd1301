#include "core/runtime/resource.h"

#include <chrono>

QString resourceStateName(ResourceState state)
{
    switch (state) {
    case ResourceState::Boot: return QStringLiteral("boot");
    case ResourceState::Ready: return QStringLiteral("ready");
    case ResourceState::Running: return QStringLiteral("running");
    case ResourceState::Paused: return QStringLiteral("paused");
    case ResourceState::Faulted: return QStringLiteral("faulted");
    case ResourceState::Stopped: return QStringLiteral("stopped");
    }
    return QString();
}

void ReloadReply::resolve(const RuntimeMetadata &metadata)
{
    {
        std::lock_guard<std::mutex> lg(m_mutex);
        if (m_finished)
            return;
        m_finished = true;
        m_ok = true;
        m_metadata = metadata;
    }
    m_done.notify_all();
}

void ReloadReply::reject(const QString &error)
{
    {
        std::lock_guard<std::mutex> lg(m_mutex);
        if (m_finished)
            return;
        m_finished = true;
        m_ok = false;
        m_error = error;
    }
    m_done.notify_all();
}

bool ReloadReply::waitFor(int timeoutMs)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_done.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] { return m_finished; });
}

bool ReloadReply::succeeded() const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_finished && m_ok;
}

RuntimeMetadata ReloadReply::metadata() const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_metadata;
}

QString ReloadReply::error() const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_error;
}
