#include "core/control/control_state.h"

#include <QDebug>

ControlState::ControlState()
    : debugEnabled(false)
{
    uptime.start();
}

QString ControlState::authToken() const
{
    std::lock_guard<std::mutex> lg(m_authMutex);
    return m_authToken;
}

void ControlState::setAuthToken(const QString &token)
{
    std::lock_guard<std::mutex> lg(m_authMutex);
    m_authToken = token;
}

ControlMode ControlState::controlMode() const
{
    std::lock_guard<std::mutex> lg(m_modeMutex);
    return m_controlMode;
}

void ControlState::setControlMode(ControlMode mode)
{
    std::lock_guard<std::mutex> lg(m_modeMutex);
    m_controlMode = mode;
}

void ControlState::setIoSnapshot(const IoSnapshot &snapshot)
{
    std::lock_guard<std::mutex> lg(m_ioMutex);
    m_ioSnapshot = snapshot;
    m_hasIoSnapshot = true;
}

bool ControlState::ioSnapshot(IoSnapshot *out) const
{
    std::lock_guard<std::mutex> lg(m_ioMutex);
    if (!m_hasIoSnapshot)
        return false;
    *out = m_ioSnapshot;
    return true;
}

void ControlState::setIoDrivers(const QVector<IoDriverStatus> &drivers)
{
    std::lock_guard<std::mutex> lg(m_ioMutex);
    m_ioDrivers = drivers;
}

QVector<IoDriverStatus> ControlState::ioDrivers() const
{
    std::lock_guard<std::mutex> lg(m_ioMutex);
    return m_ioDrivers;
}

void ControlState::publishProgram(quint32 fileId, const QString &text, const RuntimeMetadata &programMetadata)
{
    {
        std::lock_guard<std::mutex> lg(metadataMutex);
        if (!sources.replaceText(fileId, text))
            qWarning() << "Control: reloaded program has no registered source" << fileId;
        metadata = programMetadata;
    }
    debug.resetSource(fileId);
}

void ControlState::requestRestart(RestartMode mode)
{
    std::lock_guard<std::mutex> lg(m_restartMutex);
    m_hasPendingRestart = true;
    m_pendingRestart = mode;
}

bool ControlState::takePendingRestart(RestartMode *out)
{
    std::lock_guard<std::mutex> lg(m_restartMutex);
    if (!m_hasPendingRestart)
        return false;
    m_hasPendingRestart = false;
    *out = m_pendingRestart;
    return true;
}

ResourceState ControlState::resourceState() const
{
    return resource ? resource->state() : ResourceState::Boot;
}

QString ControlState::resourceError() const
{
    return resource ? resource->lastError() : QString();
}
