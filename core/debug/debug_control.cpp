#include "core/debug/debug_control.h"

#include <utility>

#include <QDateTime>
#include <QDebug>

QString PendingWrite::targetText() const
{
    switch (target) {
    case Global: return QStringLiteral("global:%1").arg(name);
    case Retain: return QStringLiteral("retain:%1").arg(name);
    case Instance: return QStringLiteral("instance:%1:%2").arg(instanceId).arg(name);
    case Io: return formatIoAddress(address);
    }
    return QString();
}

bool PendingWrite::sameTarget(const PendingWrite &other) const
{
    if (target != other.target)
        return false;
    switch (target) {
    case Io:
        return address == other.address;
    case Instance:
        if (instanceId != other.instanceId)
            return false;
        break;
    default:
        break;
    }
    return name.compare(other.name, Qt::CaseInsensitive) == 0;
}

ControlOutcome DebugControl::applyAction(ControlAction action)
{
    std::lock_guard<std::mutex> lg(m_mutex);
    ControlOutcome outcome = ControlOutcome::Applied;
    bool notify = false;

    switch (action) {
    case ControlAction::Pause:
        if (m_mode == DebugMode::Paused) {
            outcome = ControlOutcome::Ignored;
            break;
        }
        m_mode = DebugMode::Paused;
        m_step = StepState();
        m_hasPendingStop = true;
        m_pendingStop = DebugStopReason::Pause;
        break;
    case ControlAction::Continue:
        m_mode = DebugMode::Running;
        m_step = StepState();
        m_hasPendingStop = false;
        notify = true;
        break;
    case ControlAction::StepIn:
    case ControlAction::StepOver:
    case ControlAction::StepOut:
        m_step.active = true;
        m_step.kind = action;
        m_step.targetDepth = m_lastCallDepth;
        m_mode = DebugMode::Running;
        m_hasPendingStop = false;
        notify = true;
        break;
    }

    if (notify)
        m_resumed.notify_all();
    return outcome;
}

void DebugControl::pauseEntry()
{
    std::lock_guard<std::mutex> lg(m_mutex);
    m_mode = DebugMode::Paused;
    m_step = StepState();
    m_hasPendingStop = true;
    m_pendingStop = DebugStopReason::Entry;
}

DebugMode DebugControl::mode() const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_mode;
}

bool DebugControl::isPaused() const
{
    return mode() == DebugMode::Paused;
}

bool DebugControl::lastStop(DebugStop *out) const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    if (!m_hasLastStop)
        return false;
    *out = m_lastStop;
    return true;
}

QVector<DebugStop> DebugControl::drainStops()
{
    std::lock_guard<std::mutex> lg(m_mutex);
    QVector<DebugStop> stops;
    stops.swap(m_stops);
    return stops;
}

bool DebugControl::snapshot(DebugSnapshot *out) const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    if (!m_hasSnapshot)
        return false;
    *out = m_snapshot;
    return true;
}

bool DebugControl::hasSnapshot() const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_hasSnapshot;
}

void DebugControl::setBreakpointsForFile(quint32 fileId, const QVector<DebugBreakpoint> &breakpoints)
{
    std::lock_guard<std::mutex> lg(m_mutex);
    const quint64 generation = m_generations.value(fileId, 0) + 1;
    m_generations.insert(fileId, generation);

    QVector<DebugBreakpoint> kept;
    for (const DebugBreakpoint &bp : std::as_const(m_breakpoints)) {
        if (bp.location.fileId != fileId)
            kept.append(bp);
    }
    for (DebugBreakpoint bp : breakpoints) {
        bp.generation = generation;
        kept.append(bp);
    }
    m_breakpoints = kept;
}

void DebugControl::clearBreakpoints()
{
    std::lock_guard<std::mutex> lg(m_mutex);
    m_breakpoints.clear();
    for (auto it = m_generations.begin(); it != m_generations.end(); ++it)
        ++it.value();
}

void DebugControl::resetSource(quint32 fileId)
{
    std::lock_guard<std::mutex> lg(m_mutex);
    QVector<DebugBreakpoint> kept;
    for (const DebugBreakpoint &bp : std::as_const(m_breakpoints)) {
        if (bp.location.fileId != fileId)
            kept.append(bp);
    }
    if (kept.size() != m_breakpoints.size() || m_generations.contains(fileId))
        m_generations.insert(fileId, m_generations.value(fileId, 0) + 1);
    m_breakpoints = kept;

    for (auto it = m_frameLocations.begin(); it != m_frameLocations.end();) {
        if (it.value().fileId == fileId)
            it = m_frameLocations.erase(it);
        else
            ++it;
    }
    if (m_hasLastStop && m_lastStop.hasLocation && m_lastStop.location.fileId == fileId)
        m_lastStop.hasLocation = false;
    for (DebugStop &stop : m_stops) {
        if (stop.hasLocation && stop.location.fileId == fileId)
            stop.hasLocation = false;
    }
}

QVector<DebugBreakpoint> DebugControl::breakpoints() const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_breakpoints;
}

bool DebugControl::breakpointGeneration(quint32 fileId, quint64 *out) const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    auto it = m_generations.constFind(fileId);
    if (it == m_generations.constEnd())
        return false;
    *out = it.value();
    return true;
}

bool DebugControl::frameLocation(quint32 frameId, SourceLocation *out) const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    auto it = m_frameLocations.constFind(frameId);
    if (it == m_frameLocations.constEnd())
        return false;
    *out = it.value();
    return true;
}

QHash<quint32, SourceLocation> DebugControl::frameLocations() const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_frameLocations;
}

void DebugControl::enqueueGlobalWrite(const QString &name, const Value &value)
{
    PendingWrite write;
    write.target = PendingWrite::Global;
    write.name = name;
    write.value = value;
    std::lock_guard<std::mutex> lg(m_mutex);
    m_writes.append(write);
}

void DebugControl::enqueueRetainWrite(const QString &name, const Value &value)
{
    PendingWrite write;
    write.target = PendingWrite::Retain;
    write.name = name;
    write.value = value;
    std::lock_guard<std::mutex> lg(m_mutex);
    m_writes.append(write);
}

void DebugControl::enqueueInstanceWrite(quint32 instanceId, const QString &name, const Value &value)
{
    PendingWrite write;
    write.target = PendingWrite::Instance;
    write.instanceId = instanceId;
    write.name = name;
    write.value = value;
    std::lock_guard<std::mutex> lg(m_mutex);
    m_writes.append(write);
}

void DebugControl::enqueueIoWrite(const IoAddress &address, const Value &value)
{
    PendingWrite write;
    write.target = PendingWrite::Io;
    write.address = address;
    write.value = value;
    std::lock_guard<std::mutex> lg(m_mutex);
    m_writes.append(write);
}

QVector<PendingWrite> DebugControl::drainWrites()
{
    std::lock_guard<std::mutex> lg(m_mutex);
    QVector<PendingWrite> writes;
    writes.swap(m_writes);
    return writes;
}

void DebugControl::addForce(const PendingWrite &force)
{
    std::lock_guard<std::mutex> lg(m_mutex);
    for (PendingWrite &existing : m_forces) {
        if (existing.sameTarget(force)) {
            existing.value = force.value;
            return;
        }
    }
    m_forces.append(force);
}

void DebugControl::removeForce(const PendingWrite &force)
{
    std::lock_guard<std::mutex> lg(m_mutex);
    for (int i = 0; i < m_forces.size(); ++i) {
        if (m_forces[i].sameTarget(force)) {
            m_forces.removeAt(i);
            return;
        }
    }
}

void DebugControl::forceGlobal(const QString &name, const Value &value)
{
    PendingWrite force;
    force.target = PendingWrite::Global;
    force.name = name;
    force.value = value;
    addForce(force);
}

void DebugControl::forceRetain(const QString &name, const Value &value)
{
    PendingWrite force;
    force.target = PendingWrite::Retain;
    force.name = name;
    force.value = value;
    addForce(force);
}

void DebugControl::forceInstance(quint32 instanceId, const QString &name, const Value &value)
{
    PendingWrite force;
    force.target = PendingWrite::Instance;
    force.instanceId = instanceId;
    force.name = name;
    force.value = value;
    addForce(force);
}

void DebugControl::forceIo(const IoAddress &address, const Value &value)
{
    PendingWrite force;
    force.target = PendingWrite::Io;
    force.address = address;
    force.value = value;
    addForce(force);
}

void DebugControl::releaseGlobal(const QString &name)
{
    PendingWrite force;
    force.target = PendingWrite::Global;
    force.name = name;
    removeForce(force);
}

void DebugControl::releaseRetain(const QString &name)
{
    PendingWrite force;
    force.target = PendingWrite::Retain;
    force.name = name;
    removeForce(force);
}

void DebugControl::releaseInstance(quint32 instanceId, const QString &name)
{
    PendingWrite force;
    force.target = PendingWrite::Instance;
    force.instanceId = instanceId;
    force.name = name;
    removeForce(force);
}

void DebugControl::releaseIo(const IoAddress &address)
{
    PendingWrite force;
    force.target = PendingWrite::Io;
    force.address = address;
    removeForce(force);
}

QVector<PendingWrite> DebugControl::forcedVariables() const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    QVector<PendingWrite> out;
    for (const PendingWrite &force : m_forces) {
        if (force.target != PendingWrite::Io)
            out.append(force);
    }
    return out;
}

QVector<PendingWrite> DebugControl::forcedIo() const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    QVector<PendingWrite> out;
    for (const PendingWrite &force : m_forces) {
        if (force.target == PendingWrite::Io)
            out.append(force);
    }
    return out;
}

void DebugControl::publishSnapshot(const VariableStorage &storage)
{
    DebugSnapshot snapshot;
    snapshot.storage = storage;
    snapshot.timestampMs = QDateTime::currentMSecsSinceEpoch();

    std::lock_guard<std::mutex> lg(m_mutex);
    m_snapshot = snapshot;
    m_hasSnapshot = true;
}

bool DebugControl::stepReached(quint32 callDepth) const
{
    if (!m_step.active)
        return false;
    switch (m_step.kind) {
    case ControlAction::StepIn:
        return true;
    case ControlAction::StepOver:
        return callDepth <= m_step.targetDepth;
    case ControlAction::StepOut:
        return callDepth < m_step.targetDepth;
    default:
        break;
    }
    return false;
}

bool DebugControl::onStatement(const SourceLocation &location, quint32 frameId, quint32 callDepth,
                               const VariableStorage &storage)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_interrupted)
        return false;

    m_frameLocations.insert(frameId, location);

    DebugStop stop;
    stop.hasLocation = true;
    stop.location = location;

    if (m_mode == DebugMode::Paused && m_hasPendingStop) {
        stop.reason = m_pendingStop;
        m_hasPendingStop = false;
    } else if (stepReached(callDepth)) {
        stop.reason = DebugStopReason::Step;
        m_step = StepState();
    } else {
        bool hit = false;
        for (const DebugBreakpoint &bp : std::as_const(m_breakpoints)) {
            if (bp.location == location) {
                stop.reason = DebugStopReason::Breakpoint;
                stop.hasGeneration = true;
                stop.breakpointGeneration = bp.generation;
                hit = true;
                break;
            }
        }
        if (!hit)
            return true;
        m_step = StepState();
    }

    m_mode = DebugMode::Paused;
    m_lastCallDepth = callDepth;
    m_lastStop = stop;
    m_hasLastStop = true;
    m_stops.append(stop);
    if (m_stops.size() > MaxQueuedStops)
        m_stops.removeFirst();

    m_snapshot.storage = storage;
    m_snapshot.timestampMs = QDateTime::currentMSecsSinceEpoch();
    m_hasSnapshot = true;

    qDebug() << "Debug stop in file" << location.fileId << "at offset" << location.start;

    m_resumed.wait(lock, [this] { return m_mode != DebugMode::Paused || m_interrupted; });
    return !m_interrupted;
}

void DebugControl::interrupt()
{
    {
        std::lock_guard<std::mutex> lg(m_mutex);
        m_interrupted = true;
    }
    m_resumed.notify_all();
}

bool DebugControl::isInterrupted() const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_interrupted;
}
