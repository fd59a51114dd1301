#ifndef DEBUG_CONTROL_H
#define DEBUG_CONTROL_H

#include <condition_variable>
#include <mutex>

#include <QHash>
#include <QString>
#include <QVector>

#include "core/debug/debug_types.h"
#include "core/runtime/io.h"
#include "core/runtime/value.h"

// A write queued for the next cycle boundary, or a persistent force.
struct PendingWrite {
    enum Target {
        Global,
        Retain,
        Instance,
        Io
    } target = Global;
    QString name;
    quint32 instanceId = 0;
    IoAddress address;
    Value value;

    // "global:<name>", "retain:<name>", "instance:<id>:<name>" or the IO address.
    QString targetText() const;
    bool sameTarget(const PendingWrite &other) const;
};

/* Shared between the control service and the execution thread.
 *
 * The control side requests actions, edits breakpoints and queues writes;
 * the execution side calls onStatement() before every statement, which
 * records stops and blocks while the program is paused. All members are
 * guarded by one mutex; nothing here runs user code. */
class DebugControl
{
public:
    static constexpr int MaxQueuedStops = 256;

    ControlOutcome applyAction(ControlAction action);
    // Stop before the first statement that executes.
    void pauseEntry();
    DebugMode mode() const;
    bool isPaused() const;
    bool lastStop(DebugStop *out) const;
    QVector<DebugStop> drainStops();
    bool snapshot(DebugSnapshot *out) const;
    bool hasSnapshot() const;

    void setBreakpointsForFile(quint32 fileId, const QVector<DebugBreakpoint> &breakpoints);
    // Removes every breakpoint; generations keep counting.
    void clearBreakpoints();
    // Forgets breakpoints and locations of a file whose text was replaced.
    void resetSource(quint32 fileId);
    QVector<DebugBreakpoint> breakpoints() const;
    bool breakpointGeneration(quint32 fileId, quint64 *out) const;

    bool frameLocation(quint32 frameId, SourceLocation *out) const;
    QHash<quint32, SourceLocation> frameLocations() const;

    void enqueueGlobalWrite(const QString &name, const Value &value);
    void enqueueRetainWrite(const QString &name, const Value &value);
    void enqueueInstanceWrite(quint32 instanceId, const QString &name, const Value &value);
    void enqueueIoWrite(const IoAddress &address, const Value &value);
    QVector<PendingWrite> drainWrites();

    void forceGlobal(const QString &name, const Value &value);
    void forceRetain(const QString &name, const Value &value);
    void forceInstance(quint32 instanceId, const QString &name, const Value &value);
    void forceIo(const IoAddress &address, const Value &value);
    void releaseGlobal(const QString &name);
    void releaseRetain(const QString &name);
    void releaseInstance(quint32 instanceId, const QString &name);
    void releaseIo(const IoAddress &address);
    QVector<PendingWrite> forcedVariables() const;
    QVector<PendingWrite> forcedIo() const;

    // Execution thread side.
    void publishSnapshot(const VariableStorage &storage);
    /* Returns false when the controller was interrupted while waiting, in
     * which case the caller must abandon the cycle. */
    bool onStatement(const SourceLocation &location, quint32 frameId, quint32 callDepth,
                     const VariableStorage &storage);
    // Wakes a blocked execution thread for good (shutdown).
    void interrupt();
    bool isInterrupted() const;

private:
    struct StepState {
        bool active = false;
        ControlAction kind = ControlAction::StepIn;
        quint32 targetDepth = 0;
    };

    bool stepReached(quint32 callDepth) const;
    void addForce(const PendingWrite &force);
    void removeForce(const PendingWrite &force);

    mutable std::mutex m_mutex;
    std::condition_variable m_resumed;

    DebugMode m_mode = DebugMode::Running;
    bool m_hasPendingStop = false;
    DebugStopReason m_pendingStop = DebugStopReason::Pause;
    StepState m_step;
    quint32 m_lastCallDepth = 0;
    bool m_interrupted = false;

    QVector<DebugBreakpoint> m_breakpoints;
    QHash<quint32, quint64> m_generations;

    bool m_hasLastStop = false;
    DebugStop m_lastStop;
    QVector<DebugStop> m_stops;

    bool m_hasSnapshot = false;
    DebugSnapshot m_snapshot;
    QHash<quint32, SourceLocation> m_frameLocations;

    QVector<PendingWrite> m_writes;
    QVector<PendingWrite> m_forces;
};

#endif
