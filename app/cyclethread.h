#ifndef CYCLETHREAD_H
#define CYCLETHREAD_H

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>

#include <QElapsedTimer>
#include <QThread>

#include "app/program_image.h"
#include "core/runtime/resource.h"

struct ControlState;

/* Runs the loaded program cyclically and serves as the execution
 * controller behind the control service. Storage belongs to this thread;
 * the control side only sees published snapshots and queued commands. */
class CycleThread : public QThread, public ExecutionController
{
    Q_OBJECT

public:
    CycleThread(ControlState *state, const ProgramImage &program, quint32 fileId, QObject *parent = nullptr);
    ~CycleThread() override;

    void setCycleInterval(int ms) { m_cycleMs = ms; }
    void setWatchdog(const WatchdogPolicy &policy);
    void setFaultPolicy(FaultPolicy policy);

    ResourceState state() const override;
    QString lastError() const override;
    void pause() override;
    void resume() override;
    void stop() override;
    bool sendCommand(const ResourceCommand &command, QString *errorOut = nullptr) override;

protected:
    void run() override;

private:
    void setState(ResourceState state);
    void processCommands();
    void reload(const ResourceCommand &command);
    void restart(RestartMode mode);
    // False when the cycle was abandoned; errorOut is empty when it was interrupted.
    bool runCycle(qint64 *debugWaitNs, QString *errorOut);
    void applyWrites(const QVector<PendingWrite> &writes, bool logFailures);
    void publishIo();
    void checkWatchdog(qint64 cycleNs);
    void fault(const QString &error, bool fromWatchdog);
    void safeOutputs();
    void waitForNextCycle(qint64 remainingMs);
    qint64 nowNs() const { return m_clock.nsecsElapsed(); }

    ControlState *m_controlState;
    quint32 m_fileId;
    ProgramImage m_program;
    VariableStorage m_storage;
    quint32 m_programInstance = 0;
    quint64 m_cycle = 0;
    QElapsedTimer m_clock;
    int m_cycleMs = 100;

    mutable std::mutex m_mutex;
    std::condition_variable m_wake;
    ResourceState m_state = ResourceState::Boot;
    QString m_lastError;
    std::deque<ResourceCommand> m_commands;
    WatchdogPolicy m_watchdog;
    FaultPolicy m_faultPolicy = FaultPolicy::SafeHalt;
    qint64 m_retainSaveIntervalMs = 0;
    std::atomic<bool> m_exiting{false};
};

#endif
