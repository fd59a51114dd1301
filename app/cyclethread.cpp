#include "app/cyclethread.h"

#include <chrono>

#include <QDebug>

#include "core/control/control_state.h"

namespace {

RuntimeEvent taskEvent(RuntimeEvent::Kind kind, const QString &name, qint64 timeNs)
{
    RuntimeEvent event;
    event.kind = kind;
    event.name = name;
    event.timeNs = timeNs;
    return event;
}

} // namespace

CycleThread::CycleThread(ControlState *state, const ProgramImage &program, quint32 fileId, QObject *parent) :
    QThread(parent),
    m_controlState(state),
    m_fileId(fileId),
    m_program(program)
{
    m_clock.start();
    m_programInstance = m_program.initStorage(&m_storage, false);
    m_controlState->debug.publishSnapshot(m_storage);
    publishIo();
    setState(ResourceState::Ready);
}

CycleThread::~CycleThread()
{
    stop();
    wait();
}

void CycleThread::setWatchdog(const WatchdogPolicy &policy)
{
    std::lock_guard<std::mutex> lg(m_mutex);
    m_watchdog = policy;
}

void CycleThread::setFaultPolicy(FaultPolicy policy)
{
    std::lock_guard<std::mutex> lg(m_mutex);
    m_faultPolicy = policy;
}

ResourceState CycleThread::state() const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_state;
}

QString CycleThread::lastError() const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_lastError;
}

void CycleThread::pause()
{
    std::lock_guard<std::mutex> lg(m_mutex);
    if (m_state == ResourceState::Running) {
        m_state = ResourceState::Paused;
        qInfo() << "Runtime: paused";
    }
}

void CycleThread::resume()
{
    {
        std::lock_guard<std::mutex> lg(m_mutex);
        if (m_state != ResourceState::Paused)
            return;
        m_state = ResourceState::Running;
        qInfo() << "Runtime: resumed";
    }
    m_wake.notify_all();
}

void CycleThread::stop()
{
    m_exiting = true;
    // Releases a cycle blocked at a debug stop
    m_controlState->debug.interrupt();
    m_wake.notify_all();
}

bool CycleThread::sendCommand(const ResourceCommand &command, QString *errorOut)
{
    {
        std::lock_guard<std::mutex> lg(m_mutex);
        if (m_exiting || m_state == ResourceState::Stopped) {
            if (errorOut)
                *errorOut = QStringLiteral("resource stopped");
            return false;
        }
        m_commands.push_back(command);
    }
    m_wake.notify_all();
    return true;
}

void CycleThread::run()
{
    setState(ResourceState::Running);
    qInfo() << "Runtime: program" << m_program.name() << "running every" << m_cycleMs << "ms";

    while (!m_exiting) {
        processCommands();

        RestartMode mode;
        if (m_controlState->takePendingRestart(&mode))
            restart(mode);

        if (state() != ResourceState::Running) {
            waitForNextCycle(m_cycleMs);
            continue;
        }

        const qint64 start = nowNs();
        qint64 debugWaitNs = 0;
        QString error;
        if (!runCycle(&debugWaitNs, &error)) {
            if (error.isEmpty())
                break;
            fault(error, false);
            continue;
        }

        // Time spent halted at debug stops does not count against the cycle
        const qint64 busyNs = nowNs() - start - debugWaitNs;
        const qint64 intervalNs = qint64(m_cycleMs) * 1000000;
        if (busyNs > intervalNs) {
            RuntimeEvent overrun = taskEvent(RuntimeEvent::TaskOverrun, m_program.name(), nowNs());
            overrun.missed = quint64(busyNs / intervalNs);
            m_controlState->events.push(overrun);
        }
        checkWatchdog(busyNs);
        waitForNextCycle(m_cycleMs - busyNs / 1000000);
    }

    setState(ResourceState::Stopped);
    qInfo() << "Runtime: stopped after" << m_cycle << "cycles";
}

void CycleThread::setState(ResourceState state)
{
    std::lock_guard<std::mutex> lg(m_mutex);
    if (m_state != state)
        qDebug() << "Runtime: state" << resourceStateName(m_state) << "->" << resourceStateName(state);
    m_state = state;
}

void CycleThread::processCommands()
{
    std::deque<ResourceCommand> commands;
    {
        std::lock_guard<std::mutex> lg(m_mutex);
        commands.swap(m_commands);
    }

    for (const ResourceCommand &command : commands) {
        switch (command.kind) {
        case ResourceCommand::Pause:
            pause();
            break;
        case ResourceCommand::Resume:
            resume();
            break;
        case ResourceCommand::UpdateWatchdog:
            setWatchdog(command.watchdog);
            qDebug() << "Runtime: watchdog" << (command.watchdog.enabled ? "enabled" : "disabled")
                     << "timeout" << command.watchdog.timeoutMs << "ms";
            break;
        case ResourceCommand::UpdateFaultPolicy:
            setFaultPolicy(command.faultPolicy);
            qDebug() << "Runtime: fault policy" << faultPolicyName(command.faultPolicy);
            break;
        case ResourceCommand::UpdateRetainSaveInterval: {
            std::lock_guard<std::mutex> lg(m_mutex);
            m_retainSaveIntervalMs = command.retainSaveIntervalMs;
            qDebug() << "Runtime: retain save interval" << m_retainSaveIntervalMs << "ms";
            break;
        }
        case ResourceCommand::ReloadBytecode:
            reload(command);
            break;
        }
    }
}

void CycleThread::reload(const ResourceCommand &command)
{
    ProgramImage image;
    QString error;
    if (!ProgramImage::parse(QString::fromUtf8(command.bytes), m_fileId, &image, &error)) {
        qWarning() << "Runtime: reload rejected:" << error;
        if (command.reply)
            command.reply->reject(QStringLiteral("invalid bytecode: %1").arg(error));
        return;
    }

    m_program = image;
    m_programInstance = m_program.initStorage(&m_storage, true);
    m_controlState->publishProgram(m_fileId, QString::fromUtf8(command.bytes), m_program.metadata());
    m_controlState->debug.publishSnapshot(m_storage);
    publishIo();
    qInfo() << "Runtime: program" << m_program.name() << "reloaded," << m_program.statements().size()
            << "statements";
    if (command.reply)
        command.reply->resolve(m_program.metadata());
}

void CycleThread::restart(RestartMode mode)
{
    m_programInstance = m_program.initStorage(&m_storage, mode == RestartMode::Warm);
    {
        std::lock_guard<std::mutex> lg(m_mutex);
        m_lastError.clear();
        m_state = ResourceState::Running;
    }
    m_controlState->debug.publishSnapshot(m_storage);
    publishIo();
    qInfo() << "Runtime:" << (mode == RestartMode::Cold ? "cold" : "warm") << "restart";
}

bool CycleThread::runCycle(qint64 *debugWaitNs, QString *errorOut)
{
    ++m_cycle;
    m_controlState->events.push(RuntimeEvent::cycleStart(m_cycle, nowNs()));

    applyWrites(m_controlState->debug.drainWrites(), true);
    const QVector<PendingWrite> forces =
        m_controlState->debug.forcedVariables() + m_controlState->debug.forcedIo();
    applyWrites(forces, false);

    m_controlState->events.push(taskEvent(RuntimeEvent::TaskStart, m_program.name(), nowNs()));
    const quint32 frameId = m_storage.pushFrame(m_program.name(), m_programInstance).id;

    EvalScope scope;
    scope.storage = &m_storage;
    scope.frameId = frameId;
    scope.usingList = m_program.usingList();

    for (const ProgramStatement &statement : m_program.statements()) {
        QElapsedTimer waited;
        waited.start();
        const bool proceed = m_controlState->debug.onStatement(statement.location, frameId, 1, m_storage);
        *debugWaitNs += waited.nsecsElapsed();
        if (!proceed) {
            m_storage.popFrame();
            errorOut->clear();
            return false;
        }

        Value value;
        ValueRef target;
        QString error;
        bool ok = evaluateExpression(statement.expression, scope, &value, &error);
        if (ok && !resolveVariable(scope, statement.target, &target)) {
            error = QStringLiteral("unknown identifier '%1'").arg(statement.target);
            ok = false;
        }
        if (ok)
            ok = assignVariable(m_storage, target, value, &error);
        if (!ok) {
            m_storage.popFrame();
            *errorOut = error;
            return false;
        }
        applyWrites(forces, false);
    }

    m_storage.popFrame();
    m_controlState->events.push(taskEvent(RuntimeEvent::TaskEnd, m_program.name(), nowNs()));
    publishIo();
    m_controlState->events.push(RuntimeEvent::cycleEnd(m_cycle, nowNs()));
    m_controlState->debug.publishSnapshot(m_storage);
    return true;
}

void CycleThread::applyWrites(const QVector<PendingWrite> &writes, bool logFailures)
{
    for (const PendingWrite &write : writes) {
        ValueRef ref;
        ref.name = write.name;
        QString error;
        bool ok = true;

        switch (write.target) {
        case PendingWrite::Global:
            ref.area = ValueRef::Global;
            break;
        case PendingWrite::Retain:
            ref.area = ValueRef::Retain;
            break;
        case PendingWrite::Instance:
            ref.area = ValueRef::Instance;
            ref.owner = write.instanceId;
            break;
        case PendingWrite::Io:
            if (const ProgramVariable *binding = m_program.bindingAt(write.address)) {
                ref.area = binding->retain ? ValueRef::Retain : ValueRef::Global;
                ref.name = binding->name;
            } else {
                error = QStringLiteral("no variable bound to %1").arg(formatIoAddress(write.address));
                ok = false;
            }
            break;
        }

        if (ok)
            ok = assignVariable(m_storage, ref, write.value, &error);
        if (!ok && logFailures)
            qWarning() << "Runtime: write to" << write.targetText() << "failed:" << error;
    }
}

void CycleThread::publishIo()
{
    IoSnapshot io;
    for (const ProgramVariable &var : m_program.globals()) {
        if (!var.bound)
            continue;
        IoSnapshotEntry entry;
        entry.name = var.name;
        entry.address = var.address;
        if (var.address.wildcard) {
            entry.state = IoSnapshotEntry::Unresolved;
        } else {
            const VariableTable &table = var.retain ? m_storage.retain() : m_storage.globals();
            if (const Value *value = table.get(var.name)) {
                entry.value = *value;
            } else {
                entry.state = IoSnapshotEntry::Error;
                entry.error = QStringLiteral("unknown identifier '%1'").arg(var.name);
            }
        }

        switch (var.address.area) {
        case IoArea::Input:
            io.inputs.append(entry);
            break;
        case IoArea::Output:
            io.outputs.append(entry);
            break;
        case IoArea::Memory:
            io.memory.append(entry);
            break;
        }
    }
    m_controlState->setIoSnapshot(io);
}

void CycleThread::checkWatchdog(qint64 cycleNs)
{
    WatchdogPolicy watchdog;
    {
        std::lock_guard<std::mutex> lg(m_mutex);
        watchdog = m_watchdog;
    }
    if (!watchdog.enabled || watchdog.timeoutMs <= 0 || cycleNs <= watchdog.timeoutMs * 1000000)
        return;
    fault(QStringLiteral("watchdog timeout: cycle took %1 ms (limit %2 ms)")
              .arg(cycleNs / 1000000)
              .arg(watchdog.timeoutMs),
          true);
}

void CycleThread::fault(const QString &error, bool fromWatchdog)
{
    m_controlState->events.push(RuntimeEvent::fault(error, nowNs()));
    qWarning() << "Runtime: fault:" << error;

    bool restartWanted = false;
    bool safeHalt = false;
    {
        std::lock_guard<std::mutex> lg(m_mutex);
        if (fromWatchdog) {
            restartWanted = m_watchdog.action == WatchdogAction::Restart;
            safeHalt = m_watchdog.action == WatchdogAction::SafeHalt;
        } else {
            restartWanted = m_faultPolicy == FaultPolicy::Restart;
            safeHalt = m_faultPolicy == FaultPolicy::SafeHalt;
        }
    }

    if (restartWanted) {
        restart(RestartMode::Warm);
        return;
    }
    if (safeHalt)
        safeOutputs();
    {
        std::lock_guard<std::mutex> lg(m_mutex);
        m_state = ResourceState::Faulted;
        m_lastError = error;
    }
    publishIo();
    m_controlState->debug.publishSnapshot(m_storage);
}

// Drives every bound output back to its zero value.
void CycleThread::safeOutputs()
{
    for (const ProgramVariable &var : m_program.globals()) {
        if (!var.bound || var.address.wildcard || var.address.area != IoArea::Output)
            continue;
        ValueRef ref;
        ref.area = var.retain ? ValueRef::Retain : ValueRef::Global;
        ref.name = var.name;
        const Value safe = var.type == ValueType::Enum ? var.initial : Value::defaultFor(var.type);
        QString error;
        if (!assignVariable(m_storage, ref, safe, &error))
            qWarning() << "Runtime: cannot reset output" << var.name << ":" << error;
    }
}

void CycleThread::waitForNextCycle(qint64 remainingMs)
{
    if (remainingMs <= 0)
        return;
    std::unique_lock<std::mutex> lock(m_mutex);
    m_wake.wait_for(lock, std::chrono::milliseconds(remainingMs),
                    [this] { return m_exiting || !m_commands.empty(); });
}
