#include <QtTest/QtTest>

#include <QJsonArray>

#include "app/cyclethread.h"
#include "core/control/control_state.h"
#include "core/control/dispatcher.h"

namespace {

const char *const CounterProgram =
    "VAR_GLOBAL\n"
    "    counter : DINT;\n"
    "    lamp AT %QX0.0 : BOOL;\n"
    "END_VAR\n"
    "VAR_GLOBAL RETAIN\n"
    "    total : LINT;\n"
    "END_VAR\n"
    "PROGRAM Main\n"
    "VAR\n"
    "    step : INT := 1;\n"
    "END_VAR\n"
    "    counter := counter + step;\n"
    "    lamp := NOT lamp;\n"
    "END_PROGRAM\n";

const char *const FaultingProgram =
    "VAR_GLOBAL\n"
    "    zero : DINT;\n"
    "    valve AT %QX0.1 : BOOL := TRUE;\n"
    "    x : DINT;\n"
    "END_VAR\n"
    "PROGRAM Main\n"
    "    x := 10 / zero;\n"
    "END_PROGRAM\n";

ProgramImage loadProgram(const char *text)
{
    ProgramImage image;
    QString error;
    if (!ProgramImage::parse(QString::fromLatin1(text), 1, &image, &error))
        qWarning() << "test program rejected:" << error;
    return image;
}

// Reads a global or retain variable from the last published snapshot.
Value snapshotValue(const ControlState &state, const QString &name)
{
    DebugSnapshot snapshot;
    if (!state.debug.snapshot(&snapshot))
        return Value();
    if (const Value *value = snapshot.storage.globals().get(name))
        return *value;
    if (const Value *value = snapshot.storage.retain().get(name))
        return *value;
    return Value();
}

qint64 snapshotInt(const ControlState &state, const char *name)
{
    const Value value = snapshotValue(state, QString::fromLatin1(name));
    return value.isNull() ? -1 : value.toInt();
}

QString programType(const ControlState &state)
{
    DebugSnapshot snapshot;
    if (!state.debug.snapshot(&snapshot) || snapshot.storage.instances().isEmpty())
        return QString();
    return snapshot.storage.instances().first().typeName;
}

QJsonObject setBreakpoint(ControlState &state, int line)
{
    QJsonObject params;
    params.insert(QStringLiteral("source"), QStringLiteral("/plc/counter.st"));
    params.insert(QStringLiteral("lines"), QJsonArray() << line);
    ControlRequest request;
    request.id = 1;
    request.type = QStringLiteral("breakpoints.set");
    request.hasParams = true;
    request.params = params;
    return handleRequest(request, state, QString()).toJson().value(QStringLiteral("result")).toObject();
}

int faultCount(const ControlState &state)
{
    int count = 0;
    for (const RuntimeEvent &event : state.events.tail(EventLog::DefaultCapacity)) {
        if (event.kind == RuntimeEvent::Fault)
            ++count;
    }
    return count;
}

} // namespace

class CycleThreadTest : public QObject
{
    Q_OBJECT

private slots:
    void runsCycles()
    {
        ControlState state;
        CycleThread cycle(&state, loadProgram(CounterProgram), 1);
        QCOMPARE(cycle.state(), ResourceState::Ready);
        QCOMPARE(snapshotInt(state, "counter"), qint64(0));

        IoSnapshot io;
        QVERIFY(state.ioSnapshot(&io));
        QCOMPARE(io.outputs.size(), 1);
        QCOMPARE(io.outputs.first().name, QStringLiteral("lamp"));

        cycle.setCycleInterval(5);
        cycle.start();
        QTRY_COMPARE(cycle.state(), ResourceState::Running);
        QTRY_VERIFY(snapshotInt(state, "counter") >= 3);

        bool sawCycleEnd = false;
        for (const RuntimeEvent &event : state.events.tail(EventLog::DefaultCapacity)) {
            if (event.kind == RuntimeEvent::CycleEnd)
                sawCycleEnd = true;
        }
        QVERIFY(sawCycleEnd);

        cycle.stop();
        QVERIFY(cycle.wait(5000));
        QCOMPARE(cycle.state(), ResourceState::Stopped);

        QString error;
        ResourceCommand command;
        command.kind = ResourceCommand::Pause;
        QVERIFY(!cycle.sendCommand(command, &error));
        QCOMPARE(error, QStringLiteral("resource stopped"));
    }

    void pausesAndResumes()
    {
        ControlState state;
        CycleThread cycle(&state, loadProgram(CounterProgram), 1);
        cycle.setCycleInterval(5);
        cycle.start();
        QTRY_VERIFY(snapshotInt(state, "counter") >= 1);

        cycle.pause();
        QCOMPARE(cycle.state(), ResourceState::Paused);
        QTest::qWait(30);
        const qint64 frozen = snapshotInt(state, "counter");
        QTest::qWait(50);
        QCOMPARE(snapshotInt(state, "counter"), frozen);

        cycle.resume();
        QCOMPARE(cycle.state(), ResourceState::Running);
        QTRY_VERIFY(snapshotInt(state, "counter") > frozen);
    }

    void appliesWritesAndForces()
    {
        ControlState state;
        CycleThread cycle(&state, loadProgram(CounterProgram), 1);
        cycle.setCycleInterval(5);
        cycle.start();

        state.debug.enqueueGlobalWrite(QStringLiteral("counter"), Value::fromInt(ValueType::LInt, 1000));
        QTRY_VERIFY(snapshotInt(state, "counter") >= 1000);
        QCOMPARE(snapshotValue(state, QStringLiteral("counter")).type(), ValueType::DInt);

        state.debug.forceGlobal(QStringLiteral("lamp"), Value::fromBool(true));
        QTRY_VERIFY(snapshotValue(state, QStringLiteral("lamp")).toBool());
        for (int i = 0; i < 5; ++i) {
            QTest::qWait(7);
            QVERIFY(snapshotValue(state, QStringLiteral("lamp")).toBool());
        }

        state.debug.enqueueRetainWrite(QStringLiteral("total"), Value::fromInt(ValueType::LInt, 7));
        QTRY_COMPARE(snapshotInt(state, "total"), qint64(7));
        QCOMPARE(cycle.state(), ResourceState::Running);
    }

    void restartsWarmAndCold()
    {
        ControlState state;
        CycleThread cycle(&state, loadProgram(CounterProgram), 1);
        cycle.setCycleInterval(5);
        cycle.start();

        state.debug.enqueueRetainWrite(QStringLiteral("total"), Value::fromInt(ValueType::LInt, 42));
        state.debug.enqueueGlobalWrite(QStringLiteral("counter"), Value::fromInt(ValueType::LInt, 1000));
        QTRY_VERIFY(snapshotInt(state, "counter") >= 1000);
        QCOMPARE(snapshotInt(state, "total"), qint64(42));

        state.requestRestart(RestartMode::Warm);
        QTRY_VERIFY(snapshotInt(state, "counter") < 1000);
        QCOMPARE(snapshotInt(state, "total"), qint64(42));

        state.requestRestart(RestartMode::Cold);
        QTRY_COMPARE(snapshotInt(state, "total"), qint64(0));
    }

    void reloadsProgram()
    {
        ControlState state;
        CycleThread cycle(&state, loadProgram(CounterProgram), 1);
        cycle.setCycleInterval(5);
        cycle.start();

        ResourceCommand command;
        command.kind = ResourceCommand::ReloadBytecode;
        command.bytes = QByteArray("PROGRAM Other\nVAR\n  x : DINT;\nEND_VAR\n  x := x + 2;\nEND_PROGRAM\n");
        command.reply = std::make_shared<ReloadReply>();
        QVERIFY(cycle.sendCommand(command));
        QVERIFY(command.reply->waitFor(5000));
        QVERIFY2(command.reply->succeeded(), qPrintable(command.reply->error()));
        QCOMPARE(command.reply->metadata().statements(1).size(), 1);

        QTRY_COMPARE(programType(state), QStringLiteral("Other"));

        command.bytes = QByteArray("garbage");
        command.reply = std::make_shared<ReloadReply>();
        QVERIFY(cycle.sendCommand(command));
        QVERIFY(command.reply->waitFor(5000));
        QVERIFY(!command.reply->succeeded());
        QCOMPARE(command.reply->error(), QStringLiteral("invalid bytecode: line 1: unexpected 'garbage'"));
        QCOMPARE(cycle.state(), ResourceState::Running);
    }

    void reloadReplacesSourceText()
    {
        ControlState state;
        state.debugEnabled.store(true);
        state.sources.addFile(QStringLiteral("/plc/counter.st"), QString::fromLatin1(CounterProgram));
        const ProgramImage program = loadProgram(CounterProgram);
        {
            std::lock_guard<std::mutex> lg(state.metadataMutex);
            state.metadata = program.metadata();
        }
        CycleThread cycle(&state, program, 1);
        cycle.setCycleInterval(5);

        // line 11 holds "counter := counter + step;"
        QJsonObject set = setBreakpoint(state, 11);
        QCOMPARE(set.value(QStringLiteral("resolved")).toArray().at(0).toObject().value(QStringLiteral("line")).toInt(), 11);
        QCOMPARE(state.debug.breakpoints().size(), 1);

        // Shifts every statement down one line; applied before the first cycle
        const QString shifted = QStringLiteral("(* reloaded *)\n") + QString::fromLatin1(CounterProgram);
        ResourceCommand command;
        command.kind = ResourceCommand::ReloadBytecode;
        command.bytes = shifted.toUtf8();
        command.reply = std::make_shared<ReloadReply>();
        QVERIFY(cycle.sendCommand(command));
        cycle.start();
        QVERIFY(command.reply->waitFor(5000));
        QVERIFY2(command.reply->succeeded(), qPrintable(command.reply->error()));

        QVERIFY(state.debug.breakpoints().isEmpty());
        quint64 generation = 0;
        QVERIFY(state.debug.breakpointGeneration(1, &generation));
        QCOMPARE(generation, quint64(2));
        SourceFile file;
        QVERIFY(state.sources.fileById(1, &file));
        QCOMPARE(file.text, shifted);

        set = setBreakpoint(state, 12);
        const QJsonObject resolved = set.value(QStringLiteral("resolved")).toArray().at(0).toObject();
        QCOMPARE(resolved.value(QStringLiteral("line")).toInt(), 12);
        QCOMPARE(resolved.value(QStringLiteral("column")).toInt(), 4);
        QCOMPARE(set.value(QStringLiteral("generation")).toInt(), 3);
        QTRY_VERIFY(state.debug.isPaused());
        DebugStop stop;
        QVERIFY(state.debug.lastStop(&stop));
        QCOMPARE(stop.location.start, quint32(shifted.indexOf(QLatin1String("counter := counter"))));
    }

    void faultsWithSafeHalt()
    {
        ControlState state;
        CycleThread cycle(&state, loadProgram(FaultingProgram), 1);
        cycle.setFaultPolicy(FaultPolicy::SafeHalt);
        cycle.setCycleInterval(5);
        QVERIFY(snapshotValue(state, QStringLiteral("valve")).toBool());
        cycle.start();

        QTRY_COMPARE(cycle.state(), ResourceState::Faulted);
        QCOMPARE(cycle.lastError(), QStringLiteral("division by zero"));
        QCOMPARE(snapshotValue(state, QStringLiteral("valve")).toBool(), false);
        QCOMPARE(faultCount(state), 1);
    }

    void faultsWithHalt()
    {
        ControlState state;
        CycleThread cycle(&state, loadProgram(FaultingProgram), 1);
        cycle.setFaultPolicy(FaultPolicy::Halt);
        cycle.setCycleInterval(5);
        cycle.start();

        QTRY_COMPARE(cycle.state(), ResourceState::Faulted);
        QVERIFY(snapshotValue(state, QStringLiteral("valve")).toBool());

        // A restart clears the fault until the next cycle faults again.
        state.requestRestart(RestartMode::Warm);
        QTRY_VERIFY(faultCount(state) >= 2);
    }

    void restartsOnFault()
    {
        ControlState state;
        CycleThread cycle(&state, loadProgram(FaultingProgram), 1);
        cycle.setFaultPolicy(FaultPolicy::Restart);
        cycle.setCycleInterval(5);
        cycle.start();

        QTRY_VERIFY(faultCount(state) >= 2);
        QCOMPARE(cycle.state(), ResourceState::Running);
        QVERIFY(cycle.lastError().isEmpty());
    }

    void haltsAtBreakpoint()
    {
        ControlState state;
        const ProgramImage image = loadProgram(CounterProgram);
        CycleThread cycle(&state, image, 1);

        DebugBreakpoint bp;
        bp.location = image.statements().at(1).location;
        state.debug.setBreakpointsForFile(1, { bp });

        cycle.setCycleInterval(5);
        cycle.start();
        QTRY_VERIFY(state.debug.isPaused());

        DebugStop stop;
        QVERIFY(state.debug.lastStop(&stop));
        QCOMPARE(stop.reason, DebugStopReason::Breakpoint);
        QCOMPARE(stop.location, bp.location);

        // The stop snapshot shows the first statement already applied.
        DebugSnapshot snapshot;
        QVERIFY(state.debug.snapshot(&snapshot));
        QCOMPARE(snapshot.storage.globals().get(QStringLiteral("counter"))->toInt(), qint64(1));
        QCOMPARE(snapshot.storage.frames().size(), 1);
        QCOMPARE(snapshot.storage.frames().first().owner, QStringLiteral("Main"));

        cycle.stop();
        QVERIFY(cycle.wait(5000));
        QCOMPARE(cycle.state(), ResourceState::Stopped);
    }
};

QTEST_GUILESS_MAIN(CycleThreadTest)

#include "cyclethread_test.moc"
