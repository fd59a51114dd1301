#include <QtTest/QtTest>

#include <thread>

#include <QJsonArray>
#include <QJsonObject>

#include "core/control/control_state.h"
#include "core/control/dispatcher.h"

namespace {

const char *const SourcePath = "/plc/main.st";
// line 0: "x := 1;"  line 1: "y := 2;"  line 2: "  z := 3;"
const char *const SourceText = "x := 1;\ny := 2;\n  z := 3;\n";

SourceLocation location(quint32 start, quint32 end)
{
    SourceLocation loc;
    loc.fileId = 1;
    loc.start = start;
    loc.end = end;
    return loc;
}

void loadProgram(ControlState &state)
{
    state.debugEnabled.store(true);
    state.sources.addFile(QString::fromLatin1(SourcePath), QString::fromLatin1(SourceText));
    std::lock_guard<std::mutex> lg(state.metadataMutex);
    state.metadata.setStatements(1, { location(0, 6), location(8, 14), location(18, 24) });
    state.metadata.setUsing(QStringLiteral("Main"), QStringList() << QStringLiteral("Lib"));
}

QJsonObject call(ControlState &state, const QString &type, const QJsonObject &params = QJsonObject())
{
    ControlRequest request;
    request.id = 7;
    request.type = type;
    request.hasParams = !params.isEmpty();
    request.params = params;
    return handleRequest(request, state, QString()).toJson();
}

QJsonObject resultOf(const QJsonObject &response)
{
    return response.value(QStringLiteral("result")).toObject();
}

QString errorOf(const QJsonObject &response)
{
    return response.value(QStringLiteral("error")).toString();
}

QString statusOf(const QJsonObject &response)
{
    return resultOf(response).value(QStringLiteral("status")).toString();
}

QJsonObject sourceParams()
{
    QJsonObject params;
    params.insert(QStringLiteral("source"), QString::fromLatin1(SourcePath));
    return params;
}

/* Runs one statement on a worker thread with an entry stop armed, so the
 * worker blocks there and leaves a snapshot behind. */
class StoppedProgram
{
public:
    explicit StoppedProgram(ControlState &state)
        : m_state(state)
    {
        m_storage.globals().set(QStringLiteral("counter"), Value::fromInt(ValueType::DInt, 4));
        m_storage.globals().set(QStringLiteral("Lib.limit"), Value::fromInt(ValueType::DInt, 10));
        instanceId = m_storage.createInstance(QStringLiteral("Main"));
        m_storage.instance(instanceId)->vars.set(QStringLiteral("n"), Value::fromInt(ValueType::DInt, 3));
        CallFrame &frame = m_storage.pushFrame(QStringLiteral("Main"), instanceId);
        frame.locals.set(QStringLiteral("tmp"), Value::fromBool(true));
        frameId = frame.id;

        m_state.debug.pauseEntry();
        m_worker = std::thread([this] {
            m_state.debug.onStatement(location(8, 14), frameId, 1, m_storage);
        });
    }

    ~StoppedProgram()
    {
        m_state.debug.interrupt();
        m_worker.join();
    }

    quint32 instanceId = 0;
    quint32 frameId = 0;

private:
    ControlState &m_state;
    VariableStorage m_storage;
    std::thread m_worker;
};

} // namespace

class DebugHandlersTest : public QObject
{
    Q_OBJECT

private slots:
    void pausesAndResumesInDebugMode()
    {
        ControlState state;
        loadProgram(state);
        state.setControlMode(ControlMode::Debug);

        QCOMPARE(statusOf(call(state, QStringLiteral("pause"))), QStringLiteral("paused"));
        QVERIFY(state.debug.isPaused());
        QCOMPARE(statusOf(call(state, QStringLiteral("resume"))), QStringLiteral("running"));
        QVERIFY(!state.debug.isPaused());
        QCOMPARE(statusOf(call(state, QStringLiteral("step_over"))), QStringLiteral("stepping"));

        const QJsonObject debugState = resultOf(call(state, QStringLiteral("debug.state")));
        QCOMPARE(debugState.value(QStringLiteral("paused")).toBool(true), false);
        QVERIFY(debugState.value(QStringLiteral("last_stop")).isNull());
    }

    void setsBreakpointsByLine()
    {
        ControlState state;
        loadProgram(state);

        QJsonObject params = sourceParams();
        params.insert(QStringLiteral("lines"), QJsonArray({ 1, 1, 5 }));
        const QJsonObject result = resultOf(call(state, QStringLiteral("breakpoints.set"), params));
        QCOMPARE(result.value(QStringLiteral("status")).toString(), QStringLiteral("ok"));
        QCOMPARE(result.value(QStringLiteral("file_id")).toInt(), 1);
        QCOMPARE(result.value(QStringLiteral("generation")).toInt(), 1);
        const QJsonArray resolved = result.value(QStringLiteral("resolved")).toArray();
        QCOMPARE(resolved.size(), 1);
        QCOMPARE(resolved.at(0).toObject().value(QStringLiteral("line")).toInt(), 1);
        QCOMPARE(resolved.at(0).toObject().value(QStringLiteral("column")).toInt(), 0);

        const QJsonArray list = resultOf(call(state, QStringLiteral("breakpoints.list")))
                                    .value(QStringLiteral("breakpoints")).toArray();
        QCOMPARE(list.size(), 1);
        QCOMPARE(list.at(0).toObject().value(QStringLiteral("start")).toInt(), 8);
        QCOMPARE(list.at(0).toObject().value(QStringLiteral("end")).toInt(), 14);

        QCOMPARE(statusOf(call(state, QStringLiteral("breakpoints.clear"), sourceParams())), QStringLiteral("cleared"));
        QVERIFY(state.debug.breakpoints().isEmpty());
        quint64 generation = 0;
        QVERIFY(state.debug.breakpointGeneration(1, &generation));
        QCOMPARE(generation, quint64(2));

        QCOMPARE(statusOf(call(state, QStringLiteral("breakpoints.clear_all"))), QStringLiteral("cleared"));
        QVERIFY(state.debug.breakpointGeneration(1, &generation));
        QCOMPARE(generation, quint64(3));
        const QJsonObject again = resultOf(call(state, QStringLiteral("breakpoints.set"), params));
        QCOMPARE(again.value(QStringLiteral("generation")).toInt(), 4);
    }

    void rejectsBreakpointTargets()
    {
        ControlState state;
        loadProgram(state);

        QJsonObject params;
        params.insert(QStringLiteral("source"), QStringLiteral("/plc/other.st"));
        params.insert(QStringLiteral("lines"), QJsonArray({ 0 }));
        QCOMPARE(errorOf(call(state, QStringLiteral("breakpoints.set"), params)), QStringLiteral("unknown source path"));

        // Lines past the int range never wrap onto line 0
        params = sourceParams();
        params.insert(QStringLiteral("lines"), QJsonArray({ qint64(4294967296LL) }));
        const QJsonObject wide = resultOf(call(state, QStringLiteral("breakpoints.set"), params));
        QVERIFY(wide.value(QStringLiteral("resolved")).toArray().isEmpty());
        QVERIFY(state.debug.breakpoints().isEmpty());

        params = sourceParams();
        QCOMPARE(errorOf(call(state, QStringLiteral("breakpoints.set"), params)),
                 QStringLiteral("invalid params: missing field 'lines'"));
        QCOMPARE(errorOf(call(state, QStringLiteral("breakpoints.set"))), QStringLiteral("missing params"));

        QJsonObject byId;
        byId.insert(QStringLiteral("file_id"), 9);
        QCOMPARE(errorOf(call(state, QStringLiteral("breakpoints.clear_id"), byId)), QStringLiteral("unknown file id"));
        byId.insert(QStringLiteral("file_id"), 1);
        const QJsonObject cleared = resultOf(call(state, QStringLiteral("breakpoints.clear_id"), byId));
        QCOMPARE(cleared.value(QStringLiteral("status")).toString(), QStringLiteral("cleared"));
        QCOMPARE(cleared.value(QStringLiteral("file_id")).toInt(), 1);
    }

    void listsBreakpointLocations()
    {
        ControlState state;
        loadProgram(state);

        QJsonObject params = sourceParams();
        params.insert(QStringLiteral("line"), 0);
        params.insert(QStringLiteral("end_line"), 2);
        params.insert(QStringLiteral("column"), 1);
        const QJsonArray locations = resultOf(call(state, QStringLiteral("debug.breakpoint_locations"), params))
                                         .value(QStringLiteral("breakpoints")).toArray();
        QCOMPARE(locations.size(), 2);
        QCOMPARE(locations.at(0).toObject().value(QStringLiteral("line")).toInt(), 1);
        QCOMPARE(locations.at(1).toObject().value(QStringLiteral("column")).toInt(), 2);

        params = sourceParams();
        params.insert(QStringLiteral("line"), 2);
        QCOMPARE(resultOf(call(state, QStringLiteral("debug.breakpoint_locations"), params))
                     .value(QStringLiteral("breakpoints")).toArray().size(), 1);
    }

    void requiresSnapshot()
    {
        ControlState state;
        loadProgram(state);
        QJsonObject params;
        params.insert(QStringLiteral("frame_id"), 1);
        QCOMPARE(errorOf(call(state, QStringLiteral("debug.stack"))), QStringLiteral("no snapshot available"));
        QCOMPARE(errorOf(call(state, QStringLiteral("debug.scopes"), params)), QStringLiteral("no snapshot available"));
        QJsonObject expr;
        expr.insert(QStringLiteral("expr"), QStringLiteral("counter"));
        QCOMPARE(errorOf(call(state, QStringLiteral("eval"), expr)), QStringLiteral("no snapshot available"));
    }

    void inspectsStoppedProgram()
    {
        ControlState state;
        loadProgram(state);
        StoppedProgram program(state);
        QTRY_VERIFY(state.debug.isPaused() && state.debug.hasSnapshot());

        const QJsonObject lastStop = resultOf(call(state, QStringLiteral("debug.state")))
                                         .value(QStringLiteral("last_stop")).toObject();
        QCOMPARE(lastStop.value(QStringLiteral("reason")).toString(), QStringLiteral("entry"));
        QCOMPARE(lastStop.value(QStringLiteral("line")).toInt(), 1);
        QCOMPARE(lastStop.value(QStringLiteral("path")).toString(), QString::fromLatin1(SourcePath));
        QVERIFY(lastStop.value(QStringLiteral("breakpoint_generation")).isNull());

        const QJsonObject stack = resultOf(call(state, QStringLiteral("debug.stack")));
        QCOMPARE(stack.value(QStringLiteral("total_frames")).toInt(), 1);
        const QJsonObject frame = stack.value(QStringLiteral("stack_frames")).toArray().at(0).toObject();
        QCOMPARE(frame.value(QStringLiteral("id")).toInt(), int(program.frameId));
        QCOMPARE(frame.value(QStringLiteral("name")).toString(), QStringLiteral("Main"));
        QCOMPARE(frame.value(QStringLiteral("source")).toObject().value(QStringLiteral("name")).toString(),
                 QStringLiteral("main.st"));
        QCOMPARE(frame.value(QStringLiteral("line")).toInt(), 1);

        QJsonObject params;
        params.insert(QStringLiteral("frame_id"), qint64(program.frameId));
        const QJsonArray scopes = resultOf(call(state, QStringLiteral("debug.scopes"), params))
                                      .value(QStringLiteral("scopes")).toArray();
        QCOMPARE(scopes.size(), 3);
        QCOMPARE(scopes.at(0).toObject().value(QStringLiteral("name")).toString(), QStringLiteral("Locals"));
        QCOMPARE(scopes.at(0).toObject().value(QStringLiteral("line")).toInt(), 1);
        QCOMPARE(scopes.at(1).toObject().value(QStringLiteral("name")).toString(), QStringLiteral("Globals"));
        QCOMPARE(scopes.at(2).toObject().value(QStringLiteral("name")).toString(), QStringLiteral("Instances"));

        QJsonObject vars;
        vars.insert(QStringLiteral("variables_reference"),
                    scopes.at(0).toObject().value(QStringLiteral("variablesReference")));
        const QJsonArray locals = resultOf(call(state, QStringLiteral("debug.variables"), vars))
                                      .value(QStringLiteral("variables")).toArray();
        QCOMPARE(locals.size(), 2);
        QCOMPARE(locals.at(0).toObject().value(QStringLiteral("name")).toString(), QStringLiteral("n"));
        QCOMPARE(locals.at(1).toObject().value(QStringLiteral("value")).toString(), QStringLiteral("TRUE"));

        vars.insert(QStringLiteral("variables_reference"), 999);
        QVERIFY(resultOf(call(state, QStringLiteral("debug.variables"), vars))
                    .value(QStringLiteral("variables")).toArray().isEmpty());

        QJsonObject evaluate;
        evaluate.insert(QStringLiteral("expression"), QStringLiteral("n + counter + limit"));
        const QJsonObject value = resultOf(call(state, QStringLiteral("debug.evaluate"), evaluate));
        QCOMPARE(value.value(QStringLiteral("result")).toString(), QStringLiteral("17"));
        QCOMPARE(value.value(QStringLiteral("type")).toString(), QStringLiteral("DINT"));
        QCOMPARE(value.value(QStringLiteral("variables_reference")).toInt(-1), 0);

        evaluate.insert(QStringLiteral("frame_id"), 42);
        QCOMPARE(errorOf(call(state, QStringLiteral("debug.evaluate"), evaluate)), QStringLiteral("unknown frame id"));
        evaluate.insert(QStringLiteral("frame_id"), qint64(program.frameId));
        evaluate.insert(QStringLiteral("expression"), QStringLiteral("missing"));
        QCOMPARE(errorOf(call(state, QStringLiteral("debug.evaluate"), evaluate)),
                 QStringLiteral("unknown identifier 'missing'"));

        QJsonObject expr;
        expr.insert(QStringLiteral("expr"), QStringLiteral("counter"));
        QCOMPARE(resultOf(call(state, QStringLiteral("eval"), expr)).value(QStringLiteral("value")).toString(),
                 QStringLiteral("4"));
        expr.insert(QStringLiteral("expr"), QStringLiteral("n"));
        QCOMPARE(errorOf(call(state, QStringLiteral("eval"), expr)), QStringLiteral("unknown identifier"));

        QCOMPARE(resultOf(call(state, QStringLiteral("debug.stops"))).value(QStringLiteral("stops")).toArray().size(), 1);
        QVERIFY(resultOf(call(state, QStringLiteral("debug.stops"))).value(QStringLiteral("stops")).toArray().isEmpty());
    }

    void scopesStartNewHandleGeneration()
    {
        ControlState state;
        loadProgram(state);
        StoppedProgram program(state);
        QTRY_VERIFY(state.debug.isPaused() && state.debug.hasSnapshot());

        QJsonObject params;
        params.insert(QStringLiteral("frame_id"), qint64(program.frameId));
        const QJsonArray scopes = resultOf(call(state, QStringLiteral("debug.scopes"), params))
                                      .value(QStringLiteral("scopes")).toArray();
        QCOMPARE(scopes.size(), 3);
        const qint64 instancesRef = scopes.at(2).toObject().value(QStringLiteral("variablesReference")).toInteger();
        QCOMPARE(instancesRef, qint64(3));

        QJsonObject vars;
        vars.insert(QStringLiteral("variables_reference"), instancesRef);
        const QJsonArray instances = resultOf(call(state, QStringLiteral("debug.variables"), vars))
                                         .value(QStringLiteral("variables")).toArray();
        QCOMPARE(instances.size(), 1);
        const qint64 instanceRef = instances.at(0).toObject().value(QStringLiteral("variablesReference")).toInteger();
        QCOMPARE(instanceRef, qint64(4));

        // Child handles stay valid until the next scopes request.
        vars.insert(QStringLiteral("variables_reference"), instanceRef);
        for (int i = 0; i < 2; ++i) {
            const QJsonArray members = resultOf(call(state, QStringLiteral("debug.variables"), vars))
                                           .value(QStringLiteral("variables")).toArray();
            QCOMPARE(members.size(), 1);
            QCOMPARE(members.at(0).toObject().value(QStringLiteral("name")).toString(), QStringLiteral("n"));
        }

        const QJsonArray again = resultOf(call(state, QStringLiteral("debug.scopes"), params))
                                     .value(QStringLiteral("scopes")).toArray();
        QCOMPARE(again.size(), 3);
        QCOMPARE(again.at(2).toObject().value(QStringLiteral("variablesReference")).toInteger(), instancesRef);
        QVERIFY(resultOf(call(state, QStringLiteral("debug.variables"), vars))
                    .value(QStringLiteral("variables")).toArray().isEmpty());

        // The reused id names the new generation's scope.
        vars.insert(QStringLiteral("variables_reference"), instancesRef);
        QCOMPARE(resultOf(call(state, QStringLiteral("debug.variables"), vars))
                     .value(QStringLiteral("variables")).toArray().size(), 1);
    }

    void queuesWritesAndForces()
    {
        ControlState state;
        loadProgram(state);

        QJsonObject params;
        params.insert(QStringLiteral("target"), QStringLiteral("global:counter"));
        params.insert(QStringLiteral("value"), QStringLiteral("5"));
        QCOMPARE(statusOf(call(state, QStringLiteral("set"), params)), QStringLiteral("queued"));
        const QVector<PendingWrite> writes = state.debug.drainWrites();
        QCOMPARE(writes.size(), 1);
        QCOMPARE(writes.first().targetText(), QStringLiteral("global:counter"));

        params.insert(QStringLiteral("target"), QStringLiteral("local:tmp"));
        QCOMPARE(errorOf(call(state, QStringLiteral("set"), params)), QStringLiteral("unsupported target"));

        params.insert(QStringLiteral("target"), QStringLiteral("instance:1:n"));
        params.insert(QStringLiteral("value"), QStringLiteral("true"));
        QCOMPARE(statusOf(call(state, QStringLiteral("var.force"), params)), QStringLiteral("forced"));
        const QJsonArray forced = resultOf(call(state, QStringLiteral("var.forced"))).value(QStringLiteral("vars")).toArray();
        QCOMPARE(forced.size(), 1);
        QCOMPARE(forced.at(0).toObject().value(QStringLiteral("target")).toString(), QStringLiteral("instance:1:n"));
        QCOMPARE(forced.at(0).toObject().value(QStringLiteral("value")).toString(), QStringLiteral("TRUE"));

        params.insert(QStringLiteral("target"), QStringLiteral("instance:x:n"));
        QCOMPARE(errorOf(call(state, QStringLiteral("var.force"), params)), QStringLiteral("invalid instance id"));
        params.insert(QStringLiteral("target"), QStringLiteral("io:%QX0.0"));
        QCOMPARE(errorOf(call(state, QStringLiteral("var.force"), params)),
                 QStringLiteral("unsupported target (use global:<name> or retain:<name>)"));

        QJsonObject release;
        release.insert(QStringLiteral("target"), QStringLiteral("instance:1:N"));
        QCOMPARE(statusOf(call(state, QStringLiteral("var.unforce"), release)), QStringLiteral("released"));
        QVERIFY(state.debug.forcedVariables().isEmpty());
    }

    void evaluatesAgainstPublishedSnapshot()
    {
        ControlState state;
        loadProgram(state);
        VariableStorage storage;
        storage.globals().set(QStringLiteral("counter"), Value::fromInt(ValueType::DInt, 4));
        state.debug.publishSnapshot(storage);

        QJsonObject write;
        write.insert(QStringLiteral("target"), QStringLiteral("global:counter"));
        write.insert(QStringLiteral("value"), QStringLiteral("5"));
        QCOMPARE(statusOf(call(state, QStringLiteral("set"), write)), QStringLiteral("queued"));

        // Nothing has applied the write yet
        QJsonObject eval;
        eval.insert(QStringLiteral("expression"), QStringLiteral("counter"));
        QCOMPARE(resultOf(call(state, QStringLiteral("debug.evaluate"), eval)).value(QStringLiteral("result")).toString(),
                 QStringLiteral("4"));
    }
};

QTEST_GUILESS_MAIN(DebugHandlersTest)

#include "debug_handlers_test.moc"
