#include <QtTest/QtTest>

#include <QJsonArray>
#include <QJsonObject>

#include "core/runtime/events.h"
#include "core/runtime/io.h"
#include "core/runtime/storage.h"
#include "core/runtime/value.h"

class RuntimeModelTest : public QObject
{
    Q_OBJECT

private slots:
    void formatsValues()
    {
        QCOMPARE(formatValue(Value::fromBool(true)), QStringLiteral("TRUE"));
        QCOMPARE(formatValue(Value::fromInt(ValueType::DInt, -42)), QStringLiteral("-42"));
        QCOMPARE(formatValue(Value::fromUInt(ValueType::UDInt, 4000000000u)), QStringLiteral("4000000000"));
        QCOMPARE(formatValue(Value::fromTimeNs(1500000000)), QStringLiteral("T#1500ms"));
        QCOMPARE(formatValue(Value::fromTimeNs(1500)), QStringLiteral("T#1500ns"));
        QCOMPARE(formatValue(Value::fromString(QStringLiteral("hi"))), QStringLiteral("hi"));
        QCOMPARE(formatValue(Value::fromEnum(QStringLiteral("Mode"), QStringLiteral("Run"), 1)),
                 QStringLiteral("Mode::Run"));
        QCOMPARE(formatValue(Value::nullReference()), QStringLiteral("NULL_REF"));
        QCOMPARE(formatValue(Value::fromInstance(3)), QStringLiteral("Instance(3)"));
        QCOMPARE(formatValue(Value()), QStringLiteral("NULL"));

        std::vector<Value> elements;
        elements.push_back(Value::fromInt(ValueType::Int, 1));
        elements.push_back(Value::fromInt(ValueType::Int, 2));
        QCOMPARE(formatValue(Value::fromArray(elements)), QStringLiteral("[2]"));
    }

    void reportsTypeNames()
    {
        QCOMPARE(valueTypeName(Value::fromInt(ValueType::LInt, 1)), QStringLiteral("LINT"));
        QCOMPARE(valueTypeName(Value::fromString(QStringLiteral("x"), true)), QStringLiteral("WSTRING"));
        QCOMPARE(valueTypeName(Value::fromInstance(1)), QStringLiteral("INSTANCE"));

        ValueType type = ValueType::Null;
        QVERIFY(parseValueTypeName(QStringLiteral("udint"), &type));
        QCOMPARE(type, ValueType::UDInt);
        QVERIFY(!parseValueTypeName(QStringLiteral("ARRAY"), &type));
    }

    void coercesWithRangeChecks()
    {
        Value out;
        QString error;
        QVERIFY(coerceValue(Value::fromInt(ValueType::LInt, 300), ValueType::Int, &out, &error));
        QCOMPARE(out.type(), ValueType::Int);
        QCOMPARE(out.toInt(), qint64(300));

        QVERIFY(!coerceValue(Value::fromInt(ValueType::LInt, 300), ValueType::SInt, &out, &error));
        QCOMPARE(error, QStringLiteral("value out of range for SINT"));

        QVERIFY(!coerceValue(Value::fromInt(ValueType::LInt, -1), ValueType::UInt, &out, &error));
        QCOMPARE(error, QStringLiteral("value out of range for UINT"));

        QVERIFY(!coerceValue(Value::fromString(QStringLiteral("x")), ValueType::DInt, &out, &error));
        QCOMPARE(error, QStringLiteral("type mismatch"));

        QVERIFY(coerceValue(Value::fromReal(ValueType::LReal, 2.9), ValueType::DInt, &out, &error));
        QCOMPARE(out.toInt(), qint64(2));
    }

    void parsesIoAddresses_data()
    {
        QTest::addColumn<QString>("text");
        QTest::addColumn<QString>("canonical");

        QTest::newRow("bit") << QStringLiteral("%IX0.1") << QStringLiteral("%IX0.1");
        QTest::newRow("implicit bit") << QStringLiteral("%Q3.7") << QStringLiteral("%QX3.7");
        QTest::newRow("word") << QStringLiteral("%QW2") << QStringLiteral("%QW2");
        QTest::newRow("dword") << QStringLiteral("%MD4") << QStringLiteral("%MD4");
        QTest::newRow("wildcard") << QStringLiteral("%IX*") << QStringLiteral("%IX*");
    }

    void parsesIoAddresses()
    {
        QFETCH(QString, text);
        QFETCH(QString, canonical);

        IoAddress address;
        QString error;
        QVERIFY2(parseIoAddress(text, &address, &error), qPrintable(error));
        QCOMPARE(formatIoAddress(address), canonical);
    }

    void rejectsBadIoAddresses()
    {
        IoAddress address;
        QString error;
        QVERIFY(!parseIoAddress(QStringLiteral("%IX0.8"), &address, &error));
        QCOMPARE(error, QStringLiteral("invalid I/O address '%IX0.8'"));
        QVERIFY(!parseIoAddress(QStringLiteral("%ZX0.0"), &address, &error));
        QVERIFY(!parseIoAddress(QStringLiteral("IX0.0"), &address, &error));
    }

    void serializesIoSnapshot()
    {
        IoSnapshot snapshot;
        QVERIFY(snapshot.isEmpty());

        IoSnapshotEntry lamp;
        lamp.name = QStringLiteral("lamp");
        parseIoAddress(QStringLiteral("%QX0.0"), &lamp.address);
        lamp.value = Value::fromBool(true);
        snapshot.outputs.append(lamp);

        IoSnapshotEntry any;
        any.state = IoSnapshotEntry::Unresolved;
        parseIoAddress(QStringLiteral("%IX*"), &any.address);
        snapshot.inputs.append(any);

        IoSnapshotEntry broken;
        broken.state = IoSnapshotEntry::Error;
        broken.error = QStringLiteral("driver offline");
        parseIoAddress(QStringLiteral("%MW0"), &broken.address);
        snapshot.memory.append(broken);

        const QJsonObject json = snapshot.toJson();
        const QJsonObject out = json.value(QStringLiteral("outputs")).toArray().first().toObject();
        QCOMPARE(out.value(QStringLiteral("name")).toString(), QStringLiteral("lamp"));
        QCOMPARE(out.value(QStringLiteral("address")).toString(), QStringLiteral("%QX0.0"));
        QCOMPARE(out.value(QStringLiteral("value")).toString(), QStringLiteral("TRUE"));

        const QJsonObject in = json.value(QStringLiteral("inputs")).toArray().first().toObject();
        QVERIFY(in.value(QStringLiteral("name")).isNull());
        QCOMPARE(in.value(QStringLiteral("value")).toString(), QStringLiteral("unresolved"));

        const QJsonObject mem = json.value(QStringLiteral("memory")).toArray().first().toObject();
        QCOMPARE(mem.value(QStringLiteral("value")).toObject().value(QStringLiteral("error")).toString(),
                 QStringLiteral("driver offline"));
    }

    void eventLogKeepsNewest()
    {
        EventLog log(3);
        for (int i = 1; i <= 5; ++i)
            log.push(RuntimeEvent::cycleStart(quint64(i), i * 10));
        QCOMPARE(log.size(), 3);

        const QVector<RuntimeEvent> tail = log.tail(2);
        QCOMPARE(tail.size(), 2);
        QCOMPARE(tail.at(0).cycle, quint64(5));
        QCOMPARE(tail.at(1).cycle, quint64(4));

        const QJsonObject fault = RuntimeEvent::fault(QStringLiteral("boom"), 7).toJson();
        QCOMPARE(fault.value(QStringLiteral("type")).toString(), QStringLiteral("fault"));
        QCOMPARE(fault.value(QStringLiteral("error")).toString(), QStringLiteral("boom"));
        QCOMPARE(fault.value(QStringLiteral("time_ns")).toInteger(), qint64(7));
    }

    void storageResolvesReferences()
    {
        VariableStorage storage;
        storage.globals().set(QStringLiteral("Counter"), Value::fromInt(ValueType::DInt, 1));
        const quint32 fb = storage.createInstance(QStringLiteral("Motor"));
        storage.instance(fb)->vars.set(QStringLiteral("speed"), Value::fromInt(ValueType::Int, 10));

        ValueRef ref;
        ref.area = ValueRef::Global;
        ref.name = QStringLiteral("counter");
        Value value;
        QVERIFY(storage.readByRef(ref, &value));
        QCOMPARE(value.toInt(), qint64(1));
        QVERIFY(storage.writeByRef(ref, Value::fromInt(ValueType::DInt, 2)));
        QCOMPARE(storage.globals().get(QStringLiteral("COUNTER"))->toInt(), qint64(2));

        ValueRef speed;
        speed.area = ValueRef::Instance;
        speed.owner = fb;
        speed.name = QStringLiteral("speed");
        QVERIFY(storage.readByRef(speed, &value));
        QCOMPARE(value.toInt(), qint64(10));

        speed.owner = fb + 1;
        QVERIFY(!storage.readByRef(speed, &value));

        const quint32 frameId = storage.pushFrame(QStringLiteral("Main"), fb).id;
        QCOMPARE(storage.currentFrame()->id, frameId);
        storage.popFrame();
        QVERIFY(storage.currentFrame() == nullptr);
    }
};

QTEST_GUILESS_MAIN(RuntimeModelTest)

#include "runtime_model_test.moc"
