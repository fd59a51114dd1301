#include <QtTest/QtTest>

#include "core/debug/variable_handles.h"

class VariableHandlesTest : public QObject
{
    Q_OBJECT

private slots:
    void allocatesOneBasedIds()
    {
        VariableHandleArena arena;
        QVERIFY(!arena.get(0));
        QCOMPARE(arena.alloc(VariableHandle::ofKind(VariableHandle::Globals)), quint32(1));
        QCOMPARE(arena.alloc(VariableHandle::locals(4)), quint32(2));
        QCOMPARE(arena.get(2)->frameId, quint32(4));
        QVERIFY(!arena.get(3));

        arena.clear();
        QVERIFY(!arena.get(1));
        QCOMPARE(arena.alloc(VariableHandle::instance(9)), quint32(1));
    }

    void expandsAggregates()
    {
        VariableStorage storage;
        std::vector<Value> elements;
        elements.push_back(Value::fromInt(ValueType::Int, 10));
        elements.push_back(Value::fromInt(ValueType::Int, 20));
        storage.globals().set(QStringLiteral("table"), Value::fromArray(elements));

        std::vector<StructField> fields;
        StructField field;
        field.name = QStringLiteral("x");
        field.value = Value::fromReal(ValueType::LReal, 1.5);
        fields.push_back(field);
        storage.globals().set(QStringLiteral("point"), Value::fromStruct(QStringLiteral("Point"), fields));
        storage.globals().set(QStringLiteral("flag"), Value::fromBool(true));

        VariableHandleArena arena;
        const QVector<DebugVariable> globals =
            expandVariableHandle(arena, VariableHandle::ofKind(VariableHandle::Globals), storage, nullptr);
        QCOMPARE(globals.size(), 3);
        QCOMPARE(globals.at(0).name, QStringLiteral("table"));
        QCOMPARE(globals.at(0).value, QStringLiteral("[2]"));
        QVERIFY(globals.at(0).variablesReference != 0);
        QCOMPARE(globals.at(2).variablesReference, quint32(0));
        QCOMPARE(globals.at(2).type, QStringLiteral("BOOL"));

        const VariableHandle array = *arena.get(globals.at(0).variablesReference);
        const QVector<DebugVariable> items = expandVariableHandle(arena, array, storage, nullptr);
        QCOMPARE(items.size(), 2);
        QCOMPARE(items.at(0).name, QStringLiteral("[0]"));
        QCOMPARE(items.at(1).value, QStringLiteral("20"));

        const VariableHandle point = *arena.get(globals.at(1).variablesReference);
        const QVector<DebugVariable> members = expandVariableHandle(arena, point, storage, nullptr);
        QCOMPARE(members.size(), 1);
        QCOMPARE(members.at(0).name, QStringLiteral("x"));
        QCOMPARE(members.at(0).type, QStringLiteral("LREAL"));
    }

    void expandsInstancesAndReferences()
    {
        VariableStorage storage;
        const quint32 outer = storage.createInstance(QStringLiteral("Main"));
        const quint32 inner = storage.createInstance(QStringLiteral("Motor"), outer);
        storage.instance(inner)->vars.set(QStringLiteral("rpm"), Value::fromInt(ValueType::DInt, 1200));

        ValueRef ref;
        ref.area = ValueRef::Instance;
        ref.owner = inner;
        ref.name = QStringLiteral("rpm");
        storage.globals().set(QStringLiteral("rpmRef"), Value::fromReference(ref));
        storage.globals().set(QStringLiteral("none"), Value::nullReference());

        VariableHandleArena arena;
        const QVector<DebugVariable> instances =
            expandVariableHandle(arena, VariableHandle::ofKind(VariableHandle::Instances), storage, nullptr);
        QCOMPARE(instances.size(), 2);
        QCOMPARE(instances.at(1).name, QStringLiteral("Motor#%1").arg(inner));
        QCOMPARE(instances.at(1).type, QStringLiteral("INSTANCE"));

        const QVector<DebugVariable> motor =
            expandVariableHandle(arena, *arena.get(instances.at(1).variablesReference), storage, nullptr);
        QCOMPARE(motor.size(), 2);
        QCOMPARE(motor.at(0).value, QStringLiteral("1200"));
        QCOMPARE(motor.at(1).name, QStringLiteral("parent"));
        QCOMPARE(motor.at(1).value, QStringLiteral("Instance(%1)").arg(outer));

        const QVector<DebugVariable> globals =
            expandVariableHandle(arena, VariableHandle::ofKind(VariableHandle::Globals), storage, nullptr);
        QCOMPARE(globals.size(), 2);
        QVERIFY(globals.at(0).variablesReference != 0);
        QCOMPARE(globals.at(1).variablesReference, quint32(0));

        const QVector<DebugVariable> target =
            expandVariableHandle(arena, *arena.get(globals.at(0).variablesReference), storage, nullptr);
        QCOMPARE(target.size(), 1);
        QCOMPARE(target.at(0).name, QStringLiteral("*"));
        QCOMPARE(target.at(0).value, QStringLiteral("1200"));
    }

    void expandsLocalsWithOwner()
    {
        VariableStorage storage;
        const quint32 instance = storage.createInstance(QStringLiteral("Main"));
        storage.instance(instance)->vars.set(QStringLiteral("count"), Value::fromInt(ValueType::DInt, 3));
        CallFrame &frame = storage.pushFrame(QStringLiteral("Main"), instance);
        frame.locals.set(QStringLiteral("tmp"), Value::fromBool(false));
        const quint32 frameId = frame.id;

        VariableHandleArena arena;
        const QVector<DebugVariable> locals =
            expandVariableHandle(arena, VariableHandle::locals(frameId), storage, nullptr);
        QCOMPARE(locals.size(), 2);
        QCOMPARE(locals.at(0).name, QStringLiteral("count"));
        QCOMPARE(locals.at(1).name, QStringLiteral("tmp"));

        QVERIFY(expandVariableHandle(arena, VariableHandle::locals(frameId + 1), storage, nullptr).isEmpty());
    }

    void expandsIoGroups()
    {
        IoSnapshot io;
        QVERIFY(!ioScopeAvailable(&io));
        QVERIFY(!ioScopeAvailable(nullptr));

        IoSnapshotEntry entry;
        QVERIFY(parseIoAddress(QStringLiteral("%IX0.1"), &entry.address));
        entry.name = QStringLiteral("start_button");
        entry.value = Value::fromBool(true);
        io.inputs.append(entry);
        IoSnapshotEntry anonymous;
        QVERIFY(parseIoAddress(QStringLiteral("%QW2"), &anonymous.address));
        anonymous.value = Value::fromUInt(ValueType::Word, 7);
        io.outputs.append(anonymous);
        QVERIFY(ioScopeAvailable(&io));

        VariableStorage storage;
        VariableHandleArena arena;
        const QVector<DebugVariable> groups =
            expandVariableHandle(arena, VariableHandle::ofKind(VariableHandle::IoRoot), storage, &io);
        QCOMPARE(groups.size(), 3);
        QCOMPARE(groups.at(0).name, QStringLiteral("Inputs"));
        QCOMPARE(groups.at(0).value, QStringLiteral("1 items"));
        QCOMPARE(groups.at(2).value, QStringLiteral("0 items"));

        const QVector<DebugVariable> inputs =
            expandVariableHandle(arena, *arena.get(groups.at(0).variablesReference), storage, &io);
        QCOMPARE(inputs.size(), 1);
        QCOMPARE(inputs.at(0).name, QStringLiteral("start_button"));
        QCOMPARE(inputs.at(0).value, QStringLiteral("TRUE"));

        const QVector<DebugVariable> outputs =
            expandVariableHandle(arena, *arena.get(groups.at(1).variablesReference), storage, &io);
        QCOMPARE(outputs.at(0).name, QStringLiteral("%QW2"));
        QCOMPARE(outputs.at(0).type, QStringLiteral("WORD"));
    }

    void serializesVariables()
    {
        DebugVariable var;
        var.name = QStringLiteral("x");
        var.value = QStringLiteral("1");
        const QJsonObject obj = var.toJson();
        QCOMPARE(obj.value(QStringLiteral("variablesReference")).toInt(), 0);
        QVERIFY(!obj.contains(QStringLiteral("type")));
        QVERIFY(!obj.contains(QStringLiteral("evaluateName")));
    }
};

QTEST_GUILESS_MAIN(VariableHandlesTest)

#include "variable_handles_test.moc"
