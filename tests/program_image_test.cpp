#include <QtTest/QtTest>

#include "app/program_image.h"

namespace {

const char *const SampleProgram =
    "TYPE Mode : (Idle, Run, Fault); END_TYPE\n"
    "VAR_GLOBAL\n"
    "    counter : DINT := 0;\n"
    "    lamp AT %QX0.0 : BOOL;\n"
    "    mode : Mode := Mode#Run;\n"
    "END_VAR\n"
    "VAR_GLOBAL RETAIN\n"
    "    total : LINT;\n"
    "END_VAR\n"
    "PROGRAM Main\n"
    "USING Lib;\n"
    "VAR\n"
    "    step : INT := 1;\n"
    "END_VAR\n"
    "    counter := counter + step;\n"
    "    lamp := NOT lamp;\n"
    "END_PROGRAM\n";

ValueRef globalRef(const QString &name)
{
    ValueRef ref;
    ref.area = ValueRef::Global;
    ref.name = name;
    return ref;
}

} // namespace

class ProgramImageTest : public QObject
{
    Q_OBJECT

private slots:
    void parsesSampleProgram()
    {
        const QString text = QString::fromLatin1(SampleProgram);
        ProgramImage image;
        QString error;
        QVERIFY2(ProgramImage::parse(text, 3, &image, &error), qPrintable(error));

        QCOMPARE(image.name(), QStringLiteral("Main"));
        QCOMPARE(image.usingList(), QStringList() << QStringLiteral("Lib"));
        QCOMPARE(image.globals().size(), 4);
        QCOMPARE(image.locals().size(), 1);
        QCOMPARE(image.locals().first().initial.toInt(), qint64(1));
        QCOMPARE(image.locals().first().type, ValueType::Int);

        const ProgramVariable &lamp = image.globals().at(1);
        QVERIFY(lamp.bound);
        QCOMPARE(formatIoAddress(lamp.address), QStringLiteral("%QX0.0"));
        QCOMPARE(image.bindingAt(lamp.address), &lamp);

        const ProgramVariable &mode = image.globals().at(2);
        QCOMPARE(mode.type, ValueType::Enum);
        QCOMPARE(formatValue(mode.initial), QStringLiteral("Mode::Run"));
        QVERIFY(image.globals().at(3).retain);

        QCOMPARE(image.statements().size(), 2);
        const ProgramStatement &first = image.statements().first();
        QCOMPARE(first.target, QStringLiteral("counter"));
        QCOMPARE(first.location.fileId, quint32(3));
        const int start = text.indexOf(QLatin1String("counter := counter"));
        QCOMPARE(first.location.start, quint32(start));
        QCOMPARE(first.location.end, quint32(text.indexOf(QLatin1Char(';'), start) + 1));

        QCOMPARE(image.metadata().statements(3).size(), 2);
        QCOMPARE(image.metadata().usingFor(QStringLiteral("MAIN")), QStringList() << QStringLiteral("Lib"));
        QVERIFY(image.metadata().types().findEnum(QStringLiteral("mode")));
    }

    void ignoresComments()
    {
        const QString text = QStringLiteral("(* header\n   spans lines *)\n"
                                            "TYPE\n  Color : (Red, Green);\nEND_TYPE\n"
                                            "PROGRAM P // main program\n"
                                            "VAR\n  c : Color;\nEND_VAR\n"
                                            "  c := Color#Green; (* switch *)\n"
                                            "END_PROGRAM\n");
        ProgramImage image;
        QString error;
        QVERIFY2(ProgramImage::parse(text, 1, &image, &error), qPrintable(error));
        QCOMPARE(image.name(), QStringLiteral("P"));
        QCOMPARE(image.statements().size(), 1);
        const SourceLocation location = image.statements().first().location;
        QCOMPARE(text.mid(int(location.start), int(location.end - location.start)),
                 QStringLiteral("c := Color#Green;"));
        QCOMPARE(formatValue(image.locals().first().initial), QStringLiteral("Color::Red"));
    }

    void rejectsInvalidPrograms_data()
    {
        QTest::addColumn<QString>("text");
        QTest::addColumn<QString>("error");

        QTest::newRow("unknown-type") << "VAR_GLOBAL\n  a : FOO;\nEND_VAR\nPROGRAM P\nEND_PROGRAM\n"
                                      << "line 2: unknown type 'FOO'";
        QTest::newRow("duplicate") << "VAR_GLOBAL\n  a : INT;\n  A : BOOL;\nEND_VAR\nPROGRAM P\nEND_PROGRAM\n"
                                   << "line 3: duplicate variable 'A'";
        QTest::newRow("initial") << "VAR_GLOBAL\n  a : SINT := 300;\nEND_VAR\nPROGRAM P\nEND_PROGRAM\n"
                                 << "line 2: invalid initial value for 'a': value out of range for SINT";
        QTest::newRow("qualifier") << "VAR_GLOBAL CONSTANT\n  a : INT;\nEND_VAR\n"
                                   << "line 1: unsupported qualifier 'CONSTANT'";
        QTest::newRow("no-program") << "VAR_GLOBAL\n  a : INT;\nEND_VAR\n" << "missing PROGRAM";
        QTest::newRow("unterminated") << "PROGRAM P\n  a := 1;\n" << "unexpected end of program text";
        QTest::newRow("two-programs") << "PROGRAM A\nEND_PROGRAM\nPROGRAM B\nEND_PROGRAM\n"
                                      << "line 3: only one PROGRAM is supported";
        QTest::newRow("statement") << "PROGRAM P\n  a = 1;\nEND_PROGRAM\n"
                                   << "line 2: expected '<target> := <expression>;'";
        QTest::newRow("target") << "PROGRAM P\n  a.b := 1;\nEND_PROGRAM\n"
                                << "line 2: invalid assignment target 'a.b'";
        QTest::newRow("expression") << "PROGRAM P\n  a := 1 +;\nEND_PROGRAM\n"
                                    << "line 2: parse error: unexpected end of expression";
        QTest::newRow("local-binding") << "PROGRAM P\nVAR\n  x AT %IX0.0 : BOOL;\nEND_VAR\nEND_PROGRAM\n"
                                       << "line 3: AT bindings are only allowed in VAR_GLOBAL";
    }

    void rejectsInvalidPrograms()
    {
        QFETCH(QString, text);
        QFETCH(QString, error);
        ProgramImage image;
        QString message;
        QVERIFY(!ProgramImage::parse(text, 1, &image, &message));
        QCOMPARE(message, error);
    }

    void initializesStorage()
    {
        ProgramImage image;
        QVERIFY(ProgramImage::parse(QString::fromLatin1(SampleProgram), 1, &image));

        VariableStorage storage;
        const quint32 instance = image.initStorage(&storage, false);
        QCOMPARE(storage.globals().size(), 3);
        QCOMPARE(storage.retain().size(), 1);
        QCOMPARE(storage.instance(instance)->typeName, QStringLiteral("Main"));
        QCOMPARE(storage.instance(instance)->vars.get(QStringLiteral("step"))->toInt(), qint64(1));

        storage.retain().set(QStringLiteral("total"), Value::fromInt(ValueType::LInt, 42));
        storage.globals().set(QStringLiteral("counter"), Value::fromInt(ValueType::DInt, 9));
        image.initStorage(&storage, true);
        QCOMPARE(storage.retain().get(QStringLiteral("total"))->toInt(), qint64(42));
        QCOMPARE(storage.globals().get(QStringLiteral("counter"))->toInt(), qint64(0));
        QCOMPARE(storage.instances().size(), 1);

        image.initStorage(&storage, false);
        QCOMPARE(storage.retain().get(QStringLiteral("total"))->toInt(), qint64(0));
    }

    void assignsWithConversion()
    {
        VariableStorage storage;
        storage.globals().set(QStringLiteral("small"), Value::fromInt(ValueType::SInt, 0));
        storage.globals().set(QStringLiteral("mode"), Value::fromEnum(QStringLiteral("Mode"), QStringLiteral("Idle"), 0));

        QString error;
        QVERIFY(assignVariable(storage, globalRef(QStringLiteral("small")), Value::fromInt(ValueType::LInt, 5), &error));
        QCOMPARE(storage.globals().get(QStringLiteral("small"))->type(), ValueType::SInt);

        QVERIFY(!assignVariable(storage, globalRef(QStringLiteral("small")), Value::fromInt(ValueType::LInt, 500), &error));
        QCOMPARE(error, QStringLiteral("value out of range for SINT"));

        QVERIFY(!assignVariable(storage, globalRef(QStringLiteral("mode")), Value::fromInt(ValueType::DInt, 1), &error));
        QCOMPARE(error, QStringLiteral("type mismatch"));
        QVERIFY(assignVariable(storage, globalRef(QStringLiteral("mode")),
                               Value::fromEnum(QStringLiteral("Mode"), QStringLiteral("Run"), 1), &error));

        QVERIFY(!assignVariable(storage, globalRef(QStringLiteral("missing")), Value::fromBool(true), &error));
        QCOMPARE(error, QStringLiteral("unknown identifier 'missing'"));
    }
};

QTEST_GUILESS_MAIN(ProgramImageTest)

#include "program_image_test.moc"
