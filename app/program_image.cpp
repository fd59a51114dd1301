#include "app/program_image.h"

#include <QRegularExpression>

namespace {

enum class Section {
    Top,
    Types,
    Globals,
    Program,
    Locals
};

struct SourceLine {
    int number = 0; // 1-based, for messages
    int start = 0;  // offset of the line in the source
    QString code;   // comments blanked out
};

bool fail(QString *errorOut, int line, const QString &message)
{
    if (errorOut)
        *errorOut = line > 0 ? QStringLiteral("line %1: %2").arg(line).arg(message) : message;
    return false;
}

// Replaces (* *) and // comments with spaces, keeping offsets and newlines.
QString blankComments(const QString &text)
{
    QString out = text;
    int i = 0;
    const int n = out.size();
    while (i < n) {
        const QChar c = out.at(i);
        if (c == QLatin1Char('\'') || c == QLatin1Char('"')) {
            ++i;
            while (i < n && out.at(i) != c && out.at(i) != QLatin1Char('\n')) {
                if (out.at(i) == QLatin1Char('$'))
                    ++i;
                ++i;
            }
            ++i;
        } else if (c == QLatin1Char('(') && i + 1 < n && out.at(i + 1) == QLatin1Char('*')) {
            int end = out.indexOf(QLatin1String("*)"), i + 2);
            end = end < 0 ? n : end + 2;
            for (; i < end; ++i) {
                if (out.at(i) != QLatin1Char('\n'))
                    out[i] = QLatin1Char(' ');
            }
        } else if (c == QLatin1Char('/') && i + 1 < n && out.at(i + 1) == QLatin1Char('/')) {
            for (; i < n && out.at(i) != QLatin1Char('\n'); ++i)
                out[i] = QLatin1Char(' ');
        } else {
            ++i;
        }
    }
    return out;
}

QVector<SourceLine> splitLines(const QString &code)
{
    QVector<SourceLine> lines;
    int start = 0;
    int number = 1;
    while (start <= code.size()) {
        int end = code.indexOf(QLatin1Char('\n'), start);
        if (end < 0)
            end = code.size();
        SourceLine line;
        line.number = number++;
        line.start = start;
        line.code = code.mid(start, end - start);
        if (line.code.endsWith(QLatin1Char('\r')))
            line.code.chop(1);
        lines.append(line);
        start = end + 1;
    }
    return lines;
}

QString firstWord(const QString &trimmed)
{
    int end = 0;
    while (end < trimmed.size() && (trimmed.at(end).isLetterOrNumber() || trimmed.at(end) == QLatin1Char('_')))
        ++end;
    return trimmed.left(end).toUpper();
}

bool convertTo(const ProgramVariable &var, const Value &value, Value *out, QString *errorOut)
{
    if (var.type == ValueType::Enum) {
        if (value.type() != ValueType::Enum || value.typeName().compare(var.enumType, Qt::CaseInsensitive) != 0) {
            if (errorOut)
                *errorOut = QStringLiteral("type mismatch");
            return false;
        }
        *out = value;
        return true;
    }
    return coerceValue(value, var.type, out, errorOut);
}

bool parseEnumTypes(const QString &block, int line, TypeRegistry &types, QString *errorOut)
{
    static const QRegularExpression enumDecl(
        QStringLiteral("^\\s*([A-Za-z_]\\w*)\\s*:\\s*\\(([^)]*)\\)\\s*;\\s*"));
    QString rest = block;
    while (!rest.trimmed().isEmpty()) {
        const QRegularExpressionMatch m = enumDecl.match(rest);
        if (!m.hasMatch())
            return fail(errorOut, line, QStringLiteral("unsupported type declaration '%1'").arg(rest.simplified()));
        EnumType type;
        type.name = m.captured(1);
        for (const QString &variant : m.captured(2).split(QLatin1Char(','))) {
            const QString name = variant.trimmed();
            if (name.isEmpty())
                return fail(errorOut, line, QStringLiteral("empty variant in type '%1'").arg(type.name));
            type.variants.append(name);
        }
        if (types.findEnum(type.name))
            return fail(errorOut, line, QStringLiteral("duplicate type '%1'").arg(type.name));
        types.addEnum(type);
        rest = rest.mid(m.capturedEnd());
    }
    return true;
}

} // namespace

bool ProgramImage::parse(const QString &text, quint32 fileId, ProgramImage *out, QString *errorOut)
{
    static const QRegularExpression declaration(
        QStringLiteral("^([A-Za-z_]\\w*)\\s*(?:AT\\s+(%[^\\s:]+)\\s*)?:\\s*([A-Za-z_]\\w*)\\s*(?::=\\s*(.*?))?\\s*;$"),
        QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression targetName(QStringLiteral("^[A-Za-z_]\\w*$"));

    ProgramImage image;
    Section section = Section::Top;
    bool retainBlock = false;
    bool bodyStarted = false;
    bool programSeen = false;
    QString typeBlock;
    int typeLine = 0;
    QVector<SourceLocation> locations;

    auto declare = [&](const SourceLine &line, const QString &decl, bool global) {
        const QRegularExpressionMatch m = declaration.match(decl);
        if (!m.hasMatch())
            return fail(errorOut, line.number, QStringLiteral("invalid declaration '%1'").arg(decl));

        ProgramVariable var;
        var.name = m.captured(1);
        var.retain = global && retainBlock;
        for (const QVector<ProgramVariable> *table : { &image.m_globals, &image.m_locals }) {
            for (const ProgramVariable &existing : *table) {
                if (existing.name.compare(var.name, Qt::CaseInsensitive) == 0)
                    return fail(errorOut, line.number, QStringLiteral("duplicate variable '%1'").arg(var.name));
            }
        }

        if (!m.captured(2).isEmpty()) {
            if (!global)
                return fail(errorOut, line.number, QStringLiteral("AT bindings are only allowed in VAR_GLOBAL"));
            QString error;
            if (!parseIoAddress(m.captured(2), &var.address, &error))
                return fail(errorOut, line.number, error);
            var.bound = true;
        }

        const QString typeName = m.captured(3);
        if (parseValueTypeName(typeName, &var.type)) {
            var.initial = Value::defaultFor(var.type);
        } else if (const EnumType *type = image.m_metadata.types().findEnum(typeName)) {
            var.type = ValueType::Enum;
            var.enumType = type->name;
            var.initial = Value::fromEnum(type->name, type->variants.value(0), 0);
        } else {
            return fail(errorOut, line.number, QStringLiteral("unknown type '%1'").arg(typeName));
        }

        if (!m.captured(4).isEmpty()) {
            DebugExpression expr;
            QString error;
            VariableStorage empty;
            EvalScope scope;
            scope.storage = &empty;
            Value value;
            if (!DebugExpression::parse(m.captured(4), image.m_metadata.types(), &expr, &error)
                || !evaluateExpression(expr, scope, &value, &error)
                || !convertTo(var, value, &var.initial, &error))
                return fail(errorOut, line.number,
                            QStringLiteral("invalid initial value for '%1': %2").arg(var.name, error));
        }

        (global ? image.m_globals : image.m_locals).append(var);
        return true;
    };

    const QVector<SourceLine> lines = splitLines(blankComments(text));
    for (const SourceLine &line : lines) {
        const QString trimmed = line.code.trimmed();
        if (trimmed.isEmpty())
            continue;
        const QString keyword = firstWord(trimmed);

        switch (section) {
        case Section::Top:
            if (keyword == QLatin1String("TYPE")) {
                section = Section::Types;
                typeLine = line.number;
                typeBlock = trimmed.mid(4);
                const int end = typeBlock.indexOf(QLatin1String("END_TYPE"), 0, Qt::CaseInsensitive);
                if (end >= 0) {
                    if (!parseEnumTypes(typeBlock.left(end), typeLine, image.m_metadata.types(), errorOut))
                        return false;
                    section = Section::Top;
                }
            } else if (keyword == QLatin1String("VAR_GLOBAL")) {
                const QString qualifier = trimmed.mid(10).trimmed().toUpper();
                if (!qualifier.isEmpty() && qualifier != QLatin1String("RETAIN"))
                    return fail(errorOut, line.number, QStringLiteral("unsupported qualifier '%1'").arg(qualifier));
                retainBlock = !qualifier.isEmpty();
                section = Section::Globals;
            } else if (keyword == QLatin1String("PROGRAM")) {
                if (programSeen)
                    return fail(errorOut, line.number, QStringLiteral("only one PROGRAM is supported"));
                image.m_name = trimmed.mid(7).trimmed();
                if (image.m_name.isEmpty())
                    return fail(errorOut, line.number, QStringLiteral("missing program name"));
                programSeen = true;
                section = Section::Program;
            } else {
                return fail(errorOut, line.number, QStringLiteral("unexpected '%1'").arg(trimmed));
            }
            break;

        case Section::Types: {
            const int end = trimmed.indexOf(QLatin1String("END_TYPE"), 0, Qt::CaseInsensitive);
            typeBlock += QLatin1Char(' ') + (end >= 0 ? trimmed.left(end) : trimmed);
            if (end >= 0) {
                if (!parseEnumTypes(typeBlock, typeLine, image.m_metadata.types(), errorOut))
                    return false;
                section = Section::Top;
            }
            break;
        }

        case Section::Globals:
        case Section::Locals:
            if (keyword == QLatin1String("END_VAR")) {
                section = section == Section::Globals ? Section::Top : Section::Program;
            } else if (!declare(line, trimmed, section == Section::Globals)) {
                return false;
            }
            break;

        case Section::Program:
            if (keyword == QLatin1String("END_PROGRAM")) {
                section = Section::Top;
            } else if (keyword == QLatin1String("VAR") && !bodyStarted) {
                section = Section::Locals;
            } else if (keyword == QLatin1String("USING") && !bodyStarted) {
                QString names = trimmed.mid(5).trimmed();
                if (names.endsWith(QLatin1Char(';')))
                    names.chop(1);
                for (const QString &name : names.split(QLatin1Char(','))) {
                    if (!name.trimmed().isEmpty())
                        image.m_using.append(name.trimmed());
                }
            } else {
                const int assign = line.code.indexOf(QLatin1String(":="));
                const int semicolon = line.code.lastIndexOf(QLatin1Char(';'));
                if (assign < 0 || semicolon < assign || !line.code.mid(semicolon + 1).trimmed().isEmpty())
                    return fail(errorOut, line.number, QStringLiteral("expected '<target> := <expression>;'"));

                ProgramStatement statement;
                statement.target = line.code.left(assign).trimmed();
                if (!targetName.match(statement.target).hasMatch())
                    return fail(errorOut, line.number, QStringLiteral("invalid assignment target '%1'").arg(statement.target));
                QString error;
                if (!DebugExpression::parse(line.code.mid(assign + 2, semicolon - assign - 2),
                                            image.m_metadata.types(), &statement.expression, &error))
                    return fail(errorOut, line.number, error);

                int first = 0;
                while (line.code.at(first).isSpace())
                    ++first;
                statement.location.fileId = fileId;
                statement.location.start = quint32(line.start + first);
                statement.location.end = quint32(line.start + semicolon + 1);
                image.m_statements.append(statement);
                locations.append(statement.location);
                bodyStarted = true;
            }
            break;
        }
    }

    if (section != Section::Top)
        return fail(errorOut, 0, QStringLiteral("unexpected end of program text"));
    if (!programSeen)
        return fail(errorOut, 0, QStringLiteral("missing PROGRAM"));

    image.m_metadata.setStatements(fileId, locations);
    image.m_metadata.setUsing(image.m_name, image.m_using);
    *out = image;
    return true;
}

const ProgramVariable *ProgramImage::bindingAt(const IoAddress &address) const
{
    for (const ProgramVariable &var : m_globals) {
        if (var.bound && var.address == address)
            return &var;
    }
    return nullptr;
}

quint32 ProgramImage::initStorage(VariableStorage *storage, bool keepRetain) const
{
    const VariableTable previousRetain = storage->retain();
    storage->clear();

    for (const ProgramVariable &var : m_globals) {
        if (!var.retain) {
            storage->globals().set(var.name, var.initial);
            continue;
        }
        const Value *kept = keepRetain ? previousRetain.get(var.name) : nullptr;
        const bool sameType = kept && kept->type() == var.initial.type()
                              && kept->typeName() == var.initial.typeName();
        storage->retain().set(var.name, sameType ? *kept : var.initial);
    }

    const quint32 instanceId = storage->createInstance(m_name);
    InstanceData *instance = storage->instance(instanceId);
    for (const ProgramVariable &var : m_locals)
        instance->vars.set(var.name, var.initial);
    return instanceId;
}

bool assignVariable(VariableStorage &storage, const ValueRef &ref, const Value &value, QString *errorOut)
{
    Value current;
    if (!storage.readByRef(ref, &current)) {
        if (errorOut)
            *errorOut = QStringLiteral("unknown identifier '%1'").arg(ref.name);
        return false;
    }

    Value converted;
    switch (current.type()) {
    case ValueType::Enum:
        if (value.type() != ValueType::Enum || value.typeName() != current.typeName()) {
            if (errorOut)
                *errorOut = QStringLiteral("type mismatch");
            return false;
        }
        converted = value;
        break;
    case ValueType::Array:
    case ValueType::Struct:
    case ValueType::Reference:
    case ValueType::Instance:
    case ValueType::Null:
        if (value.type() != current.type()) {
            if (errorOut)
                *errorOut = QStringLiteral("type mismatch");
            return false;
        }
        converted = value;
        break;
    default:
        if (!coerceValue(value, current.type(), &converted, errorOut))
            return false;
        break;
    }

    if (!storage.writeByRef(ref, converted)) {
        if (errorOut)
            *errorOut = QStringLiteral("unknown identifier '%1'").arg(ref.name);
        return false;
    }
    return true;
}
