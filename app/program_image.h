#ifndef PROGRAM_IMAGE_H
#define PROGRAM_IMAGE_H

#include <QString>
#include <QStringList>
#include <QVector>

#include "core/debug/evaluator.h"
#include "core/runtime/io.h"
#include "core/runtime/metadata.h"
#include "core/runtime/storage.h"

struct ProgramVariable {
    QString name;
    ValueType type = ValueType::Null; // Enum for enum-typed variables
    QString enumType;
    Value initial;
    bool retain = false;
    bool bound = false;
    IoAddress address;
};

struct ProgramStatement {
    SourceLocation location;
    QString target;
    DebugExpression expression;
};

/* A loaded Structured Text program: TYPE enums, VAR_GLOBAL [RETAIN] blocks
 * and one PROGRAM whose body is a list of "<target> := <expression>;"
 * assignments. */
class ProgramImage
{
public:
    static bool parse(const QString &text, quint32 fileId, ProgramImage *out, QString *errorOut = nullptr);

    QString name() const { return m_name; }
    QStringList usingList() const { return m_using; }
    const QVector<ProgramVariable> &globals() const { return m_globals; }
    const QVector<ProgramVariable> &locals() const { return m_locals; }
    const QVector<ProgramStatement> &statements() const { return m_statements; }
    const RuntimeMetadata &metadata() const { return m_metadata; }
    // Locates the variable bound to address; nullptr when nothing is bound there.
    const ProgramVariable *bindingAt(const IoAddress &address) const;

    /* Rebuilds storage with initial values. Globals and retain land in
     * their tables, the program's own variables in one instance whose id is
     * returned. With keepRetain, retain values already in storage survive. */
    quint32 initStorage(VariableStorage *storage, bool keepRetain) const;

private:
    QString m_name;
    QStringList m_using;
    QVector<ProgramVariable> m_globals;
    QVector<ProgramVariable> m_locals;
    QVector<ProgramStatement> m_statements;
    RuntimeMetadata m_metadata;
};

// Assigns value to an existing variable, converting to the variable's type.
bool assignVariable(VariableStorage &storage, const ValueRef &ref, const Value &value, QString *errorOut = nullptr);

#endif
