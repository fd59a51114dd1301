#ifndef RUNTIME_METADATA_H
#define RUNTIME_METADATA_H

#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#include "core/debug/debug_types.h"

struct EnumType {
    QString name;
    QStringList variants; // ordinal == index
};

class TypeRegistry
{
public:
    void addEnum(const EnumType &type);
    const EnumType *findEnum(const QString &name) const;
    bool isEmpty() const { return m_enums.isEmpty(); }

private:
    QVector<EnumType> m_enums;
};

/* Static description of the loaded program used by the debugger: statement
 * spans per source file, USING lists per POU and the user type registry. */
class RuntimeMetadata
{
public:
    TypeRegistry &types() { return m_types; }
    const TypeRegistry &types() const { return m_types; }

    void setStatements(quint32 fileId, QVector<SourceLocation> statements);
    QVector<SourceLocation> statements(quint32 fileId) const;

    void setUsing(const QString &owner, const QStringList &namespaces);
    QStringList usingFor(const QString &owner) const;

    /* Snaps a 0-based (line, column) in text to the statement a breakpoint
     * there would hit. */
    bool resolveBreakpointPosition(const QString &text, quint32 fileId, int line, int column,
                                   SourceLocation *out) const;

private:
    TypeRegistry m_types;
    QHash<quint32, QVector<SourceLocation>> m_statements;
    QHash<QString, QStringList> m_using;
};

#endif
