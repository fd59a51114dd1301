#include "core/runtime/metadata.h"

#include <algorithm>

#include "core/debug/source_location.h"

void TypeRegistry::addEnum(const EnumType &type)
{
    for (EnumType &existing : m_enums) {
        if (existing.name.compare(type.name, Qt::CaseInsensitive) == 0) {
            existing = type;
            return;
        }
    }
    m_enums.append(type);
}

const EnumType *TypeRegistry::findEnum(const QString &name) const
{
    for (const EnumType &type : m_enums) {
        if (type.name.compare(name, Qt::CaseInsensitive) == 0)
            return &type;
    }
    return nullptr;
}

void RuntimeMetadata::setStatements(quint32 fileId, QVector<SourceLocation> statements)
{
    std::sort(statements.begin(), statements.end(), [](const SourceLocation &a, const SourceLocation &b) {
        return a.start < b.start || (a.start == b.start && a.end < b.end);
    });
    m_statements.insert(fileId, statements);
}

QVector<SourceLocation> RuntimeMetadata::statements(quint32 fileId) const
{
    return m_statements.value(fileId);
}

void RuntimeMetadata::setUsing(const QString &owner, const QStringList &namespaces)
{
    m_using.insert(owner.toUpper(), namespaces);
}

QStringList RuntimeMetadata::usingFor(const QString &owner) const
{
    return m_using.value(owner.toUpper());
}

bool RuntimeMetadata::resolveBreakpointPosition(const QString &text, quint32 fileId, int line, int column,
                                                SourceLocation *out) const
{
    return resolveBreakpointLocation(text, fileId, m_statements.value(fileId), line, column, out);
}
