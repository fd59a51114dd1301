#ifndef DEBUG_VARIABLE_HANDLES_H
#define DEBUG_VARIABLE_HANDLES_H

#include <QJsonObject>
#include <QString>
#include <QVector>

#include "core/runtime/io.h"
#include "core/runtime/storage.h"
#include "core/runtime/value.h"

// One expandable scope of live data a client can page through.
struct VariableHandle {
    enum Kind {
        Locals,
        Globals,
        Retain,
        Instances,
        Instance,
        Struct,
        Array,
        Reference,
        IoRoot,
        IoInputs,
        IoOutputs,
        IoMemory
    } kind = Globals;
    quint32 frameId = 0;
    quint32 instanceId = 0;
    Value value;   // Struct / Array
    ValueRef ref;  // Reference

    static VariableHandle locals(quint32 frameId);
    static VariableHandle instance(quint32 instanceId);
    static VariableHandle ofKind(Kind kind);
};

/* Index-keyed handle table. Ids are 1-based and only meaningful within one
 * generation: clear() starts a new generation and invalidates every id
 * handed out before it. Not thread-safe; callers hold the owning lock. */
class VariableHandleArena
{
public:
    void clear() { m_handles.clear(); }
    quint32 alloc(const VariableHandle &handle);
    const VariableHandle *get(quint32 id) const;
    int size() const { return m_handles.size(); }

private:
    QVector<VariableHandle> m_handles;
};

struct DebugVariable {
    QString name;
    QString value;
    QString type;
    quint32 variablesReference = 0;
    QString evaluateName;

    QJsonObject toJson() const;
};

// Allocates a child handle for aggregate, instance and non-null reference values.
DebugVariable variableFromValue(VariableHandleArena &arena, const QString &name, const Value &value,
                                const QString &evaluateName = QString());
QVector<DebugVariable> variablesFromEntries(VariableHandleArena &arena, const QVector<VariableEntry> &entries);

bool ioScopeAvailable(const IoSnapshot *io);

/* Expands a handle into its child entries against a frozen storage copy.
 * io may be null when no IO snapshot has been published. */
QVector<DebugVariable> expandVariableHandle(VariableHandleArena &arena, const VariableHandle &handle,
                                            const VariableStorage &storage, const IoSnapshot *io);

#endif
