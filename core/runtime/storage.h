#ifndef RUNTIME_STORAGE_H
#define RUNTIME_STORAGE_H

#include <QMap>
#include <QString>
#include <QVector>

#include "core/runtime/value.h"

struct VariableEntry {
    QString name;
    Value value;
};

// Declaration-ordered variable table with case-insensitive lookup.
class VariableTable
{
public:
    bool isEmpty() const { return m_entries.isEmpty(); }
    int size() const { return m_entries.size(); }
    const QVector<VariableEntry> &entries() const { return m_entries; }

    const Value *get(const QString &name) const;
    Value *get(const QString &name);
    bool contains(const QString &name) const { return get(name) != nullptr; }
    void set(const QString &name, const Value &value);
    void clear() { m_entries.clear(); }

private:
    int indexOf(const QString &name) const;

    QVector<VariableEntry> m_entries;
};

struct CallFrame {
    quint32 id = 0;
    QString owner;
    quint32 instanceId = 0; // 0 when the frame has no owning instance
    VariableTable locals;
};

struct InstanceData {
    QString typeName;
    quint32 parent = 0; // 0 when the instance is not nested
    VariableTable vars;
};

class VariableStorage
{
public:
    VariableTable &globals() { return m_globals; }
    const VariableTable &globals() const { return m_globals; }
    VariableTable &retain() { return m_retain; }
    const VariableTable &retain() const { return m_retain; }

    const QVector<CallFrame> &frames() const { return m_frames; }
    CallFrame &pushFrame(const QString &owner, quint32 instanceId);
    void popFrame();
    const CallFrame *frame(quint32 id) const;
    CallFrame *frame(quint32 id);
    // The innermost frame, or nullptr when no POU is executing.
    const CallFrame *currentFrame() const;

    const QMap<quint32, InstanceData> &instances() const { return m_instances; }
    quint32 createInstance(const QString &typeName, quint32 parent = 0);
    const InstanceData *instance(quint32 id) const;
    InstanceData *instance(quint32 id);

    bool readByRef(const ValueRef &ref, Value *out) const;
    bool writeByRef(const ValueRef &ref, const Value &value);

    void clear();

private:
    VariableTable m_globals;
    VariableTable m_retain;
    QVector<CallFrame> m_frames;
    QMap<quint32, InstanceData> m_instances;
    quint32 m_nextFrameId = 1;
    quint32 m_nextInstanceId = 1;
};

#endif
