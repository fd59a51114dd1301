#include "core/runtime/storage.h"

int VariableTable::indexOf(const QString &name) const
{
    for (int i = 0; i < m_entries.size(); ++i) {
        if (m_entries[i].name.compare(name, Qt::CaseInsensitive) == 0)
            return i;
    }
    return -1;
}

const Value *VariableTable::get(const QString &name) const
{
    const int index = indexOf(name);
    return index < 0 ? nullptr : &m_entries[index].value;
}

Value *VariableTable::get(const QString &name)
{
    const int index = indexOf(name);
    return index < 0 ? nullptr : &m_entries[index].value;
}

void VariableTable::set(const QString &name, const Value &value)
{
    const int index = indexOf(name);
    if (index < 0)
        m_entries.append({ name, value });
    else
        m_entries[index].value = value;
}

CallFrame &VariableStorage::pushFrame(const QString &owner, quint32 instanceId)
{
    CallFrame frame;
    frame.id = m_nextFrameId++;
    frame.owner = owner;
    frame.instanceId = instanceId;
    m_frames.append(frame);
    return m_frames.last();
}

void VariableStorage::popFrame()
{
    if (!m_frames.isEmpty())
        m_frames.removeLast();
}

const CallFrame *VariableStorage::frame(quint32 id) const
{
    for (const CallFrame &f : m_frames) {
        if (f.id == id)
            return &f;
    }
    return nullptr;
}

CallFrame *VariableStorage::frame(quint32 id)
{
    for (CallFrame &f : m_frames) {
        if (f.id == id)
            return &f;
    }
    return nullptr;
}

const CallFrame *VariableStorage::currentFrame() const
{
    return m_frames.isEmpty() ? nullptr : &m_frames.last();
}

quint32 VariableStorage::createInstance(const QString &typeName, quint32 parent)
{
    const quint32 id = m_nextInstanceId++;
    InstanceData data;
    data.typeName = typeName;
    data.parent = parent;
    m_instances.insert(id, data);
    return id;
}

const InstanceData *VariableStorage::instance(quint32 id) const
{
    auto it = m_instances.constFind(id);
    return it == m_instances.constEnd() ? nullptr : &it.value();
}

InstanceData *VariableStorage::instance(quint32 id)
{
    auto it = m_instances.find(id);
    return it == m_instances.end() ? nullptr : &it.value();
}

bool VariableStorage::readByRef(const ValueRef &ref, Value *out) const
{
    const Value *value = nullptr;
    switch (ref.area) {
    case ValueRef::Global:
        value = m_globals.get(ref.name);
        break;
    case ValueRef::Retain:
        value = m_retain.get(ref.name);
        break;
    case ValueRef::Instance:
        if (const InstanceData *data = instance(ref.owner))
            value = data->vars.get(ref.name);
        break;
    case ValueRef::Local:
        if (const CallFrame *f = frame(ref.owner))
            value = f->locals.get(ref.name);
        break;
    }
    if (!value)
        return false;
    *out = *value;
    return true;
}

bool VariableStorage::writeByRef(const ValueRef &ref, const Value &value)
{
    Value *slot = nullptr;
    switch (ref.area) {
    case ValueRef::Global:
        slot = m_globals.get(ref.name);
        break;
    case ValueRef::Retain:
        slot = m_retain.get(ref.name);
        break;
    case ValueRef::Instance:
        if (InstanceData *data = instance(ref.owner))
            slot = data->vars.get(ref.name);
        break;
    case ValueRef::Local:
        if (CallFrame *f = frame(ref.owner))
            slot = f->locals.get(ref.name);
        break;
    }
    if (!slot)
        return false;
    *slot = value;
    return true;
}

void VariableStorage::clear()
{
    m_globals.clear();
    m_retain.clear();
    m_frames.clear();
    m_instances.clear();
    m_nextFrameId = 1;
    m_nextInstanceId = 1;
}
