#include "core/debug/variable_handles.h"

namespace {

QVector<DebugVariable> ioEntries(const QVector<IoSnapshotEntry> &entries)
{
    QVector<DebugVariable> out;
    for (const IoSnapshotEntry &entry : entries) {
        DebugVariable var;
        var.name = entry.name.isEmpty() ? formatIoAddress(entry.address) : entry.name;
        var.value = formatIoEntryValue(entry);
        if (entry.state == IoSnapshotEntry::Resolved)
            var.type = valueTypeName(entry.value);
        out.append(var);
    }
    return out;
}

DebugVariable ioGroup(VariableHandleArena &arena, const QString &name, VariableHandle::Kind kind, int count)
{
    DebugVariable var;
    var.name = name;
    var.value = QStringLiteral("%1 items").arg(count);
    var.variablesReference = arena.alloc(VariableHandle::ofKind(kind));
    return var;
}

} // namespace

VariableHandle VariableHandle::locals(quint32 frameId)
{
    VariableHandle handle;
    handle.kind = Locals;
    handle.frameId = frameId;
    return handle;
}

VariableHandle VariableHandle::instance(quint32 instanceId)
{
    VariableHandle handle;
    handle.kind = Instance;
    handle.instanceId = instanceId;
    return handle;
}

VariableHandle VariableHandle::ofKind(Kind kind)
{
    VariableHandle handle;
    handle.kind = kind;
    return handle;
}

quint32 VariableHandleArena::alloc(const VariableHandle &handle)
{
    m_handles.append(handle);
    return quint32(m_handles.size());
}

const VariableHandle *VariableHandleArena::get(quint32 id) const
{
    if (id == 0 || id > quint32(m_handles.size()))
        return nullptr;
    return &m_handles[int(id) - 1];
}

QJsonObject DebugVariable::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("name"), name);
    obj.insert(QStringLiteral("value"), value);
    if (!type.isEmpty())
        obj.insert(QStringLiteral("type"), type);
    obj.insert(QStringLiteral("variablesReference"), qint64(variablesReference));
    if (!evaluateName.isEmpty())
        obj.insert(QStringLiteral("evaluateName"), evaluateName);
    return obj;
}

DebugVariable variableFromValue(VariableHandleArena &arena, const QString &name, const Value &value,
                                const QString &evaluateName)
{
    DebugVariable var;
    var.name = name;
    var.value = formatValue(value);
    var.type = valueTypeName(value);
    var.evaluateName = evaluateName;

    switch (value.type()) {
    case ValueType::Struct: {
        VariableHandle handle = VariableHandle::ofKind(VariableHandle::Struct);
        handle.value = value;
        var.variablesReference = arena.alloc(handle);
        break;
    }
    case ValueType::Array: {
        VariableHandle handle = VariableHandle::ofKind(VariableHandle::Array);
        handle.value = value;
        var.variablesReference = arena.alloc(handle);
        break;
    }
    case ValueType::Instance:
        var.variablesReference = arena.alloc(VariableHandle::instance(value.instanceId()));
        break;
    case ValueType::Reference:
        if (value.hasReference()) {
            VariableHandle handle = VariableHandle::ofKind(VariableHandle::Reference);
            handle.ref = value.reference();
            var.variablesReference = arena.alloc(handle);
        }
        break;
    default:
        break;
    }
    return var;
}

QVector<DebugVariable> variablesFromEntries(VariableHandleArena &arena, const QVector<VariableEntry> &entries)
{
    QVector<DebugVariable> out;
    for (const VariableEntry &entry : entries)
        out.append(variableFromValue(arena, entry.name, entry.value, entry.name));
    return out;
}

bool ioScopeAvailable(const IoSnapshot *io)
{
    return io && !io->isEmpty();
}

QVector<DebugVariable> expandVariableHandle(VariableHandleArena &arena, const VariableHandle &handle,
                                            const VariableStorage &storage, const IoSnapshot *io)
{
    QVector<DebugVariable> out;

    switch (handle.kind) {
    case VariableHandle::Locals: {
        const CallFrame *frame = storage.frame(handle.frameId);
        if (!frame)
            break;
        if (frame->instanceId != 0) {
            if (const InstanceData *owner = storage.instance(frame->instanceId))
                out += variablesFromEntries(arena, owner->vars.entries());
        }
        out += variablesFromEntries(arena, frame->locals.entries());
        break;
    }
    case VariableHandle::Globals:
        out = variablesFromEntries(arena, storage.globals().entries());
        break;
    case VariableHandle::Retain:
        out = variablesFromEntries(arena, storage.retain().entries());
        break;
    case VariableHandle::Instances:
        for (auto it = storage.instances().constBegin(); it != storage.instances().constEnd(); ++it) {
            DebugVariable var;
            var.name = QStringLiteral("%1#%2").arg(it.value().typeName).arg(it.key());
            var.value = QStringLiteral("Instance(%1)").arg(it.key());
            var.type = QStringLiteral("INSTANCE");
            var.variablesReference = arena.alloc(VariableHandle::instance(it.key()));
            var.evaluateName = var.name;
            out.append(var);
        }
        break;
    case VariableHandle::Instance: {
        const InstanceData *data = storage.instance(handle.instanceId);
        if (!data)
            break;
        out = variablesFromEntries(arena, data->vars.entries());
        if (data->parent != 0)
            out.append(variableFromValue(arena, QStringLiteral("parent"), Value::fromInstance(data->parent)));
        break;
    }
    case VariableHandle::Struct:
        for (const StructField &field : handle.value.fields())
            out.append(variableFromValue(arena, field.name, field.value, field.name));
        break;
    case VariableHandle::Array: {
        const std::vector<Value> &elements = handle.value.elements();
        for (size_t i = 0; i < elements.size(); ++i)
            out.append(variableFromValue(arena, QStringLiteral("[%1]").arg(i), elements[i]));
        break;
    }
    case VariableHandle::Reference: {
        Value target;
        if (storage.readByRef(handle.ref, &target))
            out.append(variableFromValue(arena, QStringLiteral("*"), target));
        break;
    }
    case VariableHandle::IoRoot:
        if (!io)
            break;
        out.append(ioGroup(arena, QStringLiteral("Inputs"), VariableHandle::IoInputs, io->inputs.size()));
        out.append(ioGroup(arena, QStringLiteral("Outputs"), VariableHandle::IoOutputs, io->outputs.size()));
        out.append(ioGroup(arena, QStringLiteral("Memory"), VariableHandle::IoMemory, io->memory.size()));
        break;
    case VariableHandle::IoInputs:
        if (io)
            out = ioEntries(io->inputs);
        break;
    case VariableHandle::IoOutputs:
        if (io)
            out = ioEntries(io->outputs);
        break;
    case VariableHandle::IoMemory:
        if (io)
            out = ioEntries(io->memory);
        break;
    }

    return out;
}
