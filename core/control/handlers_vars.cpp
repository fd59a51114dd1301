#include "core/control/handlers.h"

#include <QJsonArray>

#include "core/debug/evaluator.h"

namespace {

QJsonObject scopeJson(const QString &name, quint32 reference)
{
    QJsonObject scope;
    scope.insert(QStringLiteral("name"), name);
    scope.insert(QStringLiteral("variablesReference"), qint64(reference));
    scope.insert(QStringLiteral("expensive"), false);
    return scope;
}

ControlResponse status(quint64 id, const QString &text)
{
    QJsonObject result;
    result.insert(QStringLiteral("status"), text);
    return ControlResponse::success(id, result);
}

// global:<name>, retain:<name> or instance:<id>:<name>
bool parseVarTarget(const QString &text, PendingWrite *out, QString *errorOut)
{
    const QString target = text.trimmed();
    if (target.startsWith(QLatin1String("global:"))) {
        out->target = PendingWrite::Global;
        out->name = target.mid(7).trimmed();
        if (out->name.isEmpty()) {
            *errorOut = QStringLiteral("missing global name");
            return false;
        }
        return true;
    }
    if (target.startsWith(QLatin1String("retain:"))) {
        out->target = PendingWrite::Retain;
        out->name = target.mid(7).trimmed();
        if (out->name.isEmpty()) {
            *errorOut = QStringLiteral("missing retain name");
            return false;
        }
        return true;
    }
    if (target.startsWith(QLatin1String("instance:"))) {
        const QString rest = target.mid(9);
        const int colon = rest.indexOf(QLatin1Char(':'));
        bool ok = false;
        const uint id = (colon < 0 ? rest : rest.left(colon)).trimmed().toUInt(&ok);
        if (!ok) {
            *errorOut = QStringLiteral("invalid instance id");
            return false;
        }
        out->target = PendingWrite::Instance;
        out->instanceId = id;
        out->name = colon < 0 ? QString() : rest.mid(colon + 1).trimmed();
        if (out->name.isEmpty()) {
            *errorOut = QStringLiteral("missing instance name");
            return false;
        }
        return true;
    }
    *errorOut = QStringLiteral("unsupported target (use global:<name> or retain:<name>)");
    return false;
}

} // namespace

ControlResponse handleDebugScopes(const ControlRequest &request, ControlState &state)
{
    QJsonObject params;
    QString error;
    quint64 frameId = 0;
    if (!requireParams(request, &params, &error) || !requiredUInt(params, "frame_id", &frameId, &error))
        return ControlResponse::failure(request.id, error);

    DebugSnapshot snapshot;
    if (!state.debug.snapshot(&snapshot))
        return ControlResponse::failure(request.id, QStringLiteral("no snapshot available"));

    const VariableStorage &storage = snapshot.storage;
    const CallFrame *frame = frameId <= 0xFFFFFFFFu ? storage.frame(quint32(frameId)) : nullptr;
    if (!frame)
        frame = storage.currentFrame();

    IoSnapshot io;
    const bool hasIo = state.ioSnapshot(&io) && ioScopeAvailable(&io);

    QJsonArray scopes;
    std::lock_guard<std::mutex> lg(state.handlesMutex);
    state.handles.clear();

    if (frame) {
        QJsonObject locals = scopeJson(QStringLiteral("Locals"),
                                       state.handles.alloc(VariableHandle::locals(frame->id)));
        SourceLocation location;
        bool hasLocation = state.debug.frameLocation(frame->id, &location);
        if (!hasLocation) {
            DebugStop stop;
            hasLocation = state.debug.lastStop(&stop) && stop.hasLocation;
            location = stop.location;
        }
        QJsonObject source;
        int line = 0, column = 0;
        if (hasLocation && locationToSource(state, location, &source, &line, &column)) {
            locals.insert(QStringLiteral("source"), source);
            locals.insert(QStringLiteral("line"), line);
            locals.insert(QStringLiteral("column"), column);
        }
        scopes.append(locals);
    }
    if (!storage.globals().isEmpty())
        scopes.append(scopeJson(QStringLiteral("Globals"),
                                state.handles.alloc(VariableHandle::ofKind(VariableHandle::Globals))));
    if (!storage.retain().isEmpty())
        scopes.append(scopeJson(QStringLiteral("Retain"),
                                state.handles.alloc(VariableHandle::ofKind(VariableHandle::Retain))));
    if (hasIo)
        scopes.append(scopeJson(QStringLiteral("I/O"),
                                state.handles.alloc(VariableHandle::ofKind(VariableHandle::IoRoot))));
    if (!storage.instances().isEmpty())
        scopes.append(scopeJson(QStringLiteral("Instances"),
                                state.handles.alloc(VariableHandle::ofKind(VariableHandle::Instances))));

    QJsonObject result;
    result.insert(QStringLiteral("scopes"), scopes);
    return ControlResponse::success(request.id, result);
}

ControlResponse handleDebugVariables(const ControlRequest &request, ControlState &state)
{
    QJsonObject params;
    QString error;
    quint64 reference = 0;
    if (!requireParams(request, &params, &error)
        || !requiredUInt(params, "variables_reference", &reference, &error))
        return ControlResponse::failure(request.id, error);

    DebugSnapshot snapshot;
    if (!state.debug.snapshot(&snapshot))
        return ControlResponse::failure(request.id, QStringLiteral("no snapshot available"));
    IoSnapshot io;
    const bool hasIo = state.ioSnapshot(&io);

    QJsonArray variables;
    {
        std::lock_guard<std::mutex> lg(state.handlesMutex);
        const VariableHandle *found = reference <= 0xFFFFFFFFu ? state.handles.get(quint32(reference)) : nullptr;
        if (found) {
            // alloc() may grow the arena while expanding, so work on a copy
            const VariableHandle handle = *found;
            const QVector<DebugVariable> children =
                expandVariableHandle(state.handles, handle, snapshot.storage, hasIo ? &io : nullptr);
            for (const DebugVariable &var : children)
                variables.append(var.toJson());
        }
    }

    QJsonObject result;
    result.insert(QStringLiteral("variables"), variables);
    return ControlResponse::success(request.id, result);
}

ControlResponse handleDebugEvaluate(const ControlRequest &request, ControlState &state)
{
    QJsonObject params;
    QString error, expression;
    quint64 frameId = 0;
    bool hasFrame = false;
    if (!requireParams(request, &params, &error)
        || !requiredString(params, "expression", &expression, &error)
        || !optionalUInt(params, "frame_id", &frameId, &hasFrame, &error))
        return ControlResponse::failure(request.id, error);

    DebugSnapshot snapshot;
    if (!state.debug.snapshot(&snapshot))
        return ControlResponse::failure(request.id, QStringLiteral("no snapshot available"));

    EvalScope scope;
    scope.storage = &snapshot.storage;
    const CallFrame *frame = nullptr;
    if (hasFrame) {
        frame = frameId <= 0xFFFFFFFFu ? snapshot.storage.frame(quint32(frameId)) : nullptr;
        if (!frame)
            return ControlResponse::failure(request.id, QStringLiteral("unknown frame id"));
        scope.frameId = frame->id;
    } else {
        frame = snapshot.storage.currentFrame();
    }

    DebugExpression expr;
    {
        std::lock_guard<std::mutex> lg(state.metadataMutex);
        if (frame)
            scope.usingList = state.metadata.usingFor(frame->owner);
        if (!DebugExpression::parse(expression, state.metadata.types(), &expr, &error))
            return ControlResponse::failure(request.id, error);
    }

    Value value;
    if (!evaluateExpression(expr, scope, &value, &error))
        return ControlResponse::failure(request.id, error);

    QJsonObject result;
    result.insert(QStringLiteral("result"), formatValue(value));
    result.insert(QStringLiteral("type"), valueTypeName(value));
    result.insert(QStringLiteral("variables_reference"), 0);
    return ControlResponse::success(request.id, result);
}

ControlResponse handleEval(const ControlRequest &request, ControlState &state)
{
    QJsonObject params;
    QString error, expr;
    if (!requireParams(request, &params, &error) || !requiredString(params, "expr", &expr, &error))
        return ControlResponse::failure(request.id, error);

    DebugSnapshot snapshot;
    if (!state.debug.snapshot(&snapshot))
        return ControlResponse::failure(request.id, QStringLiteral("no snapshot available"));

    const QString name = expr.trimmed();
    const Value *value = snapshot.storage.globals().get(name);
    if (!value)
        value = snapshot.storage.retain().get(name);
    if (!value)
        return ControlResponse::failure(request.id, QStringLiteral("unknown identifier"));

    QJsonObject result;
    result.insert(QStringLiteral("value"), formatValue(*value));
    return ControlResponse::success(request.id, result);
}

ControlResponse handleSet(const ControlRequest &request, ControlState &state)
{
    QJsonObject params;
    QString error, target, valueText;
    if (!requireParams(request, &params, &error) || !requiredString(params, "target", &target, &error)
        || !requiredString(params, "value", &valueText, &error))
        return ControlResponse::failure(request.id, error);

    Value value;
    if (!parseControlValue(valueText, &value, &error))
        return ControlResponse::failure(request.id, error);

    const QString trimmed = target.trimmed();
    if (trimmed.startsWith(QLatin1String("global:"))) {
        state.debug.enqueueGlobalWrite(trimmed.mid(7).trimmed(), value);
    } else if (trimmed.startsWith(QLatin1String("retain:"))) {
        state.debug.enqueueRetainWrite(trimmed.mid(7).trimmed(), value);
    } else {
        return ControlResponse::failure(request.id, QStringLiteral("unsupported target"));
    }
    return status(request.id, QStringLiteral("queued"));
}

ControlResponse handleVarForce(const ControlRequest &request, ControlState &state)
{
    QJsonObject params;
    QString error, targetText, valueText;
    if (!requireParams(request, &params, &error) || !requiredString(params, "target", &targetText, &error)
        || !requiredString(params, "value", &valueText, &error))
        return ControlResponse::failure(request.id, error);

    PendingWrite target;
    Value value;
    if (!parseVarTarget(targetText, &target, &error) || !parseControlValue(valueText, &value, &error))
        return ControlResponse::failure(request.id, error);

    switch (target.target) {
    case PendingWrite::Global:
        state.debug.forceGlobal(target.name, value);
        break;
    case PendingWrite::Retain:
        state.debug.forceRetain(target.name, value);
        break;
    case PendingWrite::Instance:
        state.debug.forceInstance(target.instanceId, target.name, value);
        break;
    case PendingWrite::Io:
        break;
    }
    return status(request.id, QStringLiteral("forced"));
}

ControlResponse handleVarUnforce(const ControlRequest &request, ControlState &state)
{
    QJsonObject params;
    QString error, targetText;
    if (!requireParams(request, &params, &error) || !requiredString(params, "target", &targetText, &error))
        return ControlResponse::failure(request.id, error);

    PendingWrite target;
    if (!parseVarTarget(targetText, &target, &error))
        return ControlResponse::failure(request.id, error);

    switch (target.target) {
    case PendingWrite::Global:
        state.debug.releaseGlobal(target.name);
        break;
    case PendingWrite::Retain:
        state.debug.releaseRetain(target.name);
        break;
    case PendingWrite::Instance:
        state.debug.releaseInstance(target.instanceId, target.name);
        break;
    case PendingWrite::Io:
        break;
    }
    return status(request.id, QStringLiteral("released"));
}

ControlResponse handleVarForced(const ControlRequest &request, ControlState &state)
{
    QJsonArray vars;
    for (const PendingWrite &force : state.debug.forcedVariables()) {
        QJsonObject entry;
        entry.insert(QStringLiteral("target"), force.targetText());
        entry.insert(QStringLiteral("value"), formatValue(force.value));
        vars.append(entry);
    }
    QJsonObject result;
    result.insert(QStringLiteral("vars"), vars);
    return ControlResponse::success(request.id, result);
}
