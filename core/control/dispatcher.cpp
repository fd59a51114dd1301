#include "core/control/dispatcher.h"

#include <QDateTime>
#include <QDebug>
#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include "core/control/audit.h"
#include "core/control/handlers.h"

namespace {

void recordAudit(ControlState &state, quint64 requestId, const QString &requestType,
                 const ControlResponse &response, bool authPresent, const QString &client)
{
    if (!state.audit)
        return;
    ControlAuditEvent event;
    event.timestampMs = QDateTime::currentMSecsSinceEpoch();
    event.requestId = requestId;
    event.requestType = requestType;
    event.ok = response.ok;
    event.error = response.error;
    event.authPresent = authPresent;
    event.client = client;
    state.audit->send(event);
}

bool invalidParams(QString *errorOut, const QString &detail)
{
    if (errorOut)
        *errorOut = QStringLiteral("invalid params: %1").arg(detail);
    return false;
}

bool toUnsigned(const QJsonValue &value, quint64 *out)
{
    if (!value.isDouble())
        return false;
    const qint64 number = value.toInteger(-1);
    if (number < 0)
        return false;
    *out = quint64(number);
    return true;
}

} // namespace

ControlResponse ControlResponse::success(quint64 id, const QJsonValue &result)
{
    ControlResponse response;
    response.id = id;
    response.ok = true;
    response.result = result;
    return response;
}

ControlResponse ControlResponse::failure(quint64 id, const QString &error)
{
    ControlResponse response;
    response.id = id;
    response.ok = false;
    response.error = error;
    return response;
}

QJsonObject ControlResponse::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), qint64(id));
    obj.insert(QStringLiteral("ok"), ok);
    if (ok)
        obj.insert(QStringLiteral("result"), result);
    else
        obj.insert(QStringLiteral("error"), error);
    return obj;
}

bool parseControlRequest(const QByteArray &line, ControlRequest *out, QString *errorOut)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorOut)
            *errorOut = QStringLiteral("invalid request: %1 at offset %2")
                            .arg(parseError.errorString()).arg(parseError.offset);
        return false;
    }
    if (!doc.isObject()) {
        if (errorOut)
            *errorOut = QStringLiteral("invalid request: expected a JSON object");
        return false;
    }

    const QJsonObject obj = doc.object();
    ControlRequest request;
    if (!obj.contains(QLatin1String("id"))) {
        if (errorOut)
            *errorOut = QStringLiteral("invalid request: missing field 'id'");
        return false;
    }
    if (!toUnsigned(obj.value(QLatin1String("id")), &request.id)) {
        if (errorOut)
            *errorOut = QStringLiteral("invalid request: 'id' must be an unsigned integer");
        return false;
    }
    const QJsonValue type = obj.value(QLatin1String("type"));
    if (type.isUndefined()) {
        if (errorOut)
            *errorOut = QStringLiteral("invalid request: missing field 'type'");
        return false;
    }
    if (!type.isString()) {
        if (errorOut)
            *errorOut = QStringLiteral("invalid request: 'type' must be a string");
        return false;
    }
    request.type = type.toString();

    const QJsonValue params = obj.value(QLatin1String("params"));
    request.hasParams = !params.isUndefined() && !params.isNull();
    request.params = params;

    const QJsonValue auth = obj.value(QLatin1String("auth"));
    if (!auth.isUndefined() && !auth.isNull()) {
        if (!auth.isString()) {
            if (errorOut)
                *errorOut = QStringLiteral("invalid request: 'auth' must be a string");
            return false;
        }
        request.hasAuth = true;
        request.auth = auth.toString();
    }

    *out = request;
    return true;
}

bool isDebugRequest(const QString &type)
{
    static const QStringList debugTypes = {
        QStringLiteral("pause"), QStringLiteral("resume"),
        QStringLiteral("step_in"), QStringLiteral("step_over"), QStringLiteral("step_out"),
        QStringLiteral("breakpoints.set"), QStringLiteral("breakpoints.clear"),
        QStringLiteral("breakpoints.clear_all"), QStringLiteral("breakpoints.clear_id"),
        QStringLiteral("breakpoints.list"),
        QStringLiteral("eval"), QStringLiteral("set"),
        QStringLiteral("var.force"), QStringLiteral("var.unforce"), QStringLiteral("var.forced"),
        QStringLiteral("debug.state"), QStringLiteral("debug.stops"), QStringLiteral("debug.stack"),
        QStringLiteral("debug.scopes"), QStringLiteral("debug.variables"),
        QStringLiteral("debug.evaluate"), QStringLiteral("debug.breakpoint_locations")
    };
    return debugTypes.contains(type);
}

ControlHandler findControlHandler(const QString &type)
{
    static const QHash<QString, ControlHandler> handlers = {
        { QStringLiteral("status"), handleStatus },
        { QStringLiteral("health"), handleHealth },
        { QStringLiteral("events.tail"), handleEventsTail },
        { QStringLiteral("faults"), handleFaults },
        { QStringLiteral("config.get"), handleConfigGet },
        { QStringLiteral("config.set"), handleConfigSet },
        { QStringLiteral("shutdown"), handleShutdown },
        { QStringLiteral("restart"), handleRestart },
        { QStringLiteral("bytecode.reload"), handleBytecodeReload },
        { QStringLiteral("io.list"), handleIoList },
        { QStringLiteral("io.read"), handleIoRead },
        { QStringLiteral("io.write"), handleIoWrite },
        { QStringLiteral("io.force"), handleIoForce },
        { QStringLiteral("io.unforce"), handleIoUnforce },
        { QStringLiteral("pause"), handlePause },
        { QStringLiteral("resume"), handleResume },
        { QStringLiteral("step_in"), handleStepIn },
        { QStringLiteral("step_over"), handleStepOver },
        { QStringLiteral("step_out"), handleStepOut },
        { QStringLiteral("breakpoints.set"), handleBreakpointsSet },
        { QStringLiteral("breakpoints.clear"), handleBreakpointsClear },
        { QStringLiteral("breakpoints.clear_all"), handleBreakpointsClearAll },
        { QStringLiteral("breakpoints.clear_id"), handleBreakpointsClearId },
        { QStringLiteral("breakpoints.list"), handleBreakpointsList },
        { QStringLiteral("debug.breakpoint_locations"), handleBreakpointLocations },
        { QStringLiteral("debug.state"), handleDebugState },
        { QStringLiteral("debug.stops"), handleDebugStops },
        { QStringLiteral("debug.stack"), handleDebugStack },
        { QStringLiteral("debug.scopes"), handleDebugScopes },
        { QStringLiteral("debug.variables"), handleDebugVariables },
        { QStringLiteral("debug.evaluate"), handleDebugEvaluate },
        { QStringLiteral("eval"), handleEval },
        { QStringLiteral("set"), handleSet },
        { QStringLiteral("var.force"), handleVarForce },
        { QStringLiteral("var.unforce"), handleVarUnforce },
        { QStringLiteral("var.forced"), handleVarForced },
    };
    return handlers.value(type, nullptr);
}

ControlResponse handleRequest(const ControlRequest &request, ControlState &state, const QString &client)
{
    ControlResponse response;
    const QString token = state.authToken();

    if (!token.isEmpty() && (!request.hasAuth || request.auth != token)) {
        response = ControlResponse::failure(request.id, QStringLiteral("unauthorized"));
    } else if (!state.debugEnabled.load() && isDebugRequest(request.type)) {
        response = ControlResponse::failure(request.id, QStringLiteral("debug disabled"));
    } else if (ControlHandler handler = findControlHandler(request.type)) {
        response = handler(request, state);
        response.id = request.id;
    } else {
        response = ControlResponse::failure(request.id, QStringLiteral("unsupported request"));
    }

    recordAudit(state, request.id, request.type, response, request.hasAuth, client);
    return response;
}

QByteArray handleRequestLine(const QByteArray &line, ControlState &state, const QString &client)
{
    ControlRequest request;
    QString error;
    if (!parseControlRequest(line, &request, &error))
        return rejectRequestLine(state, client, error);
    const ControlResponse response = handleRequest(request, state, client);
    return QJsonDocument(response.toJson()).toJson(QJsonDocument::Compact);
}

QByteArray rejectRequestLine(ControlState &state, const QString &client, const QString &error)
{
    qDebug() << "Control: rejected request from" << client << ":" << error;
    const ControlResponse response = ControlResponse::failure(0, error);
    recordAudit(state, 0, QStringLiteral("invalid"), response, false, client);
    return QJsonDocument(response.toJson()).toJson(QJsonDocument::Compact);
}

bool requireParams(const ControlRequest &request, QJsonObject *out, QString *errorOut)
{
    if (!request.hasParams) {
        if (errorOut)
            *errorOut = QStringLiteral("missing params");
        return false;
    }
    if (!request.params.isObject())
        return invalidParams(errorOut, QStringLiteral("expected an object"));
    *out = request.params.toObject();
    return true;
}

bool requiredString(const QJsonObject &params, const char *key, QString *out, QString *errorOut)
{
    const QJsonValue value = params.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull())
        return invalidParams(errorOut, QStringLiteral("missing field '%1'").arg(QLatin1String(key)));
    if (!value.isString())
        return invalidParams(errorOut, QStringLiteral("field '%1' must be a string").arg(QLatin1String(key)));
    *out = value.toString();
    return true;
}

bool requiredUInt(const QJsonObject &params, const char *key, quint64 *out, QString *errorOut)
{
    const QJsonValue value = params.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull())
        return invalidParams(errorOut, QStringLiteral("missing field '%1'").arg(QLatin1String(key)));
    if (!toUnsigned(value, out))
        return invalidParams(errorOut, QStringLiteral("field '%1' must be an unsigned integer").arg(QLatin1String(key)));
    return true;
}

bool optionalUInt(const QJsonObject &params, const char *key, quint64 *out, bool *present, QString *errorOut)
{
    const QJsonValue value = params.value(QLatin1String(key));
    *present = false;
    if (value.isUndefined() || value.isNull())
        return true;
    if (!toUnsigned(value, out))
        return invalidParams(errorOut, QStringLiteral("field '%1' must be an unsigned integer").arg(QLatin1String(key)));
    *present = true;
    return true;
}

bool requiredUIntArray(const QJsonObject &params, const char *key, QVector<quint64> *out, QString *errorOut)
{
    const QJsonValue value = params.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull())
        return invalidParams(errorOut, QStringLiteral("missing field '%1'").arg(QLatin1String(key)));
    if (!value.isArray())
        return invalidParams(errorOut, QStringLiteral("field '%1' must be an array").arg(QLatin1String(key)));
    out->clear();
    const QJsonArray items = value.toArray();
    for (const QJsonValue &item : items) {
        quint64 number = 0;
        if (!toUnsigned(item, &number))
            return invalidParams(errorOut, QStringLiteral("field '%1' must contain unsigned integers").arg(QLatin1String(key)));
        out->append(number);
    }
    return true;
}
