#include "core/control/handlers.h"

#include <memory>

#include <QDebug>
#include <QJsonArray>

namespace {

const int DefaultEventLimit = 50;
const int ReloadTimeoutMs = 5000;

QJsonValue faultValue(const QString &error)
{
    return error.isEmpty() ? QJsonValue() : QJsonValue(error);
}

QJsonArray driversToJson(const QVector<IoDriverStatus> &drivers)
{
    QJsonArray out;
    for (const IoDriverStatus &driver : drivers)
        out.append(driver.toJson());
    return out;
}

int eventLimit(const ControlRequest &request)
{
    if (!request.params.isObject())
        return DefaultEventLimit;
    const QJsonValue limit = request.params.toObject().value(QLatin1String("limit"));
    const qint64 value = limit.toInteger(-1);
    if (!limit.isDouble() || value < 0)
        return DefaultEventLimit;
    return int(qMin<qint64>(value, EventLog::DefaultCapacity));
}

bool ioParams(const ControlRequest &request, IoAddress *address, Value *value, QString *errorOut)
{
    QJsonObject params;
    QString addressText;
    if (!requireParams(request, &params, errorOut)
        || !requiredString(params, "address", &addressText, errorOut))
        return false;
    if (value) {
        QString valueText;
        if (!requiredString(params, "value", &valueText, errorOut))
            return false;
        if (!parseIoAddress(addressText, address, errorOut))
            return false;
        return parseControlValue(valueText, value, errorOut);
    }
    return parseIoAddress(addressText, address, errorOut);
}

} // namespace

bool parseControlValue(const QString &text, Value *out, QString *errorOut)
{
    const QString upper = text.trimmed().toUpper();
    if (upper == QLatin1String("TRUE")) {
        *out = Value::fromBool(true);
        return true;
    }
    if (upper == QLatin1String("FALSE")) {
        *out = Value::fromBool(false);
        return true;
    }
    bool ok = false;
    const qint64 number = upper.toLongLong(&ok);
    if (ok) {
        *out = Value::fromInt(ValueType::LInt, number);
        return true;
    }
    if (errorOut)
        *errorOut = QStringLiteral("unsupported value '%1'").arg(text);
    return false;
}

ControlResponse handleStatus(const ControlRequest &request, ControlState &state)
{
    QJsonObject result;
    result.insert(QStringLiteral("state"), resourceStateName(state.resourceState()));
    result.insert(QStringLiteral("fault"), faultValue(state.resourceError()));
    result.insert(QStringLiteral("resource"), state.resourceName);
    result.insert(QStringLiteral("plc_name"), state.resourceName);
    result.insert(QStringLiteral("uptime_ms"), state.uptime.elapsed());
    result.insert(QStringLiteral("debug_enabled"), state.debugEnabled.load());
    result.insert(QStringLiteral("control_mode"), controlModeName(state.controlMode()).toLower());
    result.insert(QStringLiteral("io_drivers"), driversToJson(state.ioDrivers()));
    return ControlResponse::success(request.id, result);
}

ControlResponse handleHealth(const ControlRequest &request, ControlState &state)
{
    const ResourceState resourceState = state.resourceState();
    const QString error = state.resourceError();
    const QVector<IoDriverStatus> drivers = state.ioDrivers();

    bool driverFaulted = false;
    for (const IoDriverStatus &driver : drivers) {
        if (driver.health == IoDriverStatus::Faulted)
            driverFaulted = true;
    }
    const bool ok = (resourceState == ResourceState::Running || resourceState == ResourceState::Ready
                     || resourceState == ResourceState::Paused)
        && error.isEmpty() && !driverFaulted;

    QJsonObject result;
    result.insert(QStringLiteral("ok"), ok);
    result.insert(QStringLiteral("state"), resourceStateName(resourceState));
    result.insert(QStringLiteral("fault"), faultValue(error));
    result.insert(QStringLiteral("io_drivers"), driversToJson(drivers));
    return ControlResponse::success(request.id, result);
}

ControlResponse handleEventsTail(const ControlRequest &request, ControlState &state)
{
    QJsonArray events;
    for (const RuntimeEvent &event : state.events.tail(eventLimit(request)))
        events.append(event.toJson());
    QJsonObject result;
    result.insert(QStringLiteral("events"), events);
    return ControlResponse::success(request.id, result);
}

ControlResponse handleFaults(const ControlRequest &request, ControlState &state)
{
    QJsonArray faults;
    for (const RuntimeEvent &event : state.events.tail(eventLimit(request))) {
        if (event.kind == RuntimeEvent::Fault)
            faults.append(event.toJson());
    }
    QJsonObject result;
    result.insert(QStringLiteral("faults"), faults);
    return ControlResponse::success(request.id, result);
}

ControlResponse handleShutdown(const ControlRequest &request, ControlState &state)
{
    qInfo() << "Control: shutdown requested";
    if (state.resource)
        state.resource->stop();
    QJsonObject result;
    result.insert(QStringLiteral("status"), QStringLiteral("stopping"));
    return ControlResponse::success(request.id, result);
}

ControlResponse handleRestart(const ControlRequest &request, ControlState &state)
{
    QJsonObject params;
    QString error, modeText;
    if (!requireParams(request, &params, &error) || !requiredString(params, "mode", &modeText, &error))
        return ControlResponse::failure(request.id, error);

    RestartMode mode;
    const QString lower = modeText.toLower();
    if (lower == QLatin1String("cold"))
        mode = RestartMode::Cold;
    else if (lower == QLatin1String("warm"))
        mode = RestartMode::Warm;
    else
        return ControlResponse::failure(request.id, QStringLiteral("invalid restart mode"));

    state.requestRestart(mode);
    QJsonObject result;
    result.insert(QStringLiteral("status"), QStringLiteral("restart queued"));
    return ControlResponse::success(request.id, result);
}

ControlResponse handleBytecodeReload(const ControlRequest &request, ControlState &state)
{
    QJsonObject params;
    QString error, encoded;
    if (!requireParams(request, &params, &error) || !requiredString(params, "bytes", &encoded, &error))
        return ControlResponse::failure(request.id, error);

    const QByteArray::FromBase64Result decoded =
        QByteArray::fromBase64Encoding(encoded.toLatin1(), QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded)
        return ControlResponse::failure(request.id, QStringLiteral("invalid bytecode: invalid base64 payload"));
    if (!state.resource)
        return ControlResponse::failure(request.id, QStringLiteral("resource unavailable"));

    ResourceCommand command;
    command.kind = ResourceCommand::ReloadBytecode;
    command.bytes = *decoded;
    command.reply = std::make_shared<ReloadReply>();
    if (!state.resource->sendCommand(command, &error))
        return ControlResponse::failure(request.id, error);

    if (!command.reply->waitFor(ReloadTimeoutMs))
        return ControlResponse::failure(request.id, QStringLiteral("reload timeout"));
    if (!command.reply->succeeded())
        return ControlResponse::failure(request.id, command.reply->error());

    qInfo() << "Control: program reloaded";
    QJsonObject result;
    result.insert(QStringLiteral("status"), QStringLiteral("reloaded"));
    return ControlResponse::success(request.id, result);
}

ControlResponse handleIoList(const ControlRequest &request, ControlState &state)
{
    IoSnapshot snapshot;
    if (!state.ioSnapshot(&snapshot))
        return ControlResponse::failure(request.id, QStringLiteral("no snapshot available"));
    return ControlResponse::success(request.id, snapshot.toJson());
}

ControlResponse handleIoRead(const ControlRequest &request, ControlState &state)
{
    IoSnapshot snapshot;
    QJsonObject result;
    if (state.ioSnapshot(&snapshot))
        result.insert(QStringLiteral("snapshot"), snapshot.toJson());
    else
        result.insert(QStringLiteral("snapshot"), QJsonValue());
    return ControlResponse::success(request.id, result);
}

ControlResponse handleIoWrite(const ControlRequest &request, ControlState &state)
{
    IoAddress address;
    Value value;
    QString error;
    if (!ioParams(request, &address, &value, &error))
        return ControlResponse::failure(request.id, error);
    state.debug.enqueueIoWrite(address, value);
    QJsonObject result;
    result.insert(QStringLiteral("status"), QStringLiteral("queued"));
    return ControlResponse::success(request.id, result);
}

ControlResponse handleIoForce(const ControlRequest &request, ControlState &state)
{
    IoAddress address;
    Value value;
    QString error;
    if (!ioParams(request, &address, &value, &error))
        return ControlResponse::failure(request.id, error);
    state.debug.forceIo(address, value);
    QJsonObject result;
    result.insert(QStringLiteral("status"), QStringLiteral("forced"));
    return ControlResponse::success(request.id, result);
}

ControlResponse handleIoUnforce(const ControlRequest &request, ControlState &state)
{
    IoAddress address;
    QString error;
    if (!ioParams(request, &address, nullptr, &error))
        return ControlResponse::failure(request.id, error);
    state.debug.releaseIo(address);
    QJsonObject result;
    result.insert(QStringLiteral("status"), QStringLiteral("released"));
    return ControlResponse::success(request.id, result);
}
