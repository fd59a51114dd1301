#include "core/control/handlers.h"

#include <utility>

#include <QDebug>
#include <QJsonArray>
#include <QSettings>

namespace {

QString configTypeError(const QString &key, const QString &expected)
{
    return QStringLiteral("invalid config value for '%1': expected %2").arg(key, expected);
}

QString configValueError(const QString &key, const QString &message)
{
    return QStringLiteral("invalid config value for '%1': %2").arg(key, message);
}

bool expectBool(const QString &key, const QJsonValue &value, bool *out, QString *errorOut)
{
    if (!value.isBool()) {
        *errorOut = configTypeError(key, QStringLiteral("boolean"));
        return false;
    }
    *out = value.toBool();
    return true;
}

bool expectNonEmptyString(const QString &key, const QJsonValue &value, QString *out, QString *errorOut)
{
    if (!value.isString()) {
        *errorOut = configTypeError(key, QStringLiteral("string"));
        return false;
    }
    const QString text = value.toString().trimmed();
    if (text.isEmpty()) {
        *errorOut = configValueError(key, QStringLiteral("must not be empty"));
        return false;
    }
    *out = text;
    return true;
}

bool expectPositiveInt(const QString &key, const QJsonValue &value, qint64 *out, QString *errorOut)
{
    const qint64 number = value.toInteger(0);
    if (!value.isDouble() || double(number) != value.toDouble()) {
        *errorOut = configTypeError(key, QStringLiteral("integer >= 1"));
        return false;
    }
    if (number < 1) {
        *errorOut = configValueError(key, QStringLiteral("must be >= 1"));
        return false;
    }
    *out = number;
    return true;
}

bool expectStringArray(const QString &key, const QJsonValue &value, QStringList *out, QString *errorOut)
{
    if (!value.isArray()) {
        *errorOut = configTypeError(key, QStringLiteral("array of strings"));
        return false;
    }
    const QJsonArray items = value.toArray();
    QStringList list;
    for (int i = 0; i < items.size(); ++i) {
        if (!items.at(i).isString()) {
            *errorOut = configValueError(key, QStringLiteral("entry %1 must be a string").arg(i));
            return false;
        }
        const QString text = items.at(i).toString().trimmed();
        if (text.isEmpty()) {
            *errorOut = configValueError(key, QStringLiteral("entry %1 must not be empty").arg(i));
            return false;
        }
        list << text;
    }
    *out = list;
    return true;
}

bool expectStringMap(const QString &key, const QJsonValue &value, QMap<QString, QString> *out, QString *errorOut)
{
    if (!value.isObject()) {
        *errorOut = configTypeError(key, QStringLiteral("object of strings"));
        return false;
    }
    const QJsonObject items = value.toObject();
    QMap<QString, QString> map;
    for (auto it = items.constBegin(); it != items.constEnd(); ++it) {
        if (it.key().trimmed().isEmpty()) {
            *errorOut = configValueError(key, QStringLiteral("map keys must not be empty"));
            return false;
        }
        if (!it.value().isString()) {
            *errorOut = configValueError(key, QStringLiteral("entry '%1' must be a string").arg(it.key()));
            return false;
        }
        const QString text = it.value().toString().trimmed();
        if (text.isEmpty()) {
            *errorOut = configValueError(key, QStringLiteral("entry '%1' must not be empty").arg(it.key()));
            return false;
        }
        map.insert(it.key(), text);
    }
    *out = map;
    return true;
}

struct KeyOutcome {
    enum {
        Ignored,
        Live,
        Cold
    } kind = Ignored;
    bool pushWatchdog = false;
    bool pushFaultPolicy = false;
    bool pushRetainInterval = false;
};

/* Validates and commits a single key. Keys that only touch RuntimeSettings
 * are applied under the settings lock; the others go to their own group. */
bool applyConfigKey(ControlState &state, const QString &key, const QJsonValue &value,
                    KeyOutcome *outcome, QString *errorOut)
{
    if (key == QLatin1String("control.auth_token")) {
        if (value.isNull()) {
            if (state.authRequired) {
                *errorOut = QStringLiteral("auth token required for tcp endpoints");
                return false;
            }
            state.setAuthToken(QString());
        } else if (value.isString()) {
            const QString token = value.toString().trimmed();
            if (token.isEmpty()) {
                *errorOut = configValueError(key, QStringLiteral("must not be empty"));
                return false;
            }
            state.setAuthToken(token);
        } else {
            *errorOut = configTypeError(key, QStringLiteral("string or null"));
            return false;
        }
        outcome->kind = KeyOutcome::Cold;
        return true;
    }

    if (key == QLatin1String("control.debug_enabled")) {
        bool enabled = false;
        if (!expectBool(key, value, &enabled, errorOut))
            return false;
        state.debugEnabled.store(enabled);
        outcome->kind = KeyOutcome::Live;
        return true;
    }

    if (key == QLatin1String("control.mode")) {
        QString text;
        if (!expectNonEmptyString(key, value, &text, errorOut))
            return false;
        ControlMode mode;
        if (!parseControlMode(text, &mode)) {
            *errorOut = configValueError(key, QStringLiteral("expected 'production' or 'debug'"));
            return false;
        }
        state.setControlMode(mode);
        outcome->kind = KeyOutcome::Cold;
        return true;
    }

    if (key == QLatin1String("web.auth")) {
        QString text;
        if (!expectNonEmptyString(key, value, &text, errorOut))
            return false;
        text = text.toLower();
        if (text == QLatin1String("token") && state.authToken().isEmpty()) {
            *errorOut = configValueError(key, QStringLiteral("token mode requires control.auth_token"));
            return false;
        }
        if (text != QLatin1String("local") && text != QLatin1String("token")) {
            *errorOut = configValueError(key, QStringLiteral("expected 'local' or 'token'"));
            return false;
        }
        std::lock_guard<std::mutex> lg(state.settingsMutex);
        state.settings.web.auth = text;
        outcome->kind = KeyOutcome::Cold;
        return true;
    }

    // Remaining keys edit RuntimeSettings only.
    RuntimeSettings edited;
    {
        std::lock_guard<std::mutex> lg(state.settingsMutex);
        edited = state.settings;
    }

    QString text;
    bool flag = false;
    qint64 number = 0;
    QStringList list;

    if (key == QLatin1String("log.level")) {
        if (!expectNonEmptyString(key, value, &text, errorOut))
            return false;
        edited.logLevel = text;
        applyLogLevel(text);
        outcome->kind = KeyOutcome::Live;
    } else if (key == QLatin1String("watchdog.enabled")) {
        if (!expectBool(key, value, &flag, errorOut))
            return false;
        edited.watchdog.enabled = flag;
        outcome->kind = KeyOutcome::Live;
        outcome->pushWatchdog = true;
    } else if (key == QLatin1String("watchdog.timeout_ms")) {
        if (!expectPositiveInt(key, value, &number, errorOut))
            return false;
        edited.watchdog.timeoutMs = number;
        outcome->kind = KeyOutcome::Live;
        outcome->pushWatchdog = true;
    } else if (key == QLatin1String("watchdog.action")) {
        QString error;
        if (!expectNonEmptyString(key, value, &text, errorOut))
            return false;
        if (!parseWatchdogAction(text, &edited.watchdog.action, &error)) {
            *errorOut = configValueError(key, error);
            return false;
        }
        outcome->kind = KeyOutcome::Live;
        outcome->pushWatchdog = true;
    } else if (key == QLatin1String("fault.policy")) {
        QString error;
        if (!expectNonEmptyString(key, value, &text, errorOut))
            return false;
        if (!parseFaultPolicy(text, &edited.faultPolicy, &error)) {
            *errorOut = configValueError(key, error);
            return false;
        }
        outcome->kind = KeyOutcome::Live;
        outcome->pushFaultPolicy = true;
    } else if (key == QLatin1String("retain.save_interval_ms")) {
        if (!expectPositiveInt(key, value, &number, errorOut))
            return false;
        edited.retainSaveIntervalMs = number;
        outcome->kind = KeyOutcome::Live;
        outcome->pushRetainInterval = true;
    } else if (key == QLatin1String("retain.mode")) {
        QString error;
        if (!expectNonEmptyString(key, value, &text, errorOut))
            return false;
        if (!parseRetainMode(text, &edited.retainMode, &error)) {
            *errorOut = configValueError(key, error);
            return false;
        }
        outcome->kind = KeyOutcome::Cold;
    } else if (key == QLatin1String("web.enabled")) {
        if (!expectBool(key, value, &edited.web.enabled, errorOut))
            return false;
        outcome->kind = KeyOutcome::Cold;
    } else if (key == QLatin1String("web.listen")) {
        if (!expectNonEmptyString(key, value, &edited.web.listen, errorOut))
            return false;
        outcome->kind = KeyOutcome::Cold;
    } else if (key == QLatin1String("web.tls")) {
        if (!expectBool(key, value, &edited.web.tls, errorOut))
            return false;
        outcome->kind = KeyOutcome::Cold;
    } else if (key == QLatin1String("discovery.enabled")) {
        if (!expectBool(key, value, &edited.discovery.enabled, errorOut))
            return false;
        outcome->kind = KeyOutcome::Cold;
    } else if (key == QLatin1String("discovery.service_name")) {
        if (!expectNonEmptyString(key, value, &edited.discovery.serviceName, errorOut))
            return false;
        outcome->kind = KeyOutcome::Cold;
    } else if (key == QLatin1String("discovery.advertise")) {
        if (!expectBool(key, value, &edited.discovery.advertise, errorOut))
            return false;
        outcome->kind = KeyOutcome::Cold;
    } else if (key == QLatin1String("discovery.interfaces")) {
        if (!expectStringArray(key, value, &edited.discovery.interfaces, errorOut))
            return false;
        outcome->kind = KeyOutcome::Cold;
    } else if (key == QLatin1String("mesh.enabled")) {
        if (!expectBool(key, value, &edited.mesh.enabled, errorOut))
            return false;
        outcome->kind = KeyOutcome::Cold;
    } else if (key == QLatin1String("mesh.listen")) {
        if (!expectNonEmptyString(key, value, &edited.mesh.listen, errorOut))
            return false;
        outcome->kind = KeyOutcome::Cold;
    } else if (key == QLatin1String("mesh.tls")) {
        if (!expectBool(key, value, &edited.mesh.tls, errorOut))
            return false;
        outcome->kind = KeyOutcome::Cold;
    } else if (key == QLatin1String("mesh.auth_token")) {
        if (value.isNull()) {
            edited.mesh.authToken.clear();
        } else if (value.isString()) {
            text = value.toString().trimmed();
            if (text.isEmpty()) {
                *errorOut = configValueError(key, QStringLiteral("must not be empty"));
                return false;
            }
            edited.mesh.authToken = text;
        } else {
            *errorOut = configTypeError(key, QStringLiteral("string or null"));
            return false;
        }
        outcome->kind = KeyOutcome::Cold;
    } else if (key == QLatin1String("mesh.publish")) {
        if (!expectStringArray(key, value, &list, errorOut))
            return false;
        edited.mesh.publish = list;
        outcome->kind = KeyOutcome::Cold;
    } else if (key == QLatin1String("mesh.subscribe")) {
        if (!expectStringMap(key, value, &edited.mesh.subscribe, errorOut))
            return false;
        outcome->kind = KeyOutcome::Cold;
    } else {
        outcome->kind = KeyOutcome::Ignored;
        return true;
    }

    std::lock_guard<std::mutex> lg(state.settingsMutex);
    state.settings = edited;
    return true;
}

void pushLiveSettings(ControlState &state, const KeyOutcome &outcome)
{
    if (!state.resource)
        return;

    RuntimeSettings current;
    {
        std::lock_guard<std::mutex> lg(state.settingsMutex);
        current = state.settings;
    }

    QString error;
    ResourceCommand command;
    if (outcome.pushWatchdog) {
        command.kind = ResourceCommand::UpdateWatchdog;
        command.watchdog = current.watchdog;
        if (!state.resource->sendCommand(command, &error))
            qWarning() << "Control: watchdog update not delivered:" << error;
    }
    if (outcome.pushFaultPolicy) {
        command.kind = ResourceCommand::UpdateFaultPolicy;
        command.faultPolicy = current.faultPolicy;
        if (!state.resource->sendCommand(command, &error))
            qWarning() << "Control: fault policy update not delivered:" << error;
    }
    if (outcome.pushRetainInterval) {
        command.kind = ResourceCommand::UpdateRetainSaveInterval;
        command.retainSaveIntervalMs = current.retainSaveIntervalMs;
        if (!state.resource->sendCommand(command, &error))
            qWarning() << "Control: retain interval update not delivered:" << error;
    }
}

void persistSettings(ControlState &state)
{
    if (state.settingsPath.isEmpty())
        return;

    RuntimeSettings current;
    {
        std::lock_guard<std::mutex> lg(state.settingsMutex);
        current = state.settings;
    }

    QSettings file(state.settingsPath, QSettings::IniFormat);
    saveRuntimeSettings(file, current);
    file.beginGroup(QStringLiteral("control"));
    file.setValue(QStringLiteral("mode"), controlModeName(state.controlMode()).toLower());
    file.setValue(QStringLiteral("debug_enabled"), state.debugEnabled.load());
    const QString token = state.authToken();
    if (token.isEmpty())
        file.remove(QStringLiteral("auth_token"));
    else
        file.setValue(QStringLiteral("auth_token"), token);
    file.endGroup();
    file.sync();
    if (file.status() != QSettings::NoError)
        qWarning() << "Control: could not write settings to" << state.settingsPath;
}

} // namespace

ControlResponse handleConfigGet(const ControlRequest &request, ControlState &state)
{
    RuntimeSettings settings;
    {
        std::lock_guard<std::mutex> lg(state.settingsMutex);
        settings = state.settings;
    }
    const QString token = state.authToken();

    QJsonObject subscribe;
    for (auto it = settings.mesh.subscribe.constBegin(); it != settings.mesh.subscribe.constEnd(); ++it)
        subscribe.insert(it.key(), it.value());

    QJsonObject result;
    result.insert(QStringLiteral("log.level"), settings.logLevel);
    result.insert(QStringLiteral("watchdog.enabled"), settings.watchdog.enabled);
    result.insert(QStringLiteral("watchdog.timeout_ms"), settings.watchdog.timeoutMs);
    result.insert(QStringLiteral("watchdog.action"), watchdogActionName(settings.watchdog.action));
    result.insert(QStringLiteral("fault.policy"), faultPolicyName(settings.faultPolicy));
    result.insert(QStringLiteral("retain.mode"), retainModeName(settings.retainMode));
    result.insert(QStringLiteral("retain.save_interval_ms"),
                  settings.retainSaveIntervalMs > 0 ? QJsonValue(settings.retainSaveIntervalMs) : QJsonValue());
    result.insert(QStringLiteral("web.enabled"), settings.web.enabled);
    result.insert(QStringLiteral("web.listen"), settings.web.listen);
    result.insert(QStringLiteral("web.auth"), settings.web.auth);
    result.insert(QStringLiteral("web.tls"), settings.web.tls);
    result.insert(QStringLiteral("discovery.enabled"), settings.discovery.enabled);
    result.insert(QStringLiteral("discovery.service_name"),
                  settings.discovery.serviceName.isEmpty() ? state.resourceName : settings.discovery.serviceName);
    result.insert(QStringLiteral("discovery.advertise"), settings.discovery.advertise);
    result.insert(QStringLiteral("discovery.interfaces"), QJsonArray::fromStringList(settings.discovery.interfaces));
    result.insert(QStringLiteral("mesh.enabled"), settings.mesh.enabled);
    result.insert(QStringLiteral("mesh.listen"), settings.mesh.listen);
    result.insert(QStringLiteral("mesh.tls"), settings.mesh.tls);
    result.insert(QStringLiteral("mesh.auth_token_set"), !settings.mesh.authToken.isEmpty());
    result.insert(QStringLiteral("mesh.publish"), QJsonArray::fromStringList(settings.mesh.publish));
    result.insert(QStringLiteral("mesh.subscribe"), subscribe);
    result.insert(QStringLiteral("control.auth_token_set"), !token.isEmpty());
    result.insert(QStringLiteral("control.auth_token_length"),
                  token.isEmpty() ? QJsonValue() : QJsonValue(qint64(token.toUtf8().size())));
    result.insert(QStringLiteral("control.debug_enabled"), state.debugEnabled.load());
    result.insert(QStringLiteral("control.mode"), controlModeName(state.controlMode()));
    return ControlResponse::success(request.id, result);
}

ControlResponse handleConfigSet(const ControlRequest &request, ControlState &state)
{
    if (!request.hasParams)
        return ControlResponse::failure(request.id, QStringLiteral("missing params"));
    if (!request.params.isObject())
        return ControlResponse::failure(request.id, QStringLiteral("invalid config payload: params must be an object"));

    const QJsonObject params = request.params.toObject();
    QStringList keys = params.keys();
    if (keys.removeAll(QStringLiteral("control.auth_token")) > 0)
        keys.prepend(QStringLiteral("control.auth_token"));

    QJsonArray updated, restartRequired;
    QString error;
    bool failed = false;
    for (const QString &key : std::as_const(keys)) {
        KeyOutcome outcome;
        if (!applyConfigKey(state, key, params.value(key), &outcome, &error)) {
            failed = true;
            break;
        }
        if (outcome.kind == KeyOutcome::Ignored)
            continue;
        updated.append(key);
        if (outcome.kind == KeyOutcome::Cold)
            restartRequired.append(key);
        pushLiveSettings(state, outcome);
    }

    if (!updated.isEmpty()) {
        qInfo() << "Control: settings updated:" << updated.toVariantList();
        persistSettings(state);
    }
    if (failed)
        return ControlResponse::failure(request.id, error);

    QJsonObject result;
    result.insert(QStringLiteral("updated"), updated);
    result.insert(QStringLiteral("restart_required"), restartRequired);
    return ControlResponse::success(request.id, result);
}
