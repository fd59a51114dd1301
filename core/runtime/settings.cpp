#include "core/runtime/settings.h"

#include <QDebug>
#include <QLoggingCategory>
#include <QSettings>

namespace {

QString normalized(const QString &text)
{
    return text.trimmed().toLower();
}

} // namespace

bool parseWatchdogAction(const QString &text, WatchdogAction *out, QString *errorOut)
{
    const QString value = normalized(text);
    if (value == QStringLiteral("halt"))
        *out = WatchdogAction::Halt;
    else if (value == QStringLiteral("safe_halt"))
        *out = WatchdogAction::SafeHalt;
    else if (value == QStringLiteral("restart"))
        *out = WatchdogAction::Restart;
    else {
        if (errorOut)
            *errorOut = QStringLiteral("invalid watchdog action '%1'").arg(text);
        return false;
    }
    return true;
}

bool parseFaultPolicy(const QString &text, FaultPolicy *out, QString *errorOut)
{
    const QString value = normalized(text);
    if (value == QStringLiteral("halt"))
        *out = FaultPolicy::Halt;
    else if (value == QStringLiteral("safe_halt"))
        *out = FaultPolicy::SafeHalt;
    else if (value == QStringLiteral("restart"))
        *out = FaultPolicy::Restart;
    else {
        if (errorOut)
            *errorOut = QStringLiteral("invalid fault policy '%1'").arg(text);
        return false;
    }
    return true;
}

bool parseRetainMode(const QString &text, RetainMode *out, QString *errorOut)
{
    const QString value = normalized(text);
    if (value == QStringLiteral("none"))
        *out = RetainMode::None;
    else if (value == QStringLiteral("file"))
        *out = RetainMode::File;
    else {
        if (errorOut)
            *errorOut = QStringLiteral("invalid retain mode '%1'").arg(text);
        return false;
    }
    return true;
}

bool parseControlMode(const QString &text, ControlMode *out)
{
    const QString value = normalized(text);
    if (value == QStringLiteral("production"))
        *out = ControlMode::Production;
    else if (value == QStringLiteral("debug"))
        *out = ControlMode::Debug;
    else
        return false;
    return true;
}

QString watchdogActionName(WatchdogAction action)
{
    switch (action) {
    case WatchdogAction::Halt: return QStringLiteral("Halt");
    case WatchdogAction::SafeHalt: return QStringLiteral("SafeHalt");
    case WatchdogAction::Restart: return QStringLiteral("Restart");
    }
    return QString();
}

QString faultPolicyName(FaultPolicy policy)
{
    switch (policy) {
    case FaultPolicy::Halt: return QStringLiteral("Halt");
    case FaultPolicy::SafeHalt: return QStringLiteral("SafeHalt");
    case FaultPolicy::Restart: return QStringLiteral("Restart");
    }
    return QString();
}

QString retainModeName(RetainMode mode)
{
    return mode == RetainMode::File ? QStringLiteral("File") : QStringLiteral("None");
}

QString controlModeName(ControlMode mode)
{
    return mode == ControlMode::Debug ? QStringLiteral("Debug") : QStringLiteral("Production");
}

QString watchdogActionKey(WatchdogAction action)
{
    switch (action) {
    case WatchdogAction::Halt: return QStringLiteral("halt");
    case WatchdogAction::SafeHalt: return QStringLiteral("safe_halt");
    case WatchdogAction::Restart: return QStringLiteral("restart");
    }
    return QString();
}

QString faultPolicyKey(FaultPolicy policy)
{
    switch (policy) {
    case FaultPolicy::Halt: return QStringLiteral("halt");
    case FaultPolicy::SafeHalt: return QStringLiteral("safe_halt");
    case FaultPolicy::Restart: return QStringLiteral("restart");
    }
    return QString();
}

QString retainModeKey(RetainMode mode)
{
    return mode == RetainMode::File ? QStringLiteral("file") : QStringLiteral("none");
}

void applyLogLevel(const QString &level)
{
    const QString value = normalized(level);
    if (value == QStringLiteral("trace") || value == QStringLiteral("debug"))
        QLoggingCategory::setFilterRules(QStringLiteral("*.debug=true"));
    else if (value == QStringLiteral("info"))
        QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false"));
    else if (value == QStringLiteral("warn") || value == QStringLiteral("warning"))
        QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false\n*.info=false"));
    else if (value == QStringLiteral("error"))
        QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false\n*.info=false\n*.warning=false"));
    else
        qWarning() << "Unknown log level" << level << "- keeping current filter rules";
}

bool loadRuntimeSettings(QSettings &settings, RuntimeSettings *out, QString *errorOut)
{
    RuntimeSettings runtime;

    runtime.logLevel = settings.value(QStringLiteral("log/level"), runtime.logLevel).toString();

    settings.beginGroup(QStringLiteral("watchdog"));
    runtime.watchdog.enabled = settings.value(QStringLiteral("enabled"), false).toBool();
    runtime.watchdog.timeoutMs = settings.value(QStringLiteral("timeout_ms"), 0).toLongLong();
    const QString action = settings.value(QStringLiteral("action"), QStringLiteral("safe_halt")).toString();
    settings.endGroup();
    if (!parseWatchdogAction(action, &runtime.watchdog.action, errorOut))
        return false;

    const QString policy = settings.value(QStringLiteral("fault/policy"), QStringLiteral("safe_halt")).toString();
    if (!parseFaultPolicy(policy, &runtime.faultPolicy, errorOut))
        return false;

    settings.beginGroup(QStringLiteral("retain"));
    const QString retainMode = settings.value(QStringLiteral("mode"), QStringLiteral("none")).toString();
    runtime.retainSaveIntervalMs = settings.value(QStringLiteral("save_interval_ms"), 0).toLongLong();
    settings.endGroup();
    if (!parseRetainMode(retainMode, &runtime.retainMode, errorOut))
        return false;

    settings.beginGroup(QStringLiteral("web"));
    runtime.web.enabled = settings.value(QStringLiteral("enabled"), false).toBool();
    runtime.web.listen = settings.value(QStringLiteral("listen"), runtime.web.listen).toString();
    runtime.web.auth = settings.value(QStringLiteral("auth"), runtime.web.auth).toString().toLower();
    runtime.web.tls = settings.value(QStringLiteral("tls"), false).toBool();
    settings.endGroup();
    if (runtime.web.auth != QStringLiteral("local") && runtime.web.auth != QStringLiteral("token")) {
        if (errorOut)
            *errorOut = QStringLiteral("invalid web auth '%1'").arg(runtime.web.auth);
        return false;
    }

    settings.beginGroup(QStringLiteral("discovery"));
    runtime.discovery.enabled = settings.value(QStringLiteral("enabled"), false).toBool();
    runtime.discovery.serviceName = settings.value(QStringLiteral("service_name")).toString();
    runtime.discovery.advertise = settings.value(QStringLiteral("advertise"), true).toBool();
    runtime.discovery.interfaces = settings.value(QStringLiteral("interfaces")).toStringList();
    settings.endGroup();

    settings.beginGroup(QStringLiteral("mesh"));
    runtime.mesh.enabled = settings.value(QStringLiteral("enabled"), false).toBool();
    runtime.mesh.listen = settings.value(QStringLiteral("listen"), runtime.mesh.listen).toString();
    runtime.mesh.tls = settings.value(QStringLiteral("tls"), false).toBool();
    runtime.mesh.authToken = settings.value(QStringLiteral("auth_token")).toString();
    runtime.mesh.publish = settings.value(QStringLiteral("publish")).toStringList();
    settings.beginGroup(QStringLiteral("subscribe"));
    const QStringList topics = settings.childKeys();
    for (const QString &topic : topics)
        runtime.mesh.subscribe.insert(topic, settings.value(topic).toString());
    settings.endGroup();
    settings.endGroup();

    *out = runtime;
    return true;
}

void saveRuntimeSettings(QSettings &settings, const RuntimeSettings &runtime)
{
    settings.setValue(QStringLiteral("log/level"), runtime.logLevel);

    settings.beginGroup(QStringLiteral("watchdog"));
    settings.setValue(QStringLiteral("enabled"), runtime.watchdog.enabled);
    settings.setValue(QStringLiteral("timeout_ms"), runtime.watchdog.timeoutMs);
    settings.setValue(QStringLiteral("action"), watchdogActionKey(runtime.watchdog.action));
    settings.endGroup();

    settings.setValue(QStringLiteral("fault/policy"), faultPolicyKey(runtime.faultPolicy));

    settings.beginGroup(QStringLiteral("retain"));
    settings.setValue(QStringLiteral("mode"), retainModeKey(runtime.retainMode));
    if (runtime.retainSaveIntervalMs > 0)
        settings.setValue(QStringLiteral("save_interval_ms"), runtime.retainSaveIntervalMs);
    else
        settings.remove(QStringLiteral("save_interval_ms"));
    settings.endGroup();

    settings.beginGroup(QStringLiteral("web"));
    settings.setValue(QStringLiteral("enabled"), runtime.web.enabled);
    settings.setValue(QStringLiteral("listen"), runtime.web.listen);
    settings.setValue(QStringLiteral("auth"), runtime.web.auth);
    settings.setValue(QStringLiteral("tls"), runtime.web.tls);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("discovery"));
    settings.setValue(QStringLiteral("enabled"), runtime.discovery.enabled);
    settings.setValue(QStringLiteral("service_name"), runtime.discovery.serviceName);
    settings.setValue(QStringLiteral("advertise"), runtime.discovery.advertise);
    settings.setValue(QStringLiteral("interfaces"), runtime.discovery.interfaces);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("mesh"));
    settings.setValue(QStringLiteral("enabled"), runtime.mesh.enabled);
    settings.setValue(QStringLiteral("listen"), runtime.mesh.listen);
    settings.setValue(QStringLiteral("tls"), runtime.mesh.tls);
    if (runtime.mesh.authToken.isEmpty())
        settings.remove(QStringLiteral("auth_token"));
    else
        settings.setValue(QStringLiteral("auth_token"), runtime.mesh.authToken);
    settings.setValue(QStringLiteral("publish"), runtime.mesh.publish);
    settings.remove(QStringLiteral("subscribe"));
    settings.beginGroup(QStringLiteral("subscribe"));
    for (auto it = runtime.mesh.subscribe.constBegin(); it != runtime.mesh.subscribe.constEnd(); ++it)
        settings.setValue(it.key(), it.value());
    settings.endGroup();
    settings.endGroup();

    settings.sync();
}
