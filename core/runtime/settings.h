#ifndef RUNTIME_SETTINGS_H
#define RUNTIME_SETTINGS_H

#include <QMap>
#include <QString>
#include <QStringList>

class QSettings;

enum class WatchdogAction {
    Halt,
    SafeHalt,
    Restart
};

enum class FaultPolicy {
    Halt,
    SafeHalt,
    Restart
};

enum class RetainMode {
    None,
    File
};

enum class ControlMode {
    Production,
    Debug
};

enum class RestartMode {
    Cold,
    Warm
};

struct WatchdogPolicy {
    bool enabled = false;
    qint64 timeoutMs = 0;
    WatchdogAction action = WatchdogAction::SafeHalt;
};

struct WebSettings {
    bool enabled = false;
    QString listen = QStringLiteral("127.0.0.1:8080");
    QString auth = QStringLiteral("local"); // "local" or "token"
    bool tls = false;
};

struct DiscoverySettings {
    bool enabled = false;
    QString serviceName;
    bool advertise = true;
    QStringList interfaces;
};

struct MeshSettings {
    bool enabled = false;
    QString listen = QStringLiteral("127.0.0.1:5200");
    bool tls = false;
    QString authToken; // empty when unset
    QStringList publish;
    QMap<QString, QString> subscribe;
};

struct RuntimeSettings {
    QString logLevel = QStringLiteral("info");
    WatchdogPolicy watchdog;
    FaultPolicy faultPolicy = FaultPolicy::SafeHalt;
    RetainMode retainMode = RetainMode::None;
    qint64 retainSaveIntervalMs = 0; // 0 when unset
    WebSettings web;
    DiscoverySettings discovery;
    MeshSettings mesh;
};

bool parseWatchdogAction(const QString &text, WatchdogAction *out, QString *errorOut = nullptr);
bool parseFaultPolicy(const QString &text, FaultPolicy *out, QString *errorOut = nullptr);
bool parseRetainMode(const QString &text, RetainMode *out, QString *errorOut = nullptr);
bool parseControlMode(const QString &text, ControlMode *out);

// Names as reported by config.get: "Halt", "SafeHalt", "File", "Debug", ...
QString watchdogActionName(WatchdogAction action);
QString faultPolicyName(FaultPolicy policy);
QString retainModeName(RetainMode mode);
QString controlModeName(ControlMode mode);
// Vocabulary spelling used in settings files: "safe_halt", "file", ...
QString watchdogActionKey(WatchdogAction action);
QString faultPolicyKey(FaultPolicy policy);
QString retainModeKey(RetainMode mode);

// Routes the level to Qt's logging filter rules.
void applyLogLevel(const QString &level);

bool loadRuntimeSettings(QSettings &settings, RuntimeSettings *out, QString *errorOut = nullptr);
void saveRuntimeSettings(QSettings &settings, const RuntimeSettings &runtime);

#endif
