#include <atomic>
#include <thread>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSettings>

#include "app/cyclethread.h"
#include "app/program_image.h"
#include "core/control/audit.h"
#include "core/control/control_server.h"
#include "core/control/control_state.h"
#include "core/control/endpoint.h"

namespace {

const char DefaultEndpoint[] = "unix:///tmp/plcctl.sock";

struct ControlSettings {
    ControlMode mode = ControlMode::Production;
    bool debugEnabled = false;
    QString authToken;
};

bool loadControlSettings(QSettings &file, ControlSettings *out, QString *errorOut)
{
    file.beginGroup(QStringLiteral("control"));
    const QString mode = file.value(QStringLiteral("mode"), QStringLiteral("production")).toString();
    out->debugEnabled = file.value(QStringLiteral("debug_enabled"), false).toBool();
    out->authToken = file.value(QStringLiteral("auth_token")).toString().trimmed();
    file.endGroup();
    if (!parseControlMode(mode, &out->mode)) {
        if (errorOut)
            *errorOut = QStringLiteral("invalid control mode '%1'").arg(mode);
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("plcctl-runtime"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Cyclic PLC runtime with a control and debug endpoint"));
    parser.addHelpOption();

    QCommandLineOption programOpt(QStringList() << QStringLiteral("p") << QStringLiteral("program"),
                                  QStringLiteral("Structured Text program to run."),
                                  QStringLiteral("file.st"));
    QCommandLineOption settingsOpt(QStringList() << QStringLiteral("s") << QStringLiteral("settings"),
                                   QStringLiteral("Runtime settings file (ini)."),
                                   QStringLiteral("file.ini"));
    QCommandLineOption endpointOpt(QStringList() << QStringLiteral("e") << QStringLiteral("endpoint"),
                                   QStringLiteral("Control endpoint: tcp://<loopback ip>:<port> or unix://<path>."),
                                   QStringLiteral("endpoint"),
                                   QLatin1String(DefaultEndpoint));
    QCommandLineOption tokenOpt(QStringList() << QStringLiteral("token"),
                                QStringLiteral("Auth token required on every control request."),
                                QStringLiteral("text"));
    QCommandLineOption debugOpt(QStringList() << QStringLiteral("debug"),
                                QStringLiteral("Accept debug requests."));
    QCommandLineOption modeOpt(QStringList() << QStringLiteral("mode"),
                               QStringLiteral("Control mode: production|debug."),
                               QStringLiteral("mode"));
    QCommandLineOption cycleOpt(QStringList() << QStringLiteral("cycle-ms"),
                                QStringLiteral("Cycle interval in milliseconds."),
                                QStringLiteral("ms"),
                                QStringLiteral("100"));
    QCommandLineOption nameOpt(QStringList() << QStringLiteral("name"),
                               QStringLiteral("Resource name reported by status."),
                               QStringLiteral("resource"));

    parser.addOption(programOpt);
    parser.addOption(settingsOpt);
    parser.addOption(endpointOpt);
    parser.addOption(tokenOpt);
    parser.addOption(debugOpt);
    parser.addOption(modeOpt);
    parser.addOption(cycleOpt);
    parser.addOption(nameOpt);
    parser.process(app);

    if (!parser.isSet(programOpt)) {
        parser.showHelp(2);
        return 2;
    }

    bool okCycle = false;
    const int cycleMs = parser.value(cycleOpt).toInt(&okCycle);
    if (!okCycle || cycleMs < 1) {
        qCritical("Invalid --cycle-ms value.");
        return 2;
    }

    ControlEndpoint endpoint;
    QString error;
    if (!parseEndpoint(parser.value(endpointOpt), &endpoint, &error)) {
        qCritical().noquote() << error;
        return 2;
    }

    RuntimeSettings settings;
    ControlSettings control;
    const QString settingsPath = parser.value(settingsOpt);
    if (!settingsPath.isEmpty()) {
        QSettings file(settingsPath, QSettings::IniFormat);
        if (!loadRuntimeSettings(file, &settings, &error) || !loadControlSettings(file, &control, &error)) {
            qCritical().noquote() << settingsPath << ":" << error;
            return 1;
        }
    }
    if (parser.isSet(modeOpt) && !parseControlMode(parser.value(modeOpt), &control.mode)) {
        qCritical("Invalid --mode value. Use production or debug.");
        return 2;
    }
    if (parser.isSet(tokenOpt))
        control.authToken = parser.value(tokenOpt).trimmed();
    if (parser.isSet(debugOpt))
        control.debugEnabled = true;

    if (endpoint.kind == ControlEndpoint::Tcp && control.authToken.isEmpty()) {
        qCritical("control requires auth: tcp endpoints need --token or control/auth_token");
        return 1;
    }

    applyLogLevel(settings.logLevel);

    const QString programPath = parser.value(programOpt);
    ControlState state;
    if (!SourceRegistry::loadFiles(QStringList() << programPath, &state.sources, &error)) {
        qCritical().noquote() << error;
        return 1;
    }
    const SourceFile source = state.sources.files().first();
    ProgramImage program;
    if (!ProgramImage::parse(source.text, source.id, &program, &error)) {
        qCritical().noquote() << programPath << ":" << error;
        return 1;
    }

    state.resourceName = parser.isSet(nameOpt) ? parser.value(nameOpt) : QFileInfo(programPath).baseName();
    state.settingsPath = settingsPath;
    state.authRequired = endpoint.kind == ControlEndpoint::Tcp;
    state.setAuthToken(control.authToken);
    state.setControlMode(control.mode);
    state.debugEnabled = control.debugEnabled;
    state.metadata = program.metadata();
    state.settings = settings;

    AuditChannel audit;
    state.audit = &audit;
    std::atomic<bool> auditRunning{true};
    std::thread auditSink([&audit, &auditRunning] {
        ControlAuditEvent event;
        while (auditRunning || audit.pending() > 0) {
            if (audit.receive(&event, 200))
                qInfo().noquote() << "audit" << QJsonDocument(event.toJson()).toJson(QJsonDocument::Compact);
        }
        if (audit.dropped() > 0)
            qWarning() << "audit: dropped" << audit.dropped() << "events";
    });

    CycleThread cycle(&state, program, source.id);
    cycle.setCycleInterval(cycleMs);
    cycle.setWatchdog(settings.watchdog);
    cycle.setFaultPolicy(settings.faultPolicy);
    state.resource = &cycle;
    QObject::connect(&cycle, &QThread::finished, &app, &QCoreApplication::quit);

    ControlServer server;
    int rc = 0;
    if (server.start(endpoint, &state, &error)) {
        cycle.start();
        rc = app.exec();
        server.stop();
    } else {
        qCritical().noquote() << "Control:" << error;
        rc = 1;
    }

    cycle.stop();
    cycle.wait();
    state.resource = nullptr;

    auditRunning = false;
    audit.close();
    auditSink.join();
    return rc;
}
