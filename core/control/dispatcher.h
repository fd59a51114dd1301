#ifndef CONTROL_DISPATCHER_H
#define CONTROL_DISPATCHER_H

#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

struct ControlState;

struct ControlRequest {
    quint64 id = 0;
    QString type;
    bool hasParams = false;
    QJsonValue params;
    bool hasAuth = false;
    QString auth;
};

// Exactly one of result / error is serialized.
struct ControlResponse {
    quint64 id = 0;
    bool ok = false;
    QJsonValue result;
    QString error;

    static ControlResponse success(quint64 id, const QJsonValue &result);
    static ControlResponse failure(quint64 id, const QString &error);

    QJsonObject toJson() const;
};

bool parseControlRequest(const QByteArray &line, ControlRequest *out, QString *errorOut = nullptr);

// Types refused with "debug disabled" while debugging is switched off.
bool isDebugRequest(const QString &type);

/* Authenticates, gates, routes and audits one request. Never throws; every
 * outcome is a response carrying the request id. */
ControlResponse handleRequest(const ControlRequest &request, ControlState &state, const QString &client);

// One request line in, one compact JSON response line out (without '\n').
QByteArray handleRequestLine(const QByteArray &line, ControlState &state, const QString &client);

// Error line for input that never became a request; audited as "invalid" with id 0.
QByteArray rejectRequestLine(ControlState &state, const QString &client, const QString &error);

#endif
