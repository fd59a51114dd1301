#include <errno.h>
#include <string.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QTextStream>

#include "core/control/endpoint.h"

namespace {

int connectEndpoint(const ControlEndpoint &endpoint, QString *errorOut)
{
    int fd = -1;
    int r = -1;
    if (endpoint.kind == ControlEndpoint::Unix) {
        const QByteArray path = QFile::encodeName(endpoint.path);
        struct sockaddr_un addr;
        memset(&addr, 0, sizeof addr);
        if (size_t(path.size()) >= sizeof(addr.sun_path)) {
            *errorOut = QStringLiteral("unix socket path too long: %1").arg(endpoint.path);
            return -1;
        }
        addr.sun_family = AF_UNIX;
        memcpy(addr.sun_path, path.constData(), size_t(path.size()));
        fd = socket(AF_UNIX, SOCK_STREAM, 0);
        if (fd != -1)
            r = ::connect(fd, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr));
    } else {
        const QByteArray host = endpoint.host.toLatin1();
        if (endpoint.ipv6) {
            struct sockaddr_in6 addr;
            memset(&addr, 0, sizeof addr);
            addr.sin6_family = AF_INET6;
            addr.sin6_port = htons(endpoint.port);
            if (inet_pton(AF_INET6, host.constData(), &addr.sin6_addr) != 1) {
                *errorOut = QStringLiteral("invalid address '%1'").arg(endpoint.host);
                return -1;
            }
            fd = socket(AF_INET6, SOCK_STREAM, 0);
            if (fd != -1)
                r = ::connect(fd, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr));
        } else {
            struct sockaddr_in addr;
            memset(&addr, 0, sizeof addr);
            addr.sin_family = AF_INET;
            addr.sin_port = htons(endpoint.port);
            if (inet_pton(AF_INET, host.constData(), &addr.sin_addr) != 1) {
                *errorOut = QStringLiteral("invalid address '%1'").arg(endpoint.host);
                return -1;
            }
            fd = socket(AF_INET, SOCK_STREAM, 0);
            if (fd != -1)
                r = ::connect(fd, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr));
        }
    }

    if (fd == -1 || r == -1) {
        *errorOut = QStringLiteral("cannot connect to %1: %2")
                        .arg(endpoint.toString(), QString::fromLocal8Bit(strerror(errno)));
        if (fd != -1)
            close(fd);
        return -1;
    }
    return fd;
}

bool sendAll(int fd, const QByteArray &data)
{
    qsizetype sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.constData() + sent, size_t(data.size() - sent), MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return false;
        sent += n;
    }
    return true;
}

bool readLine(int fd, QByteArray *out)
{
    char chunk[4096];
    while (!out->contains('\n')) {
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return false;
        out->append(chunk, n);
    }
    out->truncate(out->indexOf('\n'));
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("plcctl"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Send one control request to a PLC runtime"));
    parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("type"), QStringLiteral("Request type, e.g. status or debug.state."));

    QCommandLineOption endpointOpt(QStringList() << QStringLiteral("e") << QStringLiteral("endpoint"),
                                   QStringLiteral("Control endpoint of the runtime."),
                                   QStringLiteral("endpoint"),
                                   QStringLiteral("unix:///tmp/plcctl.sock"));
    QCommandLineOption tokenOpt(QStringList() << QStringLiteral("t") << QStringLiteral("token"),
                                QStringLiteral("Auth token."),
                                QStringLiteral("text"));
    QCommandLineOption idOpt(QStringList() << QStringLiteral("id"),
                             QStringLiteral("Request id."),
                             QStringLiteral("n"),
                             QStringLiteral("1"));
    QCommandLineOption paramsOpt(QStringList() << QStringLiteral("params"),
                                 QStringLiteral("Request params as a JSON object."),
                                 QStringLiteral("json"));

    parser.addOption(endpointOpt);
    parser.addOption(tokenOpt);
    parser.addOption(idOpt);
    parser.addOption(paramsOpt);
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        parser.showHelp(2);
        return 2;
    }

    ControlEndpoint endpoint;
    QString error;
    if (!parseEndpoint(parser.value(endpointOpt), &endpoint, &error)) {
        qCritical().noquote() << error;
        return 2;
    }

    bool okId = false;
    const qint64 id = parser.value(idOpt).toLongLong(&okId);
    if (!okId || id < 0) {
        qCritical("Invalid --id value.");
        return 2;
    }

    QJsonObject request;
    request.insert(QStringLiteral("id"), id);
    request.insert(QStringLiteral("type"), args.first());
    if (parser.isSet(paramsOpt)) {
        QJsonParseError parseError;
        const QJsonDocument params = QJsonDocument::fromJson(parser.value(paramsOpt).toUtf8(), &parseError);
        if (parseError.error != QJsonParseError::NoError || !params.isObject()) {
            qCritical("Invalid --params value: expected a JSON object.");
            return 2;
        }
        request.insert(QStringLiteral("params"), params.object());
    }
    if (parser.isSet(tokenOpt))
        request.insert(QStringLiteral("auth"), parser.value(tokenOpt));

    int fd = connectEndpoint(endpoint, &error);
    if (fd == -1) {
        qCritical().noquote() << error;
        return 1;
    }

    QByteArray response;
    const bool exchanged = sendAll(fd, QJsonDocument(request).toJson(QJsonDocument::Compact) + '\n')
                           && readLine(fd, &response);
    close(fd);
    if (!exchanged) {
        qCritical("Connection closed before a response arrived.");
        return 1;
    }

    QTextStream(stdout) << response << '\n';
    return QJsonDocument::fromJson(response).object().value(QStringLiteral("ok")).toBool() ? 0 : 1;
}
