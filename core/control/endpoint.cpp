#include "core/control/endpoint.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <string.h>

namespace {

bool fail(QString *errorOut, const QString &message)
{
    if (errorOut)
        *errorOut = message;
    return false;
}

bool isLoopback(const QString &host, bool ipv6)
{
    const QByteArray raw = host.toLatin1();
    if (ipv6) {
        struct in6_addr addr;
        if (inet_pton(AF_INET6, raw.constData(), &addr) != 1)
            return false;
        return memcmp(&addr, &in6addr_loopback, sizeof(addr)) == 0;
    }
    struct in_addr addr;
    if (inet_pton(AF_INET, raw.constData(), &addr) != 1)
        return false;
    return (ntohl(addr.s_addr) >> 24) == 127;
}

} // namespace

QString ControlEndpoint::toString() const
{
    if (kind == Unix)
        return QStringLiteral("unix://%1").arg(path);
    if (ipv6)
        return QStringLiteral("tcp://[%1]:%2").arg(host).arg(port);
    return QStringLiteral("tcp://%1:%2").arg(host).arg(port);
}

bool parseEndpoint(const QString &text, ControlEndpoint *out, QString *errorOut)
{
    if (text.startsWith(QLatin1String("tcp://"))) {
        const QString rest = text.mid(6);
        QString host, port;
        bool ipv6 = false;
        if (rest.startsWith(QLatin1Char('['))) {
            const int close = rest.indexOf(QLatin1String("]:"));
            if (close < 0)
                return fail(errorOut, QStringLiteral("invalid tcp endpoint: invalid socket address syntax"));
            host = rest.mid(1, close - 1);
            port = rest.mid(close + 2);
            ipv6 = true;
        } else {
            const int colon = rest.lastIndexOf(QLatin1Char(':'));
            if (colon < 0)
                return fail(errorOut, QStringLiteral("invalid tcp endpoint: invalid socket address syntax"));
            host = rest.left(colon);
            port = rest.mid(colon + 1);
        }

        bool ok = false;
        const uint portNumber = port.toUInt(&ok);
        if (!ok || portNumber > 65535)
            return fail(errorOut, QStringLiteral("invalid tcp endpoint: invalid port '%1'").arg(port));

        const QByteArray raw = host.toLatin1();
        unsigned char parsed[sizeof(struct in6_addr)];
        if (inet_pton(ipv6 ? AF_INET6 : AF_INET, raw.constData(), parsed) != 1)
            return fail(errorOut, QStringLiteral("invalid tcp endpoint: invalid IP address '%1'").arg(host));
        if (!isLoopback(host, ipv6))
            return fail(errorOut, QStringLiteral("tcp endpoint must be loopback (use unix:// for local sockets)"));

        out->kind = ControlEndpoint::Tcp;
        out->host = host;
        out->ipv6 = ipv6;
        out->port = quint16(portNumber);
        out->path.clear();
        return true;
    }

    if (text.startsWith(QLatin1String("unix://"))) {
        const QString path = text.mid(7);
        if (path.isEmpty())
            return fail(errorOut, QStringLiteral("unsupported endpoint '%1'").arg(text));
        out->kind = ControlEndpoint::Unix;
        out->path = path;
        out->host.clear();
        out->port = 0;
        return true;
    }

    return fail(errorOut, QStringLiteral("unsupported endpoint '%1'").arg(text));
}
