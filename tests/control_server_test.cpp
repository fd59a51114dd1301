#include <QtTest/QtTest>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include <QJsonDocument>
#include <QJsonObject>

#include "core/control/control_server.h"
#include "core/control/control_state.h"

namespace {

// Minimal blocking client with a receive timeout.
class TestClient
{
public:
    ~TestClient()
    {
        if (m_fd != -1)
            close(m_fd);
    }

    bool connectUnix(const QString &path)
    {
        m_fd = socket(AF_UNIX, SOCK_STREAM, 0);
        if (m_fd == -1)
            return false;
        struct sockaddr_un addr = {};
        addr.sun_family = AF_UNIX;
        const QByteArray raw = QFile::encodeName(path);
        if (size_t(raw.size()) >= sizeof(addr.sun_path))
            return false;
        memcpy(addr.sun_path, raw.constData(), size_t(raw.size()));
        return setTimeout() && ::connect(m_fd, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) == 0;
    }

    bool connectTcp(quint16 port)
    {
        m_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (m_fd == -1)
            return false;
        struct sockaddr_in addr = {};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        return setTimeout() && ::connect(m_fd, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) == 0;
    }

    bool send(const QByteArray &data)
    {
        qsizetype sent = 0;
        while (sent < data.size()) {
            const ssize_t rv = ::send(m_fd, data.constData() + sent, size_t(data.size() - sent), MSG_NOSIGNAL);
            if (rv <= 0)
                return false;
            sent += rv;
        }
        return true;
    }

    // Empty on timeout or disconnect.
    QByteArray readLine()
    {
        for (;;) {
            const qsizetype newline = m_buffer.indexOf('\n');
            if (newline != -1) {
                const QByteArray line = m_buffer.left(newline);
                m_buffer.remove(0, newline + 1);
                return line;
            }
            char chunk[4096];
            const ssize_t rv = recv(m_fd, chunk, sizeof(chunk), 0);
            if (rv <= 0)
                return QByteArray();
            m_buffer.append(chunk, int(rv));
        }
    }

    QJsonObject readResponse()
    {
        return QJsonDocument::fromJson(readLine()).object();
    }

    bool closedByPeer()
    {
        char byte;
        return recv(m_fd, &byte, 1, 0) == 0;
    }

private:
    bool setTimeout()
    {
        struct timeval tv;
        tv.tv_sec = 5;
        tv.tv_usec = 0;
        return setsockopt(m_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
    }

    int m_fd = -1;
    QByteArray m_buffer;
};

} // namespace

class ControlServerTest : public QObject
{
    Q_OBJECT

private slots:
    void servesUnixSocket()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("plc.sock"));

        ControlState state;
        state.resourceName = QStringLiteral("cell7");
        ControlEndpoint endpoint;
        QVERIFY(parseEndpoint(QStringLiteral("unix://") + path, &endpoint));

        ControlServer server;
        QString error;
        QVERIFY2(server.start(endpoint, &state, &error), qPrintable(error));
        QVERIFY(server.isRunning());
        QVERIFY(QFile::exists(path));
        QVERIFY(!server.start(endpoint, &state, &error));
        QCOMPARE(error, QStringLiteral("control server already running"));

        TestClient client;
        QVERIFY(client.connectUnix(path));
        QVERIFY(client.send("{\"id\":1,\"type\":\"status\"}\n\n{\"id\":2,\"type\":\"health\"}\r\n"));

        QJsonObject first = client.readResponse();
        QCOMPARE(first.value(QStringLiteral("id")).toInt(), 1);
        QVERIFY(first.value(QStringLiteral("ok")).toBool());
        QCOMPARE(first.value(QStringLiteral("result")).toObject().value(QStringLiteral("resource")).toString(),
                 QStringLiteral("cell7"));
        QJsonObject second = client.readResponse();
        QCOMPARE(second.value(QStringLiteral("id")).toInt(), 2);

        // Requests may arrive split across writes.
        QVERIFY(client.send("{\"id\":3,\"ty"));
        QVERIFY(client.send("pe\":\"nope\"}\n"));
        QCOMPARE(client.readResponse().value(QStringLiteral("error")).toString(), QStringLiteral("unsupported request"));

        server.stop();
        QVERIFY(!server.isRunning());
        QVERIFY(!QFile::exists(path));
    }

    void servesLoopbackTcp()
    {
        ControlState state;
        state.authRequired = true;
        state.setAuthToken(QStringLiteral("s3cret"));
        ControlEndpoint endpoint;
        QVERIFY(parseEndpoint(QStringLiteral("tcp://127.0.0.1:0"), &endpoint));

        ControlServer server;
        QString error;
        QVERIFY2(server.start(endpoint, &state, &error), qPrintable(error));
        QVERIFY(server.port() != 0);

        TestClient client;
        QVERIFY(client.connectTcp(server.port()));
        QVERIFY(client.send("{\"id\":5,\"type\":\"status\"}\n"));
        QCOMPARE(client.readResponse().value(QStringLiteral("error")).toString(), QStringLiteral("unauthorized"));
        QVERIFY(client.send("{\"id\":6,\"type\":\"status\",\"auth\":\"s3cret\"}\n"));
        QVERIFY(client.readResponse().value(QStringLiteral("ok")).toBool());
    }

    void reapsDisconnectedClients()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("plc.sock"));
        ControlState state;
        ControlEndpoint endpoint;
        QVERIFY(parseEndpoint(QStringLiteral("unix://") + path, &endpoint));
        ControlServer server;
        QVERIFY(server.start(endpoint, &state));

        for (int i = 0; i < 20; ++i) {
            TestClient client;
            QVERIFY(client.connectUnix(path));
            QVERIFY(client.send(QStringLiteral("{\"id\":%1,\"type\":\"health\"}\n").arg(i).toUtf8()));
            QCOMPARE(client.readResponse().value(QStringLiteral("id")).toInt(), i);
        }
        QTRY_COMPARE(server.clientCount(), 0);

        TestClient held;
        QVERIFY(held.connectUnix(path));
        QVERIFY(held.send("{\"id\":99,\"type\":\"health\"}\n"));
        QCOMPARE(held.readResponse().value(QStringLiteral("id")).toInt(), 99);
        QCOMPARE(server.clientCount(), 1);

        server.stop();
        QCOMPARE(server.clientCount(), 0);
    }

    void rejectsOverlongLine()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("plc.sock"));
        ControlState state;
        ControlEndpoint endpoint;
        QVERIFY(parseEndpoint(QStringLiteral("unix://") + path, &endpoint));
        ControlServer server;
        QVERIFY(server.start(endpoint, &state));

        TestClient client;
        QVERIFY(client.connectUnix(path));
        // The server may hang up before the tail of the payload is written.
        client.send(QByteArray(ControlServer::MaxLineBytes + 16, 'x'));

        const QJsonObject response = client.readResponse();
        QCOMPARE(response.value(QStringLiteral("id")).toInt(-1), 0);
        QCOMPARE(response.value(QStringLiteral("error")).toString(),
                 QStringLiteral("invalid request: line exceeds 1048576 bytes"));
        QVERIFY(client.closedByPeer());
    }
};

QTEST_GUILESS_MAIN(ControlServerTest)

#include "control_server_test.moc"
