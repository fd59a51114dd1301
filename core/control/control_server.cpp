#include "core/control/control_server.h"

#include <errno.h>
#include <string.h>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include <utility>

#include <QDebug>
#include <QFile>

#include "core/control/control_state.h"
#include "core/control/dispatcher.h"

namespace {

const int PollIntervalUs = 100000;

QString socketError(const char *what)
{
    return QStringLiteral("%1: %2").arg(QLatin1String(what), QString::fromLocal8Bit(strerror(errno)));
}

void set_nonblocking(int socket, bool nonblocking)
{
    int ret = fcntl(socket, F_GETFL, 0);
    fcntl(socket, F_SETFL, nonblocking ? ret | O_NONBLOCK : ret & ~O_NONBLOCK);
    ret = fcntl(socket, F_GETFD, 0);
    fcntl(socket, F_SETFD, ret | FD_CLOEXEC);
}

// Waits up to one poll interval. Returns 1 when readable, 0 on timeout, -1 on error.
int waitReadable(int fd)
{
    fd_set rfds;
    FD_ZERO(&rfds);
    FD_SET(fd, &rfds);
    struct timeval timeout = {0, PollIntervalUs};
    int ret = select(fd + 1, &rfds, NULL, NULL, &timeout);
    if (ret == -1 && errno == EINTR)
        return 0;
    return ret;
}

bool writeAll(int fd, const QByteArray &data)
{
    const char *p = data.constData();
    qsizetype remaining = data.size();
    while (remaining > 0) {
        ssize_t n = send(fd, p, size_t(remaining), MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                fd_set wfds;
                FD_ZERO(&wfds);
                FD_SET(fd, &wfds);
                struct timeval timeout = {0, PollIntervalUs};
                select(fd + 1, NULL, &wfds, NULL, &timeout);
                continue;
            }
            return false;
        }
        p += n;
        remaining -= n;
    }
    return true;
}

QString peerLabel(const struct sockaddr_storage &addr)
{
    char host[INET6_ADDRSTRLEN] = {0};
    if (addr.ss_family == AF_INET) {
        const struct sockaddr_in *in = reinterpret_cast<const struct sockaddr_in *>(&addr);
        inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        return QStringLiteral("%1:%2").arg(QLatin1String(host)).arg(ntohs(in->sin_port));
    }
    if (addr.ss_family == AF_INET6) {
        const struct sockaddr_in6 *in6 = reinterpret_cast<const struct sockaddr_in6 *>(&addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        return QStringLiteral("[%1]:%2").arg(QLatin1String(host)).arg(ntohs(in6->sin6_port));
    }
    return QStringLiteral("unix");
}

} // namespace

ControlServer::~ControlServer()
{
    stop();
}

bool ControlServer::start(const ControlEndpoint &endpoint, ControlState *state, QString *errorOut)
{
    auto fail = [this, errorOut](const QString &message) {
        if (errorOut)
            *errorOut = message;
        if (m_listenFd != -1) {
            close(m_listenFd);
            m_listenFd = -1;
        }
        return false;
    };

    if (m_listenFd != -1)
        return fail(QStringLiteral("control server already running"));

    m_state = state;
    m_endpoint = endpoint;
    m_stopping = false;

    if (endpoint.kind == ControlEndpoint::Unix) {
        const QByteArray path = QFile::encodeName(endpoint.path);
        struct sockaddr_un addr;
        memset(&addr, 0, sizeof addr);
        if (size_t(path.size()) >= sizeof(addr.sun_path))
            return fail(QStringLiteral("unix socket path too long: %1").arg(endpoint.path));
        addr.sun_family = AF_UNIX;
        memcpy(addr.sun_path, path.constData(), size_t(path.size()));

        if (unlink(path.constData()) == -1 && errno != ENOENT)
            return fail(socketError("failed to remove stale socket"));

        m_listenFd = socket(AF_UNIX, SOCK_STREAM, 0);
        if (m_listenFd == -1)
            return fail(socketError("failed to create socket"));
        if (bind(m_listenFd, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) == -1)
            return fail(socketError("failed to bind socket"));
        if (chmod(path.constData(), 0600) == -1)
            return fail(socketError("failed to set socket permissions"));
    } else {
        struct sockaddr_storage storage;
        socklen_t length = 0;
        memset(&storage, 0, sizeof storage);
        const QByteArray host = endpoint.host.toLatin1();
        if (endpoint.ipv6) {
            struct sockaddr_in6 *addr = reinterpret_cast<struct sockaddr_in6 *>(&storage);
            addr->sin6_family = AF_INET6;
            addr->sin6_port = htons(endpoint.port);
            if (inet_pton(AF_INET6, host.constData(), &addr->sin6_addr) != 1)
                return fail(QStringLiteral("invalid IP address '%1'").arg(endpoint.host));
            length = sizeof(*addr);
        } else {
            struct sockaddr_in *addr = reinterpret_cast<struct sockaddr_in *>(&storage);
            addr->sin_family = AF_INET;
            addr->sin_port = htons(endpoint.port);
            if (inet_pton(AF_INET, host.constData(), &addr->sin_addr) != 1)
                return fail(QStringLiteral("invalid IP address '%1'").arg(endpoint.host));
            length = sizeof(*addr);
        }

        m_listenFd = socket(endpoint.ipv6 ? AF_INET6 : AF_INET, SOCK_STREAM, 0);
        if (m_listenFd == -1)
            return fail(socketError("failed to create socket"));
        int on = 1;
        if (setsockopt(m_listenFd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) == -1)
            qWarning() << "Control:" << socketError("setsockopt(SO_REUSEADDR) failed");
        if (bind(m_listenFd, reinterpret_cast<struct sockaddr *>(&storage), length) == -1)
            return fail(socketError("failed to bind socket"));

        struct sockaddr_storage bound;
        socklen_t boundLength = sizeof(bound);
        if (getsockname(m_listenFd, reinterpret_cast<struct sockaddr *>(&bound), &boundLength) == 0) {
            if (bound.ss_family == AF_INET6)
                m_port = ntohs(reinterpret_cast<struct sockaddr_in6 *>(&bound)->sin6_port);
            else
                m_port = ntohs(reinterpret_cast<struct sockaddr_in *>(&bound)->sin_port);
        }
    }

    set_nonblocking(m_listenFd, true);
    if (listen(m_listenFd, SOMAXCONN) == -1)
        return fail(socketError("failed to listen on socket"));

    qInfo() << "Control: listening on" << endpoint.toString();
    m_acceptThread = std::thread(&ControlServer::acceptLoop, this);
    return true;
}

void ControlServer::stop()
{
    if (m_listenFd == -1)
        return;

    m_stopping = true;
    if (m_acceptThread.joinable())
        m_acceptThread.join();

    std::vector<ClientThread> clients;
    {
        std::lock_guard<std::mutex> lg(m_clientsMutex);
        clients.swap(m_clients);
    }
    for (ClientThread &client : clients)
        client.thread.join();

    close(m_listenFd);
    m_listenFd = -1;
    if (m_endpoint.kind == ControlEndpoint::Unix)
        unlink(QFile::encodeName(m_endpoint.path).constData());
    qInfo() << "Control: server stopped";
}

int ControlServer::clientCount() const
{
    std::lock_guard<std::mutex> lg(m_clientsMutex);
    return int(m_clients.size());
}

void ControlServer::reapClients()
{
    std::vector<ClientThread> finished;
    {
        std::lock_guard<std::mutex> lg(m_clientsMutex);
        auto it = m_clients.begin();
        while (it != m_clients.end()) {
            if (it->done->load()) {
                finished.push_back(std::move(*it));
                it = m_clients.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (ClientThread &client : finished)
        client.thread.join();
}

void ControlServer::acceptLoop()
{
    while (!m_stopping) {
        reapClients();
        int ret = waitReadable(m_listenFd);
        if (ret == -1) {
            qWarning() << "Control:" << socketError("accept wait failed");
            return;
        }
        if (ret == 0)
            continue;

        struct sockaddr_storage peer;
        socklen_t peerLength = sizeof(peer);
        memset(&peer, 0, sizeof peer);
        int fd = accept(m_listenFd, reinterpret_cast<struct sockaddr *>(&peer), &peerLength);
        if (fd == -1) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                qWarning() << "Control:" << socketError("accept failed");
            continue;
        }
        set_nonblocking(fd, true);

        QString client = QStringLiteral("unix");
        if (m_endpoint.kind == ControlEndpoint::Tcp) {
            client = peerLabel(peer);
            // Disable Nagle for low latency
            int on = 1;
            if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on)) == -1)
                qWarning() << "Control:" << socketError("setsockopt(TCP_NODELAY) failed");
        }
        qDebug() << "Control: client connected:" << client;

        ClientThread thread;
        thread.done = std::make_shared<std::atomic<bool>>(false);
        thread.thread = std::thread(&ControlServer::serveClient, this, fd, client, thread.done);
        std::lock_guard<std::mutex> lg(m_clientsMutex);
        m_clients.push_back(std::move(thread));
    }
}

void ControlServer::serveClient(int fd, QString client, std::shared_ptr<std::atomic<bool>> done)
{
    QByteArray buffer;
    char chunk[4096];
    bool open = true;
    bool overlong = false;

    while (open && !m_stopping) {
        int ret = waitReadable(fd);
        if (ret == -1)
            break;
        if (ret == 0)
            continue;

        ssize_t rv = recv(fd, chunk, sizeof(chunk), 0);
        if (rv == 0)
            break;
        if (rv < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                continue;
            qWarning() << "Control:" << socketError("connection error") << "from" << client;
            break;
        }
        buffer.append(chunk, int(rv));

        qsizetype lineStart = 0;
        qsizetype lineEnd;
        while ((lineEnd = buffer.indexOf('\n', lineStart)) != -1) {
            QByteArray line = buffer.mid(lineStart, lineEnd - lineStart);
            lineStart = lineEnd + 1;
            if (line.size() > MaxLineBytes) {
                overlong = true;
                break;
            }
            if (line.endsWith('\r'))
                line.chop(1);
            if (line.trimmed().isEmpty())
                continue;
            if (!writeAll(fd, handleRequestLine(line, *m_state, client) + '\n')) {
                open = false;
                break;
            }
        }
        // Shift the buffer down so the unprocessed data is at the start
        buffer.remove(0, lineStart);

        if (!open)
            break;
        if (overlong || buffer.size() > MaxLineBytes) {
            const QString error = QStringLiteral("invalid request: line exceeds %1 bytes").arg(MaxLineBytes);
            if (!writeAll(fd, rejectRequestLine(*m_state, client, error) + '\n'))
                qDebug() << "Control: could not report overlong line to" << client;
            break;
        }
    }

    qDebug() << "Control: client disconnected:" << client;
    close(fd);
    done->store(true);
}
