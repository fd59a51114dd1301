#ifndef CONTROL_SERVER_H
#define CONTROL_SERVER_H

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <QString>

#include "core/control/endpoint.h"

struct ControlState;

/* Line-oriented socket server in front of the request dispatcher.
 *
 * One thread accepts connections and every client gets a thread of its own
 * that reads newline-terminated requests and writes one response line per
 * request. */
class ControlServer
{
public:
    static constexpr int MaxLineBytes = 1024 * 1024;

    ControlServer() = default;
    ~ControlServer();
    ControlServer(const ControlServer &) = delete;
    ControlServer &operator=(const ControlServer &) = delete;

    bool start(const ControlEndpoint &endpoint, ControlState *state, QString *errorOut = nullptr);
    // Closes the listening socket and joins every client thread.
    void stop();
    bool isRunning() const { return m_listenFd != -1; }
    // The bound TCP port; useful when listening on port 0.
    quint16 port() const { return m_port; }
    // Client threads not yet joined. Finished clients are reaped by the accept loop.
    int clientCount() const;

private:
    struct ClientThread
    {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void acceptLoop();
    void reapClients();
    void serveClient(int fd, QString client, std::shared_ptr<std::atomic<bool>> done);

    ControlState *m_state = nullptr;
    ControlEndpoint m_endpoint;
    int m_listenFd = -1;
    quint16 m_port = 0;
    std::atomic<bool> m_stopping{false};
    std::thread m_acceptThread;

    mutable std::mutex m_clientsMutex;
    std::vector<ClientThread> m_clients;
};

#endif
