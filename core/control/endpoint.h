#ifndef CONTROL_ENDPOINT_H
#define CONTROL_ENDPOINT_H

#include <QString>

// Where the control server listens: tcp://127.0.0.1:9000, tcp://[::1]:9000
// or unix:///run/plc.sock.
struct ControlEndpoint {
    enum {
        Tcp,
        Unix
    } kind = Unix;
    QString host;       // numeric address without brackets
    bool ipv6 = false;
    quint16 port = 0;
    QString path;       // unix socket path

    QString toString() const;
};

bool parseEndpoint(const QString &text, ControlEndpoint *out, QString *errorOut = nullptr);

#endif
