#ifndef RUNTIME_RESOURCE_H
#define RUNTIME_RESOURCE_H

#include <condition_variable>
#include <memory>
#include <mutex>

#include <QByteArray>
#include <QString>

#include "core/runtime/metadata.h"
#include "core/runtime/settings.h"

enum class ResourceState {
    Boot,
    Ready,
    Running,
    Paused,
    Faulted,
    Stopped
};

// "boot", "ready", "running", ...
QString resourceStateName(ResourceState state);

/* One-shot reply slot for a reload. The execution thread resolves or rejects
 * it exactly once; the requester waits with a timeout. */
class ReloadReply
{
public:
    void resolve(const RuntimeMetadata &metadata);
    void reject(const QString &error);
    // Returns false on timeout.
    bool waitFor(int timeoutMs);

    bool succeeded() const;
    RuntimeMetadata metadata() const;
    QString error() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_done;
    bool m_finished = false;
    bool m_ok = false;
    RuntimeMetadata m_metadata;
    QString m_error;
};

struct ResourceCommand {
    enum {
        Pause,
        Resume,
        UpdateWatchdog,
        UpdateFaultPolicy,
        UpdateRetainSaveInterval,
        ReloadBytecode
    } kind = Pause;
    WatchdogPolicy watchdog;
    FaultPolicy faultPolicy = FaultPolicy::SafeHalt;
    qint64 retainSaveIntervalMs = 0;
    QByteArray bytes;
    std::shared_ptr<ReloadReply> reply;
};

/* The execution loop as seen from the control service. Implementations must
 * be safe to call from any control thread. */
class ExecutionController
{
public:
    virtual ~ExecutionController() = default;

    virtual ResourceState state() const = 0;
    // Empty when the resource has not faulted.
    virtual QString lastError() const = 0;
    virtual void pause() = 0;
    virtual void resume() = 0;
    virtual void stop() = 0;
    virtual bool sendCommand(const ResourceCommand &command, QString *errorOut = nullptr) = 0;
};

#endif
