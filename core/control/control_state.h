#ifndef CONTROL_STATE_H
#define CONTROL_STATE_H

#include <atomic>
#include <mutex>

#include <QElapsedTimer>
#include <QString>
#include <QVector>

#include "core/debug/debug_control.h"
#include "core/debug/source_registry.h"
#include "core/debug/variable_handles.h"
#include "core/runtime/events.h"
#include "core/runtime/io.h"
#include "core/runtime/metadata.h"
#include "core/runtime/resource.h"
#include "core/runtime/settings.h"

class AuditChannel;

/* Process-wide state behind the control service.
 *
 * Every field group has its own lock. Locks nest in one order only:
 * handlesMutex may be held while taking the debug control's lock or the
 * source registry's, and metadataMutex while taking the registry's. No
 * other lock is held while taking another. Cross-group reads are not
 * transactional. The resource and the audit
 * channel are owned elsewhere and must outlive the state. */
struct ControlState {
    ControlState();

    QString resourceName;
    ExecutionController *resource = nullptr;
    DebugControl debug;
    SourceRegistry sources;          // text changes only through publishProgram()
    AuditChannel *audit = nullptr;   // null when nobody consumes audit events
    bool authRequired = false;       // set for TCP endpoints
    QString settingsPath;            // INI file config.set writes back to
    QElapsedTimer uptime;

    mutable std::mutex metadataMutex;
    RuntimeMetadata metadata;

    mutable std::mutex settingsMutex;
    RuntimeSettings settings;

    std::atomic<bool> debugEnabled;
    EventLog events;

    mutable std::mutex handlesMutex;
    VariableHandleArena handles;

    QString authToken() const;
    void setAuthToken(const QString &token);
    ControlMode controlMode() const;
    void setControlMode(ControlMode mode);

    void setIoSnapshot(const IoSnapshot &snapshot);
    bool ioSnapshot(IoSnapshot *out) const;
    void setIoDrivers(const QVector<IoDriverStatus> &drivers);
    QVector<IoDriverStatus> ioDrivers() const;

    /* Called by the execution thread after a reload: swaps the file's text
     * and the metadata together and drops breakpoints and frame locations
     * that pointed into the old text. */
    void publishProgram(quint32 fileId, const QString &text, const RuntimeMetadata &programMetadata);

    void requestRestart(RestartMode mode);
    bool takePendingRestart(RestartMode *out);

    ResourceState resourceState() const;
    QString resourceError() const;

private:
    mutable std::mutex m_authMutex;
    QString m_authToken; // empty when unset

    mutable std::mutex m_modeMutex;
    ControlMode m_controlMode = ControlMode::Production;

    mutable std::mutex m_ioMutex;
    bool m_hasIoSnapshot = false;
    IoSnapshot m_ioSnapshot;
    QVector<IoDriverStatus> m_ioDrivers;

    mutable std::mutex m_restartMutex;
    bool m_hasPendingRestart = false;
    RestartMode m_pendingRestart = RestartMode::Warm;
};

#endif
