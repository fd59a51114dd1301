#ifndef CONTROL_HANDLERS_H
#define CONTROL_HANDLERS_H

#include <QJsonObject>
#include <QString>
#include <QVector>

#include "core/control/control_state.h"
#include "core/control/dispatcher.h"

typedef ControlResponse (*ControlHandler)(const ControlRequest &request, ControlState &state);

// nullptr for unknown request types
ControlHandler findControlHandler(const QString &type);

/* Parameter helpers. All of them write "missing params" or
 * "invalid params: <detail>" on failure. */
bool requireParams(const ControlRequest &request, QJsonObject *out, QString *errorOut);
bool requiredString(const QJsonObject &params, const char *key, QString *out, QString *errorOut);
bool requiredUInt(const QJsonObject &params, const char *key, quint64 *out, QString *errorOut);
bool optionalUInt(const QJsonObject &params, const char *key, quint64 *out, bool *present, QString *errorOut);
bool requiredUIntArray(const QJsonObject &params, const char *key, QVector<quint64> *out, QString *errorOut);

// Runtime family
ControlResponse handleStatus(const ControlRequest &request, ControlState &state);
ControlResponse handleHealth(const ControlRequest &request, ControlState &state);
ControlResponse handleEventsTail(const ControlRequest &request, ControlState &state);
ControlResponse handleFaults(const ControlRequest &request, ControlState &state);
ControlResponse handleShutdown(const ControlRequest &request, ControlState &state);
ControlResponse handleRestart(const ControlRequest &request, ControlState &state);
ControlResponse handleBytecodeReload(const ControlRequest &request, ControlState &state);
ControlResponse handleIoList(const ControlRequest &request, ControlState &state);
ControlResponse handleIoRead(const ControlRequest &request, ControlState &state);
ControlResponse handleIoWrite(const ControlRequest &request, ControlState &state);
ControlResponse handleIoForce(const ControlRequest &request, ControlState &state);
ControlResponse handleIoUnforce(const ControlRequest &request, ControlState &state);

// Settings
ControlResponse handleConfigGet(const ControlRequest &request, ControlState &state);
ControlResponse handleConfigSet(const ControlRequest &request, ControlState &state);

// Execution control, breakpoints and stops
ControlResponse handlePause(const ControlRequest &request, ControlState &state);
ControlResponse handleResume(const ControlRequest &request, ControlState &state);
ControlResponse handleStepIn(const ControlRequest &request, ControlState &state);
ControlResponse handleStepOver(const ControlRequest &request, ControlState &state);
ControlResponse handleStepOut(const ControlRequest &request, ControlState &state);
ControlResponse handleBreakpointsSet(const ControlRequest &request, ControlState &state);
ControlResponse handleBreakpointsClear(const ControlRequest &request, ControlState &state);
ControlResponse handleBreakpointsClearAll(const ControlRequest &request, ControlState &state);
ControlResponse handleBreakpointsClearId(const ControlRequest &request, ControlState &state);
ControlResponse handleBreakpointsList(const ControlRequest &request, ControlState &state);
ControlResponse handleBreakpointLocations(const ControlRequest &request, ControlState &state);
ControlResponse handleDebugState(const ControlRequest &request, ControlState &state);
ControlResponse handleDebugStops(const ControlRequest &request, ControlState &state);
ControlResponse handleDebugStack(const ControlRequest &request, ControlState &state);

// Variables, evaluation and forcing
ControlResponse handleDebugScopes(const ControlRequest &request, ControlState &state);
ControlResponse handleDebugVariables(const ControlRequest &request, ControlState &state);
ControlResponse handleDebugEvaluate(const ControlRequest &request, ControlState &state);
ControlResponse handleEval(const ControlRequest &request, ControlState &state);
ControlResponse handleSet(const ControlRequest &request, ControlState &state);
ControlResponse handleVarForce(const ControlRequest &request, ControlState &state);
ControlResponse handleVarUnforce(const ControlRequest &request, ControlState &state);
ControlResponse handleVarForced(const ControlRequest &request, ControlState &state);

/* Resolves a statement location to {name, path} plus its 0-based line and
 * column. False when the file is not registered. */
bool locationToSource(const ControlState &state, const SourceLocation &location, QJsonObject *source,
                      int *line, int *column);

// "TRUE", "FALSE" or a 64-bit integer
bool parseControlValue(const QString &text, Value *out, QString *errorOut);

#endif
