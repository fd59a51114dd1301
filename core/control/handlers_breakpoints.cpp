#include "core/control/handlers.h"

#include <limits>
#include <utility>

#include <QDebug>
#include <QJsonArray>

#include "core/debug/source_location.h"

namespace {

QString stopReasonName(DebugStopReason reason)
{
    switch (reason) {
    case DebugStopReason::Breakpoint: return QStringLiteral("breakpoint");
    case DebugStopReason::Step: return QStringLiteral("step");
    case DebugStopReason::Pause: return QStringLiteral("pause");
    case DebugStopReason::Entry: return QStringLiteral("entry");
    }
    return QString();
}

QJsonObject stopToJson(const ControlState &state, const DebugStop &stop)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("reason"), stopReasonName(stop.reason));
    obj.insert(QStringLiteral("thread_id"), qint64(stop.threadId));
    obj.insert(QStringLiteral("breakpoint_generation"),
               stop.hasGeneration ? QJsonValue(qint64(stop.breakpointGeneration)) : QJsonValue());
    if (stop.hasLocation) {
        SourceFile file;
        if (state.sources.fileById(stop.location.fileId, &file)) {
            int line = 0, column = 0;
            locationToLineCol(file.text, stop.location, &line, &column);
            obj.insert(QStringLiteral("file_id"), qint64(file.id));
            obj.insert(QStringLiteral("line"), line);
            obj.insert(QStringLiteral("column"), column);
            obj.insert(QStringLiteral("path"), file.path);
        }
    }
    return obj;
}

ControlResponse status(quint64 id, const QString &text)
{
    QJsonObject result;
    result.insert(QStringLiteral("status"), text);
    return ControlResponse::success(id, result);
}

ControlResponse step(const ControlRequest &request, ControlState &state, ControlAction action)
{
    state.debug.applyAction(action);
    return status(request.id, QStringLiteral("stepping"));
}

bool sourceParam(const ControlRequest &request, const ControlState &state, QJsonObject *params,
                 SourceFile *file, QString *errorOut)
{
    QString path;
    if (!requireParams(request, params, errorOut) || !requiredString(*params, "source", &path, errorOut))
        return false;
    if (!state.sources.fileByPath(path, file)) {
        *errorOut = QStringLiteral("unknown source path");
        return false;
    }
    return true;
}

// Reloads swap text and statements together under the metadata lock.
QVector<SourceLocation> statementsFor(ControlState &state, SourceFile *file)
{
    std::lock_guard<std::mutex> lg(state.metadataMutex);
    state.sources.fileById(file->id, file);
    return state.metadata.statements(file->id);
}

} // namespace

bool locationToSource(const ControlState &state, const SourceLocation &location, QJsonObject *source,
                      int *line, int *column)
{
    SourceFile file;
    if (!state.sources.fileById(location.fileId, &file))
        return false;
    locationToLineCol(file.text, location, line, column);
    source->insert(QStringLiteral("name"), file.name());
    source->insert(QStringLiteral("path"), file.path);
    return true;
}

ControlResponse handlePause(const ControlRequest &request, ControlState &state)
{
    if (state.controlMode() == ControlMode::Debug)
        state.debug.applyAction(ControlAction::Pause);
    else if (state.resource)
        state.resource->pause();
    return status(request.id, QStringLiteral("paused"));
}

ControlResponse handleResume(const ControlRequest &request, ControlState &state)
{
    if (state.controlMode() == ControlMode::Debug)
        state.debug.applyAction(ControlAction::Continue);
    else if (state.resource)
        state.resource->resume();
    return status(request.id, QStringLiteral("running"));
}

ControlResponse handleStepIn(const ControlRequest &request, ControlState &state)
{
    return step(request, state, ControlAction::StepIn);
}

ControlResponse handleStepOver(const ControlRequest &request, ControlState &state)
{
    return step(request, state, ControlAction::StepOver);
}

ControlResponse handleStepOut(const ControlRequest &request, ControlState &state)
{
    return step(request, state, ControlAction::StepOut);
}

ControlResponse handleBreakpointsSet(const ControlRequest &request, ControlState &state)
{
    QJsonObject params;
    QString error;
    SourceFile file;
    if (!sourceParam(request, state, &params, &file, &error))
        return ControlResponse::failure(request.id, error);
    QVector<quint64> lines;
    if (!requiredUIntArray(params, "lines", &lines, &error))
        return ControlResponse::failure(request.id, error);

    QVector<DebugBreakpoint> breakpoints;
    QJsonArray resolved;
    {
        std::lock_guard<std::mutex> lg(state.metadataMutex);
        state.sources.fileById(file.id, &file);
        for (quint64 line : std::as_const(lines)) {
            SourceLocation location;
            if (line > quint64(std::numeric_limits<int>::max()))
                continue;
            if (!state.metadata.resolveBreakpointPosition(file.text, file.id, int(line), 0, &location))
                continue;
            bool duplicate = false;
            for (const DebugBreakpoint &existing : std::as_const(breakpoints)) {
                if (existing.location == location)
                    duplicate = true;
            }
            if (duplicate)
                continue;
            DebugBreakpoint bp;
            bp.location = location;
            breakpoints.append(bp);

            int resolvedLine = 0, resolvedColumn = 0;
            locationToLineCol(file.text, location, &resolvedLine, &resolvedColumn);
            QJsonObject entry;
            entry.insert(QStringLiteral("line"), resolvedLine);
            entry.insert(QStringLiteral("column"), resolvedColumn);
            resolved.append(entry);
        }
    }

    state.debug.setBreakpointsForFile(file.id, breakpoints);
    quint64 generation = 0;
    state.debug.breakpointGeneration(file.id, &generation);
    qDebug() << "Control: breakpoints set in" << file.path << "generation" << generation;

    QJsonObject result;
    result.insert(QStringLiteral("status"), QStringLiteral("ok"));
    result.insert(QStringLiteral("file_id"), qint64(file.id));
    result.insert(QStringLiteral("resolved"), resolved);
    result.insert(QStringLiteral("generation"), qint64(generation));
    return ControlResponse::success(request.id, result);
}

ControlResponse handleBreakpointsClear(const ControlRequest &request, ControlState &state)
{
    QJsonObject params;
    QString error;
    SourceFile file;
    if (!sourceParam(request, state, &params, &file, &error))
        return ControlResponse::failure(request.id, error);
    state.debug.setBreakpointsForFile(file.id, QVector<DebugBreakpoint>());
    return status(request.id, QStringLiteral("cleared"));
}

ControlResponse handleBreakpointsClearAll(const ControlRequest &request, ControlState &state)
{
    state.debug.clearBreakpoints();
    return status(request.id, QStringLiteral("cleared"));
}

ControlResponse handleBreakpointsClearId(const ControlRequest &request, ControlState &state)
{
    QJsonObject params;
    QString error;
    quint64 fileId = 0;
    if (!requireParams(request, &params, &error) || !requiredUInt(params, "file_id", &fileId, &error))
        return ControlResponse::failure(request.id, error);
    if (fileId > 0xFFFFFFFFu || !state.sources.fileById(quint32(fileId)))
        return ControlResponse::failure(request.id, QStringLiteral("unknown file id"));

    state.debug.setBreakpointsForFile(quint32(fileId), QVector<DebugBreakpoint>());
    QJsonObject result;
    result.insert(QStringLiteral("status"), QStringLiteral("cleared"));
    result.insert(QStringLiteral("file_id"), qint64(fileId));
    return ControlResponse::success(request.id, result);
}

ControlResponse handleBreakpointsList(const ControlRequest &request, ControlState &state)
{
    QJsonArray list;
    for (const DebugBreakpoint &bp : state.debug.breakpoints()) {
        QJsonObject entry;
        entry.insert(QStringLiteral("file_id"), qint64(bp.location.fileId));
        entry.insert(QStringLiteral("start"), qint64(bp.location.start));
        entry.insert(QStringLiteral("end"), qint64(bp.location.end));
        entry.insert(QStringLiteral("generation"), qint64(bp.generation));
        list.append(entry);
    }
    QJsonObject result;
    result.insert(QStringLiteral("breakpoints"), list);
    return ControlResponse::success(request.id, result);
}

ControlResponse handleBreakpointLocations(const ControlRequest &request, ControlState &state)
{
    QJsonObject params;
    QString error;
    SourceFile file;
    if (!sourceParam(request, state, &params, &file, &error))
        return ControlResponse::failure(request.id, error);

    quint64 line = 0, endLine = 0, column = 0, endColumn = 0;
    bool hasEndLine = false, hasColumn = false, hasEndColumn = false;
    if (!requiredUInt(params, "line", &line, &error)
        || !optionalUInt(params, "end_line", &endLine, &hasEndLine, &error)
        || !optionalUInt(params, "column", &column, &hasColumn, &error)
        || !optionalUInt(params, "end_column", &endColumn, &hasEndColumn, &error))
        return ControlResponse::failure(request.id, error);
    const quint64 maxLine = hasEndLine ? endLine : line;

    QJsonArray breakpoints;
    for (const SourceLocation &location : statementsFor(state, &file)) {
        int locLine = 0, locColumn = 0;
        locationToLineCol(file.text, location, &locLine, &locColumn);
        if (quint64(locLine) < line || quint64(locLine) > maxLine)
            continue;
        if (hasColumn && quint64(locLine) == line && quint64(locColumn) < column)
            continue;
        if (hasEndColumn && quint64(locLine) == maxLine && quint64(locColumn) > endColumn)
            continue;
        QJsonObject entry;
        entry.insert(QStringLiteral("line"), locLine);
        entry.insert(QStringLiteral("column"), locColumn);
        breakpoints.append(entry);
    }

    QJsonObject result;
    result.insert(QStringLiteral("breakpoints"), breakpoints);
    return ControlResponse::success(request.id, result);
}

ControlResponse handleDebugState(const ControlRequest &request, ControlState &state)
{
    DebugStop stop;
    QJsonObject result;
    result.insert(QStringLiteral("paused"), state.debug.isPaused());
    if (state.debug.lastStop(&stop))
        result.insert(QStringLiteral("last_stop"), stopToJson(state, stop));
    else
        result.insert(QStringLiteral("last_stop"), QJsonValue());
    return ControlResponse::success(request.id, result);
}

ControlResponse handleDebugStops(const ControlRequest &request, ControlState &state)
{
    QJsonArray stops;
    for (const DebugStop &stop : state.debug.drainStops())
        stops.append(stopToJson(state, stop));
    QJsonObject result;
    result.insert(QStringLiteral("stops"), stops);
    return ControlResponse::success(request.id, result);
}

ControlResponse handleDebugStack(const ControlRequest &request, ControlState &state)
{
    DebugSnapshot snapshot;
    if (!state.debug.snapshot(&snapshot))
        return ControlResponse::failure(request.id, QStringLiteral("no snapshot available"));

    const QHash<quint32, SourceLocation> frameLocations = state.debug.frameLocations();
    DebugStop lastStop;
    const bool hasFallback = state.debug.lastStop(&lastStop) && lastStop.hasLocation;

    auto frameJson = [&state](quint32 id, const QString &name, const SourceLocation &location,
                              QJsonArray *out) {
        QJsonObject source;
        int line = 0, column = 0;
        if (!locationToSource(state, location, &source, &line, &column))
            return;
        QJsonObject frame;
        frame.insert(QStringLiteral("id"), qint64(id));
        frame.insert(QStringLiteral("name"), name);
        frame.insert(QStringLiteral("source"), source);
        frame.insert(QStringLiteral("line"), line);
        frame.insert(QStringLiteral("column"), column);
        out->append(frame);
    };

    QJsonArray frames;
    const QVector<CallFrame> &callFrames = snapshot.storage.frames();
    if (callFrames.isEmpty()) {
        if (hasFallback)
            frameJson(0, QStringLiteral("Main"), lastStop.location, &frames);
    } else {
        for (int i = callFrames.size() - 1; i >= 0; --i) {
            const CallFrame &frame = callFrames.at(i);
            auto it = frameLocations.constFind(frame.id);
            if (it != frameLocations.constEnd())
                frameJson(frame.id, frame.owner, it.value(), &frames);
            else if (hasFallback)
                frameJson(frame.id, frame.owner, lastStop.location, &frames);
        }
    }

    QJsonObject result;
    result.insert(QStringLiteral("stack_frames"), frames);
    result.insert(QStringLiteral("total_frames"), frames.size());
    return ControlResponse::success(request.id, result);
}
