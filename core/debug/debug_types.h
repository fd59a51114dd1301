#ifndef DEBUG_TYPES_H
#define DEBUG_TYPES_H

#include <QtGlobal>

#include "core/runtime/storage.h"

// Character span of a statement inside a registered source file.
struct SourceLocation {
    quint32 fileId = 0;
    quint32 start = 0;
    quint32 end = 0;

    bool operator==(const SourceLocation &other) const
    {
        return fileId == other.fileId && start == other.start && end == other.end;
    }
    bool operator!=(const SourceLocation &other) const { return !(*this == other); }
};

struct DebugBreakpoint {
    SourceLocation location;
    quint64 generation = 0;
};

enum class DebugStopReason {
    Breakpoint,
    Step,
    Pause,
    Entry
};

struct DebugStop {
    DebugStopReason reason = DebugStopReason::Pause;
    quint32 threadId = 1;
    bool hasGeneration = false;
    quint64 breakpointGeneration = 0;
    bool hasLocation = false;
    SourceLocation location;
};

// Frozen copy of variable storage. Never mutated once published.
struct DebugSnapshot {
    VariableStorage storage;
    qint64 timestampMs = 0;
};

enum class DebugMode {
    Running,
    Paused
};

enum class ControlAction {
    Pause,
    Continue,
    StepIn,
    StepOver,
    StepOut
};

enum class ControlOutcome {
    Applied,
    Ignored
};

#endif
