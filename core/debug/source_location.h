#ifndef DEBUG_SOURCE_LOCATION_H
#define DEBUG_SOURCE_LOCATION_H

#include <QString>
#include <QVector>

#include "core/debug/debug_types.h"

/* Line and column numbers are 0-based and counted in QChar units.
 *
 * Resolution order for a requested (line, column):
 *   1. a statement starting on that line: the one with the largest start
 *      column not after the request, else the first one after it;
 *   2. the smallest statement span containing the requested offset;
 *   3. the first statement starting after the requested offset. */
bool resolveBreakpointLocation(const QString &text, quint32 fileId,
                               const QVector<SourceLocation> &statements,
                               int line, int column, SourceLocation *out);

void offsetToLineCol(const QString &text, quint32 offset, int *line, int *column);
void locationToLineCol(const QString &text, const SourceLocation &location, int *line, int *column);

#endif
