#include "core/debug/source_location.h"

#include <algorithm>

namespace {

QVector<int> lineStarts(const QString &text)
{
    QVector<int> starts;
    starts.append(0);
    for (int i = 0; i < text.size(); ++i) {
        if (text.at(i) == QLatin1Char('\n'))
            starts.append(i + 1);
    }
    return starts;
}

int lineIndexFor(const QVector<int> &starts, int offset)
{
    auto it = std::upper_bound(starts.begin(), starts.end(), offset);
    return int(it - starts.begin()) - 1;
}

} // namespace

bool resolveBreakpointLocation(const QString &text, quint32 fileId,
                               const QVector<SourceLocation> &statements,
                               int line, int column, SourceLocation *out)
{
    const QVector<int> starts = lineStarts(text);
    if (line < 0 || line >= starts.size() || column < 0)
        return false;

    const int lineStart = starts[line];
    const int lineEnd = line + 1 < starts.size() ? starts[line + 1] - 1 : text.size();
    const quint32 offset = quint32(std::min(lineStart + column, lineEnd));

    const SourceLocation *before = nullptr;
    int beforeColumn = -1;
    const SourceLocation *after = nullptr;
    int afterColumn = -1;
    for (const SourceLocation &stmt : statements) {
        if (stmt.fileId != fileId)
            continue;
        if (lineIndexFor(starts, int(stmt.start)) != line)
            continue;
        const int stmtColumn = int(stmt.start) - lineStart;
        if (stmtColumn <= column) {
            if (!before || stmtColumn > beforeColumn) {
                before = &stmt;
                beforeColumn = stmtColumn;
            }
        } else if (!after || stmtColumn < afterColumn) {
            after = &stmt;
            afterColumn = stmtColumn;
        }
    }
    if (before || after) {
        *out = before ? *before : *after;
        return true;
    }

    const SourceLocation *containing = nullptr;
    for (const SourceLocation &stmt : statements) {
        if (stmt.fileId != fileId || stmt.start > offset || offset > stmt.end)
            continue;
        if (!containing || stmt.end - stmt.start < containing->end - containing->start)
            containing = &stmt;
    }
    if (containing) {
        *out = *containing;
        return true;
    }

    const SourceLocation *next = nullptr;
    for (const SourceLocation &stmt : statements) {
        if (stmt.fileId != fileId || stmt.start < offset)
            continue;
        if (!next || stmt.start < next->start)
            next = &stmt;
    }
    if (!next)
        return false;
    *out = *next;
    return true;
}

void offsetToLineCol(const QString &text, quint32 offset, int *line, int *column)
{
    const QVector<int> starts = lineStarts(text);
    const int index = std::max(0, lineIndexFor(starts, int(offset)));
    *line = index;
    *column = std::max(0, int(offset) - starts[index]);
}

void locationToLineCol(const QString &text, const SourceLocation &location, int *line, int *column)
{
    offsetToLineCol(text, location.start, line, column);
}
