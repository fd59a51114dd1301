#ifndef RUNTIME_IO_H
#define RUNTIME_IO_H

#include <QJsonObject>
#include <QString>
#include <QVector>

#include "core/runtime/value.h"

enum class IoArea {
    Input,
    Output,
    Memory
};

enum class IoSize {
    Bit,
    Byte,
    Word,
    DWord,
    LWord
};

// Direct representation address: %IX0.1, %QW2, %MD4, %IX* ...
struct IoAddress {
    IoArea area = IoArea::Input;
    IoSize size = IoSize::Bit;
    quint32 byte = 0;
    quint8 bit = 0;
    QVector<quint32> path;
    bool wildcard = false;

    bool operator==(const IoAddress &other) const;
};

bool parseIoAddress(const QString &text, IoAddress *out, QString *errorOut = nullptr);
QString formatIoAddress(const IoAddress &address);

struct IoSnapshotEntry {
    enum State {
        Resolved,
        Unresolved,
        Error
    } state = Resolved;
    QString name; // empty when the binding is anonymous
    IoAddress address;
    Value value;
    QString error;
};

struct IoSnapshot {
    QVector<IoSnapshotEntry> inputs;
    QVector<IoSnapshotEntry> outputs;
    QVector<IoSnapshotEntry> memory;

    bool isEmpty() const { return inputs.isEmpty() && outputs.isEmpty() && memory.isEmpty(); }
    QJsonObject toJson() const;
};

QString formatIoEntryValue(const IoSnapshotEntry &entry);

struct IoDriverStatus {
    enum Health {
        Ok,
        Degraded,
        Faulted
    } health = Ok;
    QString name;
    QString error;

    QJsonObject toJson() const;
};

#endif
