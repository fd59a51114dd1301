#include "core/runtime/io.h"

#include <QJsonArray>
#include <QStringList>

namespace {

QChar areaChar(IoArea area)
{
    switch (area) {
    case IoArea::Input: return QLatin1Char('I');
    case IoArea::Output: return QLatin1Char('Q');
    case IoArea::Memory: return QLatin1Char('M');
    }
    return QLatin1Char('?');
}

QChar sizeChar(IoSize size)
{
    switch (size) {
    case IoSize::Bit: return QLatin1Char('X');
    case IoSize::Byte: return QLatin1Char('B');
    case IoSize::Word: return QLatin1Char('W');
    case IoSize::DWord: return QLatin1Char('D');
    case IoSize::LWord: return QLatin1Char('L');
    }
    return QLatin1Char('?');
}

bool invalidAddress(const QString &text, QString *errorOut)
{
    if (errorOut)
        *errorOut = QStringLiteral("invalid I/O address '%1'").arg(text);
    return false;
}

QJsonObject entryToJson(const IoSnapshotEntry &entry)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("name"), entry.name.isEmpty() ? QJsonValue() : QJsonValue(entry.name));
    obj.insert(QStringLiteral("address"), formatIoAddress(entry.address));
    if (entry.state == IoSnapshotEntry::Error) {
        QJsonObject error;
        error.insert(QStringLiteral("error"), entry.error);
        obj.insert(QStringLiteral("value"), error);
    } else {
        obj.insert(QStringLiteral("value"), formatIoEntryValue(entry));
    }
    return obj;
}

QJsonArray entriesToJson(const QVector<IoSnapshotEntry> &entries)
{
    QJsonArray array;
    for (const IoSnapshotEntry &entry : entries)
        array.append(entryToJson(entry));
    return array;
}

} // namespace

bool IoAddress::operator==(const IoAddress &other) const
{
    if (area != other.area || size != other.size || wildcard != other.wildcard)
        return false;
    if (wildcard)
        return true;
    return byte == other.byte && bit == other.bit && path == other.path;
}

bool parseIoAddress(const QString &text, IoAddress *out, QString *errorOut)
{
    const QString trimmed = text.trimmed();
    if (!trimmed.startsWith(QLatin1Char('%')) || trimmed.size() < 3)
        return invalidAddress(trimmed, errorOut);

    IoAddress address;
    switch (trimmed.at(1).unicode()) {
    case 'I': address.area = IoArea::Input; break;
    case 'Q': address.area = IoArea::Output; break;
    case 'M': address.area = IoArea::Memory; break;
    default: return invalidAddress(trimmed, errorOut);
    }

    QString rest = trimmed.mid(2);
    const QChar first = rest.at(0);
    switch (first.unicode()) {
    case 'X': address.size = IoSize::Bit; rest.remove(0, 1); break;
    case 'B': address.size = IoSize::Byte; rest.remove(0, 1); break;
    case 'W': address.size = IoSize::Word; rest.remove(0, 1); break;
    case 'D': address.size = IoSize::DWord; rest.remove(0, 1); break;
    case 'L': address.size = IoSize::LWord; rest.remove(0, 1); break;
    case '*':
        address.wildcard = true;
        *out = address;
        return true;
    default:
        if (!first.isDigit())
            return invalidAddress(trimmed, errorOut);
        address.size = IoSize::Bit;
        break;
    }

    if (rest.trimmed() == QStringLiteral("*")) {
        address.wildcard = true;
        *out = address;
        return true;
    }

    const QStringList parts = rest.split(QLatin1Char('.'));
    const int pathParts = (address.size == IoSize::Bit && parts.size() >= 2) ? parts.size() - 1 : parts.size();
    for (int i = 0; i < pathParts; ++i) {
        bool ok = false;
        const uint value = parts[i].toUInt(&ok);
        if (!ok)
            return invalidAddress(trimmed, errorOut);
        address.path.append(value);
    }
    if (pathParts < parts.size()) {
        bool ok = false;
        const uint bit = parts.last().toUInt(&ok);
        if (!ok || bit > 7)
            return invalidAddress(trimmed, errorOut);
        address.bit = quint8(bit);
    }
    if (address.path.isEmpty())
        return invalidAddress(trimmed, errorOut);

    address.byte = address.path.first();
    *out = address;
    return true;
}

QString formatIoAddress(const IoAddress &address)
{
    QString text = QStringLiteral("%");
    text += areaChar(address.area);
    text += sizeChar(address.size);
    if (address.wildcard)
        return text + QLatin1Char('*');
    text += QString::number(address.byte);
    if (address.size == IoSize::Bit)
        text += QStringLiteral(".%1").arg(address.bit);
    return text;
}

QString formatIoEntryValue(const IoSnapshotEntry &entry)
{
    switch (entry.state) {
    case IoSnapshotEntry::Resolved:
        return formatValue(entry.value);
    case IoSnapshotEntry::Unresolved:
        return QStringLiteral("unresolved");
    case IoSnapshotEntry::Error:
        return QStringLiteral("error: %1").arg(entry.error);
    }
    return QString();
}

QJsonObject IoSnapshot::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("inputs"), entriesToJson(inputs));
    obj.insert(QStringLiteral("outputs"), entriesToJson(outputs));
    obj.insert(QStringLiteral("memory"), entriesToJson(memory));
    return obj;
}

QJsonObject IoDriverStatus::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("name"), name);
    switch (health) {
    case Ok:
        obj.insert(QStringLiteral("status"), QStringLiteral("ok"));
        break;
    case Degraded:
        obj.insert(QStringLiteral("status"), QStringLiteral("degraded"));
        obj.insert(QStringLiteral("error"), error);
        break;
    case Faulted:
        obj.insert(QStringLiteral("status"), QStringLiteral("faulted"));
        obj.insert(QStringLiteral("error"), error);
        break;
    }
    return obj;
}
