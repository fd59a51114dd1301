#include "core/debug/source_registry.h"

#include <utility>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QPair>

namespace {

QString normalizedPath(const QString &path)
{
    return QDir::cleanPath(QDir::fromNativeSeparators(path));
}

} // namespace

QString SourceFile::name() const
{
    return QFileInfo(path).fileName();
}

quint32 SourceRegistry::addFile(const QString &path, const QString &text)
{
    std::lock_guard<std::mutex> lg(m_mutex);
    SourceFile file;
    file.id = quint32(m_files.size()) + 1;
    file.path = normalizedPath(path);
    file.text = text;
    m_files.append(file);
    return file.id;
}

bool SourceRegistry::replaceText(quint32 id, const QString &text)
{
    std::lock_guard<std::mutex> lg(m_mutex);
    for (SourceFile &file : m_files) {
        if (file.id == id) {
            file.text = text;
            return true;
        }
    }
    return false;
}

bool SourceRegistry::loadFiles(const QStringList &paths, SourceRegistry *out, QString *errorOut)
{
    QVector<QPair<QString, QString>> loaded;
    for (const QString &path : paths) {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
            if (errorOut)
                *errorOut = QStringLiteral("could not read source '%1': %2").arg(path, file.errorString());
            return false;
        }
        loaded.append(qMakePair(QFileInfo(path).absoluteFilePath(), QString::fromUtf8(file.readAll())));
    }
    for (const auto &entry : std::as_const(loaded))
        out->addFile(entry.first, entry.second);
    return true;
}

QVector<SourceFile> SourceRegistry::files() const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_files;
}

bool SourceRegistry::isEmpty() const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_files.isEmpty();
}

bool SourceRegistry::fileById(quint32 id, SourceFile *out) const
{
    std::lock_guard<std::mutex> lg(m_mutex);
    for (const SourceFile &file : m_files) {
        if (file.id == id) {
            if (out)
                *out = file;
            return true;
        }
    }
    return false;
}

bool SourceRegistry::fileByPath(const QString &path, SourceFile *out) const
{
    const QString wanted = normalizedPath(path);
    std::lock_guard<std::mutex> lg(m_mutex);
    for (const SourceFile &file : m_files) {
        if (file.path == wanted) {
            if (out)
                *out = file;
            return true;
        }
    }
    return false;
}
