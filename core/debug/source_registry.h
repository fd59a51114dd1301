#ifndef DEBUG_SOURCE_REGISTRY_H
#define DEBUG_SOURCE_REGISTRY_H

#include <mutex>

#include <QString>
#include <QStringList>
#include <QVector>

struct SourceFile {
    quint32 id = 0;
    QString path;
    QString text;

    // Base name shown to debug clients.
    QString name() const;
};

/* Maps source paths to stable file ids and text. Files are added while the
 * runtime loads; a reload may replace a file's text but never its id or
 * path. Lookups hand out copies. */
class SourceRegistry
{
public:
    quint32 addFile(const QString &path, const QString &text);
    // False when no file has this id.
    bool replaceText(quint32 id, const QString &text);
    static bool loadFiles(const QStringList &paths, SourceRegistry *out, QString *errorOut = nullptr);

    QVector<SourceFile> files() const;
    bool isEmpty() const;
    bool fileById(quint32 id, SourceFile *out = nullptr) const;
    bool fileByPath(const QString &path, SourceFile *out = nullptr) const;

private:
    mutable std::mutex m_mutex;
    QVector<SourceFile> m_files;
};

#endif
