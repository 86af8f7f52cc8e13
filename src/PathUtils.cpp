#include "PathUtils.h"

#include <QDir>

QString joinPath(const QString& dir, const QString& name)
{
    if (dir.isEmpty())
        return name;
    if (dir.endsWith('/'))
        return dir + name;
    return dir + '/' + name;
}

QString parentPath(const QString& path)
{
    QString clean = path;
    while (clean.size() > 1 && clean.endsWith('/'))
        clean.chop(1);

    const int slash = clean.lastIndexOf('/');
    if (slash < 0)
        return QString();
    if (slash == 0)
        return QStringLiteral("/");
    return clean.left(slash);
}

QString fileNameOf(const QString& path)
{
    QString clean = path;
    while (clean.size() > 1 && clean.endsWith('/'))
        clean.chop(1);
    return clean.mid(clean.lastIndexOf('/') + 1);
}

QPair<QString, QString> splitFileName(const QString& name, bool isDirectory)
{
    if (isDirectory)
        return {name, QString()};

    // If name ends with a dot, there's no real extension
    // e.g., "..." should be basename "...", not ".." with empty extension
    if (name.endsWith('.'))
        return {name, QString()};

    const int dot = name.lastIndexOf('.');

    // No dot, or the only dot starts a hidden name
    if (dot <= 0)
        return {name, QString()};

    return {name.left(dot), name.mid(dot)};
}

bool isSamePath(const QString& a, const QString& b)
{
    return QDir::cleanPath(a) == QDir::cleanPath(b);
}

bool isSameOrDescendant(const QString& ancestor, const QString& path)
{
    const QString root = QDir::cleanPath(ancestor);
    const QString candidate = QDir::cleanPath(path);

    if (root == candidate)
        return true;

    QString rootWithSlash = root;
    if (!rootWithSlash.endsWith('/'))
        rootWithSlash += '/';
    return candidate.startsWith(rootWithSlash);
}
