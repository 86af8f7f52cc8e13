#include "FileOperations.h"
#include "storage/StorageProvider.h"
#include "Errors.h"
#include "PathUtils.h"

#include <QDebug>
#include <QObject>

namespace FileOperations {

bool isValidName(const QString& name, QString* errorMsg)
{
    auto reject = [errorMsg](const QString& reason) {
        if (errorMsg)
            *errorMsg = reason;
        return false;
    };

    if (name.trimmed().isEmpty())
        return reject(QObject::tr("Name cannot be empty"));

    if (name.size() > MaxNameLength)
        return reject(QObject::tr("Name is too long"));

    static const QString invalidChars = QStringLiteral("<>:\"/\\|?*");
    for (const QChar c : name) {
        if (c.isNull() || invalidChars.contains(c))
            return reject(QObject::tr("Name contains invalid characters"));
    }

    return true;
}

void validateName(const QString& name)
{
    QString reason;
    if (!isValidName(name, &reason))
        throw ValidationError(reason);
}

QString createNewFile(StorageProvider& storage, const QString& dir, const QString& name)
{
    validateName(name);

    const QString path = joinPath(dir, name);
    if (storage.exists(path))
        throw ProviderError(QObject::tr("A file with this name already exists"));

    storage.writeEmptyFile(path);
    qDebug() << "Created file" << path;
    return path;
}

QString createNewFolder(StorageProvider& storage, const QString& dir, const QString& name)
{
    validateName(name);

    const QString path = joinPath(dir, name);
    if (storage.exists(path))
        throw ProviderError(QObject::tr("A folder with this name already exists"));

    storage.mkdir(path);
    qDebug() << "Created folder" << path;
    return path;
}

QString renameEntry(StorageProvider& storage, const QString& dir,
                    const QString& oldName, const QString& newName)
{
    validateName(newName);

    const QString oldPath = joinPath(dir, oldName);
    const QString newPath = joinPath(dir, newName);
    if (oldName == newName)
        return newPath;

    if (storage.exists(newPath))
        throw ProviderError(QObject::tr("'%1' already exists").arg(newName));

    storage.rename(oldPath, newPath);
    qDebug() << "Renamed" << oldPath << "->" << newPath;
    return newPath;
}

} // namespace FileOperations
