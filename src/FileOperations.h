#ifndef FILEOPERATIONS_H
#define FILEOPERATIONS_H

#include <QString>

class StorageProvider;

namespace FileOperations {

constexpr int MaxNameLength = 255;

// Throws ValidationError if name is empty, longer than MaxNameLength or
// contains any of < > : " / \ | ? * or NUL
void validateName(const QString& name);

// Non-throwing variant; errorMsg receives the reason
bool isValidName(const QString& name, QString* errorMsg = nullptr);

// Create an empty file / a directory named 'name' inside 'dir'.
// Name is validated before the provider is touched.
// Throws ValidationError, or ProviderError if the name is taken or the
// provider fails. Returns the created path.
QString createNewFile(StorageProvider& storage, const QString& dir, const QString& name);
QString createNewFolder(StorageProvider& storage, const QString& dir, const QString& name);

// Rename an entry of 'dir'. Renaming to the same name is a no-op.
// Throws ValidationError / ProviderError. Returns the new path.
QString renameEntry(StorageProvider& storage, const QString& dir,
                    const QString& oldName, const QString& newName);

} // namespace FileOperations

#endif // FILEOPERATIONS_H
