#ifndef CONFLICTRESOLVER_H
#define CONFLICTRESOLVER_H

#include <QString>

class StorageProvider;

// Picks a free destination name when the desired one is occupied.
// Occupancy is decided by an explicit exists() check, so a failing write is
// never mistaken for a naming conflict. The number of candidates checked is
// bounded; running out throws ConflictExhaustedError.
class ConflictResolver {
public:
    enum class Style {
        Numbered,           // "name (1).ext", "name (2).ext", ...
        SameDirectoryCopy   // "name (Copy).ext", "name (Copy 2).ext", ...
    };

    static constexpr int DefaultMaxAttempts = 100;

    explicit ConflictResolver(StorageProvider& storage, int maxAttempts = DefaultMaxAttempts);

    // Returns desiredPath itself when free (Numbered style only), otherwise the
    // first free candidate in the same directory.
    QString resolve(const QString& desiredPath, bool isDirectory,
                    Style style = Style::Numbered) const;

    // n starts at 1
    static QString candidateName(const QString& name, bool isDirectory, int n, Style style);

    int maxAttempts() const { return m_maxAttempts; }

private:
    StorageProvider& m_storage;
    int m_maxAttempts;
};

#endif // CONFLICTRESOLVER_H
