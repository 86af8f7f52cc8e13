#ifndef CLIPBOARDSTORE_H
#define CLIPBOARDSTORE_H

#include <QMutex>
#include <QString>
#include <QStringList>

#include <optional>

class StorageProvider;
class TextClipboard;

enum class ClipboardMode { Copy, Cut };

struct ClipboardEntry {
    ClipboardMode mode = ClipboardMode::Copy;
    QStringList files;     // entry names, in selection order
    QString sourceDir;
};

// Single pending copy/cut request. Each set replaces the previous entry.
// The entry is mirrored as JSON into the text clipboard:
//   {"action":"copy","files":[{"name":..,"path":..,"isDirectory":..}]}
// current() prefers the in-memory entry and falls back to that text.
class ClipboardStore {
public:
    // Both collaborators are optional: without a text clipboard the store is
    // memory-only, without storage "isDirectory" is always false.
    explicit ClipboardStore(TextClipboard* textClipboard = nullptr,
                            StorageProvider* storage = nullptr);

    void setCopy(const QStringList& files, const QString& sourceDir);
    void setCut(const QStringList& files, const QString& sourceDir);
    void clear();

    std::optional<ClipboardEntry> current() const;

    // Bumped by every set and clear
    quint64 generation() const;

    // Clears only if nothing was set or cleared since 'generation' was read.
    // Returns true if the store was cleared.
    bool clearIfUnchanged(quint64 generation);

    QString serialize(const ClipboardEntry& entry) const;
    static std::optional<ClipboardEntry> deserialize(const QString& text);

private:
    void set(ClipboardEntry entry);

    mutable QMutex m_mutex;
    std::optional<ClipboardEntry> m_entry;
    quint64 m_generation = 0;
    TextClipboard* m_textClipboard;
    StorageProvider* m_storage;
};

#endif // CLIPBOARDSTORE_H
