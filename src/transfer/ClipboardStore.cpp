#include "transfer/ClipboardStore.h"
#include "transfer/TextClipboard.h"
#include "storage/StorageProvider.h"
#include "PathUtils.h"

#include <QDebug>
#include <QMutexLocker>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

ClipboardStore::ClipboardStore(TextClipboard* textClipboard, StorageProvider* storage)
    : m_textClipboard(textClipboard)
    , m_storage(storage)
{
}

void ClipboardStore::setCopy(const QStringList& files, const QString& sourceDir)
{
    set({ClipboardMode::Copy, files, sourceDir});
}

void ClipboardStore::setCut(const QStringList& files, const QString& sourceDir)
{
    set({ClipboardMode::Cut, files, sourceDir});
}

void ClipboardStore::set(ClipboardEntry entry)
{
    const QString text = serialize(entry);
    {
        QMutexLocker lock(&m_mutex);
        m_entry = std::move(entry);
        ++m_generation;
    }
    if (m_textClipboard)
        m_textClipboard->write(text);
}

void ClipboardStore::clear()
{
    {
        QMutexLocker lock(&m_mutex);
        m_entry.reset();
        ++m_generation;
    }
    if (m_textClipboard)
        m_textClipboard->write(QString());
}

quint64 ClipboardStore::generation() const
{
    QMutexLocker lock(&m_mutex);
    return m_generation;
}

bool ClipboardStore::clearIfUnchanged(quint64 generation)
{
    {
        QMutexLocker lock(&m_mutex);
        if (generation != m_generation) {
            qDebug() << "Clipboard changed since generation" << generation << ", keeping it";
            return false;
        }
        m_entry.reset();
        ++m_generation;
    }
    if (m_textClipboard)
        m_textClipboard->write(QString());
    return true;
}

std::optional<ClipboardEntry> ClipboardStore::current() const
{
    {
        QMutexLocker lock(&m_mutex);
        if (m_entry)
            return m_entry;
    }

    if (!m_textClipboard)
        return std::nullopt;

    const QString text = m_textClipboard->read();
    if (text.trimmed().isEmpty())
        return std::nullopt;
    return deserialize(text);
}

QString ClipboardStore::serialize(const ClipboardEntry& entry) const
{
    json files = json::array();
    for (const QString& name : entry.files) {
        const QString path = joinPath(entry.sourceDir, name);

        bool isDirectory = false;
        if (m_storage) {
            try {
                isDirectory = m_storage->isDirectory(path);
            } catch (const std::exception& e) {
                qDebug() << "Cannot stat" << path << ":" << e.what();
            }
        }

        files.push_back({
            {"name", name.toStdString()},
            {"path", path.toStdString()},
            {"isDirectory", isDirectory},
        });
    }

    json payload = {
        {"action", entry.mode == ClipboardMode::Cut ? "cut" : "copy"},
        {"files", files},
    };
    return QString::fromStdString(payload.dump());
}

std::optional<ClipboardEntry> ClipboardStore::deserialize(const QString& text)
{
    try {
        const json payload = json::parse(text.toStdString());

        const std::string action = payload.at("action").get<std::string>();
        ClipboardEntry entry;
        if (action == "copy")
            entry.mode = ClipboardMode::Copy;
        else if (action == "cut")
            entry.mode = ClipboardMode::Cut;
        else
            return std::nullopt;

        for (const json& file : payload.at("files")) {
            const QString name = QString::fromStdString(file.at("name").get<std::string>());
            const QString path = QString::fromStdString(file.at("path").get<std::string>());
            if (entry.files.isEmpty())
                entry.sourceDir = parentPath(path);
            entry.files.append(name);
        }

        if (entry.files.isEmpty())
            return std::nullopt;
        return entry;
    }
    catch (const json::exception& e) {
        qDebug() << "Clipboard text is not a transfer payload:" << e.what();
        return std::nullopt;
    }
}
