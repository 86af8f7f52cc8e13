#include "transfer/TextClipboard.h"

#include <QClipboard>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QGuiApplication>
#include <QSaveFile>
#include <QStandardPaths>

void QtTextClipboard::write(const QString& text)
{
    QClipboard* clipboard = QGuiApplication::clipboard();
    if (!clipboard) {
        qWarning() << "No system clipboard available";
        return;
    }
    clipboard->setText(text);
}

QString QtTextClipboard::read() const
{
    QClipboard* clipboard = QGuiApplication::clipboard();
    if (!clipboard)
        return QString();
    return clipboard->text();
}

FileTextClipboard::FileTextClipboard(const QString& path)
    : m_path(path)
{
}

QString FileTextClipboard::defaultPath()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    if (base.isEmpty())
        base = QDir::tempPath();
    return QDir(base).filePath("ferry/clipboard.json");
}

void FileTextClipboard::write(const QString& text)
{
    if (text.isEmpty()) {
        if (QFile::exists(m_path) && !QFile::remove(m_path))
            qWarning() << "Could not remove clipboard file" << m_path;
        return;
    }

    QDir().mkpath(QFileInfo(m_path).absolutePath());

    // Readers never see a half written payload
    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "Could not write clipboard file" << m_path << ":" << file.errorString();
        return;
    }
    file.write(text.toUtf8());
    if (!file.commit())
        qWarning() << "Could not write clipboard file" << m_path << ":" << file.errorString();
}

QString FileTextClipboard::read() const
{
    QFile file(m_path);
    if (!file.open(QIODevice::ReadOnly))
        return QString();
    return QString::fromUtf8(file.readAll());
}
