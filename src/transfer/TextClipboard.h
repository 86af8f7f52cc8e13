#pragma once

#include <QString>

// System text clipboard, used as a fallback channel for the clipboard entry
class TextClipboard {
public:
    virtual ~TextClipboard() = default;

    virtual void write(const QString& text) = 0;
    virtual QString read() const = 0;
};

// QClipboard binding. Needs a QGuiApplication and must be used from the GUI
// thread.
class QtTextClipboard : public TextClipboard {
public:
    void write(const QString& text) override;
    QString read() const override;
};

// Clipboard text kept in a file, so an entry outlives the process that set
// it. Writing an empty string removes the file.
class FileTextClipboard : public TextClipboard {
public:
    explicit FileTextClipboard(const QString& path);

    // $XDG_RUNTIME_DIR/ferry/clipboard.json, or the temp dir without one
    static QString defaultPath();

    void write(const QString& text) override;
    QString read() const override;

    QString path() const { return m_path; }

private:
    QString m_path;
};
