#pragma once

#include <QPair>
#include <QString>

// Join directory and entry name with a single '/'
QString joinPath(const QString& dir, const QString& name);

// "/a/b/c.txt" -> "/a/b", "/c.txt" -> "/", "c.txt" -> ""
QString parentPath(const QString& path);

// "/a/b/c.txt" -> "c.txt"
QString fileNameOf(const QString& path);

// Split entry name into base name and extension (extension keeps its dot)
// Handles hidden files like ".gitignore" correctly:
// - ".gitignore"     -> {".gitignore", ""}
// - ".bashrc.backup" -> {".bashrc", ".backup"}
// - "file.tar.gz"    -> {"file.tar", ".gz"}
// - "file"           -> {"file", ""}
// For directories, extension is always empty
QPair<QString, QString> splitFileName(const QString& name, bool isDirectory);

// True if both paths name the same directory after cleanup
bool isSamePath(const QString& a, const QString& b);

// True if 'path' equals 'ancestor' or lies below it
bool isSameOrDescendant(const QString& ancestor, const QString& path);
