#include "Config.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QDebug>
#include <QStandardPaths>

#include <fstream>
#include <optional>

#include <toml++/toml.h>

namespace {

// Non-positive values fall back to the default
int positiveOr(std::optional<int64_t> value, int fallback)
{
    if (value && *value > 0)
        return static_cast<int>(*value);
    return fallback;
}

} // anonymous namespace

QString Config::defaultConfigPath()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::ConfigLocation);
    if (base.isEmpty())
        base = QDir::homePath() + "/.config";

    QDir dir(base + "/ferry");
    if (!dir.exists())
        dir.mkpath(".");

    return dir.filePath("config.toml");
}

void Config::resetToDefaults()
{
    m_searchDebounceMs = 300;
    m_searchMaxResults = 100;
    m_searchBatchSize = 20;
    m_searchFollowSymlinks = true;
    m_maxConflictAttempts = 100;
    m_verifyCopies = false;
    m_hashAlgorithm = "SHA-256";
    m_preserveTimestamps = true;
    m_notificationDurationMs = 3000;
}

bool Config::load(const QString& path)
{
    m_configPath = path;
    resetToDefaults();

    QFile f(path);
    if (!f.exists()) {
        qDebug() << "Config file does not exist, using defaults.";
        return true;
    }

    try {
        auto tbl = toml::parse_file(path.toStdString());

        // [search] section
        if (auto search = tbl["search"].as_table()) {
            auto& s = *search;
            // zero is allowed: fire immediately
            if (auto ms = s["debounce_ms"].value<int64_t>(); ms && *ms >= 0)
                m_searchDebounceMs = static_cast<int>(*ms);
            m_searchMaxResults = positiveOr(s["max_results"].value<int64_t>(), m_searchMaxResults);
            m_searchBatchSize = positiveOr(s["batch_size"].value<int64_t>(), m_searchBatchSize);
            if (auto follow = s["follow_symlinks"].value<bool>())
                m_searchFollowSymlinks = *follow;
        }

        // [transfer] section
        if (auto transfer = tbl["transfer"].as_table()) {
            auto& t = *transfer;
            m_maxConflictAttempts = positiveOr(t["max_conflict_attempts"].value<int64_t>(),
                                               m_maxConflictAttempts);
            if (auto verify = t["verify_copies"].value<bool>())
                m_verifyCopies = *verify;
            if (auto algo = t["hash_algorithm"].value<std::string>())
                m_hashAlgorithm = QString::fromStdString(*algo);
            if (auto preserve = t["preserve_timestamps"].value<bool>())
                m_preserveTimestamps = *preserve;
        }

        // [notifications] section
        if (auto notifications = tbl["notifications"].as_table()) {
            m_notificationDurationMs = positiveOr((*notifications)["duration_ms"].value<int64_t>(),
                                                  m_notificationDurationMs);
        }
    }
    catch (const std::exception& e) {
        qWarning() << "Failed to parse config.toml:" << e.what();
        return false;
    }

    return true;
}

bool Config::validateToml(const QString& content, QString& errorMsg)
{
    try {
        auto parse_result = toml::parse(content.toStdString());
        return true;
    }
    catch (const toml::parse_error& e) {
        errorMsg = QString::fromStdString(std::string(e.description()));
        if (e.source().begin.line > 0) {
            errorMsg += QString(" (line %1)").arg(e.source().begin.line);
        }
        return false;
    }
    catch (const std::exception& e) {
        errorMsg = QString::fromUtf8(e.what());
        return false;
    }
}

bool Config::save() const
{
    if (m_configPath.isEmpty())
        return false;

    toml::table tbl;

    // [search] section
    toml::table searchTbl;
    searchTbl.insert("debounce_ms", static_cast<int64_t>(m_searchDebounceMs));
    searchTbl.insert("max_results", static_cast<int64_t>(m_searchMaxResults));
    searchTbl.insert("batch_size", static_cast<int64_t>(m_searchBatchSize));
    searchTbl.insert("follow_symlinks", m_searchFollowSymlinks);
    tbl.insert("search", searchTbl);

    // [transfer] section
    toml::table transferTbl;
    transferTbl.insert("max_conflict_attempts", static_cast<int64_t>(m_maxConflictAttempts));
    transferTbl.insert("verify_copies", m_verifyCopies);
    transferTbl.insert("hash_algorithm", m_hashAlgorithm.toStdString());
    transferTbl.insert("preserve_timestamps", m_preserveTimestamps);
    tbl.insert("transfer", transferTbl);

    // [notifications] section
    toml::table notificationsTbl;
    notificationsTbl.insert("duration_ms", static_cast<int64_t>(m_notificationDurationMs));
    tbl.insert("notifications", notificationsTbl);

    std::ofstream out(m_configPath.toStdString());
    if (!out) {
        qWarning() << "Failed to save TOML config" << m_configPath;
        return false;
    }
    out << tbl;
    return static_cast<bool>(out);
}
