#ifndef CONFIG_H
#define CONFIG_H

#include <QString>

class Config
{
public:
  Config() = default;

  static QString defaultConfigPath();

  bool load(const QString& path);
  bool save() const;

  void setConfigPath(const QString& p) { m_configPath = p; }
  QString configPath() const { return m_configPath; }

  // Validate TOML content without loading it
  static bool validateToml(const QString& content, QString& errorMsg);

  // [search]
  int searchDebounceMs() const { return m_searchDebounceMs; }
  void setSearchDebounceMs(int ms) { m_searchDebounceMs = ms; }
  int searchMaxResults() const { return m_searchMaxResults; }
  void setSearchMaxResults(int max) { m_searchMaxResults = max; }
  int searchBatchSize() const { return m_searchBatchSize; }
  void setSearchBatchSize(int size) { m_searchBatchSize = size; }
  bool searchFollowSymlinks() const { return m_searchFollowSymlinks; }
  void setSearchFollowSymlinks(bool follow) { m_searchFollowSymlinks = follow; }

  // [transfer]
  int maxConflictAttempts() const { return m_maxConflictAttempts; }
  void setMaxConflictAttempts(int attempts) { m_maxConflictAttempts = attempts; }
  bool verifyCopies() const { return m_verifyCopies; }
  void setVerifyCopies(bool verify) { m_verifyCopies = verify; }
  QString hashAlgorithm() const { return m_hashAlgorithm; }
  void setHashAlgorithm(const QString& algorithm) { m_hashAlgorithm = algorithm; }
  bool preserveTimestamps() const { return m_preserveTimestamps; }
  void setPreserveTimestamps(bool preserve) { m_preserveTimestamps = preserve; }

  // [notifications]
  int notificationDurationMs() const { return m_notificationDurationMs; }
  void setNotificationDurationMs(int ms) { m_notificationDurationMs = ms; }

private:
  void resetToDefaults();

  QString m_configPath;

  int m_searchDebounceMs = 300;
  int m_searchMaxResults = 100;
  int m_searchBatchSize = 20;
  bool m_searchFollowSymlinks = true;

  int m_maxConflictAttempts = 100;
  bool m_verifyCopies = false;
  QString m_hashAlgorithm = "SHA-256";
  bool m_preserveTimestamps = true;

  int m_notificationDurationMs = 3000;
};

#endif
