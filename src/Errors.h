#pragma once

#include <QString>

#include <stdexcept>

// Failure reported by a storage or search provider. Aborts the operation
// or request that triggered it.
class ProviderError : public std::runtime_error {
public:
    explicit ProviderError(const QString& message)
        : std::runtime_error(message.toStdString())
    {}

    QString message() const { return QString::fromStdString(what()); }
};

// Path does not exist (stat/remove/readDir on a missing entry)
class NotFoundError : public ProviderError {
public:
    using ProviderError::ProviderError;
};

// Target path is occupied. path() names the occupied target.
class AlreadyExistsError : public ProviderError {
public:
    AlreadyExistsError(const QString& message, const QString& path)
        : ProviderError(message)
        , m_path(path)
    {}

    QString path() const { return m_path; }

private:
    QString m_path;
};

// Every candidate name up to the configured ceiling was already taken
class ConflictExhaustedError : public ProviderError {
public:
    using ProviderError::ProviderError;
};

// Raised from inside a provider call when the operation token was tripped
class CancelledError : public ProviderError {
public:
    using ProviderError::ProviderError;
};

// Invalid entry name for create/rename, raised before any provider call
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const QString& message)
        : std::runtime_error(message.toStdString())
    {}

    QString message() const { return QString::fromStdString(what()); }
};
