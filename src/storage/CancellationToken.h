#pragma once

#include "Errors.h"

#include <QObject>

#include <atomic>
#include <memory>

// Shared cancellation flag. Copies refer to the same flag, so the tracker can
// trip it while a worker thread polls it between provider calls.
class CancellationToken {
public:
    CancellationToken()
        : m_flag(std::make_shared<std::atomic<bool>>(false))
    {}

    void cancel() const { m_flag->store(true, std::memory_order_relaxed); }
    bool isCancelled() const { return m_flag->load(std::memory_order_relaxed); }

    void throwIfCancelled() const
    {
        if (isCancelled())
            throw CancelledError(QObject::tr("Operation cancelled"));
    }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};
