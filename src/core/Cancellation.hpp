/**
 * FFXIV Updater - Cooperative Cancellation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <atomic>
#include <memory>

namespace ffxiv {

/**
 * Shared cancellation flag
 *
 * Copies observe the same flag, so a caller can keep one copy and hand
 * another to a worker. Work checks isCancelled() at its iteration points.
 */
class CancellationToken {
public:
    CancellationToken()
        : m_flag(std::make_shared<std::atomic<bool>>(false))
    {
    }

    void cancel() { m_flag->store(true); }
    bool isCancelled() const { return m_flag->load(); }

    /**
     * A token that is never cancelled
     */
    static CancellationToken none() { return CancellationToken(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace ffxiv
