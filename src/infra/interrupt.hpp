#pragma once

#include <atomic>
#include <csignal>

namespace dcopy::infra {

// Кооперативная отмена: флаг проверяется между чанками каждым воркером.
class CancelToken {
public:
    CancelToken() = default;
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void request_cancel() noexcept {
        cancelled_.store(true, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_relaxed);
    }

    void reset() noexcept {
        cancelled_.store(false, std::memory_order_relaxed);
    }

private:
    std::atomic<bool> cancelled_{false};
};

/// SIGINT/SIGTERM переводят `token` в отменённое состояние.
/// Токен должен жить до завершения процесса.
void install_signal_handler(CancelToken& token);

} // namespace dcopy::infra
