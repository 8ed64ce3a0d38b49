#include "interrupt.hpp"

namespace dcopy::infra {

namespace {

std::atomic<CancelToken*> g_signal_token{nullptr};

void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        // Только async-signal-safe операции: логируем уже в движке
        if (auto* token = g_signal_token.load(std::memory_order_relaxed)) {
            token->request_cancel();
        }
    }
}

} // namespace

void install_signal_handler(CancelToken& token) {
    g_signal_token.store(&token, std::memory_order_relaxed);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

} // namespace dcopy::infra
