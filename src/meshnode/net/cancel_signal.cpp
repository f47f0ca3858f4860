/**
 * @file cancel_signal.cpp
 * @brief One-shot handler invocation.
 */
#include "meshnode/net/cancel_signal.hpp"

#include <utility>

namespace meshnode::net {

    void CancelSignal::emit() {
        if (emitted_) return;
        emitted_ = true;
        // Moved out first: the handler may clear() or re-install.
        auto h = std::move(handler_);
        handler_ = nullptr;
        if (h) h();
    }

    void CancelSignal::install(std::function<void()> handler) {
        if (emitted_) {
            handler_ = nullptr;
            if (handler) handler();
            return;
        }
        handler_ = std::move(handler);
    }

} // namespace meshnode::net
