#pragma once
/**
 * @file cancel_signal.hpp
 * @brief One-shot cancellation of the work done on behalf of an inbound request.
 * @details The server session owns the signal and emits it when the client goes
 *          away; whoever is currently waiting on I/O for that request (the
 *          upstream client, a test backend) installs a handler that aborts it.
 *          Emission and installation happen on the session strand; the signal
 *          does no locking of its own.
 */

#include <functional>

namespace meshnode::net {

    class CancelSignal {
    public:
        /// Fire once. The installed handler (if any) runs inline; later emits are no-ops.
        void emit();

        [[nodiscard]] bool emitted() const noexcept { return emitted_; }

        /// Replace the handler. Runs @p handler immediately if already emitted.
        void install(std::function<void()> handler);

        /// Drop the handler before the state it references goes away.
        void clear() noexcept { handler_ = nullptr; }

    private:
        bool emitted_{false};
        std::function<void()> handler_;
    };

} // namespace meshnode::net
