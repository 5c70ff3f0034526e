#pragma once

#include <functional>
#include <utility>

namespace avail {
    /**
     * @brief Move-only handle to a live subscription.
     *
     * Contract:
     *   - unsubscribe() is idempotent and never throws.
     *   - Destroying the handle unsubscribes.
     *   - After unsubscribe() returns, the source must not invoke the subscriber's callbacks again,
     *     including emissions that were already queued on the event loop.
     */
    class Subscription {
    public:
        using CancelFn = std::function<void()>;

        Subscription() = default;

        explicit Subscription(CancelFn cancel) : cancel_(std::move(cancel)) {}

        Subscription(const Subscription &) = delete;

        Subscription &operator=(const Subscription &) = delete;

        Subscription(Subscription &&other) noexcept : cancel_(std::exchange(other.cancel_, nullptr)) {}

        Subscription &operator=(Subscription &&other) noexcept {
            if (this != &other) {
                unsubscribe();
                cancel_ = std::exchange(other.cancel_, nullptr);
            }
            return *this;
        }

        ~Subscription() { unsubscribe(); }

        void unsubscribe() noexcept {
            if (auto fn = std::exchange(cancel_, nullptr)) fn();
        }

        [[nodiscard]] bool active() const noexcept { return static_cast<bool>(cancel_); }

    private:
        CancelFn cancel_;
    };
} // namespace avail
