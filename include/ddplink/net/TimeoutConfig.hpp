#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace ddplink::net {

/**
 * @brief Process-wide receive timeouts used when a caller does not pass one.
 *
 * - replyTimeout(): how long DdpConnection::readReply() waits for one datagram.
 * - discoveryWindow(): how long DdpController::discover() collects answers.
 *
 * Values are clamped to [0, 60s] and stored atomically so a UI thread can tune
 * them while a sender thread is reading.
 */
class TimeoutConfig {
public:
    using duration = std::chrono::milliseconds;

    static constexpr duration kDefaultReply{250};
    static constexpr duration kDefaultDiscovery{1000};
    static constexpr duration kMaximum{60000};

    static duration replyTimeout() { return duration{replyStorage().load()}; }
    static void setReplyTimeout(duration timeout) { replyStorage().store(sanitize(timeout).count()); }

    static duration discoveryWindow() { return duration{discoveryStorage().load()}; }
    static void setDiscoveryWindow(duration window) { discoveryStorage().store(sanitize(window).count()); }

    /// Restore both values to their built-in defaults.
    static void reset() {
        replyStorage().store(kDefaultReply.count());
        discoveryStorage().store(kDefaultDiscovery.count());
    }

    /** RAII helper that temporarily overrides the reply timeout. */
    class ScopedOverride {
    public:
        explicit ScopedOverride(duration timeout)
        : previous_(replyTimeout()) {
            setReplyTimeout(timeout);
        }

        ScopedOverride(const ScopedOverride&) = delete;
        ScopedOverride& operator=(const ScopedOverride&) = delete;

        ~ScopedOverride() {
            replyStorage().store(previous_.count());
        }

    private:
        duration previous_;
    };

    static duration sanitize(duration timeout) {
        if (timeout.count() < 0) return duration::zero();
        return timeout > kMaximum ? kMaximum : timeout;
    }

private:
    using Storage = std::atomic<std::int64_t>;

    static Storage& replyStorage() {
        static Storage value{kDefaultReply.count()};
        return value;
    }

    static Storage& discoveryStorage() {
        static Storage value{kDefaultDiscovery.count()};
        return value;
    }
};

} // namespace ddplink::net
