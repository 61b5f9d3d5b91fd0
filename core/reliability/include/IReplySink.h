#pragma once

#include "Frame.h"
#include <functional>
#include <utility>

namespace ChatCast {

/**
 * @brief Channel back to the sender of the frame being dispatched.
 *
 * Sends are fire-and-forget: the engine does not learn whether a reply was
 * delivered.
 */
class IReplySink {
public:
    virtual ~IReplySink() = default;

    virtual void send(const ControlFrame& reply) = 0;
};

/**
 * @brief Reply sink forwarding to a callback (tests, in-process transports).
 */
class CallbackReplySink : public IReplySink {
public:
    using Callback = std::function<void(const ControlFrame&)>;

    explicit CallbackReplySink(Callback callback) : callback_(std::move(callback)) {}

    void send(const ControlFrame& reply) override {
        if (callback_) {
            callback_(reply);
        }
    }

private:
    Callback callback_;
};

} // namespace ChatCast
