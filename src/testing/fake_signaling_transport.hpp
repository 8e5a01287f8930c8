#ifndef _TESTING_FAKE_SIGNALING_TRANSPORT_H_
#define _TESTING_FAKE_SIGNALING_TRANSPORT_H_

#include "server/signaling_transport.hpp"
#include "signaling/messages.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace meshrtc {
namespace test {

// Records the frames sent to a connection.
class FakeSignalingTransport : public SignalingTransport {
public:
    explicit FakeSignalingTransport(std::string address = "fake") 
        : address_(std::move(address)) {}

    void Send(std::string text) override {
        std::lock_guard lock(mutex_);
        sent_.push_back(std::move(text));
    }
    void Close() override {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    std::string remote_address() const override { return address_; }

    bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    std::vector<signaling::Message> messages() const {
        std::lock_guard lock(mutex_);
        std::vector<signaling::Message> messages;
        for (const auto& text : sent_) {
            messages.push_back(signaling::Parse(text));
        }
        return messages;
    }

    // Returns and clears the messages sent so far.
    std::vector<signaling::Message> TakeMessages() {
        auto result = messages();
        std::lock_guard lock(mutex_);
        sent_.clear();
        return result;
    }

    template <typename T>
    std::vector<T> MessagesOf() const {
        std::vector<T> result;
        for (auto& message : messages()) {
            if (auto* m = std::get_if<T>(&message)) {
                result.push_back(std::move(*m));
            }
        }
        return result;
    }

private:
    const std::string address_;
    mutable std::mutex mutex_;
    std::vector<std::string> sent_;
    bool closed_ = false;
};

} // namespace test
} // namespace meshrtc

#endif
