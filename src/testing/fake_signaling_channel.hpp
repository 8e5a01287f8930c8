#ifndef _TESTING_FAKE_SIGNALING_CHANNEL_H_
#define _TESTING_FAKE_SIGNALING_CHANNEL_H_

#include "client/signaling_channel.hpp"
#include "signaling/messages.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace meshrtc {
namespace test {

// Records what the client sends, the Simulate* methods fire the observer 
// the way the I/O thread of a real channel would.
class FakeSignalingChannel : public SignalingChannel {
public:
    void Connect(std::string signaling_url) override {
        std::lock_guard lock(mutex_);
        connect_urls_.push_back(std::move(signaling_url));
    }
    void Close() override {
        std::lock_guard lock(mutex_);
        connected_ = false;
        ++close_count_;
    }
    void Send(std::string msg) override {
        std::lock_guard lock(mutex_);
        if (!connected_) {
            return;
        }
        sent_.push_back(std::move(msg));
    }
    void RegisterObserver(Observer* observer) override {
        std::lock_guard lock(mutex_);
        observer_ = observer;
    }
    void DeregisterObserver(Observer* observer) override {
        std::lock_guard lock(mutex_);
        if (observer_ == observer) {
            observer_ = nullptr;
        }
    }

    void SimulateConnected() {
        std::lock_guard lock(mutex_);
        connected_ = true;
        if (observer_) {
            observer_->OnConnected();
        }
    }
    void SimulateClosed(const std::string& reason) {
        std::lock_guard lock(mutex_);
        connected_ = false;
        if (observer_) {
            observer_->OnClosed(reason);
        }
    }
    void Deliver(const signaling::Message& message) {
        DeliverText(signaling::Serialize(message));
    }
    void DeliverText(const std::string& text) {
        std::lock_guard lock(mutex_);
        if (observer_) {
            observer_->OnRead(text);
        }
    }

    bool connected() const {
        std::lock_guard lock(mutex_);
        return connected_;
    }
    int close_count() const {
        std::lock_guard lock(mutex_);
        return close_count_;
    }
    std::vector<std::string> connect_urls() const {
        std::lock_guard lock(mutex_);
        return connect_urls_;
    }

    std::vector<signaling::Message> messages() const {
        std::lock_guard lock(mutex_);
        std::vector<signaling::Message> messages;
        for (const auto& text : sent_) {
            messages.push_back(signaling::Parse(text));
        }
        return messages;
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
    mutable std::mutex mutex_;
    Observer* observer_ = nullptr;
    bool connected_ = false;
    int close_count_ = 0;
    std::vector<std::string> connect_urls_;
    std::vector<std::string> sent_;
};

} // namespace test
} // namespace meshrtc

#endif
