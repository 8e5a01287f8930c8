#ifndef _TESTING_FAKE_PEER_TRANSPORT_H_
#define _TESTING_FAKE_PEER_TRANSPORT_H_

#include "client/peer_transport.hpp"

#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace meshrtc {
namespace test {

// Completes every operation before returning, or holds the completions
// back until CompletePending() in deferred mode. An operation listed in
// `failing_operations` reports a failure instead, a remote description
// with the SDP "malformed" is always rejected.
class FakePeerTransport : public PeerTransport {
public:
    FakePeerTransport(int id, 
                      Observer* observer, 
                      std::set<std::string> failing_operations,
                      bool deferred = false) 
        : id_(id), 
          observer_(observer),
          failing_operations_(std::move(failing_operations)),
          deferred_(deferred) {}

    void AddTrack(std::shared_ptr<MediaTrack> track) override {
        Record("AddTrack");
        if (ShouldFail("AddTrack")) {
            throw std::runtime_error("AddTrack failed");
        }
        tracks_.push_back(std::move(track));
    }

    void CreateOffer(SDPCreateSuccessCallback on_success, 
                     FailureCallback on_failure) override {
        Record("CreateOffer");
        if (ShouldFail("CreateOffer")) {
            Complete([on_failure](){ on_failure(MakeError("CreateOffer failed")); });
            return;
        }
        Complete([this, on_success](){
            on_success(SessionDescription(SessionDescription::Type::OFFER, "offer-" + std::to_string(id_)));
        });
    }

    void CreateAnswer(SDPCreateSuccessCallback on_success, 
                      FailureCallback on_failure) override {
        Record("CreateAnswer");
        if (ShouldFail("CreateAnswer") || !remote_description_) {
            Complete([on_failure](){ on_failure(MakeError("CreateAnswer failed")); });
            return;
        }
        Complete([this, on_success](){
            on_success(SessionDescription(SessionDescription::Type::ANSWER, "answer-" + std::to_string(id_)));
        });
    }

    void SetLocalDescription(SessionDescription sdp,
                             SDPSetSuccessCallback on_success, 
                             FailureCallback on_failure) override {
        Record("SetLocalDescription:" + SessionDescription::ToString(sdp.type()));
        if (ShouldFail("SetLocalDescription")) {
            Complete([on_failure](){ on_failure(MakeError("SetLocalDescription failed")); });
            return;
        }
        Complete([this, sdp=std::move(sdp), on_success](){
            local_description_ = sdp;
            on_success();
        });
    }

    void SetRemoteDescription(SessionDescription sdp,
                              SDPSetSuccessCallback on_success, 
                              FailureCallback on_failure) override {
        Record("SetRemoteDescription:" + SessionDescription::ToString(sdp.type()));
        if (ShouldFail("SetRemoteDescription") || sdp.sdp() == "malformed") {
            Complete([on_failure](){ on_failure(MakeError("Invalid session description")); });
            return;
        }
        Complete([this, sdp=std::move(sdp), on_success](){
            remote_description_ = sdp;
            on_success();
        });
    }

    void AddRemoteCandidate(Candidate candidate, 
                            FailureCallback on_failure) override {
        Record("AddRemoteCandidate:" + candidate.candidate());
        if (ShouldFail("AddRemoteCandidate") || !remote_description_) {
            Complete([on_failure](){ on_failure(MakeError("AddRemoteCandidate failed")); });
            return;
        }
        std::lock_guard lock(mutex_);
        remote_candidates_.push_back(std::move(candidate));
    }

    void Close() override {
        Record("Close");
        std::lock_guard lock(mutex_);
        closed_ = true;
    }

    // Fires the observer like a real transport would.
    void EmitLocalCandidate(Candidate candidate) { observer_->OnLocalCandidate(std::move(candidate)); }
    void EmitRemoteTrack(std::shared_ptr<MediaTrack> track) { observer_->OnRemoteTrack(std::move(track)); }
    void EmitConnectionState(ConnectionState state) { observer_->OnConnectionStateChanged(state); }

    // Runs the held completions in order, returns how many ran.
    size_t CompletePending() {
        std::deque<std::function<void()>> completions;
        {
            std::lock_guard lock(mutex_);
            completions.swap(pending_);
        }
        for (auto& completion : completions) {
            completion();
        }
        return completions.size();
    }
    size_t pending_count() const {
        std::lock_guard lock(mutex_);
        return pending_.size();
    }

    int id() const { return id_; }
    bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }
    std::vector<std::string> operations() const {
        std::lock_guard lock(mutex_);
        return operations_;
    }
    std::vector<Candidate> remote_candidates() const {
        std::lock_guard lock(mutex_);
        return remote_candidates_;
    }
    const std::optional<SessionDescription>& local_description() const { return local_description_; }
    const std::optional<SessionDescription>& remote_description() const { return remote_description_; }
    const std::vector<std::shared_ptr<MediaTrack>>& tracks() const { return tracks_; }

private:
    void Complete(std::function<void()> completion) {
        if (!deferred_) {
            completion();
            return;
        }
        std::lock_guard lock(mutex_);
        pending_.push_back(std::move(completion));
    }

    void Record(std::string operation) {
        std::lock_guard lock(mutex_);
        operations_.push_back(std::move(operation));
    }

    bool ShouldFail(const std::string& operation) const {
        return failing_operations_.count(operation) > 0;
    }

    static std::exception_ptr MakeError(const std::string& what) {
        return std::make_exception_ptr(std::runtime_error(what));
    }

private:
    const int id_;
    Observer* const observer_;
    const std::set<std::string> failing_operations_;
    const bool deferred_;

    mutable std::mutex mutex_;
    std::deque<std::function<void()>> pending_;
    std::vector<std::string> operations_;
    std::vector<Candidate> remote_candidates_;
    std::vector<std::shared_ptr<MediaTrack>> tracks_;
    std::optional<SessionDescription> local_description_;
    std::optional<SessionDescription> remote_description_;
    bool closed_ = false;
};

class FakePeerTransportFactory : public PeerTransportFactory {
public:
    std::shared_ptr<PeerTransport> Create(const PeerTransport::Configuration& config, 
                                          PeerTransport::Observer* observer) override {
        std::lock_guard lock(mutex_);
        if (fail_creation_) {
            throw std::runtime_error("No transport available");
        }
        last_config_ = config;
        auto transport = std::make_shared<FakePeerTransport>(static_cast<int>(transports_.size()), observer, failing_operations_, deferred_);
        transports_.push_back(transport);
        return transport;
    }

    void set_fail_creation(bool fail) {
        std::lock_guard lock(mutex_);
        fail_creation_ = fail;
    }

    // Applies to the transports created afterwards.
    void set_deferred(bool deferred) {
        std::lock_guard lock(mutex_);
        deferred_ = deferred;
    }

    // Applies to the transports created afterwards.
    void set_failing_operations(std::set<std::string> operations) {
        std::lock_guard lock(mutex_);
        failing_operations_ = std::move(operations);
    }

    std::vector<std::shared_ptr<FakePeerTransport>> transports() const {
        std::lock_guard lock(mutex_);
        return transports_;
    }

    std::shared_ptr<FakePeerTransport> last() const {
        std::lock_guard lock(mutex_);
        return transports_.empty() ? nullptr : transports_.back();
    }

    size_t live_count() const {
        std::lock_guard lock(mutex_);
        size_t count = 0;
        for (const auto& transport : transports_) {
            if (!transport->closed()) {
                ++count;
            }
        }
        return count;
    }

    PeerTransport::Configuration last_config() const {
        std::lock_guard lock(mutex_);
        return last_config_;
    }

private:
    mutable std::mutex mutex_;
    bool fail_creation_ = false;
    bool deferred_ = false;
    std::set<std::string> failing_operations_;
    std::vector<std::shared_ptr<FakePeerTransport>> transports_;
    PeerTransport::Configuration last_config_;
};

} // namespace test
} // namespace meshrtc

#endif
