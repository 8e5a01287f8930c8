#ifndef _TESTING_FAKE_MEDIA_H_
#define _TESTING_FAKE_MEDIA_H_

#include "client/capture_device.hpp"
#include "client/media_stream.hpp"

#include <atomic>
#include <stdexcept>
#include <string>

namespace meshrtc {
namespace test {

class FakeMediaTrack : public MediaTrack {
public:
    FakeMediaTrack(std::string id, Kind kind) 
        : id_(std::move(id)), kind_(kind) {}

    std::string id() const override { return id_; }
    Kind kind() const override { return kind_; }
    void Stop() override { stopped_ = true; }

    bool stopped() const { return stopped_; }

private:
    const std::string id_;
    const Kind kind_;
    std::atomic<bool> stopped_ = false;
};

class FakeCaptureDevice : public CaptureDevice {
public:
    std::vector<std::shared_ptr<MediaTrack>> Open() override {
        ++open_count_;
        if (denied_) {
            throw std::runtime_error("Permission denied");
        }
        audio_ = std::make_shared<FakeMediaTrack>("audio-" + std::to_string(open_count_), MediaTrack::Kind::AUDIO);
        video_ = std::make_shared<FakeMediaTrack>("video-" + std::to_string(open_count_), MediaTrack::Kind::VIDEO);
        return {audio_, video_};
    }

    void set_denied(bool denied) { denied_ = denied; }
    int open_count() const { return open_count_; }
    // Tracks of the last successful Open().
    std::shared_ptr<FakeMediaTrack> audio() const { return audio_; }
    std::shared_ptr<FakeMediaTrack> video() const { return video_; }

private:
    std::atomic<bool> denied_ = false;
    std::atomic<int> open_count_ = 0;
    std::shared_ptr<FakeMediaTrack> audio_;
    std::shared_ptr<FakeMediaTrack> video_;
};

} // namespace test
} // namespace meshrtc

#endif
