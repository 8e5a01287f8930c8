#include "client/media_stream.hpp"

#include <algorithm>
#include <stdexcept>

namespace meshrtc {

MediaStream::MediaStream(std::string id) 
    : id_(std::move(id)) {}

MediaStream::~MediaStream() = default;

bool MediaStream::AddTrack(std::shared_ptr<MediaTrack> track) {
    if (!track) {
        throw std::invalid_argument("Track is null");
    }
    if (HasTrack(track->id())) {
        return false;
    }
    tracks_.push_back(std::move(track));
    return true;
}

bool MediaStream::HasTrack(const std::string& track_id) const {
    return std::any_of(tracks_.begin(), tracks_.end(), [&track_id](const auto& track){
        return track->id() == track_id;
    });
}

} // namespace meshrtc
