#ifndef _CLIENT_MEDIA_STREAM_H_
#define _CLIENT_MEDIA_STREAM_H_

#include "base/defines.hpp"

#include <memory>
#include <string>
#include <vector>

namespace meshrtc {

// MediaTrack
// Implemented by the platform layer, a local track comes from the capture
// device and a remote one from a peer transport.
class MESHRTC_EXPORT MediaTrack {
public:
    enum class Kind {
        AUDIO,
        VIDEO
    };
public:
    virtual ~MediaTrack() = default;

    virtual std::string id() const = 0;
    virtual Kind kind() const = 0;
    // Releases the underlying source.
    virtual void Stop() = 0;
};

// MediaStream
class MESHRTC_EXPORT MediaStream {
public:
    explicit MediaStream(std::string id);
    ~MediaStream();

    const std::string& id() const { return id_; }
    const std::vector<std::shared_ptr<MediaTrack>>& tracks() const { return tracks_; }

    // Returns false if a track with the same id was added before.
    bool AddTrack(std::shared_ptr<MediaTrack> track);
    bool HasTrack(const std::string& track_id) const;

private:
    const std::string id_;
    std::vector<std::shared_ptr<MediaTrack>> tracks_;
};

} // namespace meshrtc

#endif
