#ifndef _CLIENT_CAPTURE_DEVICE_H_
#define _CLIENT_CAPTURE_DEVICE_H_

#include "base/defines.hpp"
#include "client/media_stream.hpp"

#include <memory>
#include <vector>

namespace meshrtc {

// The local audio/video source.
class MESHRTC_EXPORT CaptureDevice {
public:
    virtual ~CaptureDevice() = default;

    // Opens the device and returns its tracks, throws a std::exception
    // if the device is denied or unavailable.
    virtual std::vector<std::shared_ptr<MediaTrack>> Open() = 0;
};

} // namespace meshrtc

#endif
