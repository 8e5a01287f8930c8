#ifndef _CLIENT_REMOTE_STREAM_TABLE_H_
#define _CLIENT_REMOTE_STREAM_TABLE_H_

#include "base/defines.hpp"
#include "client/media_stream.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace meshrtc {

// participant id -> display name
using Roster = std::map<std::string, std::optional<std::string>>;

// The media received from each remote participant.
class MESHRTC_EXPORT RemoteStreamTable {
public:
    struct Entry {
        std::string participant_id;
        std::shared_ptr<MediaStream> stream;
        std::optional<std::string> name;
    };
public:
    RemoteStreamTable();
    ~RemoteStreamTable();

    // Adds `track` to the participant's stream, the entry is created on the 
    // first track. Returns false if the track is known already.
    bool AddTrack(const std::string& participant_id, std::shared_ptr<MediaTrack> track);
    bool Remove(const std::string& participant_id);
    void Clear();

    // Joins the display names of `roster` into the entries, returns true if
    // any entry changed.
    bool ReconcileNames(const Roster& roster);

    std::optional<Entry> Find(const std::string& participant_id) const;
    bool Contains(const std::string& participant_id) const;
    // Ordered by participant id.
    std::vector<Entry> entries() const;
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::map<std::string, Entry> entries_;
};

} // namespace meshrtc

#endif
