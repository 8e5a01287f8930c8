#include "client/remote_stream_table.hpp"

#include <stdexcept>

namespace meshrtc {

RemoteStreamTable::RemoteStreamTable() = default;

RemoteStreamTable::~RemoteStreamTable() = default;

bool RemoteStreamTable::AddTrack(const std::string& participant_id, std::shared_ptr<MediaTrack> track) {
    auto it = entries_.find(participant_id);
    if (it == entries_.end()) {
        Entry entry;
        entry.participant_id = participant_id;
        entry.stream = std::make_shared<MediaStream>(participant_id);
        it = entries_.emplace(participant_id, std::move(entry)).first;
    }
    return it->second.stream->AddTrack(std::move(track));
}

bool RemoteStreamTable::Remove(const std::string& participant_id) {
    return entries_.erase(participant_id) > 0;
}

void RemoteStreamTable::Clear() {
    entries_.clear();
}

bool RemoteStreamTable::ReconcileNames(const Roster& roster) {
    bool changed = false;
    for (auto& [participant_id, entry] : entries_) {
        auto it = roster.find(participant_id);
        // Keep the last known name of a participant missing from the roster.
        if (it == roster.end() || !it->second) {
            continue;
        }
        if (entry.name != it->second) {
            entry.name = it->second;
            changed = true;
        }
    }
    return changed;
}

std::optional<RemoteStreamTable::Entry> RemoteStreamTable::Find(const std::string& participant_id) const {
    auto it = entries_.find(participant_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool RemoteStreamTable::Contains(const std::string& participant_id) const {
    return entries_.find(participant_id) != entries_.end();
}

std::vector<RemoteStreamTable::Entry> RemoteStreamTable::entries() const {
    std::vector<Entry> entries;
    entries.reserve(entries_.size());
    for (const auto& [participant_id, entry] : entries_) {
        entries.push_back(entry);
    }
    return entries;
}

} // namespace meshrtc
