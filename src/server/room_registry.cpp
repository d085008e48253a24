/*
 * AdaTP - room registry implementation
 */

#include "room_registry.hpp"

#include "utils.hpp"

namespace adatp {

RoomRegistry::RoomRegistry(bool persist_empty_rooms) : persist_empty_rooms_(persist_empty_rooms) {}

CreateResult RoomRegistry::create(const std::string& room,
                                  RoomVisibility visibility,
                                  const std::optional<SessionId>& creator) {
    if (!is_valid_room_name(room)) {
        return CreateResult::InvalidName;
    }

    auto state = std::make_shared<Room>();
    state->name = room;
    state->visibility = visibility;
    state->explicitly_created = true;
    if (creator.has_value()) {
        state->members.insert(*creator);
        state->invited.insert(*creator);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (rooms_.count(room) != 0) {
            return CreateResult::AlreadyExists;
        }
        rooms_[room] = state;
    }
    log_info("Created room " + room + (visibility == RoomVisibility::Private ? " (private)" : ""));
    return CreateResult::Created;
}

JoinResult RoomRegistry::join(const std::string& room, const SessionId& session) {
    if (!is_valid_room_name(room)) {
        return JoinResult::InvalidName;
    }

    for (;;) {
        std::shared_ptr<Room> state;
        bool created = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = rooms_.find(room);
            if (it == rooms_.end()) {
                state = std::make_shared<Room>();
                state->name = room;
                rooms_[room] = state;
                created = true;
            } else {
                state = it->second;
            }
        }
        if (created) {
            log_info("Created room " + room);
        }

        std::lock_guard<std::mutex> room_lock(state->mutex);
        if (state->removed) {
            // Lost a race with the last member leaving; look the name up again.
            continue;
        }
        if (state->members.count(session) != 0) {
            return JoinResult::AlreadyMember;
        }
        if (state->visibility == RoomVisibility::Private && state->invited.count(session) == 0) {
            return JoinResult::NotInvited;
        }
        state->members.insert(session);
        return JoinResult::Joined;
    }
}

InviteResult RoomRegistry::invite(const std::string& room, const SessionId& inviter, const SessionId& invitee) {
    auto state = find(room);
    if (!state) {
        return InviteResult::NotFound;
    }
    std::lock_guard<std::mutex> room_lock(state->mutex);
    if (state->removed) {
        return InviteResult::NotFound;
    }
    if (state->members.count(inviter) == 0) {
        return InviteResult::NotMember;
    }
    state->invited.insert(invitee);
    return InviteResult::Invited;
}

LeaveResult RoomRegistry::leave(const std::string& room, const SessionId& session) {
    auto state = find(room);
    if (!state) {
        return LeaveResult::NotFound;
    }

    bool destroyed = false;
    {
        std::lock_guard<std::mutex> room_lock(state->mutex);
        if (state->removed) {
            return LeaveResult::NotFound;
        }
        if (state->members.erase(session) == 0) {
            return LeaveResult::NotMember;
        }
        state->invited.erase(session);
        if (state->members.empty() && !(state->explicitly_created && persist_empty_rooms_)) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = rooms_.find(room);
            if (it != rooms_.end() && it->second == state) {
                rooms_.erase(it);
            }
            state->removed = true;
            destroyed = true;
        }
    }

    if (destroyed) {
        log_info("Destroyed room " + room);
    }
    return LeaveResult::Left;
}

std::vector<std::string> RoomRegistry::leave_all(const SessionId& session) {
    std::vector<std::string> left;
    for (const auto& state : snapshot()) {
        if (leave(state->name, session) == LeaveResult::Left) {
            left.push_back(state->name);
        }
    }
    return left;
}

std::vector<SessionId> RoomRegistry::members_of(const std::string& room) const {
    auto state = find(room);
    if (!state) {
        return {};
    }
    std::lock_guard<std::mutex> room_lock(state->mutex);
    if (state->removed) {
        return {};
    }
    return std::vector<SessionId>(state->members.begin(), state->members.end());
}

bool RoomRegistry::is_member(const std::string& room, const SessionId& session) const {
    auto state = find(room);
    if (!state) {
        return false;
    }
    std::lock_guard<std::mutex> room_lock(state->mutex);
    return !state->removed && state->members.count(session) != 0;
}

bool RoomRegistry::exists(const std::string& room) const {
    return find(room) != nullptr;
}

std::vector<RoomInfo> RoomRegistry::rooms() const {
    std::vector<RoomInfo> infos;
    for (const auto& state : snapshot()) {
        std::lock_guard<std::mutex> room_lock(state->mutex);
        if (state->removed) {
            continue;
        }
        infos.push_back(RoomInfo{state->name, state->visibility, state->explicitly_created, state->members.size()});
    }
    return infos;
}

std::size_t RoomRegistry::room_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rooms_.size();
}

void RoomRegistry::clear() {
    std::unordered_map<std::string, std::shared_ptr<Room>> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(rooms_);
    }
    for (auto& [name, state] : dropped) {
        std::lock_guard<std::mutex> room_lock(state->mutex);
        state->removed = true;
        state->members.clear();
        state->invited.clear();
    }
}

std::shared_ptr<RoomRegistry::Room> RoomRegistry::find(const std::string& room) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room);
    if (it == rooms_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::shared_ptr<RoomRegistry::Room>> RoomRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Room>> states;
    states.reserve(rooms_.size());
    for (const auto& [name, state] : rooms_) {
        states.push_back(state);
    }
    return states;
}

} // namespace adatp
