/*
 * AdaTP - room registry
 *
 * Rooms map a name to a set of member session ids. The registry mutex only
 * guards the name -> room map; membership changes take the room's own
 * mutex. Lock order is room before registry, and only leave() ever holds
 * both.
 */

#pragma once

#include "messages.hpp"
#include "protocol.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace adatp {

enum class CreateResult {
    Created,
    AlreadyExists,
    InvalidName
};

enum class JoinResult {
    Joined,
    AlreadyMember,
    NotInvited,
    InvalidName
};

enum class LeaveResult {
    Left,
    NotMember,
    NotFound
};

enum class InviteResult {
    Invited,
    NotFound,
    NotMember
};

struct RoomInfo {
    std::string name;
    RoomVisibility visibility = RoomVisibility::Public;
    bool explicitly_created = false;
    std::size_t member_count = 0;
};

class RoomRegistry {
public:
    explicit RoomRegistry(bool persist_empty_rooms = false);

    RoomRegistry(const RoomRegistry&) = delete;
    RoomRegistry& operator=(const RoomRegistry&) = delete;

    // The creator, when given, is allowed into a private room and joins it.
    CreateResult create(const std::string& room,
                        RoomVisibility visibility,
                        const std::optional<SessionId>& creator = std::nullopt);

    // Auto-creates missing rooms as public.
    JoinResult join(const std::string& room, const SessionId& session);

    // Only members may invite; inviting into a public room is harmless.
    InviteResult invite(const std::string& room, const SessionId& inviter, const SessionId& invitee);

    LeaveResult leave(const std::string& room, const SessionId& session);

    // Returns the rooms the session was removed from.
    std::vector<std::string> leave_all(const SessionId& session);

    // Sorted snapshot; empty for unknown rooms.
    std::vector<SessionId> members_of(const std::string& room) const;

    bool is_member(const std::string& room, const SessionId& session) const;
    bool exists(const std::string& room) const;
    std::vector<RoomInfo> rooms() const;
    std::size_t room_count() const;

    // Drops every room; used at server shutdown.
    void clear();

private:
    struct Room {
        std::mutex mutex;
        std::string name;
        RoomVisibility visibility = RoomVisibility::Public;
        bool explicitly_created = false;
        bool removed = false;
        std::set<SessionId> members;
        std::set<SessionId> invited;
    };

    std::shared_ptr<Room> find(const std::string& room) const;
    std::vector<std::shared_ptr<Room>> snapshot() const;

    bool persist_empty_rooms_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Room>> rooms_;
};

} // namespace adatp
