#include "session/room_directory.h"

bool RoomDirectory::add(const Room& room) {
    if (find(room.host_ip, room.tcp_port)) {
        return false;
    }
    rooms_.push_back(room);
    return true;
}

std::optional<Room> RoomDirectory::find(const std::string& ip, uint16_t port) const {
    for (const auto& room : rooms_) {
        if (room.host_ip == ip && room.tcp_port == port) {
            return room;
        }
    }
    return std::nullopt;
}
