#pragma once

#include "protocol/message.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * Rooms discovered during a scan, one entry per host ip+port.
 *
 * Beacons repeat every interval, so the same room is reported many times;
 * this keeps the first sighting and ignores the rest.
 */
class RoomDirectory {
public:
    /// Record `room`. False if a room at the same ip and port is known.
    bool add(const Room& room);

    [[nodiscard]] std::optional<Room> find(const std::string& ip, uint16_t port) const;

    [[nodiscard]] const std::vector<Room>& rooms() const { return rooms_; }
    [[nodiscard]] std::size_t size() const { return rooms_.size(); }
    [[nodiscard]] bool empty() const { return rooms_.empty(); }

    void clear() { rooms_.clear(); }

private:
    std::vector<Room> rooms_;
};
