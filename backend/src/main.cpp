/**
 * lanshare: command-line front end for LAN sessions.
 *
 *   lanshare [-c config.json] host [room]
 *   lanshare [-c config.json] scan [seconds]
 *   lanshare [-c config.json] join [ip port]
 *
 * Loads config, starts the session layer and prints the live peer list
 * until the user presses Enter or the host goes away.
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "config/session_config.h"
#include "session/room_directory.h"
#include "session/session_manager.h"

using json = nlohmann::json;

namespace {

constexpr int kDefaultScanSeconds = 3;

/// Set by the Enter key or by the session ending, whichever comes first.
struct ExitSignal {
    std::mutex mutex;
    std::condition_variable cv;
    bool raised = false;

    void raise() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            raised = true;
        }
        cv.notify_all();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this] { return raised; });
    }
};

void print_usage() {
    std::cerr << "usage: lanshare [-c config.json] <command>\n"
                 "  host [room]       host a room (default \"LAN Room\")\n"
                 "  scan [seconds]    list rooms announced on the LAN\n"
                 "  join [ip port]    join a room (first one found if omitted)\n";
}

void print_peers(const std::vector<Peer>& peers) {
    std::cout << "DEVICES:\n";
    for (const auto& peer : peers) {
        std::cout << "  * " << peer.name << " (" << peer.status << ") " << peer.ip << "\n";
    }
    std::cout.flush();
}

std::optional<int> parse_number(const std::string& text, int min, int max) {
    try {
        std::size_t used = 0;
        const int value = std::stoi(text, &used);
        if (used != text.size() || value < min || value > max) {
            return std::nullopt;
        }
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

/// Wait for Enter on a detached reader so a session end can also wake us.
void wait_for_enter_or(const std::shared_ptr<ExitSignal>& signal) {
    std::thread([signal] {
        std::cin.get();
        signal->raise();
    }).detach();
    signal->wait();
}

RoomDirectory scan_rooms(SessionManager& session, int seconds, bool verbose) {
    auto state = std::make_shared<std::pair<std::mutex, RoomDirectory>>();
    session.start_client_scan([state, verbose](const Room& room) {
        std::lock_guard<std::mutex> lock(state->first);
        if (state->second.add(room) && verbose) {
            std::cout << "  " << room.name << " (" << room.host_display_name << ") - "
                      << room.host_ip << ":" << room.tcp_port << std::endl;
        }
    });
    std::this_thread::sleep_for(std::chrono::seconds(seconds));

    std::lock_guard<std::mutex> lock(state->first);
    return state->second;
}

int run_host(SessionManager& session, const std::string& room_name) {
    try {
        session.start_host(room_name);
    } catch (const std::system_error& e) {
        spdlog::error("Cannot host room: {}", e.what());
        return 1;
    }

    std::cout << "ROOM: " << session.room_name() << "   [LAN: " << session.host_ip() << ":"
              << session.tcp_port() << "]\n";
    session.subscribe(SessionEvents{print_peers, nullptr});
    print_peers(session.peers());

    std::cout << "Press Enter to close the room." << std::endl;
    std::cin.get();
    session.shutdown();
    return 0;
}

int run_scan(SessionManager& session, int seconds) {
    std::cout << "Scanning for rooms on LAN for " << seconds << "s..." << std::endl;
    RoomDirectory rooms;
    try {
        rooms = scan_rooms(session, seconds, true);
    } catch (const std::system_error& e) {
        spdlog::error("Cannot scan: {}", e.what());
        return 1;
    }
    session.shutdown();
    std::cout << "Scan complete. Found " << rooms.size() << " room(s)" << std::endl;
    return 0;
}

int run_join(SessionManager& session, std::string ip, std::optional<uint16_t> port) {
    if (!port) {
        std::cout << "Scanning for rooms on LAN..." << std::endl;
        RoomDirectory rooms;
        try {
            rooms = scan_rooms(session, kDefaultScanSeconds, false);
        } catch (const std::system_error& e) {
            spdlog::error("Cannot scan: {}", e.what());
            return 1;
        }
        session.shutdown();
        if (rooms.empty()) {
            spdlog::error("No rooms were discovered on the network");
            return 1;
        }
        const Room& room = rooms.rooms().front();
        std::cout << "Joining " << room.name << " (" << room.host_display_name << ")" << std::endl;
        ip = room.host_ip;
        port = room.tcp_port;
    }

    if (!session.connect_to_room(ip, *port)) {
        std::cout << "CONNECTION FAILED!" << std::endl;
        return 1;
    }

    auto signal = std::make_shared<ExitSignal>();
    session.subscribe(SessionEvents{
        print_peers,
        [signal] {
            std::cout << "Host closed the room." << std::endl;
            signal->raise();
        },
    });
    // The host may have left before the subscription was in place.
    if (session.role() != SessionRole::Client) {
        std::cout << "Host closed the room." << std::endl;
        return 0;
    }
    std::cout << "ROOM: Connected   [LAN: " << ip << ":" << *port << "]\n";
    print_peers(session.peers());
    std::cout << "Press Enter to leave." << std::endl;

    wait_for_enter_or(signal);
    session.shutdown();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    auto log = spdlog::default_logger();

    std::vector<std::string> args(argv + 1, argv + argc);
    std::string config_path;
    if (args.size() >= 2 && args[0] == "-c") {
        config_path = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) {
        print_usage();
        return 1;
    }

    SessionConfig config;
    try {
        config = config_path.empty() ? config_from_json(json::object()) : load_config(config_path);
    } catch (const ConfigError& e) {
        log->error("Invalid configuration: {}", e.what());
        return 1;
    }
    spdlog::set_level(config.log_level);
    log->info("lanshare starting");
    if (!config_path.empty()) {
        log->info("Loaded config from {}", config_path);
    }
    log->info("Username: {}", config.display_name);

    const std::string& command = args[0];
    SessionManager session(config, log);

    if (command == "host") {
        return run_host(session, args.size() > 1 ? args[1] : "LAN Room");
    }
    if (command == "scan") {
        int seconds = kDefaultScanSeconds;
        if (args.size() > 1) {
            const auto parsed = parse_number(args[1], 1, 3600);
            if (!parsed) {
                print_usage();
                return 1;
            }
            seconds = *parsed;
        }
        return run_scan(session, seconds);
    }
    if (command == "join") {
        if (args.size() == 1) {
            return run_join(session, "", std::nullopt);
        }
        const auto port = args.size() == 3 ? parse_number(args[2], 1, 65535) : std::nullopt;
        if (!port) {
            print_usage();
            return 1;
        }
        return run_join(session, args[1], static_cast<uint16_t>(*port));
    }

    print_usage();
    return 1;
}
