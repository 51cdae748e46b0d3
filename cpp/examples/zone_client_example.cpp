/**
 * @file zone_client_example.cpp
 * @brief Example: a line-oriented zonechat client talking to zonechat-relay.
 *
 * Usage:
 *   zone_client_example <lat> <lng> [config.json]
 *
 * Commands (stdin):
 *   /list                      nearby zones
 *   /refresh                   ask hosts to re-announce
 *   /create NAME [PASSWORD]    create a zone (private when a password is given)
 *   /join ZONE_ID [PASSWORD]   join a discovered zone
 *   /exit                      leave the current zone
 *   /quit                      leave and stop
 *   anything else              sent as a chat message
 *
 * Stdin is read on its own thread; every line is posted to the event loop,
 * which owns all session state.
 */
#include "zc_zone.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace zonechat::zone;
using namespace zonechat::utils;

namespace
{

void print_zones(const SessionManager &session)
{
    const auto zones = session.discovery().zones();
    if (zones.empty())
    {
        std::cout << "  (no zones in range)\n";
        return;
    }
    const int64_t now = SystemClock().now_ms();
    for (const auto &dz : zones)
    {
        std::cout << fmt::format("  {}  {:<16} {:<7} {:>5.2f} km  {} member(s)  {} left\n",
                                 dz.zone.id, dz.zone.name, to_string(dz.zone.visibility),
                                 dz.distance_km, dz.zone.member_count,
                                 zonechat::format_tools::format_countdown(dz.zone.expires_at - now));
    }
}

void handle_line(SessionManager &session, EventLoop &loop, const std::string &line)
{
    std::istringstream in(line);
    std::string cmd;
    in >> cmd;

    if (cmd == "/quit")
    {
        session.stop();
        loop.stop();
    }
    else if (cmd == "/list")
    {
        print_zones(session);
    }
    else if (cmd == "/refresh")
    {
        std::cout << "  sync request: " << to_string(session.refresh_discovery()) << "\n";
    }
    else if (cmd == "/create")
    {
        std::string name;
        std::string password;
        in >> name >> password;
        const auto vis = password.empty() ? Visibility::Public : Visibility::Private;
        auto r = session.create_zone(name, vis, {},
                                     password.empty() ? std::nullopt
                                                      : std::optional<std::string>(password));
        if (r.is_error())
        {
            std::cout << "  create failed: " << to_string(r.error()) << " " << r.error_detail()
                      << "\n";
        }
    }
    else if (cmd == "/join")
    {
        std::string id;
        std::string password;
        in >> id >> password;
        auto zone = session.discovery().find(id);
        if (!zone)
        {
            std::cout << "  unknown zone " << id << "\n";
            return;
        }
        auto r = session.join_zone(*zone, {},
                                   password.empty() ? std::nullopt
                                                    : std::optional<std::string>(password));
        if (r.is_error())
        {
            std::cout << "  join failed: " << to_string(r.error()) << "\n";
        }
    }
    else if (cmd == "/exit")
    {
        session.exit(ExitReason::UserRequested);
    }
    else if (!line.empty())
    {
        session.notify_typing();
        auto r = session.send_text(line, [](PublishStatus s)
                                   {
                                       if (s != PublishStatus::Accepted)
                                           std::cout << "  not sent: " << to_string(s) << "\n";
                                   });
        if (r.is_error())
        {
            std::cout << "  " << to_string(r.error()) << " " << r.error_detail() << "\n";
        }
    }
}

} // namespace

int main(int argc, char *argv[])
{
    if (argc < 3)
    {
        std::cerr << "usage: " << argv[0] << " <lat> <lng> [config.json]\n";
        return 2;
    }

    LifecycleGuard app_lifecycle(MakeModDefList(Logger::GetLifecycleModule(),
                                                zonechat::crypto::GetLifecycleModule(),
                                                GetZMQContextModule()));

    ClientConfig config;
    try
    {
        if (argc >= 4)
        {
            config = ClientConfig::from_json_file(argv[3]);
        }
        config.apply_env_overrides();
    }
    catch (const std::exception &e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }
    if (auto lvl = Logger::level_from_string(config.log_level))
    {
        Logger::instance().set_level(*lvl);
    }

    SystemClock clock;
    EventLoop loop(clock);
    ZmqTransport transport(loop, ZmqTransport::Config{config.relay.pub_endpoint,
                                                      config.relay.sub_endpoint});
    FixedPositionProvider position(GeoPoint{std::atof(argv[1]), std::atof(argv[2])});
    SessionManager session(loop, transport, ClientIdentity::generate(config.handle), config,
                           &position);

    SessionCallbacks cb;
    cb.on_state_changed = [](SessionState s) { std::cout << "* session " << to_string(s) << "\n"; };
    cb.on_message = [](const ChatMessage &m)
    {
        std::cout << fmt::format("[{}] {}: {}\n",
                                 zonechat::format_tools::formatted_time(
                                     std::chrono::system_clock::time_point(
                                         std::chrono::milliseconds(m.timestamp))),
                                 m.sender, m.text.value_or(std::string("<") + to_string(m.kind) + ">"));
    };
    cb.on_member_count = [](int n) { std::cout << "* members: " << n << "\n"; };
    cb.on_expiry_warning = [](int64_t left)
    { std::cout << "* zone expires in " << zonechat::format_tools::format_countdown(left) << "\n"; };
    cb.on_expired = [](const Zone &z) { std::cout << "* zone " << z.name << " expired\n"; };
    cb.on_connection_state = [](ConnectionState s) { std::cout << "* relay " << to_string(s) << "\n"; };
    session.set_callbacks(std::move(cb));

    transport.connect();
    session.start();
    std::cout << "zonechat as " << session.identity().handle << " (" << session.identity().fingerprint
              << "). /list /refresh /create /join /exit /quit\n";

    std::thread input(
        [&loop, &session]
        {
            std::string line;
            while (std::getline(std::cin, line))
            {
                const bool quit = line == "/quit";
                loop.post([&session, &loop, line] { handle_line(session, loop, line); });
                if (quit)
                {
                    return;
                }
            }
            loop.post([&session, &loop] { handle_line(session, loop, "/quit"); });
        });

    loop.run();
    input.join();
    transport.disconnect();
    return 0;
}
