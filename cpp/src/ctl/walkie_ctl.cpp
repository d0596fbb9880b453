/**
 * @file walkie_ctl.cpp
 * @brief walkie-ctl: send one request to the local daemon and print the reply.
 *
 * ## Usage
 *
 *     walkie-ctl join  --channel room --secret s1
 *     walkie-ctl send  --channel room --message hi
 *     walkie-ctl read  --channel room --wait --timeout 10
 *     walkie-ctl leave --channel room
 *     walkie-ctl status | ping | stop
 *
 * Prints the daemon's JSON reply on stdout. Exit code 0 if the reply has `ok: true`.
 */
#include "daemon_config.hpp"

#include "wk_service.hpp"

#include <nlohmann/json.hpp>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;
using namespace walkie;
using nlohmann::json;

namespace
{

// Added to a read's own timeout before giving up on the daemon.
constexpr std::chrono::milliseconds kReplyGrace{5000};
constexpr std::chrono::milliseconds kDefaultReplyTimeout{35000};

struct CtlArgs
{
    std::optional<fs::path> dir;
    std::string action;
    std::optional<std::string> channel;
    std::optional<std::string> secret;
    std::optional<std::string> message;
    bool wait{false};
    std::optional<double> timeout_s;
};

void print_usage(const char *prog)
{
    std::cout << "Usage:\n"
              << "  " << prog
              << " [--dir <path>] <action> [--channel c] [--secret s] [--message m]"
                 " [--wait] [--timeout t]\n\n"
              << "Actions: join, send, read, leave, status, ping, stop\n";
}

CtlArgs parse_args(int argc, char *argv[])
{
    CtlArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        if (arg == "--dir" && i + 1 < argc)
            args.dir = fs::path(argv[++i]);
        else if (arg == "--channel" && i + 1 < argc)
            args.channel = argv[++i];
        else if (arg == "--secret" && i + 1 < argc)
            args.secret = argv[++i];
        else if (arg == "--message" && i + 1 < argc)
            args.message = argv[++i];
        else if (arg == "--wait")
            args.wait = true;
        else if (arg == "--timeout" && i + 1 < argc)
        {
            char *end = nullptr;
            const double value = std::strtod(argv[++i], &end);
            if (end == nullptr || *end != '\0')
            {
                std::cerr << "Invalid --timeout: " << argv[i] << "\n";
                std::exit(1);
            }
            args.timeout_s = value;
        }
        else if (!arg.empty() && arg[0] != '-' && args.action.empty())
            args.action = std::string(arg);
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }
    if (args.action.empty())
    {
        std::cerr << "Error: an action is required\n\n";
        print_usage(argv[0]);
        std::exit(1);
    }
    return args;
}

json build_request(const CtlArgs &args)
{
    json request{{"action", args.action}};
    if (args.channel)
        request["channel"] = *args.channel;
    if (args.secret)
        request["secret"] = *args.secret;
    if (args.message)
        request["message"] = *args.message;
    if (args.wait)
        request["wait"] = true;
    if (args.timeout_s)
        request["timeout"] = *args.timeout_s;
    return request;
}

std::chrono::milliseconds reply_timeout(const CtlArgs &args)
{
    if (args.wait && args.timeout_s && *args.timeout_s > 0.0)
    {
        return std::chrono::milliseconds(static_cast<int64_t>(*args.timeout_s * 1000.0)) +
               kReplyGrace;
    }
    return kDefaultReplyTimeout;
}

/// Sends @p line over the control socket and returns the first reply line.
std::string exchange(const fs::path &socket_path, const std::string &line,
                     std::chrono::milliseconds timeout)
{
    const std::string path = socket_path.string();
    sockaddr_un addr{};
    if (path.size() >= sizeof(addr.sun_path))
    {
        throw std::runtime_error(fmt::format("socket path too long: {}", path));
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        throw std::system_error(errno, std::generic_category(), "socket");
    }
    auto close_fd = basics::make_scope_guard([fd]() noexcept { ::close(fd); });

    if (::connect(fd, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) != 0)
    {
        throw std::system_error(errno, std::generic_category(),
                                fmt::format("daemon not reachable at {}", path));
    }

    size_t sent = 0;
    while (sent < line.size())
    {
        ssize_t n = ::send(fd, line.data() + sent, line.size() - sent, MSG_NOSIGNAL);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            throw std::system_error(errno, std::generic_category(), "send");
        }
        sent += static_cast<size_t>(n);
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string reply;
    char buf[4096];
    for (;;)
    {
        if (auto pos = reply.find('\n'); pos != std::string::npos)
        {
            return reply.substr(0, pos);
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
        {
            throw std::runtime_error("timed out waiting for the daemon");
        }
        pollfd pfd{fd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            throw std::system_error(errno, std::generic_category(), "poll");
        }
        if (ready == 0)
        {
            continue;
        }
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            throw std::system_error(errno, std::generic_category(), "recv");
        }
        if (n == 0)
        {
            throw std::runtime_error("daemon closed the connection without a reply");
        }
        reply.append(buf, static_cast<size_t>(n));
    }
}

} // anonymous namespace

int main(int argc, char *argv[])
{
    const CtlArgs args = parse_args(argc, argv);

    utils::LifecycleGuard ctl_lifecycle(
        utils::MakeModDefList(utils::Logger::GetLifecycleModule()));
    utils::Logger::instance().set_level(utils::Logger::Level::L_WARNING);

    try
    {
        const fs::path dir = args.dir ? *args.dir : daemon::default_daemon_dir();
        const daemon::DaemonPaths paths = daemon::make_daemon_paths(dir);

        const std::string request = build_request(args).dump() + "\n";
        LOGGER_DEBUG("walkie-ctl: -> {}", request.substr(0, request.size() - 1));
        const std::string reply_line = exchange(paths.socket, request, reply_timeout(args));

        const json reply = json::parse(reply_line, nullptr, /*allow_exceptions=*/false);
        if (reply.is_discarded())
        {
            std::cerr << "walkie-ctl: malformed reply: " << reply_line << "\n";
            return 1;
        }
        std::cout << reply.dump() << "\n";
        auto ok = reply.find("ok");
        return (ok != reply.end() && ok->is_boolean() && ok->get<bool>()) ? 0 : 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "walkie-ctl: " << e.what() << "\n";
        return 1;
    }
}
