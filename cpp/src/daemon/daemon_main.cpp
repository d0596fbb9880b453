/**
 * @file daemon_main.cpp
 * @brief walkied: the per-user walkie daemon.
 *
 * ## Usage
 *
 *     walkied                         # run; logs to <dir>/daemon.log
 *     walkied --foreground            # run; logs to stderr
 *     walkied --dir /tmp/w --log-level debug
 *     walkied --config ./walkie.json
 *     walkied --print-key             # print the mesh public key; exit 0
 *     walkied --self-test             # two loopback daemons; exit 0 on pass
 *
 * Exit codes: 0 clean shutdown or passed self-test, 1 startup failure (including
 * another daemon already running) or failed self-test.
 */
#include "self_test.hpp"
#include "walkie_daemon.hpp"
#include "zmq_mesh.hpp"

#include "wk_service.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;
using namespace walkie;

// ---------------------------------------------------------------------------
// Signal handling: the handler only asks the loop to stop.
// ---------------------------------------------------------------------------

static utils::EventLoop *g_loop{nullptr};

static void signal_handler(int /*sig*/) noexcept
{
    if (g_loop != nullptr)
        g_loop->request_stop();
}

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

namespace
{

struct DaemonArgs
{
    std::optional<fs::path> dir;
    std::optional<fs::path> config_file;
    std::optional<std::string> log_level;
    bool foreground{false};
    bool self_test{false};
    bool print_key{false};
};

void print_usage(const char *prog)
{
    std::cout
        << "Usage:\n"
        << "  " << prog
        << " [--dir <path>] [--config <file>] [--foreground] [--log-level <lvl>]\n"
        << "  " << prog << " --self-test | --print-key | --version | --help\n\n"
        << "Options:\n"
        << "  --dir <path>        Private state directory (default $WALKIE_DIR or ~/.walkie)\n"
        << "  --config <file>     JSON config file (default <dir>/config.json if present)\n"
        << "  --foreground        Log to stderr instead of <dir>/daemon.log\n"
        << "  --log-level <lvl>   trace | debug | info | warn | error\n"
        << "  --self-test         Run two in-process daemons and check they talk\n"
        << "  --print-key         Print the mesh public key (created if missing)\n"
        << "  --version           Print the version\n"
        << "  --help              Show this message\n";
}

DaemonArgs parse_args(int argc, char *argv[])
{
    DaemonArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        if (arg == "--version")
        {
            std::cout << "walkied " << platform::get_version_string() << "\n";
            std::exit(0);
        }
        if (arg == "--dir" && i + 1 < argc)
        {
            args.dir = fs::path(argv[++i]);
        }
        else if (arg == "--config" && i + 1 < argc)
        {
            args.config_file = fs::path(argv[++i]);
        }
        else if (arg == "--log-level" && i + 1 < argc)
        {
            args.log_level = argv[++i];
        }
        else if (arg == "--foreground")
        {
            args.foreground = true;
        }
        else if (arg == "--self-test")
        {
            args.self_test = true;
        }
        else if (arg == "--print-key")
        {
            args.print_key = true;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }
    return args;
}

int run_daemon(const daemon::DaemonConfig &config, bool foreground)
{
    const daemon::DaemonPaths paths = config.paths();

    if (!foreground)
    {
        std::error_code ec;
        fs::create_directories(paths.dir, ec);
        if (ec || !utils::Logger::instance().set_logfile(paths.log))
        {
            std::cerr << "walkied: cannot log to " << paths.log << ", logging to stderr\n";
        }
    }

    const daemon::CurveKeypair keys = daemon::ZmqMesh::load_or_create_keypair(paths.key);

    daemon::MeshConfig mesh_config = config.mesh;
    mesh_config.max_frame_size = config.limits.max_peer_buffer;

    utils::EventLoop loop;
    daemon::WalkieDaemon walkie(loop, config,
                                std::make_unique<daemon::ZmqMesh>(loop, mesh_config, keys));

    // Set before start() so a signal during startup is kept until run() sees it.
    g_loop = &loop;
    auto clear_loop = basics::make_scope_guard([]() noexcept { g_loop = nullptr; });

    auto started = walkie.start();
    if (started.is_error())
    {
        if (started.error() == daemon::DaemonError::AlreadyRunning)
        {
            LOGGER_ERROR("Another daemon already running pid={}, exiting", started.error_code());
            std::cerr << "walkied: already running (pid " << started.error_code() << ")\n";
        }
        else
        {
            std::cerr << "walkied: startup failed, see " << paths.log << "\n";
        }
        return 1;
    }

    walkie.run();
    return 0;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char *argv[])
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    const DaemonArgs args = parse_args(argc, argv);

    // ── Config ───────────────────────────────────────────────────────────────
    daemon::DaemonConfig config;
    try
    {
        config = daemon::DaemonConfig::load(args.dir, args.config_file);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }
    if (args.log_level)
    {
        auto level = utils::Logger::parse_level(*args.log_level);
        if (!level)
        {
            std::cerr << "Unknown log level: " << *args.log_level << "\n";
            return 1;
        }
        config.log_level = *level;
    }

    // ── Lifecycle guard ──────────────────────────────────────────────────────
    utils::LifecycleGuard daemon_lifecycle(utils::MakeModDefList(
        utils::Logger::GetLifecycleModule(), utils::FileLock::GetLifecycleModule(),
        crypto::GetLifecycleModule(), utils::GetZMQContextModule()));
    utils::Logger::instance().set_level(config.log_level);

    try
    {
        // ── print-key mode ───────────────────────────────────────────────────
        if (args.print_key)
        {
            const auto keys = daemon::ZmqMesh::load_or_create_keypair(config.paths().key);
            std::cout << keys.public_key << "\n";
            return 0;
        }

        // ── self-test mode ───────────────────────────────────────────────────
        if (args.self_test)
        {
            const bool passed = daemon::run_self_test(fs::temp_directory_path());
            std::cout << "walkied self-test " << (passed ? "passed" : "FAILED") << "\n";
            return passed ? 0 : 1;
        }

        // ── Run mode ─────────────────────────────────────────────────────────
        return run_daemon(config, args.foreground);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("walkied: fatal: {}", e.what());
        std::cerr << "walkied: " << e.what() << "\n";
        return 1;
    }
}
