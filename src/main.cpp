#include "config.hpp"
#include "discord.hpp"
#include "discover.hpp"
#include "http.hpp"
#include "progress.hpp"
#include "sleeper.hpp"
#include "stats.hpp"
#include "util.hpp"
#include "engine/runner.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <csignal>
#include <optional>
#include <stdexcept>

#ifndef PURGECORD_VERSION
#define PURGECORD_VERSION "dev"
#endif

static purgecord::CancelToken g_cancel;

static void signal_handler(int /*sig*/) {
    g_cancel.cancel();
}

static void print_usage() {
    std::cout << "Usage: purgecord [options]\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config PATH    Run the targets listed in a config file\n"
              << "  -d, --discover       List servers and DMs and write config.json\n"
              << "  -t, --token TOKEN    Account token (overrides env and .env)\n"
              << "  --dry-run            Preview matching messages without touching them\n"
              << "  -r, --resume         Continue from the saved checkpoint\n"
              << "  --verify-auth        Validate the token and exit\n"
              << "  -y, --yes            Skip the confirmation prompt\n"
              << "  --mark [MODE]        Overwrite content before acting:\n"
              << "                       mark_and_delete (default) or mark_only\n"
              << "  --skip-marked        Leave messages that already carry the marker text\n"
              << "  --version            Show version\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  DISCORD_TOKEN        Account token (or a DISCORD_TOKEN= line in .env)\n";
}

static std::string require_token(const std::string& flag, const std::string& env_name) {
    auto token = purgecord::resolve_token(flag, env_name);
    if (!token) {
        throw std::runtime_error("no token found. Use --token, set " + env_name +
                                 ", or add " + env_name + "=... to .env");
    }
    return *token;
}

static purgecord::UserInfo authenticate(purgecord::DiscordClient& client) {
    std::cout << "Validating token...\n";
    auto user = client.validate_token();
    std::cout << "  Logged in as: " << user.display() << " (ID: " << user.id << ")\n";
    return user;
}

static std::string describe_action(const purgecord::Settings& s) {
    switch (s.mode) {
        case purgecord::ActionMode::MarkOnly:
            return "edit messages to \"" + s.marker_text + "\" in";
        case purgecord::ActionMode::MarkAndDelete:
            return "edit messages to \"" + s.marker_text + "\" then delete them from";
        case purgecord::ActionMode::DeleteOnly:
            break;
    }
    return "delete messages from";
}

static void print_settings(const purgecord::Config& config) {
    const auto& s = config.settings;
    std::cout << "Configuration loaded:\n"
              << "  Targets: " << config.targets.size() << "\n"
              << "  Search delay: " << s.search_delay << "s\n"
              << "  Delete delay: " << s.delete_delay << "s\n"
              << "  Skip pinned: " << (s.skip_pinned ? "true" : "false") << "\n";
    if (s.skip_marked)
        std::cout << "  Skip marked: true (messages reading \"" << s.marker_text
                  << "\" are preserved)\n";
    if (s.mode != purgecord::ActionMode::DeleteOnly)
        std::cout << "  Mark mode: " << purgecord::mode_to_string(s.mode) << "\n";
    if (s.dry_run)
        std::cout << "  DRY RUN MODE: no message will be changed\n";
}

static bool confirm(const purgecord::Config& config) {
    std::cout << "\nThis will " << describe_action(config.settings) << " "
              << config.targets.size() << " channels/DMs.\n"
              << "This action cannot be undone!\n"
              << "Continue? (yes/no): " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    return purgecord::to_lower(purgecord::trim(answer)) == "yes";
}

int main(int argc, char* argv[]) try {
    std::string token_flag;
    std::string config_path;
    bool discover = false;
    bool dry_run = false;
    bool resume = false;
    bool verify_auth = false;
    bool assume_yes = false;
    bool skip_marked = false;
    std::optional<purgecord::ActionMode> mark_mode;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << "purgecord " << PURGECORD_VERSION << "\n";
            return 0;
        } else if ((std::strcmp(argv[i], "-t") == 0 || std::strcmp(argv[i], "--token") == 0) && i + 1 < argc) {
            token_flag = argv[++i];
        } else if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "-d") == 0 || std::strcmp(argv[i], "--discover") == 0) {
            discover = true;
        } else if (std::strcmp(argv[i], "--dry-run") == 0) {
            dry_run = true;
        } else if (std::strcmp(argv[i], "-r") == 0 || std::strcmp(argv[i], "--resume") == 0) {
            resume = true;
        } else if (std::strcmp(argv[i], "--verify-auth") == 0) {
            verify_auth = true;
        } else if (std::strcmp(argv[i], "-y") == 0 || std::strcmp(argv[i], "--yes") == 0) {
            assume_yes = true;
        } else if (std::strcmp(argv[i], "--skip-marked") == 0) {
            skip_marked = true;
        } else if (std::strcmp(argv[i], "--mark") == 0) {
            mark_mode = purgecord::ActionMode::MarkAndDelete;
            // Optional value
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                auto mode = purgecord::parse_action_mode(argv[++i]);
                if (!mode || *mode == purgecord::ActionMode::DeleteOnly) {
                    std::cerr << "Invalid --mark mode: " << argv[i] << "\n";
                    print_usage();
                    return 1;
                }
                mark_mode = mode;
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (!discover && !verify_auth && config_path.empty()) {
        print_usage();
        return 1;
    }

    purgecord::http_init();
    purgecord::PlatformHttpClient http_client;

    // Identity-only modes run without a config file
    if (discover || verify_auth) {
        purgecord::DiscordClient client(require_token(token_flag, "DISCORD_TOKEN"), http_client);
        authenticate(client);
        if (verify_auth) {
            std::cout << "\nToken is valid!\n";
        } else {
            purgecord::run_discover(client);
        }
        purgecord::http_cleanup();
        return 0;
    }

    auto config = purgecord::Config::load(config_path);
    if (mark_mode) config.settings.mode = *mark_mode;
    if (skip_marked) config.settings.skip_marked = true;
    if (dry_run) config.settings.dry_run = true;
    if (config.settings.mode != purgecord::ActionMode::DeleteOnly &&
        config.settings.marker_text.empty())
        throw std::invalid_argument("marker_text must not be empty when marking");

    purgecord::DiscordClient client(require_token(token_flag, config.auth_token_env),
                                    http_client, config.settings.api_base);
    auto user = authenticate(client);

    if (config.targets.empty())
        throw std::runtime_error("no enabled targets in " + config_path);

    std::cout << "\n";
    print_settings(config);

    if (!config.settings.dry_run && !assume_yes && !confirm(config)) {
        std::cout << "Aborted.\n";
        purgecord::http_cleanup();
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    purgecord::ThreadSleeper sleeper;
    purgecord::ProgressStore progress(config.settings.progress_file);
    purgecord::BatchRunner runner(client, config, user.id, progress, sleeper, g_cancel);
    const auto& stats = runner.run(resume);

    std::cout << "\n" << std::string(60, '=') << "\nSUMMARY\n"
              << std::string(60, '=') << "\n\n"
              << purgecord::format_summary(stats);
    if (runner.state() == purgecord::RunnerState::Cancelled && !config.settings.dry_run)
        std::cout << "\nInterrupted. Progress saved; continue with --resume.\n";

    purgecord::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
}
