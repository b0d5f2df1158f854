#pragma once
#include "types.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace purgecord {

inline constexpr const char* kDefaultMarkerText = "Meow Meow Meow Meow";
inline constexpr const char* kDefaultApiBase = "https://discord.com/api/v9";
inline constexpr const char* kDefaultProgressFile = ".purgecord_progress.json";

struct Settings {
    double search_delay = 10.0;  // seconds between search pages
    double delete_delay = 1.0;   // seconds between actions
    bool skip_pinned = true;
    bool skip_marked = false;
    uint32_t max_retries = 3;    // attempts per edit/delete
    ActionMode mode = ActionMode::DeleteOnly;
    std::string marker_text = kDefaultMarkerText;
    bool dry_run = false;
    std::string progress_file = kDefaultProgressFile;
    std::string api_base = kDefaultApiBase;
};

struct Config {
    std::string auth_token_env = "DISCORD_TOKEN";
    Settings settings;
    std::vector<Target> targets; // enabled targets only, in processing order
    size_t disabled_targets = 0;

    // Read and validate a config file. Throws std::runtime_error if the file
    // cannot be read or parsed, std::invalid_argument on bad values.
    static Config load(const std::string& path);

    // Validate an already-parsed document (missing keys take defaults)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by from_json, discovery and tests)
    static nlohmann::json defaults_json();
};

// Parses "off", "delete_only", "mark_and_delete", "mark_only" and the
// "edit_and_delete" / "edit_only" synonyms.
std::optional<ActionMode> parse_action_mode(const std::string& s);

// One entry of the "targets" array. Throws std::invalid_argument.
Target target_from_json(const nlohmann::json& j);

// Credential lookup: explicit flag, then env var, then KEY= line in a dotenv file.
std::optional<std::string> resolve_token(const std::string& flag_value,
                                         const std::string& env_name,
                                         const std::string& dotenv_path = ".env");

} // namespace purgecord
