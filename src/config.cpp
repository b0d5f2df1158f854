#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace purgecord {

nlohmann::json Config::defaults_json() {
    return {
        {"auth_token_env", "DISCORD_TOKEN"},
        {"settings", {
            {"search_delay", 10},
            {"delete_delay", 1},
            {"skip_pinned", true},
            {"skip_marked", false},
            {"max_retries", 3},
            {"mark_mode", "off"},
            {"marker_text", kDefaultMarkerText},
            {"dry_run", false},
            {"progress_file", kDefaultProgressFile},
            {"api_base", kDefaultApiBase}
        }},
        {"targets", nlohmann::json::array()}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

std::optional<ActionMode> parse_action_mode(const std::string& s) {
    std::string v = to_lower(trim(s));
    if (v == "off" || v == "delete_only") return ActionMode::DeleteOnly;
    if (v == "mark_and_delete" || v == "edit_and_delete") return ActionMode::MarkAndDelete;
    if (v == "mark_only" || v == "edit_only") return ActionMode::MarkOnly;
    return std::nullopt;
}

static std::string required_string(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string() || j[key].get<std::string>().empty())
        throw std::invalid_argument(std::string("target is missing \"") + key + "\"");
    return j[key].get<std::string>();
}

Target target_from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw std::invalid_argument("target must be an object");

    Target t;
    std::string type = j.value("type", std::string{});
    t.channel_id = required_string(j, "channel_id");
    t.enabled = j.value("enabled", true);

    if (type == "guild") {
        t.kind = TargetKind::Guild;
        t.container_id = required_string(j, "guild_id");
        t.display_name = "#" + j.value("channel_name", t.channel_id) + " (" +
                         j.value("guild_name", t.container_id) + ")";
    } else if (type == "dm") {
        t.kind = TargetKind::Direct;
        t.container_id = kDirectContainer;
        t.display_name = "DM: @" + j.value("recipient_name", std::string{"unknown"});
    } else if (type == "group_dm") {
        t.kind = TargetKind::Group;
        t.container_id = kDirectContainer;
        t.display_name = "Group: " + j.value("group_name", std::string{"Unnamed Group"});
    } else {
        throw std::invalid_argument("unknown target type \"" + type + "\"");
    }
    return t;
}

Config Config::from_json(const nlohmann::json& original) {
    if (!original.is_object()) throw std::invalid_argument("config root must be an object");
    nlohmann::json j = merge_defaults(original, defaults_json());

    Config cfg;
    if (j["auth_token_env"].is_string())
        cfg.auth_token_env = j["auth_token_env"].get<std::string>();

    auto& s = j["settings"];
    if (!s.is_object()) throw std::invalid_argument("\"settings\" must be an object");

    if (s["search_delay"].is_number())
        cfg.settings.search_delay = s["search_delay"].get<double>();
    if (s["delete_delay"].is_number())
        cfg.settings.delete_delay = s["delete_delay"].get<double>();
    if (s["skip_pinned"].is_boolean())
        cfg.settings.skip_pinned = s["skip_pinned"].get<bool>();
    if (s["skip_marked"].is_boolean())
        cfg.settings.skip_marked = s["skip_marked"].get<bool>();
    if (s["max_retries"].is_number_integer()) {
        auto retries = s["max_retries"].get<int64_t>();
        if (retries < 1) throw std::invalid_argument("max_retries must be at least 1");
        cfg.settings.max_retries = static_cast<uint32_t>(retries);
    }
    if (s["mark_mode"].is_string()) {
        auto mode = parse_action_mode(s["mark_mode"].get<std::string>());
        if (!mode) throw std::invalid_argument("unknown mark_mode \"" +
                                               s["mark_mode"].get<std::string>() + "\"");
        cfg.settings.mode = *mode;
    }
    if (s["marker_text"].is_string())
        cfg.settings.marker_text = s["marker_text"].get<std::string>();
    if (s["dry_run"].is_boolean())
        cfg.settings.dry_run = s["dry_run"].get<bool>();
    if (s["progress_file"].is_string())
        cfg.settings.progress_file = s["progress_file"].get<std::string>();
    if (s["api_base"].is_string())
        cfg.settings.api_base = s["api_base"].get<std::string>();

    if (cfg.settings.search_delay < 0 || cfg.settings.delete_delay < 0)
        throw std::invalid_argument("delays must not be negative");
    if (cfg.settings.marker_text.empty() && cfg.settings.mode != ActionMode::DeleteOnly)
        throw std::invalid_argument("marker_text must not be empty when marking");

    if (!j["targets"].is_array()) throw std::invalid_argument("\"targets\" must be an array");
    for (const auto& item : j["targets"]) {
        Target t = target_from_json(item);
        if (t.enabled)
            cfg.targets.push_back(std::move(t));
        else
            cfg.disabled_targets++;
    }
    return cfg;
}

Config Config::load(const std::string& path) {
    std::ifstream file(expand_home(path));
    if (!file.is_open()) throw std::runtime_error("cannot open config file " + path);

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("cannot parse config file " + path + ": " + e.what());
    }

    Config cfg = from_json(j);
    std::cerr << "[config] Loaded " << cfg.targets.size() << " enabled targets from "
              << path << " (" << cfg.disabled_targets << " disabled)\n";
    return cfg;
}

static std::string strip_quotes(std::string v) {
    if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front())
        v = v.substr(1, v.size() - 2);
    return v;
}

std::optional<std::string> resolve_token(const std::string& flag_value,
                                         const std::string& env_name,
                                         const std::string& dotenv_path) {
    if (!flag_value.empty()) {
        std::cerr << "[config] Using token from command-line argument\n";
        return flag_value;
    }

    if (!env_name.empty()) {
        if (const char* v = std::getenv(env_name.c_str())) {
            if (*v) {
                std::cerr << "[config] Using token from " << env_name << " environment variable\n";
                return std::string(v);
            }
        }
    }

    std::ifstream env_file(dotenv_path);
    if (env_file.is_open()) {
        std::string key = (env_name.empty() ? std::string("DISCORD_TOKEN") : env_name) + "=";
        std::string line;
        while (std::getline(env_file, line)) {
            line = trim(line);
            if (line.rfind(key, 0) == 0) {
                std::string token = strip_quotes(trim(line.substr(key.size())));
                if (token.empty()) continue;
                std::cerr << "[config] Using token from " << dotenv_path << "\n";
                return token;
            }
        }
    }

    return std::nullopt;
}

} // namespace purgecord
