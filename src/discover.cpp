#include "discover.hpp"
#include "config.hpp"
#include "util.hpp"
#include <iostream>
#include <stdexcept>

namespace purgecord {

namespace {

nlohmann::json parse_array(const std::string& body, const char* what) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("unreadable ") + what + " response: " + e.what());
    }
    if (!j.is_array())
        throw std::runtime_error(std::string("unexpected ") + what + " response");
    return j;
}

std::string string_field(const nlohmann::json& j, const char* key,
                         const std::string& fallback = {}) {
    if (j.is_object() && j.contains(key) && j[key].is_string())
        return j[key].get<std::string>();
    return fallback;
}

int type_field(const nlohmann::json& j) {
    if (j.is_object() && j.contains("type") && j["type"].is_number_integer())
        return j["type"].get<int>();
    return -1;
}

// Read a line from stdin, returns false on EOF
bool read_line(std::string& out) {
    if (!std::getline(std::cin, out)) return false;
    out = trim(out);
    return true;
}

// Read y/n answer; Enter and EOF mean no
bool ask_yes_no() {
    std::string answer;
    if (!read_line(answer) || answer.empty()) return false;
    return answer[0] == 'y' || answer[0] == 'Y';
}

// GET that must succeed; the listing endpoints are fatal when they fail
std::string fetch(HttpResponse resp, const char* what) {
    if (resp.status_code != 200)
        throw std::runtime_error(std::string("failed to fetch ") + what + " (HTTP " +
                                 std::to_string(resp.status_code) + ")");
    return resp.body;
}

} // namespace

std::vector<GuildInfo> parse_guilds(const std::string& body) {
    std::vector<GuildInfo> guilds;
    for (const auto& g : parse_array(body, "guild list")) {
        std::string id = string_field(g, "id");
        if (id.empty()) continue;
        guilds.push_back({id, string_field(g, "name", id)});
    }
    return guilds;
}

std::vector<DirectChannel> parse_direct_channels(const std::string& body) {
    std::vector<DirectChannel> channels;
    for (const auto& c : parse_array(body, "channel list")) {
        std::string id = string_field(c, "id");
        if (id.empty()) continue;

        int type = type_field(c);
        if (type == 1) {
            std::string name = "Unknown";
            if (c.contains("recipients") && c["recipients"].is_array() &&
                !c["recipients"].empty())
                name = string_field(c["recipients"][0], "username", name);
            channels.push_back({id, TargetKind::Direct, name});
        } else if (type == 3) {
            channels.push_back({id, TargetKind::Group,
                                string_field(c, "name", "Unnamed Group")});
        }
    }
    return channels;
}

std::vector<nlohmann::json> guild_channel_targets(const GuildInfo& guild,
                                                  const std::string& body) {
    std::vector<nlohmann::json> targets;
    for (const auto& c : parse_array(body, "guild channels")) {
        int type = type_field(c);
        // text, announcement, forum
        if (type != 0 && type != 5 && type != 15) continue;
        std::string id = string_field(c, "id");
        if (id.empty()) continue;
        targets.push_back({
            {"type", "guild"},
            {"guild_id", guild.id},
            {"guild_name", guild.name},
            {"channel_id", id},
            {"channel_name", string_field(c, "name", id)},
            {"enabled", true}
        });
    }
    return targets;
}

nlohmann::json direct_target(const DirectChannel& channel) {
    if (channel.kind == TargetKind::Group) {
        return {{"type", "group_dm"}, {"channel_id", channel.id},
                {"group_name", channel.name}, {"enabled", true}};
    }
    return {{"type", "dm"}, {"channel_id", channel.id},
            {"recipient_name", channel.name}, {"enabled", true}};
}

std::optional<std::vector<size_t>> parse_selection(const std::string& input, size_t count) {
    std::vector<size_t> picked;
    std::string s = to_lower(trim(input));
    if (s.empty()) return std::nullopt;

    if (s == "all") {
        for (size_t i = 0; i < count; i++) picked.push_back(i);
        return picked;
    }

    for (const auto& part : split(s, ',')) {
        std::string item = trim(part);
        if (item.empty()) continue;
        size_t n = 0;
        try {
            size_t used = 0;
            n = std::stoul(item, &used);
            if (used != item.size()) return std::nullopt;
        } catch (const std::exception&) {
            return std::nullopt;
        }
        if (n >= 1 && n <= count) picked.push_back(n - 1);
    }
    return picked;
}

nlohmann::json build_config(const std::vector<nlohmann::json>& targets) {
    nlohmann::json j = Config::defaults_json();
    j["targets"] = targets;
    return j;
}

bool run_discover(DiscordClient& client, const std::string& output_path) {
    std::cout << "Fetching your servers...\n";
    auto guilds = parse_guilds(fetch(client.guilds(), "guilds"));
    auto directs = parse_direct_channels(fetch(client.dm_channels(), "DM channels"));

    std::cout << "\nFound " << guilds.size() << " servers and " << directs.size()
              << " DM channels\n\nYOUR SERVERS:\n";
    for (size_t i = 0; i < guilds.size(); i++)
        std::cout << "  " << (i + 1) << ". " << guilds[i].name << " (ID: " << guilds[i].id << ")\n";

    std::cout << "\nYOUR DMs:\n";
    for (size_t i = 0; i < directs.size(); i++) {
        const auto& d = directs[i];
        std::cout << "  " << (i + 1) << ". "
                  << (d.kind == TargetKind::Group ? "Group: " : "@") << d.name
                  << " (ID: " << d.id << ")\n";
    }

    std::cout << "\nCreate " << output_path << " for batch processing? [y/N] " << std::flush;
    if (!ask_yes_no()) {
        std::cout << "You can write the config by hand or re-run with --discover.\n";
        return false;
    }

    std::cout << "\nSelect servers to process (comma-separated numbers, or 'all'): " << std::flush;
    std::string line;
    if (!read_line(line)) return false;
    std::vector<size_t> picked;
    if (!line.empty()) {
        auto selection = parse_selection(line, guilds.size());
        if (!selection) {
            std::cout << "Invalid selection.\n";
            return false;
        }
        picked = *selection;
    }

    std::vector<nlohmann::json> targets;
    for (size_t idx : picked) {
        const auto& guild = guilds[idx];
        std::cout << "\nFetching channels for: " << guild.name << "\n";
        auto resp = client.guild_channels(guild.id);
        if (resp.status_code != 200) {
            std::cerr << "[discover] Failed to fetch channels for " << guild.id
                      << " (HTTP " << resp.status_code << ")\n";
            continue;
        }

        std::vector<nlohmann::json> channels;
        try {
            channels = guild_channel_targets(guild, resp.body);
        } catch (const std::runtime_error& e) {
            std::cerr << "[discover] " << e.what() << "\n";
            continue;
        }
        std::cout << "  Found " << channels.size() << " text channels\n"
                  << "  Add all channels from this server? [y/N] " << std::flush;
        if (ask_yes_no())
            targets.insert(targets.end(), channels.begin(), channels.end());
    }

    if (!directs.empty()) {
        std::cout << "\nInclude DMs? [y/N] " << std::flush;
        if (ask_yes_no()) {
            for (const auto& d : directs) targets.push_back(direct_target(d));
        }
    }

    if (!atomic_write_file(output_path, build_config(targets).dump(2))) {
        std::cerr << "[discover] Failed to write " << output_path << "\n";
        return false;
    }

    std::cout << "\nConfiguration saved to " << output_path << "\n"
              << "  Total targets: " << targets.size() << "\n\n"
              << "Next steps:\n"
              << "  1. Review " << output_path << " and adjust settings if needed\n"
              << "  2. Test with: purgecord --config " << output_path << " --dry-run\n"
              << "  3. Execute with: purgecord --config " << output_path << "\n";
    return true;
}

} // namespace purgecord
