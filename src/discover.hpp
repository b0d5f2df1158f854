#pragma once
#include "discord.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace purgecord {

struct GuildInfo {
    std::string id;
    std::string name;
};

// A DM (type 1) or group DM (type 3) channel
struct DirectChannel {
    std::string id;
    TargetKind kind = TargetKind::Direct;
    std::string name; // recipient username or group name
};

// Decode /users/@me/guilds. Throws std::runtime_error on a malformed body.
std::vector<GuildInfo> parse_guilds(const std::string& body);

// Decode /users/@me/channels, keeping DMs and group DMs only.
// Throws std::runtime_error on a malformed body.
std::vector<DirectChannel> parse_direct_channels(const std::string& body);

// Guild target entries for the text, announcement and forum channels
// in a /guilds/{id}/channels body
std::vector<nlohmann::json> guild_channel_targets(const GuildInfo& guild,
                                                  const std::string& body);

nlohmann::json direct_target(const DirectChannel& channel);

// "all" or comma-separated 1-based numbers. Out-of-range numbers are
// dropped; nullopt if the input is not a selection at all.
std::optional<std::vector<size_t>> parse_selection(const std::string& input, size_t count);

// Default settings plus the given targets
nlohmann::json build_config(const std::vector<nlohmann::json>& targets);

// Interactive walk through guilds and DMs that writes a config file.
// Returns false if the user declined or nothing was written.
bool run_discover(DiscordClient& client, const std::string& output_path = "config.json");

} // namespace purgecord
