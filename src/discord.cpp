#include "discord.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace purgecord {

std::string UserInfo::display() const {
    if (!discriminator.empty() && discriminator != "0")
        return username + "#" + discriminator;
    return "@" + username;
}

DiscordClient::DiscordClient(const std::string& token, HttpClient& http,
                             const std::string& api_base)
    : token_(token), http_(http), api_base_(api_base)
{
    while (!api_base_.empty() && api_base_.back() == '/') api_base_.pop_back();
}

std::string DiscordClient::api_url(const std::string& path) const {
    return api_base_ + path;
}

std::vector<Header> DiscordClient::headers(bool json_body) const {
    std::vector<Header> h = {
        {"Authorization", token_},
        {"User-Agent", kUserAgent},
    };
    if (json_body) h.emplace_back("Content-Type", "application/json");
    return h;
}

std::string DiscordClient::search_url(const Target& target, const std::string& author_id,
                                      uint32_t offset, std::optional<Snowflake> max_id) const {
    std::string url;
    if (target.is_direct())
        url = api_url("/channels/" + target.channel_id + "/messages/search");
    else
        url = api_url("/guilds/" + target.container_id + "/messages/search");

    url += "?author_id=" + url_encode(author_id);
    url += "&include_nsfw=true&sort_by=timestamp&sort_order=desc";
    url += "&offset=" + std::to_string(offset);
    if (!target.is_direct())
        url += "&channel_id=" + url_encode(target.channel_id);
    if (max_id)
        url += "&max_id=" + std::to_string(*max_id);
    return url;
}

HttpResponse DiscordClient::search(const Target& target, const std::string& author_id,
                                   uint32_t offset, std::optional<Snowflake> max_id) {
    return http_.get(search_url(target, author_id, offset, max_id), headers(), 30);
}

HttpResponse DiscordClient::delete_message(const std::string& channel_id,
                                           Snowflake message_id) {
    return http_.del(api_url("/channels/" + channel_id + "/messages/" +
                             std::to_string(message_id)),
                     headers(), 10);
}

HttpResponse DiscordClient::edit_message(const std::string& channel_id,
                                         Snowflake message_id,
                                         const std::string& content) {
    nlohmann::json body = {{"content", content}};
    return http_.patch(api_url("/channels/" + channel_id + "/messages/" +
                               std::to_string(message_id)),
                       body.dump(), headers(true), 10);
}

HttpResponse DiscordClient::current_user() {
    return http_.get(api_url("/users/@me"), headers(), 10);
}

HttpResponse DiscordClient::guilds() {
    return http_.get(api_url("/users/@me/guilds"), headers(), 10);
}

HttpResponse DiscordClient::dm_channels() {
    return http_.get(api_url("/users/@me/channels"), headers(), 10);
}

HttpResponse DiscordClient::guild_channels(const std::string& guild_id) {
    return http_.get(api_url("/guilds/" + guild_id + "/channels"), headers(), 10);
}

UserInfo DiscordClient::validate_token() {
    auto resp = current_user();
    if (resp.status_code == 0)
        throw std::runtime_error("cannot reach the API to validate the token");
    if (resp.status_code == 401)
        throw std::runtime_error("invalid token (401 Unauthorized)");
    if (resp.status_code != 200)
        throw std::runtime_error("token validation failed (HTTP " +
                                 std::to_string(resp.status_code) + ")");

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(resp.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("unexpected /users/@me response: ") + e.what());
    }
    if (!j.is_object() || !j.contains("id") || !j["id"].is_string())
        throw std::runtime_error("unexpected /users/@me response: missing id");

    UserInfo user;
    user.id = j["id"].get<std::string>();
    user.username = j.value("username", std::string{});
    if (j.contains("discriminator") && j["discriminator"].is_string())
        user.discriminator = j["discriminator"].get<std::string>();
    return user;
}

static std::optional<Message> message_from_json(const nlohmann::json& m) {
    if (!m.is_object() || !m.contains("id") || !m["id"].is_string()) return std::nullopt;

    Message msg;
    try {
        msg.id = std::stoull(m["id"].get<std::string>());
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (m.contains("author") && m["author"].is_object() &&
        m["author"].contains("id") && m["author"]["id"].is_string())
        msg.author_id = m["author"]["id"].get<std::string>();
    if (m.contains("content") && m["content"].is_string())
        msg.content = m["content"].get<std::string>();
    if (m.contains("pinned") && m["pinned"].is_boolean())
        msg.pinned = m["pinned"].get<bool>();
    if (m.contains("timestamp") && m["timestamp"].is_string())
        msg.created_at = m["timestamp"].get<std::string>();
    return msg;
}

std::optional<SearchPage> DiscordClient::parse_search_page(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error&) {
        return std::nullopt;
    }
    if (!j.is_object()) return std::nullopt;

    SearchPage page;
    if (j.contains("total_results") && j["total_results"].is_number_unsigned())
        page.total_results = j["total_results"].get<uint64_t>();

    if (!j.contains("messages") || !j["messages"].is_array()) return page;

    const auto& groups = j["messages"];
    page.group_count = groups.size();
    for (const auto& group : groups) {
        if (!group.is_array()) continue;
        for (const auto& entry : group) {
            if (!entry.is_object() || !entry.contains("hit") ||
                !entry["hit"].is_boolean() || !entry["hit"].get<bool>())
                continue;
            auto msg = message_from_json(entry);
            if (msg) page.hits.push_back(std::move(*msg));
        }
    }
    return page;
}

ActionOutcome DiscordClient::classify_action(const HttpResponse& resp) {
    long code = resp.status_code;
    if (code >= 200 && code < 300) return ActionOutcome::Completed;
    if (code == 404) return ActionOutcome::AlreadyGone;
    if (code == 403) return ActionOutcome::Skipped;
    if (code == 400) {
        try {
            auto j = nlohmann::json::parse(resp.body);
            if (j.is_object() && j.value("code", 0) == kArchivedThreadCode)
                return ActionOutcome::Skipped;
        } catch (const nlohmann::json::exception&) {
            return ActionOutcome::PermanentFailure;
        }
        return ActionOutcome::PermanentFailure;
    }
    if (code == 0 || code == 429 || code >= 500) return ActionOutcome::TransientFailure;
    return ActionOutcome::PermanentFailure;
}

} // namespace purgecord
