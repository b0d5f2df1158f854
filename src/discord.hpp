#pragma once
#include "http.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace purgecord {

struct UserInfo {
    std::string id;
    std::string username;
    std::string discriminator;

    // "@name" for new-style accounts, "name#1234" for legacy ones
    std::string display() const;
};

// One decoded search response
struct SearchPage {
    uint64_t total_results = 0;
    size_t group_count = 0;
    std::vector<Message> hits; // entries flagged "hit", in delivered order
};

// Thin wrapper over the REST endpoints the engine consumes. Calls return the
// raw HttpResponse; throttling is handled by the caller via BackoffController.
class DiscordClient {
public:
    static constexpr int kArchivedThreadCode = 50083;
    static constexpr const char* kUserAgent =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
        "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";

    DiscordClient(const std::string& token, HttpClient& http,
                  const std::string& api_base = "https://discord.com/api/v9");

    // Build API URL for a path ("/users/@me")
    std::string api_url(const std::string& path) const;

    // Search URL: guild targets go through the guild index with a channel
    // filter, direct/group targets through the channel index.
    std::string search_url(const Target& target, const std::string& author_id,
                           uint32_t offset, std::optional<Snowflake> max_id) const;

    HttpResponse search(const Target& target, const std::string& author_id,
                        uint32_t offset, std::optional<Snowflake> max_id);
    HttpResponse delete_message(const std::string& channel_id, Snowflake message_id);
    HttpResponse edit_message(const std::string& channel_id, Snowflake message_id,
                              const std::string& content);

    HttpResponse current_user();
    HttpResponse guilds();
    HttpResponse dm_channels();
    HttpResponse guild_channels(const std::string& guild_id);

    // GET /users/@me. Throws std::runtime_error if the token is rejected or
    // the API cannot be reached.
    UserInfo validate_token();

    // Returns nullopt if the body is not a search response
    static std::optional<SearchPage> parse_search_page(const std::string& body);

    // Map an edit/delete response to an outcome. Throttle responses must be
    // handled before this is called; a 429 that reaches here is transient.
    static ActionOutcome classify_action(const HttpResponse& resp);

private:
    std::vector<Header> headers(bool json_body = false) const;

    std::string token_;
    HttpClient& http_;
    std::string api_base_;
};

} // namespace purgecord
