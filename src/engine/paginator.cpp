#include "paginator.hpp"
#include <iostream>
#include <string>
#include <utility>

namespace purgecord {

CursorPaginator::CursorPaginator(DiscordClient& client, RunContext& ctx)
    : client_(client), ctx_(ctx),
      filter_(FilterOptions::from_settings(ctx.settings, ctx.author_id)) {}

static std::string cursor_label(const CursorState& cursor) {
    std::string s = cursor.max_id ? "max_id=" + std::to_string(*cursor.max_id)
                                  : std::string("from newest");
    return s + ", offset=" + std::to_string(cursor.offset);
}

CursorPaginator::SearchStatus CursorPaginator::search_once(const Target& target,
                                                           const CursorState& cursor,
                                                           uint32_t& transient_failures,
                                                           SearchPage& page) {
    std::cerr << "[search] " << target.display_name << " (" << cursor_label(cursor) << ")\n";
    auto resp = client_.search(target, ctx_.author_id, cursor.offset, cursor.max_id);

    if (ctx_.backoff.handle(resp, "search", BackoffController::kSearchRateLimitFallback))
        return SearchStatus::Retry;

    if (resp.status_code == 0 || resp.status_code >= 500) {
        transient_failures++;
        std::cerr << "[search] Request failed (HTTP " << resp.status_code << "), attempt "
                  << transient_failures << "/" << ctx_.settings.max_retries << "\n";
        if (transient_failures >= ctx_.settings.max_retries) return SearchStatus::Failed;
        ctx_.sleeper.sleep_for(ctx_.settings.search_delay);
        return SearchStatus::Retry;
    }

    if (resp.status_code < 200 || resp.status_code >= 300) {
        std::cerr << "[search] Search rejected (HTTP " << resp.status_code << "): "
                  << resp.body << "\n";
        return SearchStatus::Failed;
    }

    auto parsed = DiscordClient::parse_search_page(resp.body);
    if (!parsed) {
        std::cerr << "[search] Undecodable search response\n";
        return SearchStatus::Failed;
    }
    transient_failures = 0;
    page = std::move(*parsed);
    return SearchStatus::Ok;
}

PageResult CursorPaginator::fetch_next_page(const Target& target, CursorState& cursor) {
    PageResult result;
    uint32_t transient_failures = 0;

    while (true) {
        if (ctx_.cancel.cancelled()) {
            result.status = PageResult::Status::Cancelled;
            return result;
        }

        SearchPage page;
        auto status = search_once(target, cursor, transient_failures, page);
        if (status == SearchStatus::Retry) continue;
        if (status == SearchStatus::Failed) {
            result.status = PageResult::Status::Failed;
            return result;
        }

        if (page.group_count == 0) {
            cursor.empty_page_count++;
            if (cursor.empty_page_count >= kMaxEmptyPages) {
                std::cerr << "[search] No more messages (after " << cursor.empty_page_count
                          << " empty pages)\n";
                result.status = PageResult::Status::Exhausted;
                return result;
            }
            // The index sometimes lags; retry the same cursor
            std::cerr << "[search] Empty page (" << cursor.empty_page_count << "/"
                      << kMaxEmptyPages << "), waiting before retry\n";
            ctx_.sleeper.sleep_for(ctx_.settings.search_delay);
            continue;
        }
        cursor.empty_page_count = 0;

        auto filtered = filter_messages(page.hits, filter_);

        if (filtered.eligible.empty() && !filtered.all_hits.empty()) {
            if (!cursor.advance_past(oldest_id(filtered.all_hits))) {
                result.status = PageResult::Status::Exhausted;
                return result;
            }
            std::cerr << "[search] All " << filtered.all_hits.size()
                      << " messages in page filtered (pinned/marked), cursor -> "
                      << *cursor.max_id << "\n";
            ctx_.sleeper.sleep_for(ctx_.settings.search_delay);
            continue;
        }

        if (filtered.all_hits.empty()) {
            if (!page.hits.empty()) {
                if (!cursor.advance_past(oldest_id(page.hits))) {
                    result.status = PageResult::Status::Exhausted;
                    return result;
                }
                std::cerr << "[search] No messages by us in page, cursor -> "
                          << *cursor.max_id << "\n";
            } else {
                cursor.offset += static_cast<uint32_t>(page.group_count);
                std::cerr << "[search] No decodable hits in page, offset -> "
                          << cursor.offset << "\n";
            }
            ctx_.sleeper.sleep_for(ctx_.settings.search_delay);
            continue;
        }

        result.status = PageResult::Status::Batch;
        result.candidates = std::move(filtered.eligible);
        result.total_estimate = page.total_results;
        return result;
    }
}

} // namespace purgecord
