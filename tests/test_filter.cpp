#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif
#include "engine/filter.hpp"

using namespace purgecord;

static Message msg(Snowflake id, const std::string& author = "42",
                   const std::string& content = "hi", bool pinned = false) {
    Message m;
    m.id = id;
    m.author_id = author;
    m.content = content;
    m.pinned = pinned;
    return m;
}

static FilterOptions options(bool skip_pinned, bool skip_marked) {
    FilterOptions o;
    o.author_id = "42";
    o.skip_pinned = skip_pinned;
    o.skip_marked = skip_marked;
    o.marker_text = "Meow Meow Meow Meow";
    return o;
}

TEST_CASE("filter_messages: keeps only the current user's messages", "[filter]") {
    auto r = filter_messages({msg(3), msg(2, "99"), msg(1)}, options(false, false));
    REQUIRE(r.all_hits.size() == 2);
    REQUIRE(r.eligible.size() == 2);
    REQUIRE(r.eligible[0].id == 3);
    REQUIRE(r.eligible[1].id == 1);
}

TEST_CASE("filter_messages: pinned messages are seen but not eligible", "[filter]") {
    auto r = filter_messages({msg(3), msg(2, "42", "keep", true)}, options(true, false));
    REQUIRE(r.all_hits.size() == 2);
    REQUIRE(r.eligible.size() == 1);
    REQUIRE(r.eligible[0].id == 3);
}

TEST_CASE("filter_messages: pinned messages are eligible when not skipping", "[filter]") {
    auto r = filter_messages({msg(2, "42", "keep", true)}, options(false, false));
    REQUIRE(r.eligible.size() == 1);
}

TEST_CASE("filter_messages: marked messages are excluded with skip_marked", "[filter]") {
    std::vector<Message> hits = {msg(5, "42", "Meow Meow Meow Meow"), msg(4, "42", "Meow")};

    auto skipping = filter_messages(hits, options(false, true));
    REQUIRE(skipping.all_hits.size() == 2);
    REQUIRE(skipping.eligible.size() == 1);
    REQUIRE(skipping.eligible[0].id == 4);

    auto keeping = filter_messages(hits, options(false, false));
    REQUIRE(keeping.eligible.size() == 2);
}

TEST_CASE("filter_messages: empty page gives empty result", "[filter]") {
    auto r = filter_messages({}, options(true, true));
    REQUIRE(r.all_hits.empty());
    REQUIRE(r.eligible.empty());
}

TEST_CASE("FilterOptions: from_settings copies the relevant flags", "[filter]") {
    Settings s;
    s.skip_pinned = false;
    s.skip_marked = true;
    s.marker_text = "gone";
    auto o = FilterOptions::from_settings(s, "7");
    REQUIRE(o.author_id == "7");
    REQUIRE_FALSE(o.skip_pinned);
    REQUIRE(o.skip_marked);
    REQUIRE(o.marker_text == "gone");
}

TEST_CASE("oldest_id: smallest id regardless of order", "[filter]") {
    REQUIRE(oldest_id({msg(200), msg(300), msg(100)}) == 100);
    REQUIRE(oldest_id({}) == 0);
}
