#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif
#include "progress.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace purgecord;

static std::string test_path(const std::string& name) {
    return "/tmp/purgecord_test_" + name + "_" + std::to_string(getpid()) + ".json";
}

struct ProgressFixture {
    std::string path;
    ProgressStore store;

    explicit ProgressFixture(const std::string& name = "progress")
        : path(test_path(name)), store(path) {}

    ~ProgressFixture() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + ".tmp");
    }

    void write_raw(const std::string& contents) {
        std::ofstream out(path);
        out << contents;
    }
};

TEST_CASE("ProgressStore: no file means no checkpoint", "[progress]") {
    ProgressFixture f;
    REQUIRE_FALSE(f.store.exists());
    REQUIRE_FALSE(f.store.load().has_value());
}

TEST_CASE("ProgressStore: save then load", "[progress]") {
    ProgressFixture f;
    RunStatistics stats;
    stats.completed = 10;
    stats.already_gone = 4;
    stats.rate_limited_events = 2;
    stats.start_time = 1700000000;

    REQUIRE(f.store.save(3, stats));
    REQUIRE(f.store.exists());

    auto cp = f.store.load();
    REQUIRE(cp.has_value());
    REQUIRE(cp->current_target_index == 3);
    REQUIRE(cp->statistics.completed == 10);
    REQUIRE(cp->statistics.already_gone == 4);
    REQUIRE(cp->statistics.rate_limited_events == 2);
    REQUIRE(cp->statistics.start_time == 1700000000);
    REQUIRE_FALSE(cp->saved_at.empty());
}

TEST_CASE("ProgressStore: file layout", "[progress]") {
    ProgressFixture f;
    RunStatistics stats;
    stats.completed = 1;
    REQUIRE(f.store.save(2, stats));

    std::ifstream in(f.path);
    auto j = nlohmann::json::parse(in);
    REQUIRE(j["current_target_index"] == 2);
    REQUIRE(j["statistics"]["completed"] == 1);
    REQUIRE(j["saved_at"].is_string());
}

TEST_CASE("ProgressStore: each save replaces the previous one", "[progress]") {
    ProgressFixture f;
    RunStatistics stats;
    REQUIRE(f.store.save(1, stats));
    stats.completed = 5;
    REQUIRE(f.store.save(2, stats));

    auto cp = f.store.load();
    REQUIRE(cp.has_value());
    REQUIRE(cp->current_target_index == 2);
    REQUIRE(cp->statistics.completed == 5);
    REQUIRE_FALSE(std::filesystem::exists(f.path + ".tmp"));
}

TEST_CASE("ProgressStore: malformed file is ignored", "[progress]") {
    ProgressFixture f;

    f.write_raw("{not json");
    REQUIRE_FALSE(f.store.load().has_value());

    f.write_raw(R"({"statistics":{}})");
    REQUIRE_FALSE(f.store.load().has_value());

    f.write_raw(R"({"current_target_index":-1})");
    REQUIRE_FALSE(f.store.load().has_value());
}

TEST_CASE("ProgressStore: missing statistics load as zero", "[progress]") {
    ProgressFixture f;
    f.write_raw(R"({"current_target_index":4})");

    auto cp = f.store.load();
    REQUIRE(cp.has_value());
    REQUIRE(cp->current_target_index == 4);
    REQUIRE(cp->statistics.completed == 0);
    REQUIRE(cp->saved_at.empty());
}

TEST_CASE("ProgressStore: creates missing directories", "[progress]") {
    std::string dir = "/tmp/purgecord_test_dir_" + std::to_string(getpid());
    {
        ProgressStore store(dir + "/nested/progress.json");
        REQUIRE(store.save(0, RunStatistics{}));
        REQUIRE(store.load().has_value());
    }
    std::filesystem::remove_all(dir);
}
