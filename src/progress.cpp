#include "progress.hpp"
#include "stats.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

namespace purgecord {

ProgressStore::ProgressStore(std::string path) : path_(std::move(path)) {}

bool ProgressStore::save(size_t current_target_index, const RunStatistics& stats) {
    nlohmann::json j = {
        {"current_target_index", current_target_index},
        {"statistics", stats},
        {"saved_at", timestamp_now()}
    };
    if (!atomic_write_file(path_, j.dump(2))) {
        std::cerr << "[progress] Failed to write checkpoint " << path_ << "\n";
        return false;
    }
    std::cerr << "[progress] Checkpoint saved (next target index "
              << current_target_index << ")\n";
    return true;
}

std::optional<Checkpoint> ProgressStore::load() const {
    std::ifstream file(path_);
    if (!file.is_open()) return std::nullopt;

    try {
        auto j = nlohmann::json::parse(file);
        if (!j.is_object() || !j.contains("current_target_index") ||
            !j["current_target_index"].is_number_unsigned()) {
            std::cerr << "[progress] Ignoring malformed checkpoint " << path_ << "\n";
            return std::nullopt;
        }

        Checkpoint cp;
        cp.current_target_index = j["current_target_index"].get<size_t>();
        if (j.contains("statistics") && j["statistics"].is_object())
            cp.statistics = j["statistics"].get<RunStatistics>();
        if (j.contains("saved_at") && j["saved_at"].is_string())
            cp.saved_at = j["saved_at"].get<std::string>();
        return cp;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[progress] Ignoring unreadable checkpoint " << path_
                  << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

bool ProgressStore::exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

} // namespace purgecord
