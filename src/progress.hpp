#pragma once
#include "types.hpp"
#include <optional>
#include <string>

namespace purgecord {

// Per-target checkpoint file. Each save replaces the whole file.
class ProgressStore {
public:
    explicit ProgressStore(std::string path);

    // Returns false if the file could not be written
    bool save(size_t current_target_index, const RunStatistics& stats);

    // nullopt if there is no checkpoint or it cannot be decoded
    std::optional<Checkpoint> load() const;

    bool exists() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace purgecord
