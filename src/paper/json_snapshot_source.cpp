#include "json_snapshot_source.hpp"
#include <fstream>
#include "../core/exceptions.hpp"

namespace sentinel {

JsonSnapshotSource::JsonSnapshotSource(std::string file_path, std::shared_ptr<Clock> clock)
    : file_path_(std::move(file_path)), clock_(std::move(clock)) {
    if (!clock_) {
        throw ConfigurationError("snapshot source requires a clock");
    }
}

std::vector<PoolSnapshot> JsonSnapshotSource::get_snapshots() {
    std::ifstream file(file_path_);
    if (!file.is_open()) {
        throw CollaboratorError("cannot open snapshot file " + file_path_);
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::exception& e) {
        throw CollaboratorError("malformed snapshot file " + file_path_ + ": " + e.what());
    }
    return parse(document, clock_->now());
}

std::vector<PoolSnapshot> JsonSnapshotSource::parse(const nlohmann::json& document, Timestamp observed_at) {
    const nlohmann::json& pools = document.is_object() && document.contains("pools")
        ? document.at("pools")
        : document;
    if (!pools.is_array()) {
        throw CollaboratorError("snapshot document must be an array of pools");
    }

    std::vector<PoolSnapshot> snapshots;
    snapshots.reserve(pools.size());
    for (const auto& entry : pools) {
        try {
            PoolSnapshot snapshot = entry.get<PoolSnapshot>();
            if (!entry.contains("observed_at")) {
                snapshot.observed_at = observed_at;
            }
            snapshots.push_back(std::move(snapshot));
        } catch (const nlohmann::json::exception& e) {
            throw CollaboratorError(std::string("invalid pool snapshot: ") + e.what());
        }
    }
    return snapshots;
}

} // namespace sentinel
