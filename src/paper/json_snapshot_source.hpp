#pragma once

#include <memory>
#include <string>
#include <vector>
#include "../core/clock.hpp"
#include "../core/execution_venue.hpp"

namespace sentinel {

// Re-reads a JSON file of pool snapshots on every call. Accepts either a bare
// array or an object with a "pools" array.
class JsonSnapshotSource : public SnapshotSource {
public:
    JsonSnapshotSource(std::string file_path, std::shared_ptr<Clock> clock);

    std::vector<PoolSnapshot> get_snapshots() override;

    static std::vector<PoolSnapshot> parse(const nlohmann::json& document, Timestamp observed_at);

private:
    std::string file_path_;
    std::shared_ptr<Clock> clock_;
};

} // namespace sentinel
