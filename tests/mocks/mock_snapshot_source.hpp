#pragma once

#include <vector>
#include "core/execution_venue.hpp"
#include <gmock/gmock.h>

namespace sentinel {
namespace testing {

class MockSnapshotSource : public sentinel::SnapshotSource {
public:
    MOCK_METHOD(std::vector<sentinel::PoolSnapshot>, get_snapshots, (), (override));
};

} // namespace testing
} // namespace sentinel
