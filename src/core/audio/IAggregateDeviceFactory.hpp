#pragma once

#include "AggregateDeviceSpec.hpp"
#include <cstdint>

namespace mos {

/// Outcome of one creation request. status is 0 on success, otherwise the
/// platform's (negative errno) status code and deviceId is meaningless.
struct CreateResult {
    uint32_t deviceId = 0;
    int status = 0;

    bool ok() const { return status == 0; }
};

class IAggregateDeviceFactory {
public:
    virtual ~IAggregateDeviceFactory() = default;

    /// Submit the descriptor to the platform. Never retried by callers.
    virtual CreateResult createAggregateDevice(const AggregateDeviceSpec& spec) = 0;
};

} // namespace mos
