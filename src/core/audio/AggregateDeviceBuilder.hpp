#pragma once

#include "AudioDevice.hpp"
#include "AggregateDeviceSpec.hpp"
#include "IAggregateDeviceFactory.hpp"

namespace mos {

class AggregateDeviceBuilder {
public:
    static constexpr const char* kDefaultUid = "org.multioutput.MultiOutputDevice";
    static constexpr const char* kDefaultName = "Multi-Output Device";

    struct Options {
        QString syntheticUid = kDefaultUid;
        QString displayName = kDefaultName;
        bool stacked = true;
    };

    /// Primary output always comes first in memberList and is the clock
    /// source, regardless of enumeration order.
    static AggregateDeviceSpec build(const AudioDevice& primary, const AudioDevice& loopback);
    static AggregateDeviceSpec build(const AudioDevice& primary, const AudioDevice& loopback,
                                     const Options& options);

    /// Submit spec once. A failed result is returned as-is, never retried.
    static CreateResult create(IAggregateDeviceFactory& factory, const AggregateDeviceSpec& spec);
};

} // namespace mos
