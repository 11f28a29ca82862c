#pragma once

#include "AudioDevice.hpp"

namespace mos {

class ExistenceGuard {
public:
    static constexpr const char* kDefaultTargetName = "Multi-Output Device";

    /// Exact, case-sensitive name lookup. Returns an invalid AudioDevice
    /// if no device in the snapshot carries targetName.
    static AudioDevice findExisting(const DeviceSnapshot& devices,
                                    const QString& targetName = kDefaultTargetName);
};

} // namespace mos
