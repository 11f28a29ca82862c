#pragma once

#include "AudioDevice.hpp"

namespace mos {

class IDeviceDirectory {
public:
    virtual ~IDeviceDirectory() = default;

    /// Enumerate every audio device currently exposed by the platform.
    /// Each entry has a populated name and UID. Throws PlatformQueryError
    /// when the device list or any per-device property cannot be read.
    /// Must be called at most once per provisioning run.
    virtual DeviceSnapshot listDevices() = 0;
};

} // namespace mos
