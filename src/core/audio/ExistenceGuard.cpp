#include "ExistenceGuard.hpp"

namespace mos {

AudioDevice ExistenceGuard::findExisting(const DeviceSnapshot& devices, const QString& targetName)
{
    for (const auto& dev : devices) {
        if (dev.name == targetName)
            return dev;
    }
    return {};
}

} // namespace mos
