#include "DeviceSelector.hpp"
#include <algorithm>

namespace mos {

AudioDevice DeviceSelector::selectPrimaryOutput(const DeviceSnapshot& devices,
                                                const QString& keyword)
{
    auto it = std::find_if(devices.cbegin(), devices.cend(), [&keyword](const AudioDevice& d) {
        return d.outputChannelCount > 0 && d.name.contains(keyword, Qt::CaseInsensitive);
    });
    return it != devices.cend() ? *it : AudioDevice{};
}

AudioDevice DeviceSelector::selectLoopback(const DeviceSnapshot& devices,
                                           const QString& loopbackName)
{
    auto it = std::find_if(devices.cbegin(), devices.cend(), [&loopbackName](const AudioDevice& d) {
        return d.name.compare(loopbackName, Qt::CaseInsensitive) == 0;
    });
    return it != devices.cend() ? *it : AudioDevice{};
}

} // namespace mos
