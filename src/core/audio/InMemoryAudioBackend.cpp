#include "InMemoryAudioBackend.hpp"
#include "PlatformQueryError.hpp"

namespace mos {

void InMemoryAudioBackend::addDevice(const QString& name, const QString& uid, uint32_t outputChannels)
{
    AudioDevice dev;
    dev.id = static_cast<uint32_t>(devices_.size()) + 30;
    dev.name = name;
    dev.persistentUid = uid;
    dev.outputChannelCount = outputChannels;
    devices_.append(dev);
}

void InMemoryAudioBackend::failQuery(uint32_t deviceId, const QString& property, int status)
{
    queryFails_ = true;
    failDeviceId_ = deviceId;
    failProperty_ = property;
    failStatus_ = status;
}

DeviceSnapshot InMemoryAudioBackend::listDevices()
{
    ++listCalls_;
    if (queryFails_) {
        queryFails_ = false;
        throw PlatformQueryError(failDeviceId_, failProperty_, failStatus_);
    }
    return devices_;
}

CreateResult InMemoryAudioBackend::createAggregateDevice(const AggregateDeviceSpec& spec)
{
    requests_.append(spec);

    CreateResult result;
    result.status = createStatus_;
    if (createStatus_ != 0)
        return result;

    result.deviceId = nextId_++;

    AudioDevice created;
    created.id = result.deviceId;
    created.name = spec.displayName;
    created.persistentUid = spec.syntheticUid;
    created.outputChannelCount = 2;
    devices_.append(created);
    return result;
}

} // namespace mos
