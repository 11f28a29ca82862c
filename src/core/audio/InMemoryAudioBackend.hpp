#pragma once

#include "IDeviceDirectory.hpp"
#include "IAggregateDeviceFactory.hpp"
#include <QList>

namespace mos {

/// Scripted directory + factory for running the provisioning pipeline
/// without a PipeWire daemon. Devices and the creation outcome are set up
/// front; every request is recorded for inspection.
class InMemoryAudioBackend : public IDeviceDirectory, public IAggregateDeviceFactory {
public:
    void addDevice(const QString& name, const QString& uid, uint32_t outputChannels);

    /// Next listDevices() call throws PlatformQueryError for this device/property.
    void failQuery(uint32_t deviceId, const QString& property, int status);

    /// Status returned by createAggregateDevice(); 0 means success.
    void setCreateStatus(int status) { createStatus_ = status; }
    void setNextDeviceId(uint32_t id) { nextId_ = id; }

    DeviceSnapshot listDevices() override;
    CreateResult createAggregateDevice(const AggregateDeviceSpec& spec) override;

    int listCalls() const { return listCalls_; }
    const QList<AggregateDeviceSpec>& createRequests() const { return requests_; }

private:
    DeviceSnapshot devices_;
    QList<AggregateDeviceSpec> requests_;
    uint32_t nextId_ = 100;
    int createStatus_ = 0;
    int listCalls_ = 0;

    bool queryFails_ = false;
    uint32_t failDeviceId_ = 0;
    QString failProperty_;
    int failStatus_ = 0;
};

} // namespace mos
