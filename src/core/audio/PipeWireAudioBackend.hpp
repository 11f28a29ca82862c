#pragma once

#include "IDeviceDirectory.hpp"
#include "IAggregateDeviceFactory.hpp"
#include "PipeWireSession.hpp"
#include <QHash>
#include <QList>

namespace mos {

/// Device directory and aggregate factory backed by the PipeWire daemon.
///
/// Devices are audio nodes (Audio/Sink, Audio/Source, Audio/Duplex). The
/// aggregate is a lingering null-audio-sink whose monitor ports are linked
/// to the members' playback ports with lingering links, so it outlives
/// this process.
class PipeWireAudioBackend : public IDeviceDirectory, public IAggregateDeviceFactory {
public:
    PipeWireAudioBackend() = default;

    bool isAvailable() const { return session_.isConnected(); }

    DeviceSnapshot listDevices() override;
    CreateResult createAggregateDevice(const AggregateDeviceSpec& spec) override;

    struct PortEntry {
        uint32_t id = 0;
        uint32_t nodeId = 0;
        bool playback = false;   // port.direction == in
        bool monitor = false;
        QString channel;         // audio.channel, e.g. "FL"
    };

    struct RegistryView {
        QList<uint32_t> nodeIds;              // audio device nodes, registry order
        QHash<QString, uint32_t> nodeIdByName;
        QList<PortEntry> ports;

        QList<PortEntry> playbackPorts(uint32_t nodeId) const;
        QList<PortEntry> monitorPorts(uint32_t nodeId) const;
    };

    struct PortLink {
        PortEntry from;   // aggregate monitor port
        PortEntry to;     // member playback port
    };

    /// Pair aggregate monitor ports with member playback ports. Stacked
    /// mode links every monitor port to each member by channel name, falling
    /// back to position; split mode hands out monitor ports in member order.
    static QList<PortLink> planLinks(const QList<PortEntry>& monitors,
                                     const QList<QList<PortEntry>>& members,
                                     bool stacked);

    /// audio.position for the aggregate sink. Stacked copies the first
    /// member's layout, split gets one AUX channel per member channel.
    static QString aggregatePositions(const QList<QList<PortEntry>>& members, bool stacked);

private:
    PipeWireSession session_;
};

} // namespace mos
