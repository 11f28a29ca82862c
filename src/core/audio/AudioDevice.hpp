#pragma once
#include <QString>
#include <QList>
#include <cstdint>

namespace mos {

struct AudioDevice {
    uint32_t id = 0;                 // PipeWire registry id, session-scoped, never persist
    QString name;                    // node.description, display name, not unique
    QString persistentUid;           // node.name: durable reference for members
    uint32_t outputChannelCount = 0; // playback ports, 0 for capture-only nodes

    bool isValid() const { return !persistentUid.isEmpty(); }
};

/// One enumeration result. Selection and the existence check must both
/// run over the same snapshot.
using DeviceSnapshot = QList<AudioDevice>;

} // namespace mos
