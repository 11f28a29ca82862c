#pragma once
#include <QString>
#include <QStringList>

namespace mos {

/// Descriptor for a composite sink. Built once per run, consumed by a
/// single IAggregateDeviceFactory::createAggregateDevice() call.
struct AggregateDeviceSpec {
    QString syntheticUid;      // node.name of the aggregate
    QString displayName;       // node.description, also the existence-check key
    QStringList memberList;    // ordered member UIDs, first renders first
    QString primaryMemberUid;  // clock source, always one of memberList
    bool isStacked = true;     // true: duplicate to every member, false: split channels
};

} // namespace mos
