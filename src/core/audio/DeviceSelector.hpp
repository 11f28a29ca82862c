#pragma once

#include "AudioDevice.hpp"

namespace mos {

/// Picks the two aggregate members out of an enumeration snapshot.
/// Both selectors return the first match in enumeration order, or an
/// invalid AudioDevice when nothing matches.
class DeviceSelector {
public:
    static constexpr const char* kDefaultPrimaryKeyword = "speaker";
    static constexpr const char* kDefaultLoopbackName = "BlackHole 2ch";

    /// First device whose name contains keyword (case-insensitive)
    /// and that has at least one output channel.
    static AudioDevice selectPrimaryOutput(const DeviceSnapshot& devices,
                                           const QString& keyword = kDefaultPrimaryKeyword);

    /// First device whose name equals loopbackName, ignoring case.
    /// Substrings do not match ("BlackHole 16ch" is not "BlackHole 2ch").
    static AudioDevice selectLoopback(const DeviceSnapshot& devices,
                                      const QString& loopbackName = kDefaultLoopbackName);
};

} // namespace mos
