#pragma once
#include <QString>
#include <cstdint>
#include <stdexcept>

namespace mos {

/// Raised by a device directory when a platform query cannot be answered.
/// deviceId is the object that was being queried (0 for the core itself).
class PlatformQueryError : public std::runtime_error {
public:
    PlatformQueryError(uint32_t deviceId, const QString& property, int status);

    uint32_t deviceId() const { return deviceId_; }
    QString property() const { return property_; }
    int status() const { return status_; }

private:
    uint32_t deviceId_;
    QString property_;
    int status_;
};

} // namespace mos
