#include "PlatformQueryError.hpp"
#include <cstring>
#include <string>

namespace mos {

static std::string describe(uint32_t deviceId, const QString& property, int status)
{
    std::string text = "query for '" + property.toStdString()
                       + "' on object " + std::to_string(deviceId) + " failed";
    if (status != 0)
        text += " (" + std::to_string(status) + ": " + std::strerror(status < 0 ? -status : status) + ")";
    return text;
}

PlatformQueryError::PlatformQueryError(uint32_t deviceId, const QString& property, int status)
    : std::runtime_error(describe(deviceId, property, status))
    , deviceId_(deviceId)
    , property_(property)
    , status_(status)
{
}

} // namespace mos
