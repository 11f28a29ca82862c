#pragma once

#include <QString>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <pipewire/properties.h>

namespace mos {

struct PropertiesDeleter {
    void operator()(struct pw_properties* props) const { pw_properties_free(props); }
};

/// Owned copy of a PipeWire property dictionary. Dictionaries handed to
/// listener callbacks are only valid for the duration of the callback.
using PropertyBuffer = std::unique_ptr<struct pw_properties, PropertiesDeleter>;

PropertyBuffer copyProperties(const struct spa_dict* dict);

/// Value of key, or a null QString when absent or buffer is empty.
QString propertyValue(const PropertyBuffer& props, const char* key);

/// First present key wins. Throws PlatformQueryError(objectId, keys[0]) if
/// none of the keys is set.
QString requireProperty(const PropertyBuffer& props, uint32_t objectId,
                        std::initializer_list<const char*> keys);

} // namespace mos
