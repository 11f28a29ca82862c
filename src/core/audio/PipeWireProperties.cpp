#include "PipeWireProperties.hpp"
#include "PlatformQueryError.hpp"
#include <cerrno>

namespace mos {

PropertyBuffer copyProperties(const struct spa_dict* dict)
{
    if (!dict)
        return PropertyBuffer(pw_properties_new(nullptr, nullptr));
    return PropertyBuffer(pw_properties_new_dict(dict));
}

QString propertyValue(const PropertyBuffer& props, const char* key)
{
    if (!props)
        return {};
    const char* value = pw_properties_get(props.get(), key);
    return value ? QString::fromUtf8(value) : QString();
}

QString requireProperty(const PropertyBuffer& props, uint32_t objectId,
                        std::initializer_list<const char*> keys)
{
    for (const char* key : keys) {
        QString value = propertyValue(props, key);
        if (!value.isEmpty())
            return value;
    }
    throw PlatformQueryError(objectId, QString::fromUtf8(*keys.begin()), -ENODATA);
}

} // namespace mos
