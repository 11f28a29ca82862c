#include "AggregateDeviceBuilder.hpp"
#include <boost/log/trivial.hpp>

namespace mos {

AggregateDeviceSpec AggregateDeviceBuilder::build(const AudioDevice& primary,
                                                  const AudioDevice& loopback)
{
    return build(primary, loopback, Options());
}

AggregateDeviceSpec AggregateDeviceBuilder::build(const AudioDevice& primary,
                                                  const AudioDevice& loopback,
                                                  const Options& options)
{
    AggregateDeviceSpec spec;
    spec.syntheticUid = options.syntheticUid;
    spec.displayName = options.displayName;
    spec.memberList = QStringList{primary.persistentUid, loopback.persistentUid};
    spec.primaryMemberUid = primary.persistentUid;
    spec.isStacked = options.stacked;
    return spec;
}

CreateResult AggregateDeviceBuilder::create(IAggregateDeviceFactory& factory,
                                            const AggregateDeviceSpec& spec)
{
    BOOST_LOG_TRIVIAL(debug) << "AggregateDeviceBuilder: creating '" << spec.displayName.toStdString()
                             << "' uid=" << spec.syntheticUid.toStdString()
                             << " members=" << spec.memberList.join(',').toStdString()
                             << " stacked=" << spec.isStacked;

    CreateResult result = factory.createAggregateDevice(spec);
    if (!result.ok()) {
        BOOST_LOG_TRIVIAL(error) << "AggregateDeviceBuilder: creation failed with status "
                                 << result.status;
    }
    return result;
}

} // namespace mos
