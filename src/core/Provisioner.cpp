#include "core/Provisioner.hpp"
#include "core/YamlConfig.hpp"
#include "core/audio/DeviceSelector.hpp"
#include "core/audio/ExistenceGuard.hpp"
#include "core/audio/PlatformQueryError.hpp"
#include <boost/log/trivial.hpp>
#include <cstring>

namespace mos {

static QString statusText(int status)
{
    return QStringLiteral("%1, %2")
        .arg(status)
        .arg(QString::fromLocal8Bit(std::strerror(status < 0 ? -status : status)));
}

int ProvisionResult::exitCode() const
{
    switch (state) {
    case ProvisionState::Created:
    case ProvisionState::AlreadyExists:
        return 0;
    default:
        return 1;
    }
}

Provisioner::Settings Provisioner::Settings::fromConfig(const YamlConfig& config)
{
    Settings s;
    s.primaryKeyword = config.primaryKeyword();
    s.loopbackName = config.loopbackName();
    s.aggregate.displayName = config.aggregateName();
    s.aggregate.syntheticUid = config.aggregateUid();
    s.aggregate.stacked = config.aggregateStacked();
    return s;
}

Provisioner::Provisioner(IDeviceDirectory& directory, IAggregateDeviceFactory& factory,
                         QObject* parent)
    : QObject(parent)
    , directory_(directory)
    , factory_(factory)
{
}

ProvisionResult Provisioner::fail(ProvisionState state, const QString& line, int status)
{
    BOOST_LOG_TRIVIAL(error) << "Provisioner: " << line.toStdString();
    emit report(line);

    ProvisionResult result;
    result.state = state;
    result.status = status;
    return result;
}

ProvisionResult Provisioner::run()
{
    DeviceSnapshot devices;
    try {
        devices = directory_.listDevices();
    } catch (const PlatformQueryError& e) {
        return fail(ProvisionState::QueryFailed,
                    QStringLiteral("ERROR: Could not query %1 of device %2 (status: %3)")
                        .arg(e.property())
                        .arg(e.deviceId())
                        .arg(statusText(e.status())),
                    e.status());
    }
    BOOST_LOG_TRIVIAL(info) << "Provisioner: " << devices.size() << " audio devices";

    const AudioDevice primary = DeviceSelector::selectPrimaryOutput(devices, settings_.primaryKeyword);
    if (primary.isValid()) {
        emit report(QStringLiteral("Found primary output: %1 [%2]")
                        .arg(primary.name, primary.persistentUid));
    }

    const AudioDevice loopback = DeviceSelector::selectLoopback(devices, settings_.loopbackName);
    if (loopback.isValid()) {
        emit report(QStringLiteral("Found loopback: %1 [%2]")
                        .arg(loopback.name, loopback.persistentUid));
    }

    if (!primary.isValid()) {
        return fail(ProvisionState::PrimaryOutputNotFound,
                    QStringLiteral("ERROR: Could not find primary output device (name containing '%1' with output channels)")
                        .arg(settings_.primaryKeyword));
    }
    if (!loopback.isValid()) {
        return fail(ProvisionState::LoopbackNotFound,
                    QStringLiteral("ERROR: Could not find loopback device '%1'")
                        .arg(settings_.loopbackName));
    }

    const AudioDevice existing = ExistenceGuard::findExisting(devices, settings_.aggregate.displayName);
    if (existing.isValid()) {
        emit report(QStringLiteral("%1 already exists (ID: %2). Skipping creation.")
                        .arg(existing.name)
                        .arg(existing.id));
        ProvisionResult result;
        result.state = ProvisionState::AlreadyExists;
        result.deviceId = existing.id;
        return result;
    }

    const AggregateDeviceSpec spec = AggregateDeviceBuilder::build(primary, loopback, settings_.aggregate);
    const CreateResult created = AggregateDeviceBuilder::create(factory_, spec);
    if (!created.ok()) {
        return fail(ProvisionState::CreateFailed,
                    QStringLiteral("ERROR: Failed to create %1 (status: %2)")
                        .arg(spec.displayName, statusText(created.status)),
                    created.status);
    }

    emit report(QStringLiteral("Created %1 (ID: %2)").arg(spec.displayName).arg(created.deviceId));

    ProvisionResult result;
    result.state = ProvisionState::Created;
    result.deviceId = created.deviceId;
    return result;
}

} // namespace mos
