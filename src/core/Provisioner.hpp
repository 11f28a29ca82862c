#pragma once

#include "core/audio/AggregateDeviceBuilder.hpp"
#include "core/audio/DeviceSelector.hpp"
#include "core/audio/IAggregateDeviceFactory.hpp"
#include "core/audio/IDeviceDirectory.hpp"
#include <QObject>
#include <QString>
#include <cstdint>

namespace mos {

class YamlConfig;

/// Terminal states of one provisioning run.
enum class ProvisionState {
    Created,               ///< deviceId is the new aggregate
    AlreadyExists,         ///< deviceId is the existing device, nothing created
    PrimaryOutputNotFound,
    LoopbackNotFound,
    CreateFailed,          ///< status holds the platform status code
    QueryFailed            ///< enumeration failed, status holds the platform status code
};

struct ProvisionResult {
    ProvisionState state = ProvisionState::QueryFailed;
    uint32_t deviceId = 0;
    int status = 0;

    /// 0 for Created and AlreadyExists, 1 for everything else.
    int exitCode() const;
};

/// Runs enumerate -> select -> guard -> build -> create exactly once over a
/// single device snapshot. Every console line goes out through report().
class Provisioner : public QObject {
    Q_OBJECT
public:
    struct Settings {
        QString primaryKeyword = DeviceSelector::kDefaultPrimaryKeyword;
        QString loopbackName = DeviceSelector::kDefaultLoopbackName;
        AggregateDeviceBuilder::Options aggregate;

        static Settings fromConfig(const YamlConfig& config);
    };

    Provisioner(IDeviceDirectory& directory, IAggregateDeviceFactory& factory,
                QObject* parent = nullptr);

    void setSettings(const Settings& settings) { settings_ = settings; }
    const Settings& settings() const { return settings_; }

    ProvisionResult run();

signals:
    void report(const QString& line);

private:
    ProvisionResult fail(ProvisionState state, const QString& line, int status = 0);

    IDeviceDirectory& directory_;
    IAggregateDeviceFactory& factory_;
    Settings settings_;
};

} // namespace mos
