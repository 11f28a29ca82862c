#include "core/YamlConfig.hpp"
#include "core/YamlMerge.hpp"
#include "core/audio/AggregateDeviceBuilder.hpp"
#include "core/audio/DeviceSelector.hpp"
#include <QDir>
#include <QStringList>
#include <boost/log/trivial.hpp>

namespace mos {

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["matching"]["primary_keyword"] = DeviceSelector::kDefaultPrimaryKeyword;
    root_["matching"]["loopback_name"] = DeviceSelector::kDefaultLoopbackName;

    root_["aggregate"]["name"] = AggregateDeviceBuilder::kDefaultName;
    root_["aggregate"]["uid"] = AggregateDeviceBuilder::kDefaultUid;
    root_["aggregate"]["stacked"] = true;

    root_["logging"]["level"] = "info";
}

QString YamlConfig::defaultPath()
{
    return QDir::homePath() + "/.multi-output/config.yaml";
}

bool YamlConfig::load(const QString& filePath)
{
    initDefaults();
    YAML::Node defaults = YAML::Clone(root_);

    try {
        YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
        root_ = mergeYaml(defaults, loaded);
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "YamlConfig: ignoring " << filePath.toStdString()
                                   << ": " << e.what();
        root_ = defaults;
        return false;
    }

    // Every section must still be a mapping after the merge.
    if (!root_.IsMap()) {
        BOOST_LOG_TRIVIAL(warning) << "YamlConfig: ignoring " << filePath.toStdString()
                                   << ": top level is not a mapping";
        root_ = defaults;
        return false;
    }
    for (const char* section : {"matching", "aggregate", "logging"}) {
        if (!root_[section].IsMap()) {
            BOOST_LOG_TRIVIAL(warning) << "YamlConfig: ignoring " << filePath.toStdString()
                                       << ": '" << section << "' is not a mapping";
            root_ = defaults;
            return false;
        }
    }
    return true;
}

// Empty or non-scalar values fall back, so a blank keyword never matches everything.
QString YamlConfig::stringSetting(const char* section, const char* key, const char* fallback) const
{
    const YAML::Node value = root_[section][key];
    if (!value.IsScalar())
        return QString::fromUtf8(fallback);

    const QString text = QString::fromStdString(value.Scalar()).trimmed();
    return text.isEmpty() ? QString::fromUtf8(fallback) : text;
}

// --- Matching ---

QString YamlConfig::primaryKeyword() const
{
    return stringSetting("matching", "primary_keyword", DeviceSelector::kDefaultPrimaryKeyword);
}

QString YamlConfig::loopbackName() const
{
    return stringSetting("matching", "loopback_name", DeviceSelector::kDefaultLoopbackName);
}

// --- Aggregate ---

QString YamlConfig::aggregateName() const
{
    return stringSetting("aggregate", "name", AggregateDeviceBuilder::kDefaultName);
}

QString YamlConfig::aggregateUid() const
{
    return stringSetting("aggregate", "uid", AggregateDeviceBuilder::kDefaultUid);
}

bool YamlConfig::aggregateStacked() const
{
    return root_["aggregate"]["stacked"].as<bool>(true);
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return stringSetting("logging", "level", "info");
}

// --- Generic dot-path access ---

static QVariant yamlScalarToVariant(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    const std::string s = node.Scalar();

    if (s == "true") return QVariant(true);
    if (s == "false") return QVariant(false);

    bool intOk = false;
    int i = QString::fromStdString(s).toInt(&intOk);
    if (intOk) return QVariant(i);

    return QVariant(QString::fromStdString(s));
}

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    YAML::Node node = YAML::Clone(root_);
    for (const auto& part : dottedKey.split('.')) {
        if (!node.IsMap()) return {};
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined() || node.IsNull()) return {};
    }

    return yamlScalarToVariant(node);
}

} // namespace mos
