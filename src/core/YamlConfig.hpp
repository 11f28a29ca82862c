#pragma once

#include <QString>
#include <QVariant>
#include <yaml-cpp/yaml.h>

namespace mos {

/// Read-only settings for the provisioning run. Built-in defaults, optionally
/// overridden by a YAML file. Nothing is ever written back.
class YamlConfig {
public:
    YamlConfig();

    /// Merge filePath over the defaults. Returns false (and keeps the
    /// defaults) if the file cannot be read or parsed, or if a section
    /// is not a mapping.
    bool load(const QString& filePath);

    /// ~/.multi-output/config.yaml
    static QString defaultPath();

    // Matching
    QString primaryKeyword() const;
    QString loopbackName() const;

    // Aggregate
    QString aggregateName() const;
    QString aggregateUid() const;
    bool aggregateStacked() const;

    // Logging
    QString logLevel() const;

    // Generic dot-path access (e.g. "matching.loopback_name")
    QVariant valueByPath(const QString& dottedKey) const;

private:
    YAML::Node root_;

    void initDefaults();
    QString stringSetting(const char* section, const char* key, const char* fallback) const;
};

} // namespace mos
