#include <QCoreApplication>
#include <QFile>
#include <QTextStream>
#include "core/Logging.hpp"
#include "core/Provisioner.hpp"
#include "core/YamlConfig.hpp"
#include "core/audio/PipeWireAudioBackend.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("create-multi-output");
    app.setApplicationVersion("0.1.0");

    // Optional overrides; built-in defaults otherwise. Never written.
    mos::YamlConfig config;
    const QString configPath = mos::YamlConfig::defaultPath();
    if (QFile::exists(configPath))
        config.load(configPath);

    mos::initLogging(config.logLevel());

    // --- PipeWire (directory + aggregate factory) ---
    mos::PipeWireAudioBackend backend;

    mos::Provisioner provisioner(backend, backend);
    provisioner.setSettings(mos::Provisioner::Settings::fromConfig(config));

    QTextStream out(stdout);
    QObject::connect(&provisioner, &mos::Provisioner::report,
                     [&out](const QString& line) { out << line << Qt::endl; });

    return provisioner.run().exitCode();
}
