#include "core/Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace mos {

bool initLogging(const QString& level)
{
    namespace logging = boost::log;

    const QByteArray name = level.trimmed().toLower().toUtf8();
    logging::trivial::severity_level threshold = logging::trivial::info;
    const bool known = logging::trivial::from_string(name.constData(),
                                                     static_cast<std::size_t>(name.size()),
                                                     threshold);
    if (!known)
        threshold = logging::trivial::info;

    logging::core::get()->set_filter(logging::trivial::severity >= threshold);

    if (!known)
        BOOST_LOG_TRIVIAL(warning) << "Logging: unknown level '" << name.constData() << "', using info";
    return known;
}

} // namespace mos
