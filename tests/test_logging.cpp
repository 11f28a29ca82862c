#include <QTest>
#include "core/Logging.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/trivial.hpp>
#include <boost/make_shared.hpp>
#include <sstream>

namespace logging = boost::log;
namespace sinks = boost::log::sinks;

/// Checks the severity filter by capturing records in a string sink.
class TestLogging : public QObject {
    Q_OBJECT

    using StreamSink = sinks::synchronous_sink<sinks::text_ostream_backend>;

    std::ostringstream captured_;
    boost::shared_ptr<StreamSink> sink_;

private slots:
    void initTestCase()
    {
        auto backend = boost::make_shared<sinks::text_ostream_backend>();
        backend->add_stream(boost::shared_ptr<std::ostream>(&captured_, boost::null_deleter()));
        backend->auto_flush(true);
        sink_ = boost::make_shared<StreamSink>(backend);
        logging::core::get()->add_sink(sink_);
    }

    void cleanupTestCase()
    {
        logging::core::get()->remove_sink(sink_);
        logging::core::get()->reset_filter();
    }

    void init()
    {
        captured_.str(std::string());
    }

    void knownLevelSetsThreshold()
    {
        QVERIFY(mos::initLogging("debug"));

        BOOST_LOG_TRIVIAL(trace) << "trace-record";
        BOOST_LOG_TRIVIAL(debug) << "debug-record";

        const std::string out = captured_.str();
        QVERIFY(out.find("trace-record") == std::string::npos);
        QVERIFY(out.find("debug-record") != std::string::npos);
    }

    void levelNameIsCaseInsensitive()
    {
        QVERIFY(mos::initLogging(" Warning "));

        BOOST_LOG_TRIVIAL(info) << "info-record";
        BOOST_LOG_TRIVIAL(warning) << "warning-record";

        const std::string out = captured_.str();
        QVERIFY(out.find("info-record") == std::string::npos);
        QVERIFY(out.find("warning-record") != std::string::npos);
    }

    void unknownLevelFallsBackToInfo()
    {
        QVERIFY(!mos::initLogging("verbose"));

        BOOST_LOG_TRIVIAL(debug) << "debug-record";
        BOOST_LOG_TRIVIAL(info) << "info-record";

        const std::string out = captured_.str();
        QVERIFY(out.find("unknown level 'verbose'") != std::string::npos);
        QVERIFY(out.find("debug-record") == std::string::npos);
        QVERIFY(out.find("info-record") != std::string::npos);
    }
};

QTEST_MAIN(TestLogging)
#include "test_logging.moc"
