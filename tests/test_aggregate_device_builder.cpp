#include <QTest>
#include "core/audio/AggregateDeviceBuilder.hpp"
#include "core/audio/InMemoryAudioBackend.hpp"

class TestAggregateDeviceBuilder : public QObject {
    Q_OBJECT

private slots:
    void init()
    {
        speakers_ = {};
        speakers_.id = 41;
        speakers_.name = "MacBook Pro Speakers";
        speakers_.persistentUid = "builtin-out";
        speakers_.outputChannelCount = 2;

        loopback_ = {};
        loopback_.id = 12;
        loopback_.name = "BlackHole 2ch";
        loopback_.persistentUid = "bh-uid";
        loopback_.outputChannelCount = 2;
    }

    void buildUsesFixedIdentity()
    {
        auto spec = mos::AggregateDeviceBuilder::build(speakers_, loopback_);
        QCOMPARE(spec.displayName, QString("Multi-Output Device"));
        QCOMPARE(spec.syntheticUid, QString("org.multioutput.MultiOutputDevice"));
        QVERIFY(spec.isStacked);
    }

    void primaryIsFirstMemberAndClockSource()
    {
        // Loopback has the lower id, i.e. enumerated first
        auto spec = mos::AggregateDeviceBuilder::build(speakers_, loopback_);
        QCOMPARE(spec.memberList, QStringList({"builtin-out", "bh-uid"}));
        QCOMPARE(spec.primaryMemberUid, QString("builtin-out"));
        QVERIFY(spec.memberList.contains(spec.primaryMemberUid));
    }

    void optionsOverrideIdentity()
    {
        mos::AggregateDeviceBuilder::Options options;
        options.displayName = "Fan-out";
        options.syntheticUid = "org.example.Fanout";
        options.stacked = false;

        auto spec = mos::AggregateDeviceBuilder::build(speakers_, loopback_, options);
        QCOMPARE(spec.displayName, QString("Fan-out"));
        QCOMPARE(spec.syntheticUid, QString("org.example.Fanout"));
        QVERIFY(!spec.isStacked);
        QCOMPARE(spec.memberList.first(), QString("builtin-out"));
    }

    void createSubmitsOnce()
    {
        mos::InMemoryAudioBackend backend;
        backend.setNextDeviceId(88);

        auto spec = mos::AggregateDeviceBuilder::build(speakers_, loopback_);
        auto result = mos::AggregateDeviceBuilder::create(backend, spec);

        QVERIFY(result.ok());
        QCOMPARE(result.deviceId, 88u);
        QCOMPARE(backend.createRequests().size(), 1);
        QCOMPARE(backend.createRequests().first().memberList, spec.memberList);
    }

    void createFailureIsNotRetried()
    {
        mos::InMemoryAudioBackend backend;
        backend.setCreateStatus(-5);

        auto spec = mos::AggregateDeviceBuilder::build(speakers_, loopback_);
        auto result = mos::AggregateDeviceBuilder::create(backend, spec);

        QVERIFY(!result.ok());
        QCOMPARE(result.status, -5);
        QCOMPARE(backend.createRequests().size(), 1);
    }

private:
    mos::AudioDevice speakers_;
    mos::AudioDevice loopback_;
};

QTEST_MAIN(TestAggregateDeviceBuilder)
#include "test_aggregate_device_builder.moc"
