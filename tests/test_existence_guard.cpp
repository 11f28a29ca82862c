#include <QTest>
#include "core/audio/ExistenceGuard.hpp"

class TestExistenceGuard : public QObject {
    Q_OBJECT

private slots:
    void findsExactName()
    {
        mos::AudioDevice speakers;
        speakers.id = 40;
        speakers.name = "Speakers";
        speakers.persistentUid = "alsa_output.speakers";

        mos::AudioDevice aggregate;
        aggregate.id = 77;
        aggregate.name = "Multi-Output Device";
        aggregate.persistentUid = "org.multioutput.MultiOutputDevice";

        auto found = mos::ExistenceGuard::findExisting({speakers, aggregate});
        QVERIFY(found.isValid());
        QCOMPARE(found.id, 77u);
    }

    void nameMatchIsCaseSensitive()
    {
        mos::AudioDevice lower;
        lower.id = 5;
        lower.name = "multi-output device";
        lower.persistentUid = "lower";

        QVERIFY(!mos::ExistenceGuard::findExisting({lower}).isValid());
    }

    void substringDoesNotMatch()
    {
        mos::AudioDevice other;
        other.id = 6;
        other.name = "Multi-Output Device 2";
        other.persistentUid = "other";

        QVERIFY(!mos::ExistenceGuard::findExisting({other}).isValid());
        QVERIFY(!mos::ExistenceGuard::findExisting({}).isValid());
    }

    void customTargetName()
    {
        mos::AudioDevice fanout;
        fanout.id = 9;
        fanout.name = "Fan-out";
        fanout.persistentUid = "fanout";

        QCOMPARE(mos::ExistenceGuard::findExisting({fanout}, "Fan-out").id, 9u);
    }
};

QTEST_MAIN(TestExistenceGuard)
#include "test_existence_guard.moc"
