#include <QtTest>
#include "core/YamlConfig.hpp"

class TestYamlConfig : public QObject {
    Q_OBJECT
private slots:
    void testLoadDefaults();
    void testLoadFromFile();
    void testPartialFileKeepsDefaults();
    void testBrokenFileKeepsDefaults();
    void testMissingFileKeepsDefaults();
    void testWrongShapeKeepsDefaults();
    void testScalarFileKeepsDefaults();
    void testEmptyValuesFallBack();
    void testValueByPath();
    void testValueByPathMissing();
    void testDefaultPath();
};

void TestYamlConfig::testLoadDefaults()
{
    mos::YamlConfig config;
    QCOMPARE(config.primaryKeyword(), QString("speaker"));
    QCOMPARE(config.loopbackName(), QString("BlackHole 2ch"));
    QCOMPARE(config.aggregateName(), QString("Multi-Output Device"));
    QCOMPARE(config.aggregateUid(), QString("org.multioutput.MultiOutputDevice"));
    QCOMPARE(config.aggregateStacked(), true);
    QCOMPARE(config.logLevel(), QString("info"));
}

void TestYamlConfig::testLoadFromFile()
{
    mos::YamlConfig config;
    QVERIFY(config.load(QString(TEST_DATA_DIR) + "/test_config.yaml"));

    QCOMPARE(config.primaryKeyword(), QString("headphone"));
    QCOMPARE(config.loopbackName(), QString("loopback analog"));
    QCOMPARE(config.aggregateName(), QString("Stream Mix"));
    QCOMPARE(config.aggregateUid(), QString("org.example.StreamMix"));
    QCOMPARE(config.aggregateStacked(), false);
    QCOMPARE(config.logLevel(), QString("debug"));
}

void TestYamlConfig::testPartialFileKeepsDefaults()
{
    mos::YamlConfig config;
    QVERIFY(config.load(QString(TEST_DATA_DIR) + "/partial_config.yaml"));

    QCOMPARE(config.aggregateName(), QString("Partial Override"));
    QCOMPARE(config.aggregateUid(), QString("org.multioutput.MultiOutputDevice"));
    QCOMPARE(config.loopbackName(), QString("BlackHole 2ch"));
}

void TestYamlConfig::testBrokenFileKeepsDefaults()
{
    mos::YamlConfig config;
    QVERIFY(!config.load(QString(TEST_DATA_DIR) + "/broken_config.yaml"));
    QCOMPARE(config.primaryKeyword(), QString("speaker"));
}

void TestYamlConfig::testMissingFileKeepsDefaults()
{
    mos::YamlConfig config;
    QVERIFY(!config.load(QDir::tempPath() + "/mos_no_such_config.yaml"));
    QCOMPARE(config.aggregateName(), QString("Multi-Output Device"));
}

void TestYamlConfig::testWrongShapeKeepsDefaults()
{
    mos::YamlConfig config;
    QVERIFY(!config.load(QString(TEST_DATA_DIR) + "/wrong_shape_config.yaml"));

    QCOMPARE(config.primaryKeyword(), QString("speaker"));
    QCOMPARE(config.loopbackName(), QString("BlackHole 2ch"));
    QCOMPARE(config.aggregateName(), QString("Multi-Output Device"));
}

void TestYamlConfig::testScalarFileKeepsDefaults()
{
    mos::YamlConfig config;
    QVERIFY(!config.load(QString(TEST_DATA_DIR) + "/scalar_config.yaml"));

    QCOMPARE(config.primaryKeyword(), QString("speaker"));
    QCOMPARE(config.logLevel(), QString("info"));
}

void TestYamlConfig::testEmptyValuesFallBack()
{
    mos::YamlConfig config;
    QVERIFY(config.load(QString(TEST_DATA_DIR) + "/empty_values_config.yaml"));

    QCOMPARE(config.primaryKeyword(), QString("speaker"));
    QCOMPARE(config.loopbackName(), QString("BlackHole 2ch"));
    QCOMPARE(config.aggregateName(), QString("Stream Mix"));
    QCOMPARE(config.aggregateUid(), QString("org.multioutput.MultiOutputDevice"));
    QCOMPARE(config.logLevel(), QString("info"));
}

void TestYamlConfig::testValueByPath()
{
    mos::YamlConfig config;
    QCOMPARE(config.valueByPath("matching.loopback_name").toString(), QString("BlackHole 2ch"));
    QCOMPARE(config.valueByPath("aggregate.stacked").toBool(), true);
}

void TestYamlConfig::testValueByPathMissing()
{
    mos::YamlConfig config;
    QVERIFY(!config.valueByPath("").isValid());
    QVERIFY(!config.valueByPath("matching.nonexistent").isValid());
    QVERIFY(!config.valueByPath("matching").isValid());
}

void TestYamlConfig::testDefaultPath()
{
    QVERIFY(mos::YamlConfig::defaultPath().startsWith(QDir::homePath()));
    QVERIFY(mos::YamlConfig::defaultPath().endsWith("/.multi-output/config.yaml"));
}

QTEST_MAIN(TestYamlConfig)
#include "test_yaml_config.moc"
