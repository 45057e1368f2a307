#include <QtTest/QtTest>

#include "common/models.hpp"

class BuildConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void testDefaults();
    void testMutation();
    void testNotEnabled();
    void testNoTimestamp();
    void testNothing();
    void testEffectiveEnabledTable();
};

void BuildConfigTests::testDefaults()
{
    const buildstamp::Instructions instructions;
    const buildstamp::BuildConfig &config = instructions.build;
    QVERIFY(config.enabled);
    QVERIFY(config.timestamp);
    QVERIFY(config.timezone == buildstamp::TimeZone::Utc);
    QVERIFY(config.kind == buildstamp::TimestampKind::Timestamp);
    QVERIFY(config.semver);
    QVERIFY(config.hasEnabled());
    QCOMPARE(QString::fromStdString(instructions.versionVariable),
             QStringLiteral("BUILDSTAMP_PKG_VERSION"));
}

void BuildConfigTests::testMutation()
{
    buildstamp::Instructions instructions;
    instructions.build.kind = buildstamp::TimestampKind::All;
    instructions.build.timezone = buildstamp::TimeZone::Local;
    QVERIFY(instructions.build.kind == buildstamp::TimestampKind::All);
    QVERIFY(instructions.build.timezone == buildstamp::TimeZone::Local);
}

void BuildConfigTests::testNotEnabled()
{
    buildstamp::BuildConfig config;
    config.enabled = false;
    QVERIFY(!config.hasEnabled());
}

void BuildConfigTests::testNoTimestamp()
{
    buildstamp::BuildConfig config;
    config.timestamp = false;
    QVERIFY(config.hasEnabled());
}

void BuildConfigTests::testNothing()
{
    buildstamp::BuildConfig config;
    config.timestamp = false;
    config.semver = false;
    QVERIFY(!config.hasEnabled());
}

void BuildConfigTests::testEffectiveEnabledTable()
{
    for (const bool enabled : {false, true}) {
        for (const bool timestamp : {false, true}) {
            for (const bool semver : {false, true}) {
                buildstamp::BuildConfig config;
                config.enabled = enabled;
                config.timestamp = timestamp;
                config.semver = semver;
                QCOMPARE(config.hasEnabled(), enabled && (timestamp || semver));
            }
        }
    }
}

QTEST_MAIN(BuildConfigTests)
#include "test_build_config.moc"
