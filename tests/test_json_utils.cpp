#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

class JsonUtilsTests : public QObject
{
    Q_OBJECT
private slots:
    void testEnumStrings();
    void testInstructionNames();
    void testConfigToJson();
    void testApplyPartialConfig();
    void testApplyRejectsBadMembers();
    void testInstructionsToJson();
};

void JsonUtilsTests::testEnumStrings()
{
    using buildstamp::TimestampKind;
    for (const TimestampKind kind : {TimestampKind::DateOnly, TimestampKind::TimeOnly,
                                     TimestampKind::DateAndTime, TimestampKind::Timestamp,
                                     TimestampKind::All}) {
        const auto parsed = buildstamp::parseKindString(buildstamp::toKindString(kind));
        QVERIFY(parsed.has_value());
        QVERIFY(*parsed == kind);
    }
    QVERIFY(buildstamp::parseKindString("date-and-time") == TimestampKind::DateAndTime);
    QVERIFY(!buildstamp::parseKindString("datetime").has_value());

    QVERIFY(buildstamp::parseTimeZoneString("local") == buildstamp::TimeZone::Local);
    QVERIFY(!buildstamp::parseTimeZoneString("UTC+2").has_value());

    QVERIFY(buildstamp::parseFormatString("header") == buildstamp::OutputFormat::Header);
    QVERIFY(!buildstamp::parseFormatString("yaml").has_value());
}

void JsonUtilsTests::testInstructionNames()
{
    QCOMPARE(QString::fromStdString(buildstamp::instructionName(buildstamp::InstructionKey::BuildDate)),
             QStringLiteral("BUILDSTAMP_BUILD_DATE"));
    QCOMPARE(QString::fromStdString(buildstamp::instructionName(buildstamp::InstructionKey::BuildTime)),
             QStringLiteral("BUILDSTAMP_BUILD_TIME"));
    QCOMPARE(QString::fromStdString(buildstamp::instructionName(buildstamp::InstructionKey::BuildTimestamp)),
             QStringLiteral("BUILDSTAMP_BUILD_TIMESTAMP"));
    QCOMPARE(QString::fromStdString(buildstamp::instructionName(buildstamp::InstructionKey::BuildSemver)),
             QStringLiteral("BUILDSTAMP_BUILD_SEMVER"));
}

void JsonUtilsTests::testConfigToJson()
{
    const nlohmann::json payload = buildstamp::Instructions{};
    QCOMPARE(QString::fromStdString(payload["build"]["timezone"].get<std::string>()),
             QStringLiteral("utc"));
    QCOMPARE(QString::fromStdString(payload["build"]["kind"].get<std::string>()),
             QStringLiteral("timestamp"));
    QVERIFY(payload["build"]["semver"].get<bool>());
    QCOMPARE(QString::fromStdString(payload["versionVariable"].get<std::string>()),
             QStringLiteral("BUILDSTAMP_PKG_VERSION"));
}

void JsonUtilsTests::testApplyPartialConfig()
{
    buildstamp::Instructions instructions;
    std::string error;
    const auto config = nlohmann::json::parse(R"({"build": {"kind": "all", "timezone": "local"}})");
    QVERIFY(buildstamp::applyInstructionsJson(config, instructions, error));
    QVERIFY(error.empty());

    QVERIFY(instructions.build.kind == buildstamp::TimestampKind::All);
    QVERIFY(instructions.build.timezone == buildstamp::TimeZone::Local);
    QVERIFY(instructions.build.enabled);
    QVERIFY(instructions.build.timestamp);
    QVERIFY(instructions.build.semver);

    const auto second = nlohmann::json::parse(R"({"build": {"semver": false}, "versionVariable": "APP_VERSION"})");
    QVERIFY(buildstamp::applyInstructionsJson(second, instructions, error));
    QVERIFY(!instructions.build.semver);
    QVERIFY(instructions.build.kind == buildstamp::TimestampKind::All);
    QCOMPARE(QString::fromStdString(instructions.versionVariable), QStringLiteral("APP_VERSION"));

    QVERIFY(buildstamp::applyInstructionsJson(nlohmann::json::object(), instructions, error));
}

void JsonUtilsTests::testApplyRejectsBadMembers()
{
    const char *invalid[] = {
        R"([])",
        R"({"build": true})",
        R"({"build": {"enabled": "yes"}})",
        R"({"build": {"timezone": "mars"}})",
        R"({"build": {"timezone": 3}})",
        R"({"build": {"kind": "weekly"}})",
        R"({"versionVariable": ""})",
        R"({"versionVariable": 7})",
    };
    for (const char *text : invalid) {
        buildstamp::Instructions instructions;
        std::string error;
        QVERIFY2(!buildstamp::applyInstructionsJson(nlohmann::json::parse(text), instructions, error),
                 text);
        QVERIFY(!error.empty());
    }
}

void JsonUtilsTests::testInstructionsToJson()
{
    buildstamp::InstructionMap map;
    map.emplace(buildstamp::InstructionKey::BuildSemver, "4.2.0");
    map.emplace(buildstamp::InstructionKey::BuildDate, "2021-02-12");

    const auto payload = buildstamp::instructionsToJson(map);
    QCOMPARE(payload.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(payload.at("BUILDSTAMP_BUILD_SEMVER").get<std::string>()),
             QStringLiteral("4.2.0"));
    QVERIFY(buildstamp::instructionsToJson({}).is_object());
}

QTEST_MAIN(JsonUtilsTests)
#include "test_json_utils.moc"
