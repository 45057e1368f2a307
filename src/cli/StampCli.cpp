#include "cli/StampCli.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QFile>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "stamp/build_instructions.hpp"
#include "stamp/instruction_writer.hpp"

namespace buildstamp {

namespace {

bool loadInstructionsFile(const QString &path, Instructions &instructions, std::string &error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        error = "cannot read config file " + path.toStdString();
        return false;
    }
    const QByteArray data = file.readAll();

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(data.toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        error = "invalid JSON in " + path.toStdString() + ": " + ex.what();
        return false;
    }

    std::string memberError;
    if (!applyInstructionsJson(parsed, instructions, memberError)) {
        error = path.toStdString() + ": " + memberError;
        return false;
    }
    return true;
}

void printError(const std::string &message)
{
    std::cerr << "buildstamp: error: " << message << std::endl;
}

} // namespace

StampCli::StampCli()
    : m_inputs(systemBuildInputs())
{
}

StampCli::StampCli(BuildInputs inputs)
    : m_inputs(std::move(inputs))
{
}

int StampCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }
    if (args.isEmpty()) {
        args.push_back(QStringLiteral("buildstamp"));
    }

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Emit build date, time and version constants for embedding in a binary."));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption configOption(QStringList() << "config",
                                          "Read settings from a JSON file.",
                                          "path");
    const QCommandLineOption disableOption(QStringList() << "disable",
                                           "Emit no build instructions.");
    const QCommandLineOption noTimestampOption(QStringList() << "no-timestamp",
                                               "Skip the date/time instructions.");
    const QCommandLineOption noSemverOption(QStringList() << "no-semver",
                                            "Skip the version instruction.");
    const QCommandLineOption timezoneOption(QStringList() << "timezone",
                                            "Clock to sample: utc or local.",
                                            "zone");
    const QCommandLineOption kindOption(QStringList() << "kind",
                                        "date, time, date-and-time, timestamp or all.",
                                        "kind");
    const QCommandLineOption versionEnvOption(QStringList() << "version-env",
                                              "Environment variable holding the package version.",
                                              "name");
    const QCommandLineOption formatOption(QStringList() << "format",
                                          "Output format: env, cmake, header or json.",
                                          "format",
                                          QStringLiteral("env"));
    const QCommandLineOption outOption(QStringList() << "out",
                                       "Write to a file instead of stdout.",
                                       "path");
    const QCommandLineOption traceOption(QStringList() << "trace",
                                         "Enable debug logging, echoed to stderr.");
    parser.addOptions({configOption, disableOption, noTimestampOption, noSemverOption,
                       timezoneOption, kindOption, versionEnvOption, formatOption,
                       outOption, traceOption});

    if (!parser.parse(args)) {
        printError(parser.errorText().toStdString());
        std::cerr << parser.helpText().toStdString();
        return kExitUsage;
    }
    if (parser.isSet(helpOption)) {
        std::cout << parser.helpText().toStdString();
        return kExitOk;
    }
    if (!parser.positionalArguments().isEmpty()) {
        printError("unexpected argument " + parser.positionalArguments().first().toStdString());
        return kExitUsage;
    }

    Instructions instructions;

    QString configPath = parser.value(configOption);
    if (configPath.isEmpty()) {
        configPath = qEnvironmentVariable("BUILDSTAMP_CONFIG");
    }
    if (!configPath.isEmpty()) {
        std::string error;
        if (!loadInstructionsFile(configPath, instructions, error)) {
            BLOG_ERROR(QStringLiteral("StampCli"),
                       QStringLiteral("run"),
                       QStringLiteral("config_rejected"),
                       QStringLiteral("user_config"),
                       (nlohmann::json{{"path", configPath.toStdString()}, {"error", error}}));
            printError(error);
            return kExitUsage;
        }
    }

    BuildConfig &build = instructions.build;
    if (parser.isSet(disableOption)) {
        build.enabled = false;
    }
    if (parser.isSet(noTimestampOption)) {
        build.timestamp = false;
    }
    if (parser.isSet(noSemverOption)) {
        build.semver = false;
    }
    if (parser.isSet(timezoneOption)) {
        const auto zone = parseTimeZoneString(parser.value(timezoneOption).toLower().toStdString());
        if (!zone.has_value()) {
            printError("invalid --timezone. Use utc or local.");
            return kExitUsage;
        }
        build.timezone = *zone;
    }
    if (parser.isSet(kindOption)) {
        const auto kind = parseKindString(parser.value(kindOption).toLower().toStdString());
        if (!kind.has_value()) {
            printError("invalid --kind. Use date, time, date-and-time, timestamp or all.");
            return kExitUsage;
        }
        build.kind = *kind;
    }
    if (parser.isSet(versionEnvOption)) {
        const QString name = parser.value(versionEnvOption);
        if (name.isEmpty()) {
            printError("--version-env needs a variable name.");
            return kExitUsage;
        }
        instructions.versionVariable = name.toStdString();
    }

    const auto format = parseFormatString(parser.value(formatOption).toLower().toStdString());
    if (!format.has_value()) {
        printError("invalid --format. Use env, cmake, header or json.");
        return kExitUsage;
    }

    BLOG_INFO(QStringLiteral("StampCli"),
              QStringLiteral("run"),
              QStringLiteral("stamp_start"),
              QStringLiteral("user_invocation"),
              (nlohmann::json{{"config", instructions},
                              {"format", toFormatString(*format)}}));

    InstructionMap map;
    try {
        map = generateInstructions(instructions, m_inputs);
    } catch (const std::exception &ex) {
        BLOG_ERROR(QStringLiteral("StampCli"),
                   QStringLiteral("run"),
                   QStringLiteral("stamp_failed"),
                   QStringLiteral("fatal_generation_error"),
                   (nlohmann::json{{"error", ex.what()}}));
        printError(ex.what());
        return kExitFatal;
    }

    return writeOutput(map, *format, parser.value(outOption));
}

int StampCli::writeOutput(const InstructionMap &map, OutputFormat format, const QString &outPath)
{
    const std::string content = renderInstructions(map, format);

    if (outPath.isEmpty()) {
        std::cout << content << std::flush;
        return kExitOk;
    }

    if (!writeInstructionsFile(outPath, content)) {
        BLOG_ERROR(QStringLiteral("StampCli"),
                   QStringLiteral("writeOutput"),
                   QStringLiteral("output_write_failed"),
                   QStringLiteral("io_error"),
                   (nlohmann::json{{"path", outPath.toStdString()}}));
        printError("cannot write " + outPath.toStdString());
        return kExitIo;
    }
    return kExitOk;
}

} // namespace buildstamp
