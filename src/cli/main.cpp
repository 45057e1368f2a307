#include <QCoreApplication>

#include "cli/StampCli.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

#include <vector>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("buildstamp"));

    bool trace = qEnvironmentVariableIntValue("BUILDSTAMP_TRACE") == 1;
    for (int i = 1; i < argc; ++i) {
        if (QString::fromLocal8Bit(argv[i]) == QStringLiteral("--trace")) {
            trace = true;
        }
    }
    buildstamp::logging::initLogging(QStringLiteral("buildstamp"), trace);
    BLOG_DEBUG(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("buildstamp_start"),
               QStringLiteral("build_invocation"),
               (nlohmann::json{{"args", argc - 1}}));

    // Runs once per build: generate, emit, exit.
    buildstamp::StampCli cli;
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : QCoreApplication::arguments()) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
