#include "stamp/build_inputs.hpp"

namespace buildstamp {

std::optional<QDateTime> resolveLocalTime(const QDateTime &utc, const QTimeZone &zone)
{
    if (!utc.isValid() || !zone.isValid()) {
        return std::nullopt;
    }

    // Pin the offset so formatting reports it explicitly rather than
    // re-resolving the zone.
    const QDateTime local = utc.toOffsetFromUtc(zone.offsetFromUtc(utc));
    if (!local.isValid()) {
        return std::nullopt;
    }
    return local;
}

std::optional<QDateTime> resolveLocalTime(const QDateTime &utc)
{
    return resolveLocalTime(utc, QTimeZone::systemTimeZone());
}

BuildInputs systemBuildInputs()
{
    BuildInputs inputs;
    inputs.nowUtc = []() {
        return QDateTime::currentDateTimeUtc();
    };
    inputs.nowLocal = []() {
        return resolveLocalTime(QDateTime::currentDateTimeUtc());
    };
    inputs.packageVersion = [](const std::string &name) -> std::optional<std::string> {
        const char *variable = name.c_str();
        if (!qEnvironmentVariableIsSet(variable)) {
            return std::nullopt;
        }
        return qEnvironmentVariable(variable).toStdString();
    };
    return inputs;
}

} // namespace buildstamp
