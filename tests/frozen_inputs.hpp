#pragma once

#include <map>
#include <optional>
#include <string>

#include <QDateTime>

#include "stamp/build_inputs.hpp"

namespace buildstamp::testing {

inline QDateTime parseInstant(const char *iso)
{
    return QDateTime::fromString(QString::fromLatin1(iso), Qt::ISODateWithMs);
}

// 2021-02-12T01:54:15.134Z seen from UTC and from a +02:00 zone.
inline QDateTime frozenUtc()
{
    return parseInstant("2021-02-12T01:54:15.134Z");
}

inline QDateTime frozenLocal()
{
    return parseInstant("2021-02-12T03:54:15.134+02:00");
}

inline BuildInputs frozenInputs(std::optional<QDateTime> local,
                                std::map<std::string, std::string> environment)
{
    BuildInputs inputs;
    inputs.nowUtc = []() { return frozenUtc(); };
    inputs.nowLocal = [local]() { return local; };
    inputs.packageVersion = [environment](const std::string &name) -> std::optional<std::string> {
        const auto it = environment.find(name);
        if (it == environment.end()) {
            return std::nullopt;
        }
        return it->second;
    };
    return inputs;
}

inline BuildInputs frozenInputs()
{
    return frozenInputs(frozenLocal(), {{"BUILDSTAMP_PKG_VERSION", "4.2.0"}});
}

} // namespace buildstamp::testing
