#pragma once

#include <functional>
#include <optional>
#include <string>

#include <QDateTime>
#include <QTimeZone>

namespace buildstamp {

// External reads the generator depends on. Production code binds these to the
// system clock and process environment; tests substitute frozen values.
struct BuildInputs {
    std::function<QDateTime()> nowUtc;
    // Empty when the local UTC offset cannot be resolved.
    std::function<std::optional<QDateTime>()> nowLocal;
    // Empty when the variable is unset.
    std::function<std::optional<std::string>(const std::string &name)> packageVersion;
};

BuildInputs systemBuildInputs();

// Expresses `utc` at the offset `zone` has at that instant. Empty when either
// is invalid.
std::optional<QDateTime> resolveLocalTime(const QDateTime &utc, const QTimeZone &zone);
std::optional<QDateTime> resolveLocalTime(const QDateTime &utc);

} // namespace buildstamp
