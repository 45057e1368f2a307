#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace buildstamp {

inline std::string toTimeZoneString(TimeZone zone)
{
    switch (zone) {
    case TimeZone::Utc:
        return "utc";
    case TimeZone::Local:
        return "local";
    }
    return "utc";
}

inline std::optional<TimeZone> parseTimeZoneString(const std::string &value)
{
    if (value == "utc") {
        return TimeZone::Utc;
    }
    if (value == "local") {
        return TimeZone::Local;
    }
    return std::nullopt;
}

inline std::string toKindString(TimestampKind kind)
{
    switch (kind) {
    case TimestampKind::DateOnly:
        return "date";
    case TimestampKind::TimeOnly:
        return "time";
    case TimestampKind::DateAndTime:
        return "date-and-time";
    case TimestampKind::Timestamp:
        return "timestamp";
    case TimestampKind::All:
        return "all";
    }
    return "timestamp";
}

inline std::optional<TimestampKind> parseKindString(const std::string &value)
{
    if (value == "date") {
        return TimestampKind::DateOnly;
    }
    if (value == "time") {
        return TimestampKind::TimeOnly;
    }
    if (value == "date-and-time") {
        return TimestampKind::DateAndTime;
    }
    if (value == "timestamp") {
        return TimestampKind::Timestamp;
    }
    if (value == "all") {
        return TimestampKind::All;
    }
    return std::nullopt;
}

inline std::string toFormatString(OutputFormat format)
{
    switch (format) {
    case OutputFormat::Env:
        return "env";
    case OutputFormat::CMake:
        return "cmake";
    case OutputFormat::Header:
        return "header";
    case OutputFormat::Json:
        return "json";
    }
    return "env";
}

inline std::optional<OutputFormat> parseFormatString(const std::string &value)
{
    if (value == "env") {
        return OutputFormat::Env;
    }
    if (value == "cmake") {
        return OutputFormat::CMake;
    }
    if (value == "header") {
        return OutputFormat::Header;
    }
    if (value == "json") {
        return OutputFormat::Json;
    }
    return std::nullopt;
}

// Name under which an instruction is exposed to the compiled artifact.
inline std::string instructionName(InstructionKey key)
{
    switch (key) {
    case InstructionKey::BuildDate:
        return "BUILDSTAMP_BUILD_DATE";
    case InstructionKey::BuildTime:
        return "BUILDSTAMP_BUILD_TIME";
    case InstructionKey::BuildTimestamp:
        return "BUILDSTAMP_BUILD_TIMESTAMP";
    case InstructionKey::BuildSemver:
        return "BUILDSTAMP_BUILD_SEMVER";
    }
    return "BUILDSTAMP_UNKNOWN";
}

inline void to_json(nlohmann::json &j, const TimeZone &zone)
{
    j = toTimeZoneString(zone);
}

inline void to_json(nlohmann::json &j, const TimestampKind &kind)
{
    j = toKindString(kind);
}

inline void to_json(nlohmann::json &j, const BuildConfig &config)
{
    j = nlohmann::json{
        {"enabled", config.enabled},
        {"timestamp", config.timestamp},
        {"timezone", config.timezone},
        {"kind", config.kind},
        {"semver", config.semver}
    };
}

inline void to_json(nlohmann::json &j, const Instructions &instructions)
{
    j = nlohmann::json{
        {"build", instructions.build},
        {"versionVariable", instructions.versionVariable}
    };
}

inline nlohmann::json instructionsToJson(const InstructionMap &map)
{
    nlohmann::json payload = nlohmann::json::object();
    for (const auto &[key, value] : map) {
        payload[instructionName(key)] = value;
    }
    return payload;
}

namespace detail {

inline bool readBool(const nlohmann::json &j, const char *member, bool &out, std::string &error)
{
    if (!j.contains(member)) {
        return true;
    }
    const auto &value = j.at(member);
    if (!value.is_boolean()) {
        error = std::string("'") + member + "' must be a boolean";
        return false;
    }
    out = value.get<bool>();
    return true;
}

} // namespace detail

// Overlays the members present in `j` onto `instructions`. Members that are
// absent keep their current value. On failure `error` names the offending
// member and `instructions` may be partially updated.
inline bool applyInstructionsJson(const nlohmann::json &j,
                                  Instructions &instructions,
                                  std::string &error)
{
    if (!j.is_object()) {
        error = "configuration must be a JSON object";
        return false;
    }

    if (j.contains("versionVariable")) {
        const auto &value = j.at("versionVariable");
        if (!value.is_string() || value.get<std::string>().empty()) {
            error = "'versionVariable' must be a non-empty string";
            return false;
        }
        instructions.versionVariable = value.get<std::string>();
    }

    if (!j.contains("build")) {
        return true;
    }
    const auto &build = j.at("build");
    if (!build.is_object()) {
        error = "'build' must be an object";
        return false;
    }

    BuildConfig &config = instructions.build;
    if (!detail::readBool(build, "enabled", config.enabled, error)
        || !detail::readBool(build, "timestamp", config.timestamp, error)
        || !detail::readBool(build, "semver", config.semver, error)) {
        return false;
    }

    if (build.contains("timezone")) {
        const auto &value = build.at("timezone");
        const auto zone = value.is_string()
            ? parseTimeZoneString(value.get<std::string>())
            : std::nullopt;
        if (!zone.has_value()) {
            error = "'timezone' must be one of: utc, local";
            return false;
        }
        config.timezone = *zone;
    }

    if (build.contains("kind")) {
        const auto &value = build.at("kind");
        const auto kind = value.is_string()
            ? parseKindString(value.get<std::string>())
            : std::nullopt;
        if (!kind.has_value()) {
            error = "'kind' must be one of: date, time, date-and-time, timestamp, all";
            return false;
        }
        config.kind = *kind;
    }

    return true;
}

} // namespace buildstamp
