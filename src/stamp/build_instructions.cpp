#include "stamp/build_instructions.hpp"

#include <stdexcept>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace buildstamp {

namespace {

std::optional<std::string> formatWith(const QDateTime &now, const QString &pattern)
{
    if (!now.isValid()) {
        return std::nullopt;
    }
    const QString text = now.toString(pattern);
    if (text.isEmpty()) {
        return std::nullopt;
    }
    return text.toStdString();
}

QDateTime captureSnapshot(TimeZone zone, const BuildInputs &inputs)
{
    if (zone == TimeZone::Utc) {
        return inputs.nowUtc();
    }

    const auto local = inputs.nowLocal();
    if (!local.has_value()) {
        BLOG_ERROR(QStringLiteral("BuildInstructions"),
                   QStringLiteral("captureSnapshot"),
                   QStringLiteral("local_time_unavailable"),
                   QStringLiteral("local_offset_unresolved"),
                   nlohmann::json::object());
        throw std::runtime_error("unable to retrieve local datetime");
    }
    return *local;
}

void addDateEntry(InstructionMap &map, const QDateTime &now)
{
    addEntry(map, InstructionKey::BuildDate, formatDate(now));
}

void addTimeEntry(InstructionMap &map, const QDateTime &now)
{
    addEntry(map, InstructionKey::BuildTime, formatTime(now));
}

void addTimestampEntry(InstructionMap &map, const QDateTime &now)
{
    addEntry(map, InstructionKey::BuildTimestamp, formatTimestamp(now));
}

void addTimestampEntries(InstructionMap &map, TimestampKind kind, const QDateTime &now)
{
    switch (kind) {
    case TimestampKind::DateOnly:
        addDateEntry(map, now);
        break;
    case TimestampKind::TimeOnly:
        addTimeEntry(map, now);
        break;
    case TimestampKind::DateAndTime:
        addDateEntry(map, now);
        addTimeEntry(map, now);
        break;
    case TimestampKind::Timestamp:
        addTimestampEntry(map, now);
        break;
    case TimestampKind::All:
        addDateEntry(map, now);
        addTimeEntry(map, now);
        addTimestampEntry(map, now);
        break;
    }
}

} // namespace

void addEntry(InstructionMap &map, InstructionKey key, const std::optional<std::string> &value)
{
    if (!value.has_value()) {
        BLOG_DEBUG(QStringLiteral("BuildInstructions"),
                   QStringLiteral("addEntry"),
                   QStringLiteral("entry_omitted"),
                   QStringLiteral("value_unavailable"),
                   (nlohmann::json{{"key", instructionName(key)}}));
        return;
    }

    const bool inserted = map.emplace(key, *value).second;
    if (!inserted) {
        BLOG_DEBUG(QStringLiteral("BuildInstructions"),
                   QStringLiteral("addEntry"),
                   QStringLiteral("duplicate_entry_ignored"),
                   QStringLiteral("write_once"),
                   (nlohmann::json{{"key", instructionName(key)}}));
    }
}

std::optional<std::string> formatDate(const QDateTime &now)
{
    return formatWith(now, QStringLiteral("yyyy-MM-dd"));
}

std::optional<std::string> formatTime(const QDateTime &now)
{
    return formatWith(now, QStringLiteral("HH-mm-ss"));
}

std::optional<std::string> formatTimestamp(const QDateTime &now)
{
    if (!now.isValid()) {
        return std::nullopt;
    }
    const QString text = now.toString(Qt::ISODateWithMs);
    if (text.isEmpty()) {
        return std::nullopt;
    }
    return text.toStdString();
}

void configureBuild(const Instructions &instructions,
                    const BuildInputs &inputs,
                    InstructionMap &map)
{
    const BuildConfig &config = instructions.build;
    if (!config.hasEnabled()) {
        BLOG_DEBUG(QStringLiteral("BuildInstructions"),
                   QStringLiteral("configureBuild"),
                   QStringLiteral("build_category_disabled"),
                   QStringLiteral("config"),
                   (nlohmann::json{{"build", config}}));
        return;
    }

    if (config.timestamp) {
        const QDateTime now = captureSnapshot(config.timezone, inputs);
        addTimestampEntries(map, config.kind, now);
    }

    if (config.semver) {
        addEntry(map,
                 InstructionKey::BuildSemver,
                 inputs.packageVersion(instructions.versionVariable));
    }
}

InstructionMap generateInstructions(const Instructions &instructions,
                                    const BuildInputs &inputs)
{
    InstructionMap map;
    configureBuild(instructions, inputs, map);
    BLOG_INFO(QStringLiteral("BuildInstructions"),
              QStringLiteral("generateInstructions"),
              QStringLiteral("instructions_generated"),
              QStringLiteral("build_run"),
              (nlohmann::json{{"config", instructions}, {"entries", map.size()}}));
    return map;
}

} // namespace buildstamp
