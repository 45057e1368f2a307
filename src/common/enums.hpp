#pragma once

namespace buildstamp {

enum class TimeZone {
    Utc,
    Local
};

// Which of date, time and combined timestamp to emit.
enum class TimestampKind {
    DateOnly,
    TimeOnly,
    DateAndTime,
    Timestamp,
    All
};

enum class InstructionKey {
    BuildDate,
    BuildTime,
    BuildTimestamp,
    BuildSemver
};

enum class OutputFormat {
    Env,
    CMake,
    Header,
    Json
};

} // namespace buildstamp
