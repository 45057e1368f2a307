#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace buildstamp::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// With tracing on, Debug events are kept and every event is echoed to stderr.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Identifier shared by every line written during this process.
QString runId();

// Directory holding <process>.log. BUILDSTAMP_LOG_DIR wins over the
// per-user default.
QString logsDirPath();
QString logFilePath();

// Structured log event, one JSON object per line. Never writes to stdout.
void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const nlohmann::json &context = nlohmann::json::object());

} // namespace buildstamp::logging

#define BLOG_DEBUG(component, where, what, why, ctxJson) \
    ::buildstamp::logging::logEvent(::buildstamp::logging::LogLevel::Debug, \
                                    (component), (where), (what), (why), (ctxJson))

#define BLOG_INFO(component, where, what, why, ctxJson) \
    ::buildstamp::logging::logEvent(::buildstamp::logging::LogLevel::Info, \
                                    (component), (where), (what), (why), (ctxJson))

#define BLOG_WARN(component, where, what, why, ctxJson) \
    ::buildstamp::logging::logEvent(::buildstamp::logging::LogLevel::Warn, \
                                    (component), (where), (what), (why), (ctxJson))

#define BLOG_ERROR(component, where, what, why, ctxJson) \
    ::buildstamp::logging::logEvent(::buildstamp::logging::LogLevel::Error, \
                                    (component), (where), (what), (why), (ctxJson))
