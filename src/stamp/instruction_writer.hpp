#pragma once

#include <string>

#include <QString>

#include "common/models.hpp"

namespace buildstamp {

// Serializes the generated instructions for the consuming build system.
std::string renderInstructions(const InstructionMap &map, OutputFormat format);

// Quotes `value` as a C/CMake string literal body.
std::string escapeQuoted(const std::string &value);

// Keeps an env value on one line: backslash, CR and LF become \\, \r, \n.
std::string escapeEnvValue(const std::string &value);

// Atomically replaces `path` with `content` unless the file already holds
// exactly that content. Returns false on IO failure.
bool writeInstructionsFile(const QString &path, const std::string &content);

} // namespace buildstamp
