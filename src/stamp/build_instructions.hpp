#pragma once

#include <optional>
#include <string>

#include <QDateTime>

#include "common/models.hpp"
#include "stamp/build_inputs.hpp"

namespace buildstamp {

// Populates `map` with the BUILDSTAMP_BUILD_* instructions selected by
// `instructions.build`. Must be called once per map.
//
// Throws std::runtime_error when local time is requested and the local
// offset cannot be resolved; nothing is inserted in that case.
void configureBuild(const Instructions &instructions,
                    const BuildInputs &inputs,
                    InstructionMap &map);

InstructionMap generateInstructions(const Instructions &instructions,
                                    const BuildInputs &inputs);

// Inserts `value` under `key` unless the value is missing or the key is
// already present.
void addEntry(InstructionMap &map, InstructionKey key, const std::optional<std::string> &value);

// yyyy-MM-dd
std::optional<std::string> formatDate(const QDateTime &now);
// HH-mm-ss, 24 hour clock
std::optional<std::string> formatTime(const QDateTime &now);
// RFC 3339 with milliseconds and a Z or +HH:MM offset
std::optional<std::string> formatTimestamp(const QDateTime &now);

} // namespace buildstamp
