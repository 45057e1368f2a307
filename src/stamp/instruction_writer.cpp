#include "stamp/instruction_writer.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include <sstream>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace buildstamp {

namespace {

void renderEnv(std::ostringstream &out, const InstructionMap &map)
{
    for (const auto &[key, value] : map) {
        out << instructionName(key) << '=' << escapeEnvValue(value) << '\n';
    }
}

void renderCMake(std::ostringstream &out, const InstructionMap &map)
{
    for (const auto &[key, value] : map) {
        out << "set(" << instructionName(key) << " \"" << escapeQuoted(value) << "\")\n";
    }
}

void renderHeader(std::ostringstream &out, const InstructionMap &map)
{
    out << "// Generated by buildstamp. Do not edit.\n";
    out << "#pragma once\n";
    if (!map.empty()) {
        out << '\n';
    }
    for (const auto &[key, value] : map) {
        out << "#define " << instructionName(key) << " \"" << escapeQuoted(value) << "\"\n";
    }
}

} // namespace

std::string escapeQuoted(const std::string &value)
{
    std::string escaped;
    escaped.reserve(value.size());
    for (const char c : value) {
        switch (c) {
        case '\\':
            escaped += "\\\\";
            break;
        case '"':
            escaped += "\\\"";
            break;
        case '\n':
            escaped += "\\n";
            break;
        case '\r':
            escaped += "\\r";
            break;
        case '\t':
            escaped += "\\t";
            break;
        default:
            escaped += c;
            break;
        }
    }
    return escaped;
}

std::string escapeEnvValue(const std::string &value)
{
    std::string escaped;
    escaped.reserve(value.size());
    for (const char c : value) {
        switch (c) {
        case '\\':
            escaped += "\\\\";
            break;
        case '\n':
            escaped += "\\n";
            break;
        case '\r':
            escaped += "\\r";
            break;
        default:
            escaped += c;
            break;
        }
    }
    return escaped;
}

std::string renderInstructions(const InstructionMap &map, OutputFormat format)
{
    std::ostringstream out;
    switch (format) {
    case OutputFormat::Env:
        renderEnv(out, map);
        break;
    case OutputFormat::CMake:
        renderCMake(out, map);
        break;
    case OutputFormat::Header:
        renderHeader(out, map);
        break;
    case OutputFormat::Json:
        out << instructionsToJson(map).dump(2) << '\n';
        break;
    }
    return out.str();
}

bool writeInstructionsFile(const QString &path, const std::string &content)
{
    const QByteArray data = QByteArray::fromStdString(content);

    QFile existing(path);
    if (existing.exists() && existing.open(QIODevice::ReadOnly)) {
        const bool unchanged = existing.readAll() == data;
        existing.close();
        if (unchanged) {
            BLOG_DEBUG(QStringLiteral("InstructionWriter"),
                       QStringLiteral("writeInstructionsFile"),
                       QStringLiteral("output_unchanged"),
                       QStringLiteral("content_identical"),
                       (nlohmann::json{{"path", path.toStdString()}}));
            return true;
        }
    }

    const QString dir = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(dir)) {
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        return false;
    }

    BLOG_INFO(QStringLiteral("InstructionWriter"),
              QStringLiteral("writeInstructionsFile"),
              QStringLiteral("output_written"),
              QStringLiteral("content_changed"),
              (nlohmann::json{{"path", path.toStdString()}, {"bytes", data.size()}}));
    return true;
}

} // namespace buildstamp
