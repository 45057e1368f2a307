#pragma once

#include <QString>
#include <QStringList>

#include "common/models.hpp"
#include "stamp/build_inputs.hpp"

namespace buildstamp {

class StampCli
{
public:
    StampCli();
    explicit StampCli(BuildInputs inputs);

    // Parses options, generates the instructions once and emits them.
    // returns exit code
    int run(int argc, char *argv[]);

    static constexpr int kExitOk = 0;
    static constexpr int kExitUsage = 1;
    static constexpr int kExitFatal = 2;
    static constexpr int kExitIo = 3;

private:
    BuildInputs m_inputs;

    int writeOutput(const InstructionMap &map, OutputFormat format, const QString &outPath);
};

} // namespace buildstamp
