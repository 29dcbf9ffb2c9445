#pragma once

#include <QString>
#include <QStringList>
#include <QTextStream>

namespace saturn {
namespace core {
class AppContext;
}

namespace cli {

enum ExitCode
{
    ExitSuccess = 0,
    ExitFailure = 1,
    ExitUsage = 2,
};

// Runs one sub-command ("entry", "list", ...) with the arguments that follow
// it. Results go to out, diagnostics to err.
int runCommand(core::AppContext &context, const QString &command, const QStringList &arguments, QTextStream &out,
               QTextStream &err);

QStringList commandNames();

} // namespace cli
} // namespace saturn
