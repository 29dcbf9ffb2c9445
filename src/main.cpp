#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QString>
#include <QTextStream>
#include <cstdio>

#include "version.h"

#include "saturn/cli/CommandLine.hpp"
#include "saturn/core/AppContext.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("saturn"));
    QCoreApplication::setApplicationName(QStringLiteral("saturn"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kSaturnVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Calendar and task tracker driven by short English statements."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption(QStringLiteral("config"), QStringLiteral("Configuration file to use."),
                                          QStringLiteral("file"));
    parser.addOption(configOption);
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("One of: %1.")
                                     .arg(saturn::cli::commandNames().join(QStringLiteral(", "))));
    parser.addPositionalArgument(QStringLiteral("arguments"), QStringLiteral("Command arguments."),
                                 QStringLiteral("[arguments...]"));
    parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);
    parser.process(app);

    QStringList arguments = parser.positionalArguments();
    if (arguments.isEmpty()) {
        parser.showHelp(saturn::cli::ExitUsage);
    }
    const QString command = arguments.takeFirst();

    QTextStream out(stdout);
    QTextStream err(stderr);

    saturn::core::AppContext context(parser.value(configOption));
    if (!context.load()) {
        err << "saturn: cannot read the calendar file\n";
        return saturn::cli::ExitFailure;
    }
    return saturn::cli::runCommand(context, command, arguments, out, err);
}
