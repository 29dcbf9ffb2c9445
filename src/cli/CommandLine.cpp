#include "saturn/cli/CommandLine.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <optional>
#include <vector>

#include "saturn/cli/RecordFormatter.hpp"
#include "saturn/core/AppContext.hpp"
#include "saturn/core/CommandProcessor.hpp"
#include "saturn/core/Error.hpp"
#include "saturn/core/Logging.hpp"
#include "saturn/core/Settings.hpp"
#include "saturn/parse/DurationResolver.hpp"

namespace saturn {
namespace cli {

namespace {
const QCommandLineOption kAllOption(QStringLiteral("all"), QStringLiteral("List every record."));
const QCommandLineOption kRecurOption(QStringLiteral("recur"), QStringLiteral("Operate on recurring tasks."));
const QCommandLineOption kIncludeCompletedOption(QStringLiteral("include-completed"),
                                                 QStringLiteral("Include completed records."));
const QCommandLineOption kWellOption(QStringLiteral("well"), QStringLiteral("Window around now."),
                                     QStringLiteral("duration"));
const QCommandLineOption kAckOption(QStringLiteral("ack"), QStringLiteral("Mark the notifications as delivered."));

class CommandRunner
{
public:
    CommandRunner(core::AppContext &context, QTextStream &out, QTextStream &err)
        : m_context(context)
        , m_commands(context.commands())
        , m_out(out)
        , m_err(err)
    {
    }

    int run(const QString &command, const QStringList &arguments);

private:
    int entry(const QStringList &arguments);
    int search(const QStringList &arguments);
    int list(const QStringList &arguments);
    int today(const QStringList &arguments);
    int now(const QStringList &arguments);
    int notify(const QStringList &arguments);
    int complete(const QStringList &arguments);
    int remove(const QStringList &arguments);
    int show(const QStringList &arguments);
    int field(const QStringList &arguments);
    int config(const QStringList &arguments);

    bool parseOptions(QCommandLineParser &parser, const QString &command, const QStringList &arguments);
    std::optional<quint64> parseId(const QString &text);
    std::optional<data::Duration> wellOption(const QCommandLineParser &parser);
    int print(const std::optional<std::vector<data::CalendarRecord>> &records, const core::Error &error);
    int fail(const core::Error &error);
    int usage(const QString &message);

    core::AppContext &m_context;
    core::CommandProcessor &m_commands;
    QTextStream &m_out;
    QTextStream &m_err;
};

int CommandRunner::run(const QString &command, const QStringList &arguments)
{
    const QString name = command.toLower();
    qCDebug(lcCommand) << "running" << name << arguments;
    if (name == QLatin1String("entry") || name == QLatin1String("e")) {
        return entry(arguments);
    }
    if (name == QLatin1String("search")) {
        return search(arguments);
    }
    if (name == QLatin1String("list") || name == QLatin1String("l")) {
        return list(arguments);
    }
    if (name == QLatin1String("today") || name == QLatin1String("t")) {
        return today(arguments);
    }
    if (name == QLatin1String("now")) {
        return now(arguments);
    }
    if (name == QLatin1String("notify")) {
        return notify(arguments);
    }
    if (name == QLatin1String("complete") || name == QLatin1String("c")) {
        return complete(arguments);
    }
    if (name == QLatin1String("delete") || name == QLatin1String("d")) {
        return remove(arguments);
    }
    if (name == QLatin1String("show")) {
        return show(arguments);
    }
    if (name == QLatin1String("field")) {
        return field(arguments);
    }
    if (name == QLatin1String("config")) {
        return config(arguments);
    }
    return usage(QStringLiteral("unknown command '%1'").arg(command));
}

bool CommandRunner::parseOptions(QCommandLineParser &parser, const QString &command, const QStringList &arguments)
{
    if (!parser.parse(QStringList{command} + arguments)) {
        usage(parser.errorText());
        return false;
    }
    return true;
}

std::optional<quint64> CommandRunner::parseId(const QString &text)
{
    bool ok = false;
    const quint64 id = text.toULongLong(&ok);
    if (!ok || id == 0) {
        usage(QStringLiteral("'%1' is not a record id").arg(text));
        return std::nullopt;
    }
    return id;
}

std::optional<data::Duration> CommandRunner::wellOption(const QCommandLineParser &parser)
{
    if (!parser.isSet(kWellOption)) {
        return m_context.settings().well();
    }
    core::Error error;
    const auto well = parse::resolveDuration(parser.value(kWellOption), &error);
    if (!well) {
        fail(error);
        return std::nullopt;
    }
    return well;
}

int CommandRunner::print(const std::optional<std::vector<data::CalendarRecord>> &records, const core::Error &error)
{
    if (!records) {
        return fail(error);
    }
    const bool use24h = m_context.settings().use24hTime();
    for (const data::CalendarRecord &record : *records) {
        m_out << formatRecord(record, use24h) << '\n';
    }
    return ExitSuccess;
}

int CommandRunner::fail(const core::Error &error)
{
    m_err << "saturn: " << error.toString() << '\n';
    return ExitFailure;
}

int CommandRunner::usage(const QString &message)
{
    m_err << "saturn: " << message << '\n';
    return ExitUsage;
}

int CommandRunner::entry(const QStringList &arguments)
{
    core::Error error;
    const auto record = m_commands.addEntry(arguments, &error);
    if (!record) {
        return fail(error);
    }
    m_out << formatRecord(*record, m_context.settings().use24hTime()) << '\n';
    return ExitSuccess;
}

int CommandRunner::search(const QStringList &arguments)
{
    core::Error error;
    return print(m_commands.search(arguments, &error), error);
}

int CommandRunner::list(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.addOption(kAllOption);
    parser.addOption(kRecurOption);
    parser.addOption(kIncludeCompletedOption);
    if (!parseOptions(parser, QStringLiteral("list"), arguments)) {
        return ExitUsage;
    }

    if (parser.isSet(kRecurOption)) {
        const bool use24h = m_context.settings().use24hTime();
        for (const data::RecurringTask &task : m_commands.listRecurring()) {
            m_out << formatRecurringTask(task, use24h) << '\n';
        }
        return ExitSuccess;
    }

    core::Error error;
    const bool includeCompleted = parser.isSet(kIncludeCompletedOption);
    if (parser.isSet(kAllOption)) {
        return print(m_commands.listAll(includeCompleted, &error), error);
    }
    return print(m_commands.listUpcoming(includeCompleted, &error), error);
}

int CommandRunner::today(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.addOption(kIncludeCompletedOption);
    if (!parseOptions(parser, QStringLiteral("today"), arguments)) {
        return ExitUsage;
    }
    core::Error error;
    return print(m_commands.listToday(parser.isSet(kIncludeCompletedOption), &error), error);
}

int CommandRunner::now(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.addOption(kWellOption);
    parser.addOption(kIncludeCompletedOption);
    if (!parseOptions(parser, QStringLiteral("now"), arguments)) {
        return ExitUsage;
    }
    const auto well = wellOption(parser);
    if (!well) {
        return ExitFailure;
    }
    core::Error error;
    return print(m_commands.eventsNow(*well, parser.isSet(kIncludeCompletedOption), &error), error);
}

int CommandRunner::notify(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.addOption(kWellOption);
    parser.addOption(kAckOption);
    if (!parseOptions(parser, QStringLiteral("notify"), arguments)) {
        return ExitUsage;
    }
    const auto well = wellOption(parser);
    if (!well) {
        return ExitFailure;
    }
    core::Error error;
    if (parser.isSet(kAckOption)) {
        return print(m_commands.acknowledgeNotifications(*well, &error), error);
    }
    return print(m_commands.pendingNotifications(*well, &error), error);
}

int CommandRunner::complete(const QStringList &arguments)
{
    if (arguments.size() != 1) {
        return usage(QStringLiteral("complete takes exactly one id"));
    }
    const auto id = parseId(arguments.first());
    if (!id) {
        return ExitUsage;
    }
    core::Error error;
    if (!m_commands.complete(*id, &error)) {
        return fail(error);
    }
    return ExitSuccess;
}

int CommandRunner::remove(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.addOption(kRecurOption);
    parser.addPositionalArgument(QStringLiteral("id"), QStringLiteral("Record ids."), QStringLiteral("<id...>"));
    if (!parseOptions(parser, QStringLiteral("delete"), arguments)) {
        return ExitUsage;
    }
    const QStringList ids = parser.positionalArguments();
    if (ids.isEmpty()) {
        return usage(QStringLiteral("delete needs at least one id"));
    }

    int result = ExitSuccess;
    for (const QString &text : ids) {
        const auto id = parseId(text);
        if (!id) {
            return ExitUsage;
        }
        core::Error error;
        const bool removed = parser.isSet(kRecurOption) ? m_commands.removeRecurringTask(*id, &error)
                                                        : m_commands.removeRecord(*id, &error);
        if (!removed) {
            result = fail(error);
        }
    }
    return result;
}

int CommandRunner::show(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.addOption(kRecurOption);
    parser.addPositionalArgument(QStringLiteral("id"), QStringLiteral("Record id."));
    if (!parseOptions(parser, QStringLiteral("show"), arguments)) {
        return ExitUsage;
    }
    if (parser.positionalArguments().size() != 1) {
        return usage(QStringLiteral("show takes exactly one id"));
    }
    const auto id = parseId(parser.positionalArguments().first());
    if (!id) {
        return ExitUsage;
    }

    core::Error error;
    const bool use24h = m_context.settings().use24hTime();
    if (parser.isSet(kRecurOption)) {
        const auto task = m_commands.showRecurringTask(*id, &error);
        if (!task) {
            return fail(error);
        }
        m_out << formatRecurringTask(*task, use24h) << '\n';
        return ExitSuccess;
    }
    const auto record = m_commands.show(*id, &error);
    if (!record) {
        return fail(error);
    }
    m_out << formatRecord(*record, use24h) << '\n';
    return ExitSuccess;
}

int CommandRunner::field(const QStringList &arguments)
{
    if (arguments.size() < 2) {
        return usage(QStringLiteral("usage: field <id> <key> [<value>]"));
    }
    const auto id = parseId(arguments.at(0));
    if (!id) {
        return ExitUsage;
    }
    std::optional<QString> value;
    if (arguments.size() > 2) {
        value = arguments.mid(2).join(QLatin1Char(' '));
    }
    core::Error error;
    if (!m_commands.setField(*id, arguments.at(1), value, &error)) {
        return fail(error);
    }
    return ExitSuccess;
}

int CommandRunner::config(const QStringList &arguments)
{
    core::Settings &settings = m_context.settings();
    const QString action = arguments.value(0).toLower();

    if (action == QLatin1String("show") && arguments.size() == 1) {
        m_out << "config: " << settings.fileName() << '\n';
        m_out << "calendar: " << settings.storagePath() << '\n';
        m_out << "use 24h time: " << (settings.use24hTime() ? "true" : "false") << '\n';
        m_out << "query window: " << settings.queryWindow().toString() << '\n';
        m_out << "well: " << settings.well().toString() << '\n';
        return ExitSuccess;
    }
    if (arguments.size() != 2) {
        return usage(QStringLiteral("usage: config set-24h|set-query-window|set-well <value> | config show"));
    }

    const QString value = arguments.at(1);
    if (action == QLatin1String("set-24h")) {
        const QString flag = value.toLower();
        if (flag != QLatin1String("true") && flag != QLatin1String("false")) {
            return usage(QStringLiteral("set-24h takes true or false"));
        }
        settings.setUse24hTime(flag == QLatin1String("true"));
    } else if (action == QLatin1String("set-query-window") || action == QLatin1String("set-well")) {
        core::Error error;
        const auto duration = parse::resolveDuration(value, &error);
        if (!duration) {
            return fail(error);
        }
        if (duration->isNegative()) {
            return usage(QStringLiteral("'%1' must not be negative").arg(value));
        }
        if (action == QLatin1String("set-well")) {
            settings.setWell(*duration);
        } else {
            settings.setQueryWindow(*duration);
        }
    } else {
        return usage(QStringLiteral("unknown config action '%1'").arg(arguments.at(0)));
    }

    if (!settings.sync()) {
        core::Error error;
        core::setError(&error, core::ErrorCode::StorageFailure, settings.fileName(),
                       QStringLiteral("cannot write settings"));
        return fail(error);
    }
    return ExitSuccess;
}
} // namespace

int runCommand(core::AppContext &context, const QString &command, const QStringList &arguments, QTextStream &out,
               QTextStream &err)
{
    CommandRunner runner(context, out, err);
    const int result = runner.run(command, arguments);
    out.flush();
    err.flush();
    return result;
}

QStringList commandNames()
{
    return {QStringLiteral("entry"),    QStringLiteral("search"), QStringLiteral("list"),
            QStringLiteral("today"),    QStringLiteral("now"),    QStringLiteral("notify"),
            QStringLiteral("complete"), QStringLiteral("delete"), QStringLiteral("show"),
            QStringLiteral("field"),    QStringLiteral("config")};
}

} // namespace cli
} // namespace saturn
