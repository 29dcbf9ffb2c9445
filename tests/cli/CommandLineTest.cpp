#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "saturn/cli/CommandLine.hpp"
#include "saturn/cli/RecordFormatter.hpp"
#include "saturn/core/AppContext.hpp"
#include "saturn/core/CommandProcessor.hpp"
#include "saturn/core/Settings.hpp"

using namespace saturn;

namespace {
const QDateTime kNow(QDate(2024, 3, 1), QTime(9, 0), Qt::UTC);

struct Result
{
    int exitCode = 0;
    QString out;
    QString err;
};
} // namespace

class CommandLineTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void formatsRecords();
    void entryPrintsStoredRecord();
    void entryErrorsGoToStderr();
    void persistsBetweenRuns();
    void listOptions();
    void deleteAndShow();
    void fieldCommand();
    void configCommands();
    void usageErrors();

private:
    Result run(const QString &command, const QStringList &arguments);

    std::unique_ptr<QTemporaryDir> m_dir;
    QString m_configPath;
    QString m_calendarPath;
};

void CommandLineTest::init()
{
    qunsetenv("SATURN_DB");
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_configPath = m_dir->filePath(QStringLiteral("saturn.conf"));
    m_calendarPath = m_dir->filePath(QStringLiteral("saturn.ics"));

    core::Settings settings(m_configPath);
    settings.setStoragePath(m_calendarPath);
    QVERIFY(settings.sync());
}

void CommandLineTest::cleanup()
{
    m_dir.reset();
}

Result CommandLineTest::run(const QString &command, const QStringList &arguments)
{
    // A fresh context per call, the way each process invocation starts.
    core::AppContext context(m_configPath);
    Result result;
    if (!context.load()) {
        result.exitCode = -1;
        return result;
    }
    context.commands().setNow(kNow);
    QTextStream out(&result.out);
    QTextStream err(&result.err);
    result.exitCode = cli::runCommand(context, command, arguments, out, err);
    return result;
}

void CommandLineTest::formatsRecords()
{
    data::CalendarRecord record;
    record.id = 4;
    record.date = QDate(2024, 3, 1);
    record.shape = data::RecordShape::Span;
    record.start = QTime(22, 0);
    record.end = QTime(1, 0);
    record.endDate = QDate(2024, 3, 2);
    record.detail = QStringLiteral("Night shift");
    record.completed = true;
    QCOMPARE(cli::formatRecord(record, false),
             QStringLiteral("4: 2024-03-01 from 10:00pm to 2024-03-02 1:00am: Night shift [done]"));
    QCOMPARE(cli::formatRecord(record, true),
             QStringLiteral("4: 2024-03-01 from 22:00 to 2024-03-02 01:00: Night shift [done]"));

    data::CalendarRecord occurrence;
    occurrence.date = QDate(2024, 3, 1);
    occurrence.shape = data::RecordShape::Instant;
    occurrence.start = QTime(8, 0);
    occurrence.detail = QStringLiteral("Standup");
    occurrence.recurrenceId = 2;
    occurrence.sequenceIndex = 3;
    occurrence.notify = data::Duration();
    occurrence.notify->minutes = 10;
    occurrence.fields.insert(QStringLiteral("room"), QStringLiteral("4B"));
    QCOMPARE(cli::formatRecord(occurrence, false),
             QStringLiteral("-: 2024-03-01 at 8:00am: Standup [notify 10m] {room=4B} [recur 2 #3]"));
}

void CommandLineTest::entryPrintsStoredRecord()
{
    const Result result = run(QStringLiteral("entry"), { QStringLiteral("today"), QStringLiteral("at"),
                                                         QStringLiteral("8pm"), QStringLiteral("Dinner") });
    QCOMPARE(result.exitCode, 0);
    QCOMPARE(result.out, QStringLiteral("1: 2024-03-01 at 8:00pm: Dinner\n"));
    QVERIFY(result.err.isEmpty());
    QVERIFY(QFile::exists(m_calendarPath));
}

void CommandLineTest::entryErrorsGoToStderr()
{
    const Result result = run(QStringLiteral("e"), { QStringLiteral("someday"), QStringLiteral("at"),
                                                     QStringLiteral("8pm"), QStringLiteral("Dinner") });
    QCOMPARE(result.exitCode, 1);
    QVERIFY(result.out.isEmpty());
    QVERIFY(result.err.contains(QStringLiteral("UnparsableDate")));
    QVERIFY(result.err.contains(QStringLiteral("someday")));
}

void CommandLineTest::persistsBetweenRuns()
{
    QCOMPARE(run(QStringLiteral("entry"), { QStringLiteral("today at 8pm Dinner") }).exitCode, 0);
    QCOMPARE(run(QStringLiteral("entry"), { QStringLiteral("tomorrow all day Trip") }).exitCode, 0);

    const Result today = run(QStringLiteral("today"), {});
    QCOMPARE(today.exitCode, 0);
    QCOMPARE(today.out, QStringLiteral("1: 2024-03-01 at 8:00pm: Dinner\n"));

    const Result search = run(QStringLiteral("search"), { QStringLiteral("detail"), QStringLiteral("trip") });
    QCOMPARE(search.exitCode, 0);
    QCOMPARE(search.out, QStringLiteral("2: 2024-03-02 all day: Trip\n"));
}

void CommandLineTest::listOptions()
{
    QCOMPARE(run(QStringLiteral("entry"), { QStringLiteral("today at 8pm Dinner") }).exitCode, 0);
    QCOMPARE(run(QStringLiteral("entry"), { QStringLiteral("recur 1w 3/10 at 9am Review") }).exitCode, 0);
    QCOMPARE(run(QStringLiteral("complete"), { QStringLiteral("1") }).exitCode, 0);

    QVERIFY(run(QStringLiteral("list"), {}).out.isEmpty());
    QCOMPARE(run(QStringLiteral("l"), { QStringLiteral("--include-completed") }).out,
             QStringLiteral("1: 2024-03-01 at 8:00pm: Dinner [done]\n"));
    QCOMPARE(run(QStringLiteral("list"), { QStringLiteral("--all") }).out,
             QStringLiteral("2: 2024-03-10 at 9:00am: Review [recur 1 #0]\n"));
    QCOMPARE(run(QStringLiteral("list"), { QStringLiteral("--recur") }).out,
             QStringLiteral("1: every 1w from 2024-03-10 at 9:00am: Review\n"));
}

void CommandLineTest::deleteAndShow()
{
    QCOMPARE(run(QStringLiteral("entry"), { QStringLiteral("today at 8pm Dinner") }).exitCode, 0);
    QCOMPARE(run(QStringLiteral("entry"), { QStringLiteral("today at 9pm Movie") }).exitCode, 0);
    QCOMPARE(run(QStringLiteral("entry"), { QStringLiteral("recur 1d today at 7am Run") }).exitCode, 0);

    QCOMPARE(run(QStringLiteral("show"), { QStringLiteral("2") }).out, QStringLiteral("2: 2024-03-01 at 9:00pm: Movie\n"));
    QCOMPARE(run(QStringLiteral("show"), { QStringLiteral("1"), QStringLiteral("--recur") }).out,
             QStringLiteral("1: every 1d from 2024-03-01 at 7:00am: Run\n"));

    QCOMPARE(run(QStringLiteral("d"), { QStringLiteral("1"), QStringLiteral("2") }).exitCode, 0);
    QCOMPARE(run(QStringLiteral("delete"), { QStringLiteral("--recur"), QStringLiteral("1") }).exitCode, 0);
    QVERIFY(run(QStringLiteral("list"), { QStringLiteral("--all") }).out.isEmpty());

    const Result missing = run(QStringLiteral("show"), { QStringLiteral("2") });
    QCOMPARE(missing.exitCode, 1);
    QVERIFY(missing.err.contains(QStringLiteral("UnknownRecord")));
}

void CommandLineTest::fieldCommand()
{
    QCOMPARE(run(QStringLiteral("entry"), { QStringLiteral("today at 3pm Meeting") }).exitCode, 0);
    QCOMPARE(run(QStringLiteral("field"), { QStringLiteral("1"), QStringLiteral("room"), QStringLiteral("4B"),
                                            QStringLiteral("east") })
                 .exitCode,
             0);
    QCOMPARE(run(QStringLiteral("show"), { QStringLiteral("1") }).out,
             QStringLiteral("1: 2024-03-01 at 3:00pm: Meeting {room=4B east}\n"));
    QCOMPARE(run(QStringLiteral("field"), { QStringLiteral("1"), QStringLiteral("room") }).exitCode, 0);
    QCOMPARE(run(QStringLiteral("show"), { QStringLiteral("1") }).out,
             QStringLiteral("1: 2024-03-01 at 3:00pm: Meeting\n"));
}

void CommandLineTest::configCommands()
{
    QCOMPARE(run(QStringLiteral("config"), { QStringLiteral("set-24h"), QStringLiteral("true") }).exitCode, 0);
    QCOMPARE(run(QStringLiteral("config"), { QStringLiteral("set-well"), QStringLiteral("30m") }).exitCode, 0);
    QCOMPARE(run(QStringLiteral("config"), { QStringLiteral("set-query-window"), QStringLiteral("2d") }).exitCode,
             0);

    const Result shown = run(QStringLiteral("config"), { QStringLiteral("show") });
    QCOMPARE(shown.exitCode, 0);
    QVERIFY(shown.out.contains(QStringLiteral("use 24h time: true")));
    QVERIFY(shown.out.contains(QStringLiteral("well: 30m")));
    QVERIFY(shown.out.contains(QStringLiteral("query window: 2d")));

    // With 24h time, a bare morning hour today is not moved to the afternoon.
    const Result entry = run(QStringLiteral("entry"), { QStringLiteral("today at 5 Early run") });
    QCOMPARE(entry.out, QStringLiteral("1: 2024-03-01 at 05:00: Early run\n"));

    QCOMPARE(run(QStringLiteral("config"), { QStringLiteral("set-well"), QStringLiteral("soon") }).exitCode, 1);
    QCOMPARE(run(QStringLiteral("config"), { QStringLiteral("set-24h"), QStringLiteral("maybe") }).exitCode, 2);
    QCOMPARE(run(QStringLiteral("config"), { QStringLiteral("set-color"), QStringLiteral("red") }).exitCode, 2);
}

void CommandLineTest::usageErrors()
{
    QCOMPARE(run(QStringLiteral("launch"), {}).exitCode, 2);
    QCOMPARE(run(QStringLiteral("complete"), { QStringLiteral("abc") }).exitCode, 2);
    QCOMPARE(run(QStringLiteral("complete"), {}).exitCode, 2);
    QCOMPARE(run(QStringLiteral("delete"), {}).exitCode, 2);
    QCOMPARE(run(QStringLiteral("list"), { QStringLiteral("--bogus") }).exitCode, 2);
    QCOMPARE(run(QStringLiteral("now"), { QStringLiteral("--well"), QStringLiteral("soon") }).exitCode, 1);
    QCOMPARE(run(QStringLiteral("search"), {}).exitCode, 1);
}

QTEST_GUILESS_MAIN(CommandLineTest)
#include "CommandLineTest.moc"
