#include <QtTest/QtTest>

#include "saturn/parse/EntryParser.hpp"
#include "saturn/parse/TokenScanner.hpp"

using namespace saturn;

namespace {
parse::ParseContext contextAt(const QTime &time, bool use24h = false)
{
    parse::ParseContext context;
    context.now = QDateTime(QDate(2024, 3, 1), time, Qt::UTC);
    context.use24hTime = use24h;
    return context;
}
} // namespace

class EntryParserTest : public QObject
{
    Q_OBJECT

private slots:
    void parsesInstant();
    void parsesShowerExample();
    void parsesWeeklyAllDayFromWednesday();
    void parsesSpan();
    void spanPastMidnightEndsNextDay();
    void parsesAllDay();
    void parsesRecurrenceAndNotification();
    void infersAfternoonForToday();
    void keywordsIgnoreCase();
    void detailKeepsCaseAndCollapsesSpaces();
    void acceptsArgumentList();
    void convertsToRecord();
    void rejects_data();
    void rejects();
};

void EntryParserTest::parsesInstant()
{
    core::Error error;
    const auto draft = parse::parseEntry(QStringLiteral("today at 8pm Dinner with Sam"), contextAt(QTime(9, 0)), &error);
    QVERIFY2(draft.has_value(), qPrintable(error.toString()));
    QVERIFY(!draft->recurrence.has_value());
    QCOMPARE(draft->date, QDate(2024, 3, 1));
    QCOMPARE(draft->shape, data::RecordShape::Instant);
    QCOMPARE(draft->start, QTime(20, 0));
    QVERIFY(!draft->notify.has_value());
    QCOMPARE(draft->detail, QStringLiteral("Dinner with Sam"));
}

void EntryParserTest::parsesShowerExample()
{
    const auto draft =
        parse::parseEntry(QStringLiteral("tomorrow at 8pm notify 30m Take a Shower"), contextAt(QTime(9, 0)));
    QVERIFY(draft.has_value());
    QCOMPARE(draft->date, QDate(2024, 3, 2));
    QCOMPARE(draft->shape, data::RecordShape::Instant);
    QCOMPARE(draft->start, QTime(20, 0));
    data::Duration thirtyMinutes;
    thirtyMinutes.minutes = 30;
    QVERIFY(*draft->notify == thirtyMinutes);
    QCOMPARE(draft->detail, QStringLiteral("Take a Shower"));
}

void EntryParserTest::parsesWeeklyAllDayFromWednesday()
{
    parse::ParseContext wednesday;
    wednesday.now = QDateTime(QDate(2024, 3, 6), QTime(9, 0), Qt::UTC);
    const auto draft = parse::parseEntry(QStringLiteral("recur 1w monday all day notify 1h Standup"), wednesday);
    QVERIFY(draft.has_value());
    data::Duration week;
    week.weeks = 1;
    QVERIFY(*draft->recurrence == week);
    QCOMPARE(draft->date, QDate(2024, 3, 11));
    QCOMPARE(draft->shape, data::RecordShape::AllDay);
    QCOMPARE(draft->notify->hours, 1);
}

void EntryParserTest::parsesSpan()
{
    const auto draft = parse::parseEntry(QStringLiteral("tomorrow from 9 to 10:30 Standup"), contextAt(QTime(15, 0)));
    QVERIFY(draft.has_value());
    QCOMPARE(draft->date, QDate(2024, 3, 2));
    QCOMPARE(draft->shape, data::RecordShape::Span);
    QCOMPARE(draft->start, QTime(9, 0));
    QCOMPARE(draft->end, QTime(10, 30));
    QCOMPARE(draft->endDate, QDate(2024, 3, 2));
    QCOMPARE(draft->detail, QStringLiteral("Standup"));
}

void EntryParserTest::spanPastMidnightEndsNextDay()
{
    const auto draft = parse::parseEntry(QStringLiteral("fri from 11pm until 1am Party"), contextAt(QTime(9, 0)));
    QVERIFY(draft.has_value());
    QCOMPARE(draft->date, QDate(2024, 3, 1));
    QCOMPARE(draft->start, QTime(23, 0));
    QCOMPARE(draft->end, QTime(1, 0));
    QCOMPARE(draft->endDate, QDate(2024, 3, 2));
}

void EntryParserTest::parsesAllDay()
{
    const auto draft = parse::parseEntry(QStringLiteral("10/23 all day Birthday"), contextAt(QTime(9, 0)));
    QVERIFY(draft.has_value());
    QCOMPARE(draft->date, QDate(2024, 10, 23));
    QCOMPARE(draft->shape, data::RecordShape::AllDay);
    QCOMPARE(draft->detail, QStringLiteral("Birthday"));
}

void EntryParserTest::parsesRecurrenceAndNotification()
{
    const auto draft =
        parse::parseEntry(QStringLiteral("recur 1w mon at 9am notify me 15m Team sync"), contextAt(QTime(9, 0)));
    QVERIFY(draft.has_value());
    QVERIFY(draft->recurrence.has_value());
    QCOMPARE(draft->recurrence->weeks, 1);
    QCOMPARE(draft->date, QDate(2024, 3, 4));
    QCOMPARE(draft->start, QTime(9, 0));
    QVERIFY(draft->notify.has_value());
    QCOMPARE(draft->notify->minutes, 15);
    QCOMPARE(draft->detail, QStringLiteral("Team sync"));

    const auto withoutMe = parse::parseEntry(QStringLiteral("today at 5pm notify 1h Call"), contextAt(QTime(9, 0)));
    QVERIFY(withoutMe.has_value());
    QCOMPARE(withoutMe->notify->hours, 1);
    QCOMPARE(withoutMe->detail, QStringLiteral("Call"));
}

void EntryParserTest::infersAfternoonForToday()
{
    const auto afternoon = parse::parseEntry(QStringLiteral("today at 5 Call"), contextAt(QTime(15, 0)));
    QVERIFY(afternoon.has_value());
    QCOMPARE(afternoon->start, QTime(17, 0));

    const auto weekdayToday = parse::parseEntry(QStringLiteral("friday at 5 Call"), contextAt(QTime(15, 0)));
    QVERIFY(weekdayToday.has_value());
    QCOMPARE(weekdayToday->start, QTime(17, 0));

    const auto tomorrow = parse::parseEntry(QStringLiteral("tomorrow at 5 Call"), contextAt(QTime(15, 0)));
    QVERIFY(tomorrow.has_value());
    QCOMPARE(tomorrow->start, QTime(5, 0));

    const auto literal = parse::parseEntry(QStringLiteral("today at 5 Call"), contextAt(QTime(15, 0), true));
    QVERIFY(literal.has_value());
    QCOMPARE(literal->start, QTime(5, 0));
}

void EntryParserTest::keywordsIgnoreCase()
{
    const auto draft =
        parse::parseEntry(QStringLiteral("RECUR 1d TODAY From 8PM Until 9PM NOTIFY Me 5m Gym"), contextAt(QTime(9, 0)));
    QVERIFY(draft.has_value());
    QCOMPARE(draft->recurrence->days, 1);
    QCOMPARE(draft->shape, data::RecordShape::Span);
    QCOMPARE(draft->end, QTime(21, 0));
    QCOMPARE(draft->detail, QStringLiteral("Gym"));
}

void EntryParserTest::detailKeepsCaseAndCollapsesSpaces()
{
    const auto draft = parse::parseEntry(QStringLiteral("today  at 8pm   Buy   MILK at   Store"), contextAt(QTime(9, 0)));
    QVERIFY(draft.has_value());
    QCOMPARE(draft->detail, QStringLiteral("Buy MILK at Store"));
}

void EntryParserTest::acceptsArgumentList()
{
    const QStringList arguments{ QStringLiteral("tomorrow"), QStringLiteral("all"), QStringLiteral("day"),
                                 QStringLiteral("Pay rent") };
    const auto draft = parse::parseEntry(arguments, contextAt(QTime(9, 0)));
    QVERIFY(draft.has_value());
    QCOMPARE(draft->detail, QStringLiteral("Pay rent"));
}

void EntryParserTest::convertsToRecord()
{
    const auto draft =
        parse::parseEntry(QStringLiteral("today from 10pm to 1am notify 30m Night shift"), contextAt(QTime(9, 0)));
    QVERIFY(draft.has_value());

    const data::CalendarRecord record = parse::toRecord(*draft);
    QVERIFY(data::isProvisional(record));
    QCOMPARE(record.shape, data::RecordShape::Span);
    QCOMPARE(record.date, QDate(2024, 3, 1));
    QCOMPARE(record.endDate, QDate(2024, 3, 2));
    QCOMPARE(record.detail, QStringLiteral("Night shift"));

    const QDateTime reference = contextAt(QTime(9, 0)).now;
    QCOMPARE(data::recordStart(record, reference), QDateTime(QDate(2024, 3, 1), QTime(22, 0), Qt::UTC));
    QCOMPARE(data::recordEnd(record, reference), QDateTime(QDate(2024, 3, 2), QTime(1, 0), Qt::UTC));
    QCOMPARE(*data::notificationInstant(record, reference), QDateTime(QDate(2024, 3, 1), QTime(21, 30), Qt::UTC));
}

void EntryParserTest::rejects_data()
{
    QTest::addColumn<QString>("statement");
    QTest::addColumn<int>("code");
    QTest::addColumn<QString>("token");

    const QString end = parse::endOfInput();
    QTest::newRow("empty") << "" << static_cast<int>(core::ErrorCode::UnparsableDate) << end;
    QTest::newRow("only recurrence") << "recur 1d" << static_cast<int>(core::ErrorCode::UnparsableDate) << end;
    QTest::newRow("bad date") << "whenever at 8pm Dinner" << static_cast<int>(core::ErrorCode::UnparsableDate)
                              << "whenever";
    QTest::newRow("impossible date") << "2/30 at 8pm Dinner" << static_cast<int>(core::ErrorCode::InvalidDate)
                                     << "2/30";
    QTest::newRow("no shape") << "today Dinner" << static_cast<int>(core::ErrorCode::MissingShape) << "Dinner";
    QTest::newRow("date only") << "today" << static_cast<int>(core::ErrorCode::MissingShape) << end;
    QTest::newRow("all night") << "today all night Party" << static_cast<int>(core::ErrorCode::MissingShape)
                               << "night";
    QTest::newRow("bad time") << "today at 25:00 Dinner" << static_cast<int>(core::ErrorCode::InvalidTime)
                              << "25:00";
    QTest::newRow("missing time") << "today at" << static_cast<int>(core::ErrorCode::InvalidTime) << end;
    QTest::newRow("span without end") << "today from 8pm Dinner" << static_cast<int>(core::ErrorCode::InvalidTime)
                                      << "Dinner";
    QTest::newRow("no detail") << "today at 8pm" << static_cast<int>(core::ErrorCode::MissingDetail) << end;
    QTest::newRow("no detail after notify") << "today at 8pm notify 5m"
                                            << static_cast<int>(core::ErrorCode::MissingDetail) << end;
    QTest::newRow("bad recurrence") << "recur often today at 8pm Dinner"
                                    << static_cast<int>(core::ErrorCode::MalformedDuration) << "often";
    QTest::newRow("zero recurrence") << "recur 0d today at 8pm Dinner"
                                     << static_cast<int>(core::ErrorCode::MalformedDuration) << "0d";
    QTest::newRow("negative recurrence") << "recur -1d today at 8pm Dinner"
                                         << static_cast<int>(core::ErrorCode::MalformedDuration) << "-1d";
    QTest::newRow("bad notification") << "today at 8pm notify soon Dinner"
                                      << static_cast<int>(core::ErrorCode::MalformedDuration) << "soon";
}

void EntryParserTest::rejects()
{
    QFETCH(QString, statement);
    QFETCH(int, code);
    QFETCH(QString, token);

    core::Error error;
    QVERIFY(!parse::parseEntry(statement, contextAt(QTime(9, 0)), &error).has_value());
    QCOMPARE(static_cast<int>(error.code), code);
    QCOMPARE(error.token, token);
    QVERIFY(!error.message.isEmpty());
}

QTEST_GUILESS_MAIN(EntryParserTest)
#include "EntryParserTest.moc"
