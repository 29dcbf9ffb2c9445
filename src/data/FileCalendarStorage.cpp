#include "saturn/data/FileCalendarStorage.hpp"

#include <QDate>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>
#include <QTime>
#include <QUrl>
#include <algorithm>

#include "saturn/core/Logging.hpp"
#include "saturn/parse/DurationResolver.hpp"

namespace saturn {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";
constexpr auto DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss";

enum class Section
{
    None,
    Event,
    Recur,
};

std::optional<Duration> parseStoredDuration(const QString &value)
{
    core::Error error;
    auto duration = parse::resolveDuration(value, &error);
    if (!duration) {
        qCWarning(lcStorage) << "ignoring stored duration" << value << error.toString();
    }
    return duration;
}
} // namespace

FileCalendarStorage::FileCalendarStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
}

const QString &FileCalendarStorage::filePath() const
{
    return m_filePath;
}

const QHash<quint64, CalendarRecord> &FileCalendarStorage::records() const
{
    return m_records;
}

const QHash<quint64, RecurringTask> &FileCalendarStorage::recurringTasks() const
{
    return m_tasks;
}

CalendarRecord FileCalendarStorage::addOrUpdateRecord(CalendarRecord record)
{
    if (record.id == 0) {
        record.id = m_nextRecordId;
    }
    m_nextRecordId = std::max(m_nextRecordId, record.id + 1);
    m_records.insert(record.id, record);
    return record;
}

bool FileCalendarStorage::removeRecord(quint64 id)
{
    return m_records.remove(id) > 0;
}

RecurringTask FileCalendarStorage::addRecurringTask(RecurringTask task, const QDateTime &now)
{
    if (task.id == 0) {
        task.id = m_nextTaskId;
    }
    m_nextTaskId = std::max(m_nextTaskId, task.id + 1);

    CalendarRecord first = task.templateRecord;
    first.id = 0;
    first.recurrenceId = task.id;
    first.sequenceIndex = 0;
    addOrUpdateRecord(first);

    task.templateRecord.recurrenceId = task.id;
    task.lastSequenceIndex = 0;
    task.anchor = recordStart(task.templateRecord, now);
    task.lastMaterializedAt = now;
    m_tasks.insert(task.id, task);
    return task;
}

bool FileCalendarStorage::removeRecurringTask(quint64 id)
{
    if (m_tasks.remove(id) == 0) {
        return false;
    }
    for (auto it = m_records.begin(); it != m_records.end();) {
        if (it->recurrenceId && *it->recurrenceId == id) {
            it = m_records.erase(it);
        } else {
            ++it;
        }
    }
    return true;
}

bool FileCalendarStorage::commitOccurrences(quint64 taskId, std::vector<CalendarRecord> occurrences,
                                            const QDateTime &now)
{
    auto task = m_tasks.find(taskId);
    if (task == m_tasks.end()) {
        return false;
    }
    std::sort(occurrences.begin(), occurrences.end(), [](const CalendarRecord &lhs, const CalendarRecord &rhs) {
        return lhs.sequenceIndex < rhs.sequenceIndex;
    });
    for (CalendarRecord &occurrence : occurrences) {
        if (occurrence.sequenceIndex != task->lastSequenceIndex + 1) {
            qCWarning(lcStorage) << "refusing out of order occurrence" << occurrence.sequenceIndex << "for task"
                                 << taskId;
            return false;
        }
        occurrence.id = 0;
        occurrence.recurrenceId = taskId;
        const CalendarRecord stored = addOrUpdateRecord(occurrence);
        task->lastSequenceIndex = stored.sequenceIndex;
        task->anchor = recordStart(stored, now);
        task->lastMaterializedAt = now;
    }
    return true;
}

bool FileCalendarStorage::load()
{
    m_records.clear();
    m_tasks.clear();
    m_nextRecordId = 1;
    m_nextTaskId = 1;

    QFile file(m_filePath);
    if (!file.exists()) {
        return true;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcStorage) << "cannot open" << m_filePath << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    Section currentSection = Section::None;
    CalendarRecord currentRecord;
    RecurringTask currentTask;

    // Properties shared by a VEVENT and a recurring task's template.
    auto applyRecordProperty = [&](CalendarRecord &record, const QString &name, const QString &parameters,
                                   const QString &rawValue, const QString &value) {
        const bool dateOnly = parameters.contains(QLatin1String("VALUE=DATE"), Qt::CaseInsensitive);
        if (name == QLatin1String("SUMMARY")) {
            record.detail = value;
        } else if (name == QLatin1String("DTSTART")) {
            const QDateTime start = parseDateTime(rawValue);
            record.date = start.date();
            if (!dateOnly) {
                record.start = start.time();
            }
        } else if (name == QLatin1String("DTEND")) {
            const QDateTime end = parseDateTime(rawValue);
            if (!dateOnly) {
                record.endDate = end.date();
                record.end = end.time();
            }
        } else if (name == QLatin1String("X-SATURN-SHAPE")) {
            record.shape = shapeFromString(rawValue);
        } else if (name == QLatin1String("X-SATURN-NOTIFY")) {
            record.notify = parseStoredDuration(rawValue);
        } else if (name == QLatin1String("X-SATURN-FIELD")) {
            const QString keyParameter = parameters.section(QLatin1Char('='), 1);
            record.fields.insert(QUrl::fromPercentEncoding(keyParameter.toLatin1()), value);
        }
    };

    auto handleLine = [&](const QString &line) {
        if (line == QLatin1String("BEGIN:VEVENT")) {
            currentSection = Section::Event;
            currentRecord = CalendarRecord{};
            return;
        }
        if (line == QLatin1String("END:VEVENT")) {
            if (currentRecord.id != 0 && currentRecord.date.isValid()) {
                addOrUpdateRecord(currentRecord);
            } else {
                qCWarning(lcStorage) << "skipping event without UID or DTSTART";
            }
            currentSection = Section::None;
            return;
        }
        if (line == QLatin1String("BEGIN:X-SATURN-RECUR")) {
            currentSection = Section::Recur;
            currentTask = RecurringTask{};
            return;
        }
        if (line == QLatin1String("END:X-SATURN-RECUR")) {
            if (currentTask.id != 0 && currentTask.templateRecord.date.isValid()) {
                currentTask.templateRecord.recurrenceId = currentTask.id;
                m_tasks.insert(currentTask.id, currentTask);
                m_nextTaskId = std::max(m_nextTaskId, currentTask.id + 1);
            } else {
                qCWarning(lcStorage) << "skipping recurring task without UID or DTSTART";
            }
            currentSection = Section::None;
            return;
        }

        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            return;
        }

        const QString property = line.left(colonIndex);
        const QString rawValue = line.mid(colonIndex + 1);
        const QString name = property.section(';', 0, 0).toUpper();
        const QString parameters = property.contains(';') ? property.section(';', 1) : QString();
        const QString value = decodeText(rawValue);

        if (currentSection == Section::None) {
            if (name == QLatin1String("X-SATURN-NEXT-ID")) {
                m_nextRecordId = std::max(m_nextRecordId, rawValue.toULongLong());
            } else if (name == QLatin1String("X-SATURN-NEXT-RECUR-ID")) {
                m_nextTaskId = std::max(m_nextTaskId, rawValue.toULongLong());
            }
            return;
        }

        if (currentSection == Section::Event) {
            if (name == QLatin1String("UID")) {
                currentRecord.id = rawValue.toULongLong();
            } else if (name == QLatin1String("STATUS")) {
                currentRecord.completed = rawValue.compare(QLatin1String("COMPLETED"), Qt::CaseInsensitive) == 0;
            } else if (name == QLatin1String("X-SATURN-NOTIFIED")) {
                currentRecord.notified = rawValue.compare(QLatin1String("TRUE"), Qt::CaseInsensitive) == 0;
            } else if (name == QLatin1String("X-SATURN-RECURRENCE-ID")) {
                currentRecord.recurrenceId = rawValue.toULongLong();
            } else if (name == QLatin1String("X-SATURN-SEQUENCE")) {
                currentRecord.sequenceIndex = rawValue.toInt();
            } else {
                applyRecordProperty(currentRecord, name, parameters, rawValue, value);
            }
            return;
        }

        if (name == QLatin1String("UID")) {
            currentTask.id = rawValue.toULongLong();
        } else if (name == QLatin1String("X-SATURN-INTERVAL")) {
            if (const auto interval = parseStoredDuration(rawValue)) {
                currentTask.interval = *interval;
            }
        } else if (name == QLatin1String("X-SATURN-SEQUENCE")) {
            currentTask.lastSequenceIndex = rawValue.toInt();
        } else if (name == QLatin1String("X-SATURN-ANCHOR")) {
            currentTask.anchor = parseDateTime(rawValue);
        } else if (name == QLatin1String("X-SATURN-MATERIALIZED")) {
            currentTask.lastMaterializedAt = parseDateTime(rawValue);
        } else {
            applyRecordProperty(currentTask.templateRecord, name, parameters, rawValue, value);
        }
    };

    QString accumulator;
    bool hasAccumulator = false;
    while (!stream.atEnd()) {
        QString line = stream.readLine();
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator);
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator);
    }
    qCDebug(lcStorage) << "loaded" << m_records.size() << "records and" << m_tasks.size() << "recurring tasks from"
                       << m_filePath;
    return true;
}

bool FileCalendarStorage::save() const
{
    if (m_filePath.isEmpty()) {
        return true;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcStorage) << "cannot create" << dir.path();
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcStorage) << "cannot write" << m_filePath << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    auto writeRecordBody = [&stream](const CalendarRecord &record) {
        stream << "SUMMARY:" << encodeText(record.detail) << '\n';
        stream << "X-SATURN-SHAPE:" << shapeToString(record.shape) << '\n';
        switch (record.shape) {
        case RecordShape::AllDay:
            stream << "DTSTART;VALUE=DATE:" << record.date.toString(DATE_FORMAT) << '\n';
            break;
        case RecordShape::Instant:
            stream << "DTSTART:" << formatDateTime(QDateTime(record.date, record.start)) << '\n';
            break;
        case RecordShape::Span: {
            const QDate endDate = record.endDate.isValid() ? record.endDate : record.date;
            stream << "DTSTART:" << formatDateTime(QDateTime(record.date, record.start)) << '\n';
            stream << "DTEND:" << formatDateTime(QDateTime(endDate, record.end)) << '\n';
            break;
        }
        }
        if (record.notify) {
            stream << "X-SATURN-NOTIFY:" << record.notify->toString() << '\n';
        }
        for (auto it = record.fields.constBegin(); it != record.fields.constEnd(); ++it) {
            stream << "X-SATURN-FIELD;KEY=" << QString::fromLatin1(QUrl::toPercentEncoding(it.key())) << ':'
                   << encodeText(it.value()) << '\n';
        }
    };

    stream << "BEGIN:VCALENDAR\n";
    stream << "VERSION:2.0\n";
    stream << "PRODID:-//Saturn//EN\n";
    stream << "X-SATURN-NEXT-ID:" << m_nextRecordId << '\n';
    stream << "X-SATURN-NEXT-RECUR-ID:" << m_nextTaskId << '\n';

    auto tasks = m_tasks.values();
    std::sort(tasks.begin(), tasks.end(), [](const RecurringTask &lhs, const RecurringTask &rhs) {
        return lhs.id < rhs.id;
    });
    for (const RecurringTask &task : tasks) {
        stream << "BEGIN:X-SATURN-RECUR\n";
        stream << "UID:" << task.id << '\n';
        stream << "X-SATURN-INTERVAL:" << task.interval.toString() << '\n';
        stream << "X-SATURN-SEQUENCE:" << task.lastSequenceIndex << '\n';
        if (task.anchor.isValid()) {
            stream << "X-SATURN-ANCHOR:" << formatDateTime(task.anchor) << '\n';
        }
        if (task.lastMaterializedAt.isValid()) {
            stream << "X-SATURN-MATERIALIZED:" << formatDateTime(task.lastMaterializedAt) << '\n';
        }
        writeRecordBody(task.templateRecord);
        stream << "END:X-SATURN-RECUR\n";
    }

    auto records = m_records.values();
    std::sort(records.begin(), records.end(), recordLessThan);
    for (const CalendarRecord &record : records) {
        stream << "BEGIN:VEVENT\n";
        stream << "UID:" << record.id << '\n';
        writeRecordBody(record);
        stream << "STATUS:" << (record.completed ? "COMPLETED" : "NEEDS-ACTION") << '\n';
        if (record.notified) {
            stream << "X-SATURN-NOTIFIED:TRUE\n";
        }
        if (record.recurrenceId) {
            stream << "X-SATURN-RECURRENCE-ID:" << *record.recurrenceId << '\n';
            stream << "X-SATURN-SEQUENCE:" << record.sequenceIndex << '\n';
        }
        stream << "END:VEVENT\n";
    }

    stream << "END:VCALENDAR\n";

    stream.flush();
    if (!file.commit()) {
        qCWarning(lcStorage) << "cannot commit" << m_filePath << file.errorString();
        return false;
    }
    return true;
}

QString FileCalendarStorage::encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', "\\\\");
    encoded.replace('\n', "\\n");
    encoded.replace(',', "\\,");
    encoded.replace(';', "\\;");
    return encoded;
}

QString FileCalendarStorage::decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);
        if (c != QLatin1Char('\\') || i + 1 == text.size()) {
            decoded += c;
            continue;
        }
        const QChar next = text.at(++i);
        if (next == QLatin1Char('n') || next == QLatin1Char('N')) {
            decoded += QLatin1Char('\n');
        } else if (next == QLatin1Char(',') || next == QLatin1Char(';') || next == QLatin1Char('\\')) {
            decoded += next;
        } else {
            decoded += c;
            decoded += next;
        }
    }
    return decoded;
}

// Wall-clock times are stored floating, without a zone designator.
QString FileCalendarStorage::formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return QDateTime(dt.date(), dt.time()).toString(QLatin1String(DATE_TIME_FORMAT));
}

QDateTime FileCalendarStorage::parseDateTime(const QString &value)
{
    if (value.length() == 8) {
        const QDate date = QDate::fromString(value, DATE_FORMAT);
        return QDateTime(date, QTime(0, 0));
    }
    QDateTime dt = QDateTime::fromString(value, DATE_TIME_FORMAT);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(value, Qt::ISODate);
    }
    return dt;
}

} // namespace data
} // namespace saturn
