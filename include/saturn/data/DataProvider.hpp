#pragma once

#include <memory>
#include <QString>

namespace saturn {
namespace data {

class RecordRepository;
class FileCalendarStorage;

class DataProvider
{
public:
    explicit DataProvider(const QString &filePath);
    ~DataProvider();

    // False when an existing calendar file cannot be read.
    bool load();
    RecordRepository &recordRepository();

private:
    std::shared_ptr<FileCalendarStorage> m_calendarStorage;
    std::unique_ptr<RecordRepository> m_recordRepository;
};

} // namespace data
} // namespace saturn
