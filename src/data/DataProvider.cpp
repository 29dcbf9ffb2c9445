#include "saturn/data/DataProvider.hpp"

#include "saturn/data/FileCalendarStorage.hpp"
#include "saturn/data/FileRecordRepository.hpp"

namespace saturn {
namespace data {

DataProvider::DataProvider(const QString &filePath)
    : m_calendarStorage(std::make_shared<FileCalendarStorage>(filePath))
    , m_recordRepository(std::make_unique<FileRecordRepository>(m_calendarStorage))
{
}

DataProvider::~DataProvider() = default;

bool DataProvider::load()
{
    return m_calendarStorage->load();
}

RecordRepository &DataProvider::recordRepository()
{
    return *m_recordRepository;
}

} // namespace data
} // namespace saturn
