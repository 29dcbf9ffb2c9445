#include "saturn/core/AppContext.hpp"

#include "saturn/data/DataProvider.hpp"

#include "saturn/core/CommandProcessor.hpp"
#include "saturn/core/Logging.hpp"
#include "saturn/core/Settings.hpp"

namespace saturn {
namespace core {

AppContext::AppContext(const QString &configPath)
    : m_settings(std::make_unique<Settings>(configPath))
    , m_dataProvider(std::make_unique<data::DataProvider>(m_settings->storagePath()))
    , m_commands(std::make_unique<CommandProcessor>(m_dataProvider->recordRepository(), *m_settings))
{
    qCDebug(lcCommand) << "config" << m_settings->fileName() << "calendar" << m_settings->storagePath();
}

AppContext::~AppContext() = default;

bool AppContext::load()
{
    return m_dataProvider->load();
}

Settings &AppContext::settings()
{
    return *m_settings;
}

data::RecordRepository &AppContext::recordRepository()
{
    return m_dataProvider->recordRepository();
}

CommandProcessor &AppContext::commands()
{
    return *m_commands;
}

} // namespace core
} // namespace saturn
