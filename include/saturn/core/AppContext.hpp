#pragma once

#include <memory>
#include <QString>

namespace saturn {
namespace data {
class DataProvider;
class RecordRepository;
}

namespace core {

class CommandProcessor;
class Settings;

class AppContext
{
public:
    // An empty path uses the default configuration file.
    explicit AppContext(const QString &configPath = QString());
    ~AppContext();

    bool load();

    Settings &settings();
    data::RecordRepository &recordRepository();
    CommandProcessor &commands();

private:
    std::unique_ptr<Settings> m_settings;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<CommandProcessor> m_commands;
};

} // namespace core
} // namespace saturn
