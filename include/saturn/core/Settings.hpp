#pragma once

#include <QSettings>
#include <QString>
#include <memory>

#include "saturn/data/Duration.hpp"

namespace saturn {
namespace core {

class Settings
{
public:
    // An empty path picks SATURN_CONFIG, then Qt's per-user config location.
    explicit Settings(const QString &filePath = QString());
    ~Settings();

    QString fileName() const;

    bool use24hTime() const;
    void setUse24hTime(bool enabled);

    data::Duration queryWindow() const;
    void setQueryWindow(const data::Duration &window);

    data::Duration well() const;
    void setWell(const data::Duration &well);

    // SATURN_DB wins over storage/path; both fall back to <AppDataLocation>/saturn.ics.
    QString storagePath() const;
    void setStoragePath(const QString &path);

    bool sync();

    static QString defaultFilePath();

private:
    data::Duration durationValue(const QString &key, const data::Duration &fallback) const;

    std::unique_ptr<QSettings> m_settings;
};

} // namespace core
} // namespace saturn
