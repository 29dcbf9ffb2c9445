#include "saturn/core/Settings.hpp"

#include <QDir>
#include <QStandardPaths>

#include "saturn/core/Logging.hpp"
#include "saturn/parse/DurationResolver.hpp"

namespace saturn {
namespace core {

namespace {
const QString kUse24hKey = QStringLiteral("time/use24h");
const QString kQueryWindowKey = QStringLiteral("query/window");
const QString kWellKey = QStringLiteral("notify/well");
const QString kStoragePathKey = QStringLiteral("storage/path");

data::Duration days(int count)
{
    data::Duration duration;
    duration.days = count;
    return duration;
}

data::Duration minutes(int count)
{
    data::Duration duration;
    duration.minutes = count;
    return duration;
}
} // namespace

Settings::Settings(const QString &filePath)
{
    QString path = filePath;
    if (path.isEmpty()) {
        path = qEnvironmentVariable("SATURN_CONFIG");
    }
    if (path.isEmpty()) {
        path = defaultFilePath();
    }
    m_settings = std::make_unique<QSettings>(path, QSettings::IniFormat);
}

Settings::~Settings() = default;

QString Settings::defaultFilePath()
{
    QString folder = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    if (folder.isEmpty()) {
        folder = QDir::homePath() + QStringLiteral("/.config");
    }
    return QDir(folder).filePath(QStringLiteral("saturn/saturn.conf"));
}

QString Settings::fileName() const
{
    return m_settings->fileName();
}

bool Settings::use24hTime() const
{
    return m_settings->value(kUse24hKey, false).toBool();
}

void Settings::setUse24hTime(bool enabled)
{
    m_settings->setValue(kUse24hKey, enabled);
}

data::Duration Settings::queryWindow() const
{
    return durationValue(kQueryWindowKey, days(1));
}

void Settings::setQueryWindow(const data::Duration &window)
{
    m_settings->setValue(kQueryWindowKey, window.toString());
}

data::Duration Settings::well() const
{
    return durationValue(kWellKey, minutes(15));
}

void Settings::setWell(const data::Duration &well)
{
    m_settings->setValue(kWellKey, well.toString());
}

QString Settings::storagePath() const
{
    const QString fromEnvironment = qEnvironmentVariable("SATURN_DB");
    if (!fromEnvironment.isEmpty()) {
        return fromEnvironment;
    }
    const QString stored = m_settings->value(kStoragePathKey).toString();
    if (!stored.isEmpty()) {
        return stored;
    }
    QString folder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (folder.isEmpty()) {
        folder = QDir::homePath() + QStringLiteral("/.local/share/saturn");
    }
    return QDir(folder).filePath(QStringLiteral("saturn.ics"));
}

void Settings::setStoragePath(const QString &path)
{
    m_settings->setValue(kStoragePathKey, path);
}

bool Settings::sync()
{
    m_settings->sync();
    if (m_settings->status() != QSettings::NoError) {
        qCWarning(lcCommand) << "cannot write settings to" << m_settings->fileName();
        return false;
    }
    return true;
}

data::Duration Settings::durationValue(const QString &key, const data::Duration &fallback) const
{
    const QString text = m_settings->value(key).toString();
    if (text.isEmpty()) {
        return fallback;
    }
    Error error;
    const auto duration = parse::resolveDuration(text, &error);
    if (!duration || duration->isNegative()) {
        qCWarning(lcCommand) << "ignoring setting" << key << "=" << text << error.toString();
        return fallback;
    }
    return *duration;
}

} // namespace core
} // namespace saturn
