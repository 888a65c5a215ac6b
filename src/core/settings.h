#pragma once

#include <QSettings>
#include <QString>
#include <memory>

// Report configuration, persisted with QSettings.
// Pass an INI path to read a specific file; otherwise the platform default
// location for the application's organization/name is used.
class ReportSettings {
public:
    explicit ReportSettings(const QString& iniPath = QString());

    // Display offset for HH:mm labels (minutes east of UTC). Default +09:00.
    int utcOffsetMinutes() const;
    void setUtcOffsetMinutes(int minutes);
    int utcOffsetSeconds() const { return utcOffsetMinutes() * 60; }

    // Max distance between a treatment and its CGM reading
    int toleranceSeconds() const;
    void setToleranceSeconds(int seconds);

    QString logFile() const;
    void setLogFile(const QString& path);

    bool verbose() const;
    void setVerbose(bool verbose);

    QString fileName() const { return m_settings->fileName(); }
    void sync() { m_settings->sync(); }

private:
    std::unique_ptr<QSettings> m_settings;
};
