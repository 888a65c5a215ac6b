#include "settings.h"
#include "../report/timeseriescorrelator.h"
#include <QDebug>

static constexpr int DEFAULT_UTC_OFFSET_MINUTES = 9 * 60;

// Valid UTC offsets span -12:00 .. +14:00
static constexpr int MIN_UTC_OFFSET_MINUTES = -12 * 60;
static constexpr int MAX_UTC_OFFSET_MINUTES = 14 * 60;

ReportSettings::ReportSettings(const QString& iniPath)
    : m_settings(iniPath.isEmpty() ? std::make_unique<QSettings>()
                                   : std::make_unique<QSettings>(iniPath, QSettings::IniFormat))
{
}

int ReportSettings::utcOffsetMinutes() const
{
    bool ok;
    int minutes = m_settings->value("display/utcOffsetMinutes", DEFAULT_UTC_OFFSET_MINUTES).toInt(&ok);
    if (!ok || minutes < MIN_UTC_OFFSET_MINUTES || minutes > MAX_UTC_OFFSET_MINUTES) {
        qWarning() << "ReportSettings: Ignoring invalid display/utcOffsetMinutes, using" << DEFAULT_UTC_OFFSET_MINUTES;
        return DEFAULT_UTC_OFFSET_MINUTES;
    }
    return minutes;
}

void ReportSettings::setUtcOffsetMinutes(int minutes)
{
    m_settings->setValue("display/utcOffsetMinutes", minutes);
}

int ReportSettings::toleranceSeconds() const
{
    bool ok;
    int seconds = m_settings->value("matching/toleranceSeconds",
                                    TimeSeriesCorrelator::DEFAULT_TOLERANCE_SECONDS).toInt(&ok);
    if (!ok || seconds <= 0) {
        qWarning() << "ReportSettings: Ignoring invalid matching/toleranceSeconds, using"
                   << TimeSeriesCorrelator::DEFAULT_TOLERANCE_SECONDS;
        return TimeSeriesCorrelator::DEFAULT_TOLERANCE_SECONDS;
    }
    return seconds;
}

void ReportSettings::setToleranceSeconds(int seconds)
{
    m_settings->setValue("matching/toleranceSeconds", seconds);
}

QString ReportSettings::logFile() const
{
    return m_settings->value("log/file", "").toString();
}

void ReportSettings::setLogFile(const QString& path)
{
    m_settings->setValue("log/file", path);
}

bool ReportSettings::verbose() const
{
    return m_settings->value("log/verbose", false).toBool();
}

void ReportSettings::setVerbose(bool verbose)
{
    m_settings->setValue("log/verbose", verbose);
}
