#include "timeseriescorrelator.h"
#include <algorithm>
#include <cmath>

TimeSeriesCorrelator::TimeSeriesCorrelator(const QList<GlucoseReading>& readings, int toleranceSeconds)
    : m_readings(readings)
    , m_toleranceMs(static_cast<qint64>(toleranceSeconds) * 1000)
{
}

const GlucoseReading* TimeSeriesCorrelator::findNearest(const QDateTime& time) const
{
    if (m_readings.isEmpty() || !time.isValid()) {
        return nullptr;
    }

    const qint64 target = time.toMSecsSinceEpoch();

    // First reading at or after the target
    auto it = std::lower_bound(m_readings.cbegin(), m_readings.cend(), target,
        [](const GlucoseReading& r, qint64 t) { return r.timestamp.toMSecsSinceEpoch() < t; });
    int after = static_cast<int>(it - m_readings.cbegin());

    int best = -1;
    qint64 bestDiff = 0;

    if (after > 0) {
        int before = firstIndexAt(after - 1);
        best = before;
        bestDiff = target - m_readings[before].timestamp.toMSecsSinceEpoch();
    }
    if (after < m_readings.size()) {
        qint64 diff = m_readings[after].timestamp.toMSecsSinceEpoch() - target;
        if (best < 0 || diff < bestDiff) {
            best = after;
            bestDiff = diff;
        }
    }

    if (best < 0 || bestDiff >= m_toleranceMs) {
        return nullptr;
    }
    return &m_readings[best];
}

QString TimeSeriesCorrelator::cgmDisplay(const QDateTime& time) const
{
    const GlucoseReading* reading = findNearest(time);
    if (!reading) {
        return QString();
    }
    return formatReading(*reading);
}

QString TimeSeriesCorrelator::glucoseDisplay(const TreatmentEvent& treatment) const
{
    QString display = cgmDisplay(treatment.timestamp);

    if (!treatment.measuredGlucose.isEmpty()) {
        QString measured = QString("measured:%1").arg(treatment.measuredGlucose);
        display = display.isEmpty() ? measured : QString("%1 / %2").arg(display, measured);
    }
    return display;
}

QString TimeSeriesCorrelator::formatReading(const GlucoseReading& reading)
{
    if (!reading.value || *reading.value == 0) {
        return QString();
    }

    QString text = QString::number(*reading.value);

    if (reading.delta && *reading.delta != 0) {
        // Halves round to even (2.5 -> 2)
        long rounded = static_cast<long>(std::nearbyint(*reading.delta));
        QString sign = rounded > 0 ? QStringLiteral("+") : QString();
        text += QString(" (%1%2)").arg(sign).arg(rounded);
    }

    QString arrow = NightscoutRecords::trendArrow(reading.trendDirection);
    if (!arrow.isEmpty()) {
        text += " " + arrow;
    }
    return text;
}

// Several readings can share a timestamp; the earliest in list order wins ties
int TimeSeriesCorrelator::firstIndexAt(int index) const
{
    const qint64 t = m_readings[index].timestamp.toMSecsSinceEpoch();
    while (index > 0 && m_readings[index - 1].timestamp.toMSecsSinceEpoch() == t) {
        --index;
    }
    return index;
}
