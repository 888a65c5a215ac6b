#include "reportassembler.h"
#include "noteparser.h"
#include "statsaggregator.h"
#include <QDebug>
#include <algorithm>
#include <exception>

ReportAssembler::ReportAssembler(int utcOffsetSeconds, int toleranceSeconds)
    : m_utcOffsetSeconds(utcOffsetSeconds)
    , m_toleranceSeconds(toleranceSeconds)
{
}

DailyReport ReportAssembler::assemble(const QList<GlucoseReading>& readings,
                                      const QList<TreatmentEvent>& treatments) const
{
    DailyReport report;

    const QList<GlucoseReading> entries = sortedReadings(readings);
    const QList<TreatmentEvent> events = sortedTreatments(treatments);

    // Chart series
    for (const GlucoseReading& reading : entries) {
        if (!reading.value)
            continue;
        report.chartTimes.append(displayTime(reading.timestamp));
        report.chartGlucose.append(*reading.value);
    }

    // Treatment table
    TimeSeriesCorrelator correlator(entries, m_toleranceSeconds);
    StatsAggregator stats;

    for (const TreatmentEvent& treatment : events) {
        std::optional<ReportRow> row = buildRow(treatment, correlator, stats);
        if (row) {
            report.rows.append(*row);
        }
    }

    // Average covers every reading with a value, including ones with a bad timestamp
    report.stats = stats.finalize(readings);

    qDebug() << "ReportAssembler: Built report with" << report.chartTimes.size() << "chart points,"
             << report.rows.size() << "rows";
    return report;
}

std::optional<ReportRow> ReportAssembler::buildRow(const TreatmentEvent& treatment,
                                                   const TimeSeriesCorrelator& correlator,
                                                   StatsAggregator& stats) const
{
    try {
        ParsedNote note = NoteParser::parse(treatment.rawNotes);
        stats.addTreatment(treatment, note);

        ReportRow row;
        row.time = displayTime(treatment.timestamp);
        row.glucose = correlator.glucoseDisplay(treatment);
        row.ratio = note.ratio;
        row.carbs = treatment.carbsGrams;
        row.predictedInsulin = note.predictedInsulin;
        row.actualInsulin = treatment.insulinUnits;
        row.insulinType = NoteParser::insulinTypeLabel(note.insulinType);
        row.food = note.foodItems.join(", ");
        return row;
    } catch (const std::exception& e) {
        qWarning() << "ReportAssembler: Skipping treatment at"
                   << treatment.timestamp.toString(Qt::ISODate) << "-" << e.what();
        return std::nullopt;
    }
}

QString ReportAssembler::displayTime(const QDateTime& utc) const
{
    return utc.toOffsetFromUtc(m_utcOffsetSeconds).toString("HH:mm");
}

QList<GlucoseReading> ReportAssembler::sortedReadings(const QList<GlucoseReading>& readings)
{
    QList<GlucoseReading> result;
    result.reserve(readings.size());
    for (const GlucoseReading& reading : readings) {
        if (reading.timestamp.isValid()) {
            result.append(reading);
        } else {
            qDebug() << "ReportAssembler: Skipping reading with unparseable timestamp";
        }
    }

    std::stable_sort(result.begin(), result.end(), [](const GlucoseReading& a, const GlucoseReading& b) {
        return a.timestamp < b.timestamp;
    });
    return result;
}

QList<TreatmentEvent> ReportAssembler::sortedTreatments(const QList<TreatmentEvent>& treatments)
{
    QList<TreatmentEvent> result;
    result.reserve(treatments.size());
    for (const TreatmentEvent& treatment : treatments) {
        if (treatment.timestamp.isValid()) {
            result.append(treatment);
        } else {
            qDebug() << "ReportAssembler: Skipping treatment with unparseable timestamp";
        }
    }

    std::stable_sort(result.begin(), result.end(), [](const TreatmentEvent& a, const TreatmentEvent& b) {
        return a.timestamp < b.timestamp;
    });
    return result;
}
