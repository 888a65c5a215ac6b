#pragma once

#include "dailyreport.h"
#include "noteparser.h"
#include "../nightscout/nightscoutrecords.h"
#include <QList>

// Running totals for one report. Feed every treatment through addTreatment()
// in time order, then call finalize() once.
class StatsAggregator {
public:
    static const QString SnackMarker;

    // Small carb entries (1-3 g) are snacks even when the note doesn't say so
    static constexpr double SNACK_CARBS_MIN = 1.0;
    static constexpr double SNACK_CARBS_MAX = 3.0;

    // Applies the snack rule to note (at most one insertion) and accumulates
    // carbs plus either basal or bolus insulin.
    void addTreatment(const TreatmentEvent& treatment, ParsedNote& note);

    DailyStats finalize(const QList<GlucoseReading>& readings) const;

    double totalCarbs() const { return m_totalCarbs; }
    double totalInsulin() const { return m_totalInsulin; }
    double basalInsulin() const { return m_basalInsulin; }

    static bool applySnackRule(std::optional<double> carbs, QStringList& foodItems);
    static bool hasSnackItem(const QStringList& foodItems);
    static int averageGlucose(const QList<GlucoseReading>& readings);
    static QString carbInsulinRatio(double carbs, double insulin);

private:
    double m_totalCarbs = 0;
    double m_totalInsulin = 0;
    double m_basalInsulin = 0;
};
