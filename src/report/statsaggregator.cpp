#include "statsaggregator.h"
#include <cmath>

const QString StatsAggregator::SnackMarker = QStringLiteral("snack");

static double roundTo2(double value)
{
    return std::round(value * 100.0) / 100.0;
}

void StatsAggregator::addTreatment(const TreatmentEvent& treatment, ParsedNote& note)
{
    std::optional<double> carbs = NightscoutRecords::parseNumber(treatment.carbsGrams);

    applySnackRule(carbs, note.foodItems);

    if (carbs) {
        m_totalCarbs += *carbs;
    }

    // Basal and bolus are exclusive: a basal note never counts the insulin field
    if (note.isBasal() && note.basalAmount) {
        m_basalInsulin += *note.basalAmount;
    } else if (std::optional<double> insulin = NightscoutRecords::parseNumber(treatment.insulinUnits)) {
        m_totalInsulin += *insulin;
    }
}

DailyStats StatsAggregator::finalize(const QList<GlucoseReading>& readings) const
{
    DailyStats stats;
    stats.averageGlucose = averageGlucose(readings);
    stats.totalCarbs = m_totalCarbs;
    stats.carbInsulinRatio = carbInsulinRatio(m_totalCarbs, m_totalInsulin);
    stats.totalInsulin = roundTo2(m_totalInsulin);
    stats.basalInsulin = roundTo2(m_basalInsulin);
    return stats;
}

bool StatsAggregator::applySnackRule(std::optional<double> carbs, QStringList& foodItems)
{
    if (!carbs || !(*carbs >= SNACK_CARBS_MIN && *carbs <= SNACK_CARBS_MAX)) {
        return false;
    }
    if (hasSnackItem(foodItems)) {
        return false;
    }
    foodItems.prepend(SnackMarker);
    return true;
}

bool StatsAggregator::hasSnackItem(const QStringList& foodItems)
{
    // Japanese logs write snacks as 補食
    for (const QString& item : foodItems) {
        if (item.contains(SnackMarker, Qt::CaseInsensitive) || item.contains(QStringLiteral("補食"))) {
            return true;
        }
    }
    return false;
}

int StatsAggregator::averageGlucose(const QList<GlucoseReading>& readings)
{
    double sum = 0;
    int count = 0;
    for (const GlucoseReading& reading : readings) {
        if (reading.value) {
            sum += *reading.value;
            count++;
        }
    }
    // Halves round to even, so {100, 101} averages to 100
    return count > 0 ? static_cast<int>(std::nearbyint(sum / count)) : 0;
}

QString StatsAggregator::carbInsulinRatio(double carbs, double insulin)
{
    if (insulin <= 0) {
        return QStringLiteral("-");
    }
    return QString::number(carbs / insulin, 'f', 1);
}
