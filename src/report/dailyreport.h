#pragma once

#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>
#include <QByteArray>
#include <optional>

// One line of the treatment table. Absent values render as "-".
struct ReportRow {
    QString time;                            // HH:mm at the display offset
    QString glucose;
    std::optional<double> ratio;
    QString carbs;                           // raw text, empty when absent
    std::optional<double> predictedInsulin;
    QString actualInsulin;                   // raw text, empty when absent
    QString insulinType;                     // "N", "F" or empty
    QString food;                            // items joined with ", "

    QJsonObject toJson() const;
};

struct DailyStats {
    int averageGlucose = 0;
    double totalInsulin = 0;     // bolus only
    double basalInsulin = 0;
    double totalCarbs = 0;
    QString carbInsulinRatio;    // "-" when no bolus insulin was logged
};

struct DailyReport {
    QStringList chartTimes;
    QList<int> chartGlucose;     // aligned 1:1 with chartTimes
    QList<ReportRow> rows;
    DailyStats stats;

    QJsonObject toJson() const;
    QByteArray toJsonBytes() const;
};
