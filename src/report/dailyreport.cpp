#include "dailyreport.h"
#include <QJsonArray>
#include <QJsonDocument>

static const QString Placeholder = QStringLiteral("-");

static QJsonValue textOrPlaceholder(const QString& text)
{
    return text.isEmpty() ? QJsonValue(Placeholder) : QJsonValue(text);
}

static QJsonValue numberOrPlaceholder(const std::optional<double>& value)
{
    return value ? QJsonValue(*value) : QJsonValue(Placeholder);
}

QJsonObject ReportRow::toJson() const
{
    QJsonObject obj;
    obj["time"] = time;
    obj["bg"] = textOrPlaceholder(glucose);
    obj["cir"] = numberOrPlaceholder(ratio);
    obj["carbs"] = carbs.isEmpty() ? QJsonValue(Placeholder) : QJsonValue(carbs + "g");
    obj["predicted"] = numberOrPlaceholder(predictedInsulin);
    obj["actual"] = textOrPlaceholder(actualInsulin);
    obj["type"] = textOrPlaceholder(insulinType);
    obj["food"] = textOrPlaceholder(food);
    return obj;
}

QJsonObject DailyReport::toJson() const
{
    QJsonArray times;
    for (const QString& t : chartTimes)
        times.append(t);

    QJsonArray bgs;
    for (int bg : chartGlucose)
        bgs.append(bg);

    QJsonArray table;
    for (const ReportRow& row : rows)
        table.append(row.toJson());

    QJsonObject obj;
    obj["chart_times"] = times;
    obj["chart_bgs"] = bgs;
    obj["table_data"] = table;
    obj["avg_bg"] = stats.averageGlucose;
    obj["total_insulin"] = stats.totalInsulin;
    obj["basal_insulin"] = stats.basalInsulin;
    obj["total_carbs"] = stats.totalCarbs;
    obj["tcir"] = stats.carbInsulinRatio;
    return obj;
}

QByteArray DailyReport::toJsonBytes() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}
