#include "nightscoutrecords.h"
#include <QHash>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QTimeZone>
#include <QDebug>
#include <cmath>

NightscoutRecords::EntriesResult NightscoutRecords::parseEntries(const QByteArray& json)
{
    EntriesResult result;
    QJsonArray array;
    if (!parseArray(json, array, result.errorMessage)) {
        return result;
    }

    result.readings.reserve(array.size());
    for (const QJsonValue& value : array) {
        if (!value.isObject()) {
            qDebug() << "NightscoutRecords: Skipping non-object entry";
            continue;
        }
        result.readings.append(readingFromJson(value.toObject()));
    }

    result.success = true;
    return result;
}

NightscoutRecords::TreatmentsResult NightscoutRecords::parseTreatments(const QByteArray& json)
{
    TreatmentsResult result;
    QJsonArray array;
    if (!parseArray(json, array, result.errorMessage)) {
        return result;
    }

    result.treatments.reserve(array.size());
    for (const QJsonValue& value : array) {
        if (!value.isObject()) {
            qDebug() << "NightscoutRecords: Skipping non-object treatment";
            continue;
        }
        result.treatments.append(treatmentFromJson(value.toObject()));
    }

    result.success = true;
    return result;
}

GlucoseReading NightscoutRecords::readingFromJson(const QJsonObject& obj)
{
    GlucoseReading reading;
    reading.timestamp = parseTimestamp(obj["dateString"].toString());

    QJsonValue sgv = obj["sgv"];
    if (sgv.isDouble()) {
        reading.value = qRound(sgv.toDouble());
    } else if (sgv.isString()) {
        bool ok;
        int v = sgv.toString().trimmed().toInt(&ok);
        if (ok) reading.value = v;
    }

    reading.trendDirection = trendFromCode(obj["direction"].toString());

    QJsonValue delta = obj["delta"];
    if (delta.isDouble()) {
        reading.delta = delta.toDouble();
    } else if (delta.isString()) {
        reading.delta = parseNumber(delta.toString());
    }

    return reading;
}

TreatmentEvent NightscoutRecords::treatmentFromJson(const QJsonObject& obj)
{
    TreatmentEvent event;
    event.timestamp = parseTimestamp(obj["created_at"].toString());
    event.rawNotes = obj["notes"].toString();
    event.carbsGrams = textField(obj, "carbs");
    event.insulinUnits = textField(obj, "insulin");
    event.measuredGlucose = textField(obj, "glucose");
    return event;
}

QDateTime NightscoutRecords::parseTimestamp(const QString& text)
{
    QString str = text.trimmed();
    if (str.isEmpty()) {
        return QDateTime();
    }

    QDateTime dt = QDateTime::fromString(str, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        return QDateTime();
    }

    // No offset in the string: Qt hands back local time, the feed means UTC
    if (dt.timeSpec() == Qt::LocalTime) {
        dt = QDateTime(dt.date(), dt.time(), QTimeZone::utc());
    }
    return dt.toUTC();
}

TrendDirection NightscoutRecords::trendFromCode(const QString& code)
{
    static const QHash<QString, TrendDirection> codes = {
        {"DoubleUp",          TrendDirection::DoubleUp},
        {"SingleUp",          TrendDirection::SingleUp},
        {"FortyFiveUp",       TrendDirection::FortyFiveUp},
        {"Flat",              TrendDirection::Flat},
        {"FortyFiveDown",     TrendDirection::FortyFiveDown},
        {"SingleDown",        TrendDirection::SingleDown},
        {"DoubleDown",        TrendDirection::DoubleDown},
        {"NOT COMPUTABLE",    TrendDirection::NotComputable},
        {"RATE OUT OF RANGE", TrendDirection::RateOutOfRange},
    };
    return codes.value(code, TrendDirection::Unknown);
}

QString NightscoutRecords::trendArrow(TrendDirection direction)
{
    switch (direction) {
    case TrendDirection::DoubleUp:       return QStringLiteral("⇈");
    case TrendDirection::SingleUp:       return QStringLiteral("↑");
    case TrendDirection::FortyFiveUp:    return QStringLiteral("↗");
    case TrendDirection::Flat:           return QStringLiteral("→");
    case TrendDirection::FortyFiveDown:  return QStringLiteral("↘");
    case TrendDirection::SingleDown:     return QStringLiteral("↓");
    case TrendDirection::DoubleDown:     return QStringLiteral("⇊");
    case TrendDirection::NotComputable:
    case TrendDirection::RateOutOfRange: return QStringLiteral("?");
    case TrendDirection::Unknown:        break;
    }
    return QString();
}

std::optional<double> NightscoutRecords::parseNumber(const QString& text)
{
    bool ok;
    double value = text.trimmed().toDouble(&ok);
    // "nan" and "inf" parse, but aren't quantities anyone logged
    if (!ok || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

QString NightscoutRecords::textField(const QJsonObject& obj, const QString& key)
{
    QJsonValue value = obj[key];
    if (value.isString()) {
        return value.toString();
    }
    if (value.isDouble()) {
        double d = value.toDouble();
        // Nightscout clients send 0 for "not entered"
        if (d == 0) {
            return QString();
        }
        // Whole numbers print without a fraction ("10", not "10.0")
        if (std::floor(d) == d && std::abs(d) < 1e15) {
            return QString::number(static_cast<qint64>(d));
        }
        return QString::number(d, 'g', 15);
    }
    return QString();
}

bool NightscoutRecords::parseArray(const QByteArray& json, QJsonArray& out, QString& error)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (doc.isNull()) {
        error = QString("Invalid JSON: %1").arg(parseError.errorString());
        return false;
    }
    if (!doc.isArray()) {
        error = "Expected a JSON array of records";
        return false;
    }
    out = doc.array();
    return true;
}
