#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <optional>

// Nightscout trend codes (entries "direction" field)
enum class TrendDirection {
    Unknown,
    DoubleUp,
    SingleUp,
    FortyFiveUp,
    Flat,
    FortyFiveDown,
    SingleDown,
    DoubleDown,
    NotComputable,
    RateOutOfRange
};

// One CGM sample from /api/v1/entries
struct GlucoseReading {
    QDateTime timestamp;                // UTC; invalid when dateString didn't parse
    std::optional<int> value;           // sgv, mg/dL
    TrendDirection trendDirection = TrendDirection::Unknown;
    std::optional<double> delta;        // change from previous sample
};

// One treatment log entry from /api/v1/treatments.
// Numeric fields stay as the text the user entered; empty means absent.
struct TreatmentEvent {
    QDateTime timestamp;                // UTC; invalid when created_at didn't parse
    QString rawNotes;
    QString carbsGrams;
    QString insulinUnits;
    QString measuredGlucose;            // finger-stick check, not the sensor value
};

class NightscoutRecords {
public:
    struct EntriesResult {
        bool success = false;
        QString errorMessage;
        QList<GlucoseReading> readings;
    };

    struct TreatmentsResult {
        bool success = false;
        QString errorMessage;
        QList<TreatmentEvent> treatments;
    };

    // Decode a raw JSON document. Fails only when the document isn't a JSON array.
    static EntriesResult parseEntries(const QByteArray& json);
    static TreatmentsResult parseTreatments(const QByteArray& json);

    static GlucoseReading readingFromJson(const QJsonObject& obj);
    static TreatmentEvent treatmentFromJson(const QJsonObject& obj);

    // ISO-8601 → UTC instant. Strings without an offset are taken as UTC.
    static QDateTime parseTimestamp(const QString& text);

    static TrendDirection trendFromCode(const QString& code);
    static QString trendArrow(TrendDirection direction);

    // Parse user-entered numeric text; empty optional when it isn't a number
    static std::optional<double> parseNumber(const QString& text);

private:
    static QString textField(const QJsonObject& obj, const QString& key);
    static bool parseArray(const QByteArray& json, QJsonArray& out, QString& error);
};
