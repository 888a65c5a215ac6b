#pragma once

#include <QString>
#include <QStringList>
#include <optional>

enum class InsulinType {
    Unspecified,
    Normal,     // "N"
    Fast        // "F"
};

// Structured form of a treatment's free-text notes field
struct ParsedNote {
    std::optional<double> ratio;             // carb-to-insulin ratio (CIR)
    std::optional<double> predictedInsulin;
    InsulinType insulinType = InsulinType::Unspecified;
    QStringList foodItems;
    std::optional<double> basalAmount;

    bool isBasal() const;
};

// Parses the informal notation used in the treatment log. The first non-empty
// line decides the record kind:
//
//   "Tore 2.0" / "トレ 2.0"   basal dose of 2.0 units
//   "B"                       glucose tablet snack
//   "N" / "F"                 insulin type only
//   "300 4.5N" / "CIR 300 4.5" ratio, predicted dose, optional type suffix
//
// Anything else is a plain food list. Lines after the first are food items.
// Parsing never fails; unreadable numbers are simply left out.
class NoteParser {
public:
    static const QString BasalMarker;
    static const QString GlucoseSnackMarker;

    static ParsedNote parse(const QString& notes);

    static QString insulinTypeLabel(InsulinType type);

private:
    static QStringList splitLines(const QString& notes);
    static QStringList splitTokens(const QString& line);
    static bool isBasalLine(const QString& line);
    static void parseRatioLine(const QStringList& tokens, ParsedNote& note);
    static InsulinType insulinTypeFromLetter(QChar letter);
};
