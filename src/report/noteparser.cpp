#include "noteparser.h"
#include "../nightscout/nightscoutrecords.h"
#include <QRegularExpression>

const QString NoteParser::BasalMarker = QStringLiteral("basal insulin");
const QString NoteParser::GlucoseSnackMarker = QStringLiteral("glucose snack");

bool ParsedNote::isBasal() const
{
    return foodItems.contains(NoteParser::BasalMarker);
}

ParsedNote NoteParser::parse(const QString& notes)
{
    ParsedNote note;

    QStringList lines = splitLines(notes);
    if (lines.isEmpty()) {
        return note;
    }

    const QString firstLine = lines.first();
    const QStringList rest = lines.mid(1);

    if (isBasalLine(firstLine)) {
        note.foodItems.append(BasalMarker);
        QStringList tokens = splitTokens(firstLine);
        if (tokens.size() >= 2) {
            note.basalAmount = NightscoutRecords::parseNumber(tokens[1]);
        }
        note.foodItems.append(rest);
        return note;
    }

    if (firstLine.compare("B", Qt::CaseInsensitive) == 0) {
        note.foodItems.append(GlucoseSnackMarker);
        note.foodItems.append(rest);
        return note;
    }

    if (firstLine.length() == 1) {
        InsulinType type = insulinTypeFromLetter(firstLine[0]);
        if (type != InsulinType::Unspecified) {
            note.insulinType = type;
            note.foodItems.append(rest);
            return note;
        }
    }

    // "CIR 300 4.5N", "cir300 4.5", "300 4.5"
    QString ratioLine = firstLine;
    ratioLine.remove("cir", Qt::CaseInsensitive);
    QStringList tokens = splitTokens(ratioLine);

    std::optional<double> ratio;
    if (!tokens.isEmpty()) {
        ratio = NightscoutRecords::parseNumber(tokens.first());
    }

    if (!ratio) {
        // Not a ratio line after all - everything is food
        note.foodItems = lines;
        return note;
    }

    note.ratio = ratio;
    parseRatioLine(tokens, note);
    note.foodItems.append(rest);
    return note;
}

QString NoteParser::insulinTypeLabel(InsulinType type)
{
    switch (type) {
    case InsulinType::Normal:      return QStringLiteral("N");
    case InsulinType::Fast:        return QStringLiteral("F");
    case InsulinType::Unspecified: break;
    }
    return QString();
}

QStringList NoteParser::splitLines(const QString& notes)
{
    QStringList lines;
    const QStringList rawLines = notes.split('\n');
    for (const QString& raw : rawLines) {
        QString line = raw.trimmed();
        if (!line.isEmpty()) {
            lines.append(line);
        }
    }
    return lines;
}

QStringList NoteParser::splitTokens(const QString& line)
{
    static const QRegularExpression whitespace("\\s+");
    return line.split(whitespace, Qt::SkipEmptyParts);
}

bool NoteParser::isBasalLine(const QString& line)
{
    return line.startsWith(QStringLiteral("Tore ")) || line.startsWith(QStringLiteral("トレ "));
}

void NoteParser::parseRatioLine(const QStringList& tokens, ParsedNote& note)
{
    if (tokens.size() < 2) {
        return;
    }

    // Second token is the predicted dose, optionally suffixed with the type letter
    QString dose = tokens[1];
    InsulinType suffixType = insulinTypeFromLetter(dose.back());
    if (suffixType != InsulinType::Unspecified) {
        note.insulinType = suffixType;
        dose.chop(1);
    }
    note.predictedInsulin = NightscoutRecords::parseNumber(dose);
}

InsulinType NoteParser::insulinTypeFromLetter(QChar letter)
{
    QChar upper = letter.toUpper();
    if (upper == 'N') return InsulinType::Normal;
    if (upper == 'F') return InsulinType::Fast;
    return InsulinType::Unspecified;
}
