#include "report/statsaggregator.h"
#include <gtest/gtest.h>
#include <limits>

namespace {

TreatmentEvent treatment(const QString& carbs, const QString& insulin = QString())
{
    TreatmentEvent t;
    t.carbsGrams = carbs;
    t.insulinUnits = insulin;
    return t;
}

GlucoseReading readingWithValue(std::optional<int> value)
{
    GlucoseReading r;
    r.value = value;
    return r;
}

} // namespace

TEST(StatsAggregatorTest, SmallCarbsBecomeSnack)
{
    StatsAggregator stats;
    ParsedNote note = NoteParser::parse("cookie");
    stats.addTreatment(treatment("2"), note);
    EXPECT_EQ(note.foodItems, QStringList({"snack", "cookie"}));
    EXPECT_DOUBLE_EQ(stats.totalCarbs(), 2.0);
}

TEST(StatsAggregatorTest, SnackBoundsAreInclusive)
{
    for (const QString& carbs : {QString("1"), QString("3"), QString("1.5")}) {
        QStringList items;
        EXPECT_TRUE(StatsAggregator::applySnackRule(NightscoutRecords::parseNumber(carbs), items)) << carbs.toStdString();
        EXPECT_EQ(items, QStringList({"snack"}));
    }
    for (const QString& carbs : {QString("0.5"), QString("3.1"), QString("10"), QString(""), QString("x")}) {
        QStringList items;
        EXPECT_FALSE(StatsAggregator::applySnackRule(NightscoutRecords::parseNumber(carbs), items)) << carbs.toStdString();
        EXPECT_TRUE(items.isEmpty());
    }
}

TEST(StatsAggregatorTest, LargeCarbsNeverSnack)
{
    StatsAggregator stats;
    ParsedNote note = NoteParser::parse("300 4N\nramen");
    stats.addTreatment(treatment("10", "4"), note);
    EXPECT_EQ(note.foodItems, QStringList({"ramen"}));
}

TEST(StatsAggregatorTest, ExistingSnackItemIsNotDuplicated)
{
    StatsAggregator stats;
    ParsedNote tablet = NoteParser::parse("B");
    stats.addTreatment(treatment("2"), tablet);
    EXPECT_EQ(tablet.foodItems, QStringList({"glucose snack"}));

    ParsedNote japanese = NoteParser::parse("補食 ラムネ");
    stats.addTreatment(treatment("3"), japanese);
    EXPECT_EQ(japanese.foodItems, QStringList({"補食 ラムネ"}));

    EXPECT_DOUBLE_EQ(stats.totalCarbs(), 5.0);
}

TEST(StatsAggregatorTest, BasalAndBolusAreExclusive)
{
    StatsAggregator stats;

    ParsedNote basal = NoteParser::parse("Tore 8");
    stats.addTreatment(treatment("", "8"), basal);

    ParsedNote bolus = NoteParser::parse("300 4.5N");
    stats.addTreatment(treatment("45", "4.5"), bolus);

    EXPECT_DOUBLE_EQ(stats.basalInsulin(), 8.0);
    EXPECT_DOUBLE_EQ(stats.totalInsulin(), 4.5);
}

TEST(StatsAggregatorTest, BasalWithoutAmountCountsInsulinField)
{
    StatsAggregator stats;
    ParsedNote note = NoteParser::parse("Tore ?");
    stats.addTreatment(treatment("", "6"), note);
    EXPECT_DOUBLE_EQ(stats.basalInsulin(), 0.0);
    EXPECT_DOUBLE_EQ(stats.totalInsulin(), 6.0);
}

TEST(StatsAggregatorTest, UnreadableNumbersAreIgnored)
{
    StatsAggregator stats;
    ParsedNote note = NoteParser::parse("");
    stats.addTreatment(treatment("lots", "some"), note);
    EXPECT_DOUBLE_EQ(stats.totalCarbs(), 0.0);
    EXPECT_DOUBLE_EQ(stats.totalInsulin(), 0.0);
}

TEST(StatsAggregatorTest, CarbInsulinRatio)
{
    EXPECT_EQ(StatsAggregator::carbInsulinRatio(45, 3), "15.0");
    EXPECT_EQ(StatsAggregator::carbInsulinRatio(22.5, 3), "7.5");
    EXPECT_EQ(StatsAggregator::carbInsulinRatio(100, 0), "-");
    EXPECT_EQ(StatsAggregator::carbInsulinRatio(0, 0), "-");
}

TEST(StatsAggregatorTest, FinalizeRoundsAndDerives)
{
    StatsAggregator stats;
    ParsedNote a = NoteParser::parse("");
    stats.addTreatment(treatment("45", "1.111"), a);
    ParsedNote b = NoteParser::parse("");
    stats.addTreatment(treatment("", "1.889"), b);
    ParsedNote basal = NoteParser::parse("Tore 7.333");
    stats.addTreatment(treatment(""), basal);

    DailyStats result = stats.finalize({readingWithValue(100), readingWithValue(121)});
    EXPECT_EQ(result.averageGlucose, 111);
    EXPECT_DOUBLE_EQ(result.totalCarbs, 45.0);
    EXPECT_DOUBLE_EQ(result.totalInsulin, 3.0);
    EXPECT_DOUBLE_EQ(result.basalInsulin, 7.33);
    EXPECT_EQ(result.carbInsulinRatio, "15.0");
}

TEST(StatsAggregatorTest, AverageGlucose)
{
    EXPECT_EQ(StatsAggregator::averageGlucose({}), 0);
    EXPECT_EQ(StatsAggregator::averageGlucose({readingWithValue(std::nullopt)}), 0);
    EXPECT_EQ(StatsAggregator::averageGlucose({readingWithValue(100), readingWithValue(std::nullopt),
                                               readingWithValue(131)}), 116);
    EXPECT_EQ(StatsAggregator::averageGlucose({readingWithValue(90), readingWithValue(93), readingWithValue(97)}), 93);
}

TEST(StatsAggregatorTest, AverageGlucoseRoundsHalfToEven)
{
    EXPECT_EQ(StatsAggregator::averageGlucose({readingWithValue(100), readingWithValue(101)}), 100);
    EXPECT_EQ(StatsAggregator::averageGlucose({readingWithValue(101), readingWithValue(102)}), 102);
}

TEST(StatsAggregatorTest, NonFiniteCarbsAreIgnored)
{
    for (const QString& carbs : {QString("nan"), QString("NaN"), QString("inf"), QString("-inf")}) {
        StatsAggregator stats;
        ParsedNote note = NoteParser::parse("");
        stats.addTreatment(treatment(carbs, "2"), note);
        EXPECT_TRUE(note.foodItems.isEmpty()) << carbs.toStdString();
        EXPECT_DOUBLE_EQ(stats.totalCarbs(), 0.0) << carbs.toStdString();

        DailyStats result = stats.finalize({});
        EXPECT_EQ(result.carbInsulinRatio, "0.0") << carbs.toStdString();
    }
}

TEST(StatsAggregatorTest, SnackRuleRejectsNaN)
{
    QStringList items;
    EXPECT_FALSE(StatsAggregator::applySnackRule(std::numeric_limits<double>::quiet_NaN(), items));
    EXPECT_TRUE(items.isEmpty());
}

TEST(StatsAggregatorTest, NoInsulinGivesPlaceholderRatio)
{
    StatsAggregator stats;
    ParsedNote note = NoteParser::parse("apple");
    stats.addTreatment(treatment("15"), note);
    DailyStats result = stats.finalize({});
    EXPECT_DOUBLE_EQ(result.totalInsulin, 0.0);
    EXPECT_EQ(result.carbInsulinRatio, "-");
}
