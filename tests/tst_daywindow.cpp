#include "report/daywindow.h"
#include <QTimeZone>
#include <gtest/gtest.h>

namespace {

QDateTime utc(int day, int hour, int minute = 0)
{
    return QDateTime(QDate(2024, 5, day), QTime(hour, minute), QTimeZone::utc());
}

} // namespace

TEST(DayWindowTest, LocalDayAtJapanOffset)
{
    DayWindow window = DayWindow::forDate(QDate(2024, 5, 1), 9 * 3600);
    ASSERT_TRUE(window.isValid());
    EXPECT_EQ(window.start, QDateTime(QDate(2024, 4, 30), QTime(15, 0), QTimeZone::utc()));
    EXPECT_EQ(window.end, utc(1, 15));
}

TEST(DayWindowTest, EndIsExclusive)
{
    DayWindow window = DayWindow::forDate(QDate(2024, 5, 1), 0);
    EXPECT_TRUE(window.contains(utc(1, 0)));
    EXPECT_TRUE(window.contains(utc(1, 23, 59)));
    EXPECT_FALSE(window.contains(utc(2, 0)));
    EXPECT_FALSE(window.contains(QDateTime()));
}

TEST(DayWindowTest, InvalidDate)
{
    EXPECT_FALSE(DayWindow::forDate(QDate(), 0).isValid());
}

TEST(DayWindowTest, FilterKeepsDayAndUnparseableRecords)
{
    DayWindow window = DayWindow::forDate(QDate(2024, 5, 1), 9 * 3600);

    GlucoseReading before;
    before.timestamp = utc(1, 15);
    GlucoseReading inside;
    inside.timestamp = utc(1, 2);
    GlucoseReading broken;

    QList<GlucoseReading> readings = window.filter(QList<GlucoseReading>{before, inside, broken});
    ASSERT_EQ(readings.size(), 2);
    EXPECT_EQ(readings[0].timestamp, utc(1, 2));
    EXPECT_FALSE(readings[1].timestamp.isValid());

    TreatmentEvent lateNight;
    lateNight.timestamp = utc(1, 14, 59);
    TreatmentEvent nextDay;
    nextDay.timestamp = utc(1, 15, 1);
    QList<TreatmentEvent> treatments = window.filter(QList<TreatmentEvent>{lateNight, nextDay});
    ASSERT_EQ(treatments.size(), 1);
    EXPECT_EQ(treatments[0].timestamp, utc(1, 14, 59));
}
