#include <QtTest/QtTest>

#include "calendraft/codec/AlarmTrigger.hpp"

using namespace calendraft::codec;

class AlarmTriggerTest : public QObject
{
    Q_OBJECT

private slots:
    void absoluteTriggerIsAt();
    void leadingMinusIsBefore();
    void unsignedIsAfter();
    void keepsLargestUnit();
    void rejectsSecondsOnlyAndGarbage();
    void formatsRelativeTriggers();
    void formatThenParseKeepsWhenAndValue();
    void computesFireTime();
};

void AlarmTriggerTest::absoluteTriggerIsAt()
{
    QVERIFY(isAbsoluteTrigger(QStringLiteral("20241225T090000Z")));
    QVERIFY(isAbsoluteTrigger(QStringLiteral("20241225T090000")));
    QVERIFY(!isAbsoluteTrigger(QStringLiteral("-PT15M")));

    const auto trigger = parseTrigger(QStringLiteral("20241225T090000Z"));
    QVERIFY(trigger.has_value());
    QCOMPARE(trigger->when, AlarmWhen::At);
    QCOMPARE(trigger->value, 0);
    QCOMPARE(trigger->unit, DurationUnit::Minutes);
}

void AlarmTriggerTest::leadingMinusIsBefore()
{
    const auto trigger = parseTrigger(QStringLiteral("-PT15M"));
    QVERIFY(trigger.has_value());
    QCOMPARE(trigger->when, AlarmWhen::Before);
    QCOMPARE(trigger->value, 15);
    QCOMPARE(trigger->unit, DurationUnit::Minutes);
}

void AlarmTriggerTest::unsignedIsAfter()
{
    const auto trigger = parseTrigger(QStringLiteral("PT2H"));
    QVERIFY(trigger.has_value());
    QCOMPARE(trigger->when, AlarmWhen::After);
    QCOMPARE(trigger->value, 2);
    QCOMPARE(trigger->unit, DurationUnit::Hours);
}

void AlarmTriggerTest::keepsLargestUnit()
{
    const auto trigger = parseTrigger(QStringLiteral("-P1DT12H"));
    QVERIFY(trigger.has_value());
    QCOMPARE(trigger->when, AlarmWhen::Before);
    QCOMPARE(trigger->value, 1);
    QCOMPARE(trigger->unit, DurationUnit::Days);
}

void AlarmTriggerTest::rejectsSecondsOnlyAndGarbage()
{
    QVERIFY(!parseTrigger(QString()).has_value());
    QVERIFY(!parseTrigger(QStringLiteral("-PT30S")).has_value());
    QVERIFY(!parseTrigger(QStringLiteral("whenever")).has_value());
}

void AlarmTriggerTest::formatsRelativeTriggers()
{
    QCOMPARE(formatTrigger(AlarmWhen::Before, 15, DurationUnit::Minutes), QStringLiteral("-PT15M"));
    QCOMPARE(formatTrigger(AlarmWhen::After, 1, DurationUnit::Hours), QStringLiteral("PT1H"));
    QCOMPARE(formatTrigger(AlarmWhen::Before, 2, DurationUnit::Days), QStringLiteral("-P2D"));
    QVERIFY(formatTrigger(AlarmWhen::At, 10, DurationUnit::Minutes).isEmpty());
}

void AlarmTriggerTest::formatThenParseKeepsWhenAndValue()
{
    const QList<AlarmTrigger> triggers = {
        {AlarmWhen::Before, 10, DurationUnit::Minutes},
        {AlarmWhen::After, 3, DurationUnit::Hours},
        {AlarmWhen::Before, 1, DurationUnit::Days},
    };
    for (const AlarmTrigger &original : triggers) {
        const auto parsed = parseTrigger(formatTrigger(original.when, original.value, original.unit));
        QVERIFY(parsed.has_value());
        QCOMPARE(parsed->when, original.when);
        QCOMPARE(parsed->value, original.value);
        QCOMPARE(parsed->unit, original.unit);
    }
}

void AlarmTriggerTest::computesFireTime()
{
    const QDateTime start(QDate(2024, 5, 1), QTime(10, 0), Qt::UTC);

    QCOMPARE(triggerFireTime(QStringLiteral("-PT15M"), start),
             std::optional<QDateTime>(QDateTime(QDate(2024, 5, 1), QTime(9, 45), Qt::UTC)));
    QCOMPARE(triggerFireTime(QStringLiteral("P1D"), start),
             std::optional<QDateTime>(QDateTime(QDate(2024, 5, 2), QTime(10, 0), Qt::UTC)));
    QCOMPARE(triggerFireTime(QStringLiteral("20240430T080000Z"), start),
             std::optional<QDateTime>(QDateTime(QDate(2024, 4, 30), QTime(8, 0), Qt::UTC)));
    QVERIFY(!triggerFireTime(QStringLiteral("-PT15M"), QDateTime()).has_value());
}

QTEST_GUILESS_MAIN(AlarmTriggerTest)
#include "AlarmTriggerTest.moc"
