#include <QtTest/QtTest>
#include "core/ranking/spec_parser.h"

using pa::SpecParser;

class TestSpecParser : public QObject {
    Q_OBJECT

private slots:
    void testBatteryMah();
    void testCameraMegapixelsTakesFirstLens();
    void testRamTakesFirstNumber();
    void testPriceUsdPreferredOverEur();
    void testPriceEurFallbackAndCommas();
    void testBlankAndNotAvailable();
    void testDisplayFeatures();
};

void TestSpecParser::testBatteryMah()
{
    QCOMPARE(SpecParser::batteryMah(QStringLiteral("5000 mAh, 45W wired")).value_or(-1), 5000);
    QCOMPARE(SpecParser::batteryMah(QStringLiteral("4400MAH")).value_or(-1), 4400);
    QVERIFY(!SpecParser::batteryMah(QStringLiteral("Li-Ion, non-removable")).has_value());
}

void TestSpecParser::testCameraMegapixelsTakesFirstLens()
{
    QCOMPARE(SpecParser::cameraMegapixels(
                 QStringLiteral("200 MP main | 50 MP periscope telephoto")).value_or(-1), 200);
    QCOMPARE(SpecParser::cameraMegapixels(QStringLiteral("12MP wide")).value_or(-1), 12);
}

void TestSpecParser::testRamTakesFirstNumber()
{
    // Only 12 is directly followed by "GB"
    QCOMPARE(SpecParser::ramGigabytes(QStringLiteral("8/12 GB")).value_or(-1), 12);
    QCOMPARE(SpecParser::ramGigabytes(QStringLiteral("12 GB")).value_or(-1), 12);
    QCOMPARE(SpecParser::ramGigabytes(QStringLiteral("6GB, 8GB")).value_or(-1), 6);
}

void TestSpecParser::testPriceUsdPreferredOverEur()
{
    const auto price = SpecParser::priceUsd(QStringLiteral("$1299 / €1449"));
    QVERIFY(price.has_value());
    QCOMPARE(*price, 1299.0);
}

void TestSpecParser::testPriceEurFallbackAndCommas()
{
    auto price = SpecParser::priceUsd(QStringLiteral("About €1,049.50"));
    QVERIFY(price.has_value());
    QCOMPARE(*price, 1049.5);

    price = SpecParser::priceUsd(QStringLiteral("$ 1,999"));
    QVERIFY(price.has_value());
    QCOMPARE(*price, 1999.0);

    QVERIFY(!SpecParser::priceUsd(QStringLiteral("Coming soon")).has_value());
}

void TestSpecParser::testBlankAndNotAvailable()
{
    QVERIFY(SpecParser::isBlank(QString()));
    QVERIFY(SpecParser::isBlank(QStringLiteral("  n/a ")));
    QVERIFY(!SpecParser::isBlank(QStringLiteral("5000 mAh")));
    QVERIFY(!SpecParser::batteryMah(QStringLiteral("N/A")).has_value());
    QVERIFY(!SpecParser::priceUsd(QString()).has_value());
}

void TestSpecParser::testDisplayFeatures()
{
    const QString display = QStringLiteral("6.8 inches, Dynamic AMOLED 2X, 120Hz");
    QVERIFY(SpecParser::mentionsHighRefresh(display));
    QVERIFY(SpecParser::mentionsAmoled(display));
    QVERIFY(SpecParser::mentionsHighRefresh(QStringLiteral("120 hz")));
    QVERIFY(!SpecParser::mentionsHighRefresh(QStringLiteral("PLS LCD, 90Hz")));
    QVERIFY(!SpecParser::mentionsAmoled(QStringLiteral("PLS LCD, 90Hz")));
}

QTEST_MAIN(TestSpecParser)
#include "test_spec_parser.moc"
