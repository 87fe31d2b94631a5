#include <QtTest/QtTest>
#include "core/ranking/comparison.h"

namespace {

pa::PhoneRecord s24()
{
    pa::PhoneRecord record;
    record.modelName = QStringLiteral("Samsung Galaxy S24");
    record.display = QStringLiteral("6.2 inches, Dynamic AMOLED 2X, 120Hz");
    record.battery = QStringLiteral("4000 mAh");
    record.camera = QStringLiteral("50 MP main");
    record.ram = QStringLiteral("8 GB");
    record.storage = QStringLiteral("128GB/256GB");
    record.chipset = QStringLiteral("Exynos 2400");
    record.price = QStringLiteral("$799");
    record.os = QStringLiteral("Android 14");
    return record;
}

pa::PhoneRecord s24Plus()
{
    pa::PhoneRecord record = s24();
    record.modelName = QStringLiteral("Samsung Galaxy S24+");
    record.display = QStringLiteral("6.7 inches, Dynamic AMOLED 2X, 120Hz");
    record.battery = QStringLiteral("4900 mAh");
    record.ram = QStringLiteral("12 GB");
    record.price = QStringLiteral("$999");
    record.os = QStringLiteral("Android 14, One UI 6.1");
    return record;
}

QList<pa::PhoneAttribute> attributesOf(const pa::ComparisonResult& result)
{
    QList<pa::PhoneAttribute> attributes;
    for (const auto& difference : result.differences) {
        attributes.append(difference.attribute);
    }
    return attributes;
}

} // namespace

class TestComparison : public QObject {
    Q_OBJECT

private slots:
    void testDifferencesInCanonicalOrder();
    void testAttributesOutsideCanonicalListIgnored();
    void testSymmetricUpToSwap();
    void testIdenticalRecordsHaveNoDifferences();
    void testExactStringInequality();
};

void TestComparison::testDifferencesInCanonicalOrder()
{
    const pa::ComparisonResult result = pa::ComparisonDifferencer::diff(s24(), s24Plus());
    QCOMPARE(result.recordA.modelName, QStringLiteral("Samsung Galaxy S24"));
    QCOMPARE(result.recordB.modelName, QStringLiteral("Samsung Galaxy S24+"));
    QCOMPARE(attributesOf(result),
             (QList<pa::PhoneAttribute>{pa::PhoneAttribute::Display, pa::PhoneAttribute::Battery,
                                        pa::PhoneAttribute::Ram, pa::PhoneAttribute::Price}));
    QCOMPARE(result.differences[1].valueA, QStringLiteral("4000 mAh"));
    QCOMPARE(result.differences[1].valueB, QStringLiteral("4900 mAh"));
}

void TestComparison::testAttributesOutsideCanonicalListIgnored()
{
    // os differs but is not part of the comparison order
    const auto attributes = attributesOf(pa::ComparisonDifferencer::diff(s24(), s24Plus()));
    QVERIFY(!attributes.contains(pa::PhoneAttribute::Os));
    QVERIFY(!attributes.contains(pa::PhoneAttribute::ModelName));
}

void TestComparison::testSymmetricUpToSwap()
{
    const auto forward = pa::ComparisonDifferencer::diff(s24(), s24Plus());
    const auto backward = pa::ComparisonDifferencer::diff(s24Plus(), s24());
    QCOMPARE(attributesOf(forward), attributesOf(backward));
    for (size_t i = 0; i < forward.differences.size(); ++i) {
        QCOMPARE(forward.differences[i].valueA, backward.differences[i].valueB);
        QCOMPARE(forward.differences[i].valueB, backward.differences[i].valueA);
    }
}

void TestComparison::testIdenticalRecordsHaveNoDifferences()
{
    QVERIFY(pa::ComparisonDifferencer::diff(s24(), s24()).differences.empty());
}

void TestComparison::testExactStringInequality()
{
    pa::PhoneRecord other = s24();
    other.battery = QStringLiteral("4000 MAH");
    const auto result = pa::ComparisonDifferencer::diff(s24(), other);
    QCOMPARE(attributesOf(result), QList<pa::PhoneAttribute>{pa::PhoneAttribute::Battery});
}

QTEST_MAIN(TestComparison)
#include "test_comparison.moc"
