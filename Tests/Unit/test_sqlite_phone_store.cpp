#include <QtTest/QtTest>
#include "core/catalog/sqlite_phone_store.h"

#include <QTemporaryDir>

namespace {

pa::PhoneRecord phone(const QString& name, const QString& price, const QString& battery = QString())
{
    pa::PhoneRecord record;
    record.modelName = name;
    record.price = price;
    record.battery = battery;
    return record;
}

pa::SQLitePhoneStore seededStore()
{
    auto store = pa::SQLitePhoneStore::open(QStringLiteral(":memory:"));
    if (!store.has_value()) {
        qFatal("in-memory catalog failed to open");
    }
    store->upsertPhone(phone(QStringLiteral("Samsung Galaxy S24 Ultra"), QStringLiteral("$1299 / €1449")));
    store->upsertPhone(phone(QStringLiteral("Samsung Galaxy S24"), QStringLiteral("$799 / €899")));
    store->upsertPhone(phone(QStringLiteral("Samsung Galaxy A54 5G"), QStringLiteral("$449")));
    store->upsertPhone(phone(QStringLiteral("Samsung Galaxy A34 5G"), QStringLiteral("€389")));
    store->upsertPhone(phone(QStringLiteral("Samsung Galaxy Z Fold 6"), QStringLiteral("TBA")));
    return std::move(*store);
}

} // namespace

class TestSQLitePhoneStore : public QObject {
    Q_OBJECT

private slots:
    void testOpenInMemoryIsEmpty();
    void testListingFollowsInsertOrder();
    void testUpsertUpdatesExistingRow();
    void testFindByNameExactCaseInsensitive();
    void testFindByNameSubstring();
    void testFindByNameWithoutBrandWords();
    void testFindByNameMissing();
    void testFilterByMaxPrice();
    void testFilterByMaxPriceLimit();
    void testDeleteAll();
    void testPersistsAcrossReopen();
};

void TestSQLitePhoneStore::testOpenInMemoryIsEmpty()
{
    auto store = pa::SQLitePhoneStore::open(QStringLiteral(":memory:"));
    QVERIFY(store.has_value());
    QCOMPARE(store->count(), 0);
    QVERIFY(store->listAllNames().isEmpty());
    QVERIFY(store->listAll().empty());
}

void TestSQLitePhoneStore::testListingFollowsInsertOrder()
{
    auto store = seededStore();
    QCOMPARE(store.count(), 5);
    const QStringList names = store.listAllNames();
    QCOMPARE(names.size(), 5);
    QCOMPARE(names.first(), QStringLiteral("Samsung Galaxy S24 Ultra"));
    QCOMPARE(names.last(), QStringLiteral("Samsung Galaxy Z Fold 6"));
    QCOMPARE(store.listAll().at(2).modelName, QStringLiteral("Samsung Galaxy A54 5G"));
}

void TestSQLitePhoneStore::testUpsertUpdatesExistingRow()
{
    auto store = seededStore();
    const auto before = store.findByName(QStringLiteral("Samsung Galaxy S24"));
    QVERIFY(before.has_value());

    const auto id = store.upsertPhone(phone(QStringLiteral("Samsung Galaxy S24"),
                                            QStringLiteral("$699"), QStringLiteral("4000 mAh")));
    QVERIFY(id.has_value());
    QCOMPARE(*id, before->id);
    QCOMPARE(store.count(), 5);

    const auto after = store.findByName(QStringLiteral("Samsung Galaxy S24"));
    QCOMPARE(after->price, QStringLiteral("$699"));
    QCOMPARE(after->battery, QStringLiteral("4000 mAh"));
}

void TestSQLitePhoneStore::testFindByNameExactCaseInsensitive()
{
    auto store = seededStore();
    // Exact beats the earlier "S24 Ultra" row that also contains the text.
    const auto record = store.findByName(QStringLiteral("samsung galaxy s24"));
    QVERIFY(record.has_value());
    QCOMPARE(record->modelName, QStringLiteral("Samsung Galaxy S24"));
}

void TestSQLitePhoneStore::testFindByNameSubstring()
{
    auto store = seededStore();
    const auto record = store.findByName(QStringLiteral("A54"));
    QVERIFY(record.has_value());
    QCOMPARE(record->modelName, QStringLiteral("Samsung Galaxy A54 5G"));
}

void TestSQLitePhoneStore::testFindByNameWithoutBrandWords()
{
    auto store = seededStore();
    const auto record = store.findByName(QStringLiteral("Galaxy Samsung Z Fold 6"));
    QVERIFY(record.has_value());
    QCOMPARE(record->modelName, QStringLiteral("Samsung Galaxy Z Fold 6"));
}

void TestSQLitePhoneStore::testFindByNameMissing()
{
    auto store = seededStore();
    QVERIFY(!store.findByName(QStringLiteral("Pixel 8")).has_value());
    QVERIFY(!store.findByName(QStringLiteral("   ")).has_value());
}

void TestSQLitePhoneStore::testFilterByMaxPrice()
{
    auto store = seededStore();
    const auto records = store.filterByMaxPrice(800.0, 10);
    QStringList names;
    for (const auto& record : records) {
        names.append(record.modelName);
    }
    // EUR is used when no USD price is listed; unparseable prices never match.
    QCOMPARE(names, (QStringList{QStringLiteral("Samsung Galaxy S24"),
                                 QStringLiteral("Samsung Galaxy A54 5G"),
                                 QStringLiteral("Samsung Galaxy A34 5G")}));
}

void TestSQLitePhoneStore::testFilterByMaxPriceLimit()
{
    auto store = seededStore();
    QCOMPARE(store.filterByMaxPrice(5000.0, 2).size(), size_t(2));
    QVERIFY(store.filterByMaxPrice(5000.0, 0).empty());
    QVERIFY(store.filterByMaxPrice(100.0, 10).empty());
}

void TestSQLitePhoneStore::testDeleteAll()
{
    auto store = seededStore();
    QVERIFY(store.deleteAll());
    QCOMPARE(store.count(), 0);
}

void TestSQLitePhoneStore::testPersistsAcrossReopen()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("catalog.db"));

    {
        auto store = pa::SQLitePhoneStore::open(path);
        QVERIFY(store.has_value());
        QVERIFY(store->upsertPhone(phone(QStringLiteral("Samsung Galaxy S23"), QStringLiteral("$799"))).has_value());
    }

    auto reopened = pa::SQLitePhoneStore::open(path);
    QVERIFY(reopened.has_value());
    QCOMPARE(reopened->count(), 1);
    QCOMPARE(reopened->findByName(QStringLiteral("s23"))->price, QStringLiteral("$799"));
}

QTEST_MAIN(TestSQLitePhoneStore)
#include "test_sqlite_phone_store.moc"
