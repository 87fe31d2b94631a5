#pragma once

#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

namespace pa {

// Textual spec fields of a catalog record. modelName is the identity key.
enum class PhoneAttribute {
    ModelName,
    ReleaseDate,
    Display,
    Battery,
    Camera,
    Ram,
    Storage,
    Price,
    Chipset,
    Os,
    Body,
    Url,
};

struct PhoneRecord {
    int64_t id = 0;  // store row id, listing order only
    QString modelName;
    QString releaseDate;
    QString display;
    QString battery;
    QString camera;
    QString ram;
    QString storage;
    QString price;
    QString chipset;
    QString os;
    QString body;
    QString url;

    const QString& value(PhoneAttribute attribute) const;
    void setValue(PhoneAttribute attribute, const QString& value);
};

// JSON key, e.g. "release_date".
QString phoneAttributeKey(PhoneAttribute attribute);
// Human label, e.g. "Release".
QString phoneAttributeLabel(PhoneAttribute attribute);
std::optional<PhoneAttribute> phoneAttributeFromKey(const QString& key);

// Every attribute in declaration order.
const std::vector<PhoneAttribute>& allPhoneAttributes();

// display, battery, camera, ram, storage, chipset, price
const std::vector<PhoneAttribute>& comparisonAttributeOrder();

QJsonObject phoneRecordToJson(const PhoneRecord& record);
PhoneRecord phoneRecordFromJson(const QJsonObject& json);

// Returns the value, or "N/A" when it is blank.
QString displayValue(const QString& value);

} // namespace pa
