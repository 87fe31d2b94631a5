#include "core/shared/phone_record.h"

namespace pa {

const QString& PhoneRecord::value(PhoneAttribute attribute) const
{
    switch (attribute) {
    case PhoneAttribute::ModelName:   return modelName;
    case PhoneAttribute::ReleaseDate: return releaseDate;
    case PhoneAttribute::Display:     return display;
    case PhoneAttribute::Battery:     return battery;
    case PhoneAttribute::Camera:      return camera;
    case PhoneAttribute::Ram:         return ram;
    case PhoneAttribute::Storage:     return storage;
    case PhoneAttribute::Price:       return price;
    case PhoneAttribute::Chipset:     return chipset;
    case PhoneAttribute::Os:          return os;
    case PhoneAttribute::Body:        return body;
    case PhoneAttribute::Url:         return url;
    }
    return modelName;
}

void PhoneRecord::setValue(PhoneAttribute attribute, const QString& value)
{
    switch (attribute) {
    case PhoneAttribute::ModelName:   modelName = value; break;
    case PhoneAttribute::ReleaseDate: releaseDate = value; break;
    case PhoneAttribute::Display:     display = value; break;
    case PhoneAttribute::Battery:     battery = value; break;
    case PhoneAttribute::Camera:      camera = value; break;
    case PhoneAttribute::Ram:         ram = value; break;
    case PhoneAttribute::Storage:     storage = value; break;
    case PhoneAttribute::Price:       price = value; break;
    case PhoneAttribute::Chipset:     chipset = value; break;
    case PhoneAttribute::Os:          os = value; break;
    case PhoneAttribute::Body:        body = value; break;
    case PhoneAttribute::Url:         url = value; break;
    }
}

QString phoneAttributeKey(PhoneAttribute attribute)
{
    switch (attribute) {
    case PhoneAttribute::ModelName:   return QStringLiteral("model_name");
    case PhoneAttribute::ReleaseDate: return QStringLiteral("release_date");
    case PhoneAttribute::Display:     return QStringLiteral("display");
    case PhoneAttribute::Battery:     return QStringLiteral("battery");
    case PhoneAttribute::Camera:      return QStringLiteral("camera");
    case PhoneAttribute::Ram:         return QStringLiteral("ram");
    case PhoneAttribute::Storage:     return QStringLiteral("storage");
    case PhoneAttribute::Price:       return QStringLiteral("price");
    case PhoneAttribute::Chipset:     return QStringLiteral("chipset");
    case PhoneAttribute::Os:          return QStringLiteral("os");
    case PhoneAttribute::Body:        return QStringLiteral("body");
    case PhoneAttribute::Url:         return QStringLiteral("url");
    }
    return QStringLiteral("unknown");
}

QString phoneAttributeLabel(PhoneAttribute attribute)
{
    switch (attribute) {
    case PhoneAttribute::ModelName:   return QStringLiteral("Model");
    case PhoneAttribute::ReleaseDate: return QStringLiteral("Released");
    case PhoneAttribute::Display:     return QStringLiteral("Display");
    case PhoneAttribute::Battery:     return QStringLiteral("Battery");
    case PhoneAttribute::Camera:      return QStringLiteral("Camera");
    case PhoneAttribute::Ram:         return QStringLiteral("RAM");
    case PhoneAttribute::Storage:     return QStringLiteral("Storage");
    case PhoneAttribute::Price:       return QStringLiteral("Price");
    case PhoneAttribute::Chipset:     return QStringLiteral("Chipset");
    case PhoneAttribute::Os:          return QStringLiteral("OS");
    case PhoneAttribute::Body:        return QStringLiteral("Body");
    case PhoneAttribute::Url:         return QStringLiteral("URL");
    }
    return QStringLiteral("Unknown");
}

std::optional<PhoneAttribute> phoneAttributeFromKey(const QString& key)
{
    for (PhoneAttribute attribute : allPhoneAttributes()) {
        if (phoneAttributeKey(attribute) == key) {
            return attribute;
        }
    }
    return std::nullopt;
}

const std::vector<PhoneAttribute>& allPhoneAttributes()
{
    static const std::vector<PhoneAttribute> kAll = {
        PhoneAttribute::ModelName, PhoneAttribute::ReleaseDate,
        PhoneAttribute::Display,   PhoneAttribute::Battery,
        PhoneAttribute::Camera,    PhoneAttribute::Ram,
        PhoneAttribute::Storage,   PhoneAttribute::Price,
        PhoneAttribute::Chipset,   PhoneAttribute::Os,
        PhoneAttribute::Body,      PhoneAttribute::Url,
    };
    return kAll;
}

const std::vector<PhoneAttribute>& comparisonAttributeOrder()
{
    static const std::vector<PhoneAttribute> kOrder = {
        PhoneAttribute::Display, PhoneAttribute::Battery,
        PhoneAttribute::Camera,  PhoneAttribute::Ram,
        PhoneAttribute::Storage, PhoneAttribute::Chipset,
        PhoneAttribute::Price,
    };
    return kOrder;
}

QJsonObject phoneRecordToJson(const PhoneRecord& record)
{
    QJsonObject json;
    json.insert(QStringLiteral("id"), static_cast<qint64>(record.id));
    for (PhoneAttribute attribute : allPhoneAttributes()) {
        json.insert(phoneAttributeKey(attribute), record.value(attribute));
    }
    return json;
}

PhoneRecord phoneRecordFromJson(const QJsonObject& json)
{
    PhoneRecord record;
    record.id = static_cast<int64_t>(json.value(QStringLiteral("id")).toInteger(0));
    for (PhoneAttribute attribute : allPhoneAttributes()) {
        record.setValue(attribute,
                        json.value(phoneAttributeKey(attribute)).toString().trimmed());
    }
    return record;
}

QString displayValue(const QString& value)
{
    const QString trimmed = value.trimmed();
    return trimmed.isEmpty() ? QStringLiteral("N/A") : trimmed;
}

} // namespace pa
