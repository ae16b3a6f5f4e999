#include "models/json_fields.h"
#include <QJsonValue>

namespace json_fields {

QDateTime parseDateTime(const QJsonValue& value)
{
    if (!value.isString()) return {};
    const QString raw = value.toString().trimmed();
    if (raw.isEmpty()) return {};
    QDateTime dt = QDateTime::fromString(raw, Qt::ISODateWithMs);
    if (!dt.isValid()) dt = QDateTime::fromString(raw, Qt::ISODate);
    return dt;
}

QString formatDateTime(const QDateTime& dt)
{
    if (!dt.isValid()) return "-";
    return dt.toLocalTime().toString("dd.MM.yyyy HH:mm");
}

QString idString(const QJsonValue& value)
{
    if (value.isString()) return value.toString();
    if (value.isDouble()) return QString::number(value.toVariant().toLongLong());
    return {};
}

QString optString(const QJsonObject& obj, const char* key)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    return v.isString() ? v.toString() : QString();
}

} // namespace json_fields
