#pragma once
#include <QDateTime>
#include <QJsonObject>
#include <QString>

// Small helpers for decoding backend payloads. Timestamps arrive as ISO-8601
// ("2026-10-19T08:15:00Z", "...+03:00"); ids may be strings or numbers.
namespace json_fields {

QDateTime parseDateTime(const QJsonValue& value);
QString formatDateTime(const QDateTime& dt);   // local "dd.MM.yyyy HH:mm", "-" when unset
QString idString(const QJsonValue& value);
QString optString(const QJsonObject& obj, const char* key);

} // namespace json_fields
