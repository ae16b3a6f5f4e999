#include "models/user.h"
#include <QJsonObject>
#include "models/json_fields.h"

UserSummary UserSummary::fromJson(const QJsonObject& obj)
{
    UserSummary u;
    u.id = json_fields::idString(obj.value("id"));
    u.login = obj.value("login").toString();
    u.role = obj.value("role").toString();
    u.mustChangePassword = obj.value("must_change_password").toBool(false);
    return u;
}

QString UserProfile::uiName() const
{
    const QString name = !displayName.trimmed().isEmpty() ? displayName : login;
    return name.trimmed().isEmpty() ? QStringLiteral("User") : name.trimmed();
}

UserProfile UserProfile::fromJson(const QJsonObject& obj)
{
    UserProfile u;
    u.id = json_fields::idString(obj.value("id"));
    u.login = obj.value("login").toString();
    u.email = json_fields::optString(obj, "email");
    u.role = obj.value("role").toString();
    u.isActive = obj.value("is_active").toBool(true);
    u.displayName = json_fields::optString(obj, "display_name");
    u.createdAt = json_fields::parseDateTime(obj.value("created_at"));
    return u;
}
