#pragma once
#include <QDateTime>
#include <QString>

class QJsonObject;

// Returned by POST /auth/login.
struct UserSummary {
    QString id;
    QString login;
    QString role;
    bool mustChangePassword = false;

    static UserSummary fromJson(const QJsonObject& obj);
};

// Returned by GET /users/me.
struct UserProfile {
    QString id;
    QString login;
    QString email;
    QString role;
    bool isActive = true;
    QString displayName;
    QDateTime createdAt;

    QString uiName() const;
    bool isValid() const { return !id.isEmpty(); }

    static UserProfile fromJson(const QJsonObject& obj);
};
