#pragma once
#include <QDateTime>
#include <QString>

struct Session {
    QString token;            // session cookie value
    QString login;
    QString apiBaseUrl;
    bool remembered = false;
    QDateTime startedAt;      // local, not persisted

    bool isValid() const { return !token.isEmpty(); }

    bool operator==(const Session& o) const
    {
        return token == o.token && login == o.login &&
               apiBaseUrl == o.apiBaseUrl && remembered == o.remembered;
    }
    bool operator!=(const Session& o) const { return !(*this == o); }
};
