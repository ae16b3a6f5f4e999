#pragma once
#include <QObject>
#include <QString>

#include "core/config.h"
#include "models/user.h"

class ApiClient;
class SessionStore;

// Owns the process-scoped state: configuration, the session store and the
// API client. Created by main() and handed to the navigator and pages.
class AppContext : public QObject {
    Q_OBJECT
public:
    explicit AppContext(const gme::Config& cfg, QObject* parent = nullptr);

    const gme::Config& config() const { return m_config; }
    ApiClient* api() const { return m_api; }
    SessionStore* sessions() const { return m_sessions; }

    bool isLoggedIn() const;

    const UserProfile& currentUser() const { return m_user; }
    void setCurrentUser(const UserProfile& user);
    QString loginTime() const;

signals:
    void currentUserChanged(const UserProfile& user);

private:
    gme::Config m_config;
    ApiClient* m_api = nullptr;
    SessionStore* m_sessions = nullptr;
    UserProfile m_user;
};
