#pragma once
#include "controllers/screen_controller.h"
#include "core/session.h"
#include "models/user.h"

class SessionStore;

// Sign-in, registration and start-up restore. Every successful path ends in
// SessionStore::begin() followed by signedIn().
class LoginController : public ScreenController {
    Q_OBJECT
public:
    static constexpr int kMinLoginLength = 3;
    static constexpr int kMinPasswordLength = 8;

    LoginController(ApiClient* api, SessionStore* sessions, QObject* parent = nullptr);

    // Empty string when the form is acceptable.
    static QString validateLogin(const QString& login, const QString& password);
    static QString validateRegistration(const QString& login, const QString& password,
                                        const QString& confirmation);

    void signIn(const QString& login, const QString& password, bool remember);
    void registerAccount(const QString& login, const QString& email,
                         const QString& password, const QString& confirmation);
    // true when a persisted session was found and is being verified
    bool restoreSession();

    QString lastLogin() const;
    QString busyText() const { return m_busyText; }

signals:
    void signedIn(const UserProfile& user);
    void validationFailed(const QString& message);

private:
    void signInFlow_(const QString& login, const QString& password, bool remember);
    void fetchProfile_(const Session& session);

private:
    SessionStore* m_sessions = nullptr;
    QString m_busyText;
};
