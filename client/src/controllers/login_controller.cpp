#include "controllers/login_controller.h"

#include <QJsonObject>

#include "core/session_store.h"
#include "log/logger.h"
#include "net/api_client.h"

LoginController::LoginController(ApiClient* api, SessionStore* sessions, QObject* parent)
    : ScreenController(api, parent),
      m_sessions(sessions)
{
}

QString LoginController::validateLogin(const QString& login, const QString& password)
{
    if (login.trimmed().isEmpty() || password.isEmpty()) {
        return QStringLiteral("Enter login and password.");
    }
    return {};
}

QString LoginController::validateRegistration(const QString& login, const QString& password,
                                              const QString& confirmation)
{
    if (login.trimmed().size() < kMinLoginLength) {
        return QString("Login must be at least %1 characters.").arg(kMinLoginLength);
    }
    if (password.size() < kMinPasswordLength) {
        return QString("Password must be at least %1 characters.").arg(kMinPasswordLength);
    }
    if (password != confirmation) {
        return QStringLiteral("Passwords do not match.");
    }
    return {};
}

QString LoginController::lastLogin() const
{
    return m_sessions->lastLogin();
}

void LoginController::signIn(const QString& login, const QString& password, bool remember)
{
    if (state() == State::Loading) return;
    const QString problem = validateLogin(login, password);
    if (!problem.isEmpty()) {
        emit validationFailed(problem);
        return;
    }

    m_busyText = "Signing in...";
    setState(State::Loading);
    signInFlow_(login.trimmed(), password, remember);
}

void LoginController::registerAccount(const QString& login, const QString& email,
                                      const QString& password, const QString& confirmation)
{
    if (state() == State::Loading) return;
    const QString problem = validateRegistration(login, password, confirmation);
    if (!problem.isEmpty()) {
        emit validationFailed(problem);
        return;
    }

    const QString name = login.trimmed();
    m_busyText = "Creating account...";
    setState(State::Loading);

    api()->registerUser(name, password, email, token(),
                        [this, name, password](const ApiResult<QJsonObject>& r) {
        if (!r.ok) {
            fail(r.error);
            return;
        }
        gme::Logger::info("registered account " + name.toStdString(), "session");
        // a fresh account is always remembered
        signInFlow_(name, password, true);
    });
}

void LoginController::signInFlow_(const QString& login, const QString& password, bool remember)
{
    // one session at a time: whatever was there is gone once a new login starts
    if (m_sessions->isActive()) m_sessions->end();

    api()->login(login, password, token(), [this, login, remember](const ApiResult<UserSummary>& r) {
        if (!r.ok) {
            fail(r.error);
            return;
        }
        Session s;
        s.token = api()->sessionToken();
        s.login = r.value.login.isEmpty() ? login : r.value.login;
        s.apiBaseUrl = api()->baseUrl();
        s.remembered = remember;
        fetchProfile_(s);
    });
}

bool LoginController::restoreSession()
{
    const std::optional<Session> persisted = m_sessions->restore();
    if (!persisted) return false;

    m_busyText = "Restoring session...";
    setState(State::Loading);
    api()->setSessionToken(persisted->token);
    fetchProfile_(*persisted);
    return true;
}

void LoginController::fetchProfile_(const Session& session)
{
    api()->currentUser(token(), [this, session](const ApiResult<UserProfile>& r) {
        if (!r.ok) {
            api()->clearSessionToken();
            if (session.remembered && !m_sessions->isActive()) {
                // a persisted record that no longer works is not kept around
                m_sessions->end();
            }
            fail(r.error);
            return;
        }
        m_sessions->begin(session);
        setState(State::Loaded);
        emit signedIn(r.value);
    });
}
