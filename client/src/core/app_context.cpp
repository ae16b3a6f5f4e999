#include "core/app_context.h"

#include "core/session_store.h"
#include "net/api_client.h"

AppContext::AppContext(const gme::Config& cfg, QObject* parent)
    : QObject(parent),
      m_config(cfg)
{
    m_api = new ApiClient(m_config, this);
    m_sessions = new SessionStore(m_config.session_file_path(), m_config.session_cookie_name(),
                                  m_config.management_url(), this);

    // the cookie jar follows the session; a restored token is installed by the login flow
    connect(m_sessions, &SessionStore::sessionStarted, this, [this](const Session& s) {
        if (m_api->sessionToken() != s.token) m_api->setSessionToken(s.token);
    });
    connect(m_sessions, &SessionStore::sessionEnded, this, [this]() {
        m_api->clearSessionToken();
        setCurrentUser(UserProfile{});
    });
}

bool AppContext::isLoggedIn() const
{
    return m_sessions->isActive();
}

void AppContext::setCurrentUser(const UserProfile& user)
{
    m_user = user;
    emit currentUserChanged(m_user);
}

QString AppContext::loginTime() const
{
    const QDateTime started = m_sessions->current().startedAt;
    return started.isValid() ? started.toString("yyyy-MM-dd HH:mm:ss") : QString();
}
