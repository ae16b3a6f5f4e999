#include "controllers/navigator.h"

#include "controllers/login_controller.h"
#include "controllers/project_create_controller.h"
#include "controllers/project_list_controller.h"
#include "controllers/run_history_controller.h"
#include "core/app_context.h"
#include "core/session_store.h"
#include "log/logger.h"
#include "net/api_client.h"

Navigator::Navigator(AppContext* ctx, QObject* parent)
    : QObject(parent),
      m_ctx(ctx)
{
    m_login = new LoginController(ctx->api(), ctx->sessions(), this);
    m_projectList = new ProjectListController(ctx->api(), this);
    m_projectCreate = new ProjectCreateController(ctx->api(), this);
    m_runHistory = new RunHistoryController(ctx->api(), this);

    connect(ctx->api(), &ApiClient::unauthorized, this, &Navigator::handleAuthFailure);
    connect(m_login, &LoginController::signedIn, this, &Navigator::onSignedIn_);
    connect(m_projectCreate, &ProjectCreateController::projectCreated, this, [this](const Project&) {
        navigate(Screen::ProjectList);
    });
    connect(ctx->sessions(), &SessionStore::sessionEnded, this, [this]() {
        if (m_current != Screen::Login) show_(Screen::Login, true);
    });
}

Navigator::~Navigator() = default;

Navigator::Screen Navigator::resolve(Screen requested, bool hasSession)
{
    if (!hasSession) return Screen::Login;
    // signed-in users have nothing to do on the login screen
    if (requested == Screen::Login) return Screen::ProjectList;
    return requested;
}

QString Navigator::screenName(Screen s)
{
    switch (s) {
    case Screen::Login:         return "login";
    case Screen::ProjectList:   return "projects";
    case Screen::ProjectCreate: return "create-project";
    case Screen::RunHistory:    return "run-history";
    }
    return "login";
}

ScreenController* Navigator::controller(Screen s) const
{
    switch (s) {
    case Screen::Login:         return m_login;
    case Screen::ProjectList:   return m_projectList;
    case Screen::ProjectCreate: return m_projectCreate;
    case Screen::RunHistory:    return m_runHistory;
    }
    return m_login;
}

void Navigator::start()
{
    show_(Screen::Login, true);
    if (m_login->restoreSession()) {
        gme::Logger::info("verifying remembered session", "nav");
    }
}

void Navigator::navigate(Screen screen)
{
    show_(resolve(screen, m_ctx->isLoggedIn()), false);
}

void Navigator::openRunHistory(const Project& project)
{
    if (!m_ctx->isLoggedIn()) {
        show_(Screen::Login, false);
        return;
    }
    m_runHistory->setProject(project);
    // re-entering with another project must refetch
    show_(Screen::RunHistory, true);
}

void Navigator::show_(Screen screen, bool force)
{
    if (m_started && screen == m_current && !force) return;

    if (m_started) controller(m_current)->deactivate();
    gme::Logger::info(("navigate " + screenName(m_current) + " -> " + screenName(screen)).toStdString(), "nav");
    m_current = screen;
    m_started = true;
    controller(m_current)->activate();
    emit screenChanged(m_current);
}

void Navigator::onSignedIn_(const UserProfile& user)
{
    m_ctx->setCurrentUser(user);
    show_(Screen::ProjectList, false);
}

void Navigator::logout()
{
    if (!m_ctx->isLoggedIn()) {
        show_(Screen::Login, false);
        return;
    }
    m_logoutCancel.reset();
    m_ctx->api()->logout(m_logoutCancel.token(), [this](const ApiResult<bool>& r) {
        if (!r.ok) {
            emit notice(r.error.message, true);
            return;
        }
        m_ctx->sessions()->end();
        emit notice(QStringLiteral("You have signed out."), false);
    });
}

void Navigator::handleAuthFailure()
{
    gme::Logger::warn("authentication rejected, returning to login", "nav");
    m_logoutCancel.cancel();
    // the persisted record goes too, even when no session was begun yet
    m_ctx->sessions()->end();
    m_ctx->api()->clearSessionToken();
    if (m_current != Screen::Login) show_(Screen::Login, true);
    emit notice(QStringLiteral("Your session has ended. Please sign in again."), true);
}
