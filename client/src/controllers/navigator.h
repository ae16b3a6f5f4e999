#pragma once
#include <QObject>
#include <QString>

#include "core/cancel_token.h"
#include "models/project.h"
#include "models/user.h"

class AppContext;
class LoginController;
class ProjectCreateController;
class ProjectListController;
class RunHistoryController;
class ScreenController;

// Decides which screen is shown. Without a session only Login is reachable;
// logout and any 401 from an authenticated call end the session and come
// back here.
class Navigator : public QObject {
    Q_OBJECT
public:
    enum class Screen {
        Login,
        ProjectList,
        ProjectCreate,
        RunHistory
    };
    Q_ENUM(Screen)

    explicit Navigator(AppContext* ctx, QObject* parent = nullptr);
    ~Navigator() override;

    static Screen resolve(Screen requested, bool hasSession);
    static QString screenName(Screen s);

    // restores a remembered session when there is one, else shows Login
    void start();

    void navigate(Screen screen);
    void openRunHistory(const Project& project);
    void logout();
    void handleAuthFailure();

    Screen current() const { return m_current; }
    ScreenController* controller(Screen s) const;

    LoginController* login() const { return m_login; }
    ProjectListController* projectList() const { return m_projectList; }
    ProjectCreateController* projectCreate() const { return m_projectCreate; }
    RunHistoryController* runHistory() const { return m_runHistory; }

signals:
    void screenChanged(Navigator::Screen screen);
    void notice(const QString& message, bool isError);

private:
    void onSignedIn_(const UserProfile& user);
    void show_(Screen screen, bool force);

private:
    AppContext* m_ctx = nullptr;
    LoginController* m_login = nullptr;
    ProjectListController* m_projectList = nullptr;
    ProjectCreateController* m_projectCreate = nullptr;
    RunHistoryController* m_runHistory = nullptr;
    Screen m_current = Screen::Login;
    bool m_started = false;
    CancelSource m_logoutCancel;
};
