#include "ui/main_window.h"

#include <QStackedWidget>
#include <QStatusBar>

#include "core/app_context.h"
#include "core/session_store.h"
#include "log/log_manager.h"
#include "log/logger.h"
#include "ui/console_dock.h"
#include "ui/login_page.h"
#include "ui/user_bar_widget.h"
#include "view/create_project_page.h"
#include "view/project_list_page.h"
#include "view/run_history_page.h"

MainWindow::MainWindow(AppContext* ctx, Navigator* nav, QWidget *parent)
    : QMainWindow(parent),
      ctx_(ctx),
      nav_(nav)
{
    setWindowTitle("GME Client");
    resize(1280, 820);

    setupUserBar();
    setupCentralPages();
    setupConsole();
    wireSignals();
}

MainWindow::~MainWindow()
{
    gme::LogManager::instance().removeSink(consoleSink_);
}

void MainWindow::setupUserBar() {
    userBar_ = new UserBarWidget(this);
    userBar_->setServer(ctx_->config().management_url());
    setMenuWidget(userBar_);

    connect(userBar_, &UserBarWidget::logoutClicked, nav_, &Navigator::logout);
    connect(userBar_, &UserBarWidget::projectsClicked, this, [this]() {
        nav_->navigate(Navigator::Screen::ProjectList);
    });
}

void MainWindow::setupCentralPages() {
    centralStack_ = new QStackedWidget(this);
    loginPage_ = new LoginPage(nav_->login(), this);
    projectsPage_ = new ProjectListPage(nav_->projectList(), this);
    createPage_ = new CreateProjectPage(nav_->projectCreate(), this);
    runsPage_ = new RunHistoryPage(nav_->runHistory(), this);

    // index == Navigator::Screen
    centralStack_->addWidget(loginPage_);
    centralStack_->addWidget(projectsPage_);
    centralStack_->addWidget(createPage_);
    centralStack_->addWidget(runsPage_);

    setCentralWidget(centralStack_);
}

void MainWindow::setupConsole() {
    console_ = new ConsoleDock(this);
    console_->setAllowedAreas(Qt::BottomDockWidgetArea);
    console_->setFeatures(QDockWidget::NoDockWidgetFeatures);
    addDockWidget(Qt::BottomDockWidgetArea, console_);

    consoleSink_ = std::make_shared<ConsoleDockLogSink>(console_);
    gme::LogManager::instance().addSink(consoleSink_);
    console_->appendInfo("App started");
}

void MainWindow::wireSignals() {
    connect(nav_, &Navigator::screenChanged, this, &MainWindow::onScreenChanged);
    connect(nav_, &Navigator::notice, this, &MainWindow::onNotice);

    connect(projectsPage_, &ProjectListPage::createRequested, this, [this]() {
        nav_->navigate(Navigator::Screen::ProjectCreate);
    });
    connect(projectsPage_, &ProjectListPage::projectOpened, nav_, &Navigator::openRunHistory);
    connect(createPage_, &CreateProjectPage::cancelled, this, [this]() {
        nav_->navigate(Navigator::Screen::ProjectList);
    });
    connect(runsPage_, &RunHistoryPage::backRequested, this, [this]() {
        nav_->navigate(Navigator::Screen::ProjectList);
    });

    connect(ctx_, &AppContext::currentUserChanged, this, [this](const UserProfile& user) {
        userBar_->setUsername(user.uiName());
        userBar_->setRole(user.role);
        userBar_->setLoginTime(ctx_->sessions()->current().startedAt);
        userBar_->setSignedIn(user.isValid());
    });
}

void MainWindow::onScreenChanged(Navigator::Screen screen)
{
    switch (screen) {
    case Navigator::Screen::Login:
        loginPage_->prepare();
        break;
    case Navigator::Screen::ProjectCreate:
        createPage_->reset();
        break;
    case Navigator::Screen::RunHistory:
        runsPage_->prepare();
        break;
    case Navigator::Screen::ProjectList:
        break;
    }
    centralStack_->setCurrentIndex(static_cast<int>(screen));
}

void MainWindow::onNotice(const QString& message, bool isError)
{
    if (nav_->current() == Navigator::Screen::Login) {
        loginPage_->showNotice(message, isError);
    }
    statusBar()->showMessage(message, 8000);
    if (isError) console_->appendError(message);
}
