#pragma once
#include <QMainWindow>
#include <memory>

#include "controllers/navigator.h"

class AppContext;
class ConsoleDock;
class ConsoleDockLogSink;
class CreateProjectPage;
class LoginPage;
class ProjectListPage;
class QStackedWidget;
class RunHistoryPage;
class UserBarWidget;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    MainWindow(AppContext* ctx, Navigator* nav, QWidget* parent = nullptr);
    ~MainWindow() override;

private slots:
    void onScreenChanged(Navigator::Screen screen);
    void onNotice(const QString& message, bool isError);

private:
    void setupUserBar();
    void setupCentralPages();
    void setupConsole();
    void wireSignals();

    AppContext* ctx_ = nullptr;
    Navigator* nav_ = nullptr;

    UserBarWidget* userBar_ = nullptr;
    QStackedWidget* centralStack_ = nullptr;
    LoginPage* loginPage_ = nullptr;
    ProjectListPage* projectsPage_ = nullptr;
    CreateProjectPage* createPage_ = nullptr;
    RunHistoryPage* runsPage_ = nullptr;

    ConsoleDock* console_ = nullptr;
    std::shared_ptr<ConsoleDockLogSink> consoleSink_;
};
