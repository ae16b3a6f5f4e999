#undef NDEBUG
#include "test_support.h"

#include <cassert>
#include <iostream>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "controllers/login_controller.h"
#include "controllers/navigator.h"
#include "controllers/project_create_controller.h"
#include "controllers/project_list_controller.h"
#include "controllers/run_history_controller.h"
#include "core/app_context.h"
#include "core/session_store.h"
#include "net/api_client.h"

using test_support::MockBackend;
using test_support::json;
using test_support::waitUntil;

using State = ScreenController::State;

static void sign_in(ApiClient& api) {
    bool done = false;
    api.login("alice", "password1", CancelToken(), [&](const ApiResult<UserSummary>& r) {
        assert(r.ok);
        done = true;
    });
    assert(waitUntil([&]() { return done; }));
}

static QString write_video(const QString& dir, const QString& name) {
    const QString path = QDir(dir).filePath(name);
    QFile f(path);
    assert(f.open(QIODevice::WriteOnly));
    f.write("fake mp4 payload");
    return path;
}

static void test_form_validation(const QString& dir) {
    assert(LoginController::validateLogin("", "x") == "Enter login and password.");
    assert(LoginController::validateLogin("alice", "").size() > 0);
    assert(LoginController::validateLogin("alice", "secret").isEmpty());
    assert(LoginController::validateRegistration("al", "password1", "password1") ==
           "Login must be at least 3 characters.");
    assert(LoginController::validateRegistration("alice", "short", "short") ==
           "Password must be at least 8 characters.");
    assert(LoginController::validateRegistration("alice", "password1", "password2") ==
           "Passwords do not match.");
    assert(LoginController::validateRegistration("alice", "password1", "password1").isEmpty());

    NewProject draft;
    draft.name = "  ab ";
    assert(ProjectCreateController::validate(draft) == "Project name must be at least 3 characters.");
    draft.name = "Keynote";
    assert(ProjectCreateController::validate(draft).isEmpty());
    draft.startProcessing = true;
    assert(ProjectCreateController::validate(draft) == "Select a video to start processing right away.");
    draft.videoPath = QDir(dir).filePath("missing.mp4");
    assert(ProjectCreateController::validate(draft).startsWith("Video file not found: "));
    draft.videoPath = write_video(dir, "keynote.mp4");
    assert(ProjectCreateController::validate(draft).isEmpty());

    const QString locked = write_video(dir, "locked.mp4");
    assert(QFile::setPermissions(locked, QFileDevice::Permissions()));
    draft.videoPath = locked;
    if (QFileInfo(locked).isReadable()) {
        std::cout << "[SKIP] unreadable video validation: file is still readable\n";
    } else {
        assert(ProjectCreateController::validate(draft).startsWith("Cannot read video file: "));
    }
    QFile::setPermissions(locked, QFileDevice::ReadOwner | QFileDevice::WriteOwner);

    Project p;
    p.name = "Keynote";
    p.description = "Annual CONFERENCE talk";
    assert(ProjectListController::matchesFilter(p, ""));
    assert(ProjectListController::matchesFilter(p, "key"));
    assert(ProjectListController::matchesFilter(p, "conference"));
    assert(!ProjectListController::matchesFilter(p, "podcast"));
    std::cout << "[OK] form validation\n";
}

static void test_state_transitions(MockBackend& mock, const QString& dir) {
    ApiClient api(mock.config(dir));
    sign_in(api);

    ProjectListController list(&api);
    QList<State> seen;
    QObject::connect(&list, &ScreenController::stateChanged, [&](State s) { seen.append(s); });
    int changed = 0;
    QObject::connect(&list, &ProjectListController::dataChanged, [&]() { ++changed; });

    assert(list.state() == State::Idle);
    list.activate();
    assert(list.state() == State::Loading);
    assert(waitUntil([&]() { return list.state() == State::Loaded; }));
    assert(changed == 1);
    assert(list.projects().size() == 2);
    assert(seen == QList<State>({State::Loading, State::Loaded}));

    // latest run per project, newest first across projects
    assert(list.hasLatestRun("p1"));
    assert(list.latestRun("p1").status == "completed");
    assert(!list.hasLatestRun("p2"));
    const ProjectMetrics m = list.metrics();
    assert(m.total == 2);
    assert(m.active == 2);
    assert(m.withRuns == 1);
    const QList<RecentRun> recent = list.recentRuns();
    assert(recent.size() == 1);
    assert(recent.first().projectName == "Lecture");

    list.setFilter("interv");
    assert(list.filteredProjects().size() == 1);
    assert(list.filteredProjects().first().name == "Interview");
    list.setFilter("");

    list.refresh();
    assert(list.state() == State::Loading);
    assert(waitUntil([&]() { return list.state() == State::Loaded; }));
    assert(changed == 2);

    list.deactivate();
    assert(!list.isActive());
    assert(list.projects().isEmpty());
    // retry is a no-op on an inactive screen
    list.retry();
    assert(list.state() == State::Loaded);
    std::cout << "[OK] list screen goes Idle -> Loading -> Loaded\n";
}

static void test_late_reply_discarded(MockBackend& mock, const QString& dir) {
    ApiClient api(mock.config(dir));
    sign_in(api);

    ProjectListController list(&api);
    int changed = 0;
    int errors = 0;
    QObject::connect(&list, &ProjectListController::dataChanged, [&]() { ++changed; });
    QObject::connect(&list, &ScreenController::errorOccurred, [&](const QString&) { ++errors; });

    mock.setDelayMs(300);
    list.activate();
    assert(list.state() == State::Loading);
    list.deactivate();
    test_support::spin(700);
    mock.setDelayMs(0);

    assert(changed == 0);
    assert(errors == 0);
    assert(list.projects().isEmpty());
    assert(api.dispatcher()->inFlight() == 0);
    std::cout << "[OK] replies for a left screen are discarded\n";
}

static void test_timeout_then_retry(MockBackend& mock, const QString& dir) {
    ApiClient api(mock.config(dir, 1.0));
    sign_in(api);

    ProjectListController list(&api);
    QString shown;
    QObject::connect(&list, &ScreenController::errorOccurred, [&](const QString& m) { shown = m; });

    mock.setDelayMs(1500);
    list.activate();
    assert(waitUntil([&]() { return list.state() == State::Error; }, 4000));
    mock.setDelayMs(0);
    assert(list.lastError().isTimeout());
    assert(shown == "The server did not respond within 1 s.");
    assert(list.errorMessage() == shown);

    // let the slow handler finish before retrying
    test_support::spin(700);
    list.retry();
    assert(list.state() == State::Loading);
    assert(waitUntil([&]() { return list.state() == State::Loaded; }));
    assert(!list.lastError().isError());
    assert(list.projects().size() == 2);
    std::cout << "[OK] timeout leaves the screen in Error with a working retry\n";
}

static void test_refresh_reloads_choices(MockBackend& mock, const QString& dir, const std::string& projectId) {
    ApiClient api(mock.config(dir));
    sign_in(api);

    RunHistoryController history(&api);
    Project project;
    project.id = QString::fromStdString(projectId);
    project.name = "Lecture";
    history.setProject(project);

    // runs answer at once, the provider list is still in flight on refresh
    mock.setPathDelayMs("/providers", 600);
    history.activate();
    assert(waitUntil([&]() { return history.state() == State::Loaded; }));
    assert(history.audioProviders().isEmpty());
    history.refresh();
    assert(waitUntil([&]() {
        return history.state() == State::Loaded && history.audioProviders().size() == 2 &&
               history.videoModels().size() == 2;
    }, 4000));
    mock.setPathDelayMs("/providers", 0);
    assert(history.runs().size() == 1);
    history.deactivate();
    test_support::spin(700);
    std::cout << "[OK] refresh reloads providers and models\n";
}

static void test_end_to_end(MockBackend& mock, const QString& dir) {
    AppContext ctx(mock.config(dir));
    Navigator nav(&ctx);
    QList<Navigator::Screen> screens;
    QObject::connect(&nav, &Navigator::screenChanged, [&](Navigator::Screen s) { screens.append(s); });

    nav.start();
    assert(nav.current() == Navigator::Screen::Login);
    assert(nav.login()->state() == State::Idle);

    // everything but Login needs a session
    nav.navigate(Navigator::Screen::ProjectCreate);
    assert(nav.current() == Navigator::Screen::Login);

    QString invalid;
    QObject::connect(nav.login(), &LoginController::validationFailed, [&](const QString& m) { invalid = m; });
    nav.login()->signIn("alice", "", false);
    assert(invalid == "Enter login and password.");
    assert(nav.login()->state() == State::Idle);

    nav.login()->signIn("alice", "password1", true);
    assert(nav.login()->state() == State::Loading);
    assert(waitUntil([&]() {
        return nav.current() == Navigator::Screen::ProjectList &&
               nav.projectList()->state() == State::Loaded;
    }));
    assert(ctx.isLoggedIn());
    assert(ctx.currentUser().login == "alice");
    assert(!ctx.loginTime().isEmpty());
    assert(ctx.sessions()->current().remembered);
    const int before = nav.projectList()->projects().size();

    nav.navigate(Navigator::Screen::ProjectCreate);
    assert(nav.current() == Navigator::Screen::ProjectCreate);
    NewProject draft;
    draft.name = "Product demo";
    draft.description = "launch video";
    draft.videoPath = write_video(dir, "demo.mp4");
    draft.startProcessing = true;
    nav.projectCreate()->submit(draft);
    assert(waitUntil([&]() {
        return nav.current() == Navigator::Screen::ProjectList &&
               nav.projectList()->state() == State::Loaded;
    }));
    const QString createdId = nav.projectCreate()->created().id;
    assert(!createdId.isEmpty());
    assert(nav.projectList()->projects().size() == before + 1);
    const Project created = nav.projectList()->projectById(createdId);
    assert(created.name == "Product demo");
    assert(created.videoReference == "uploads/demo.mp4");
    assert(nav.projectList()->hasLatestRun(createdId));
    assert(nav.projectList()->latestRun(createdId).status == "started");
    assert(mock.lastUploadName() == "demo.mp4");

    nav.openRunHistory(created);
    RunHistoryController* history = nav.runHistory();
    assert(nav.current() == Navigator::Screen::RunHistory);
    assert(waitUntil([&]() {
        return history->state() == State::Loaded && history->audioProviders().size() == 2 &&
               history->videoModels().size() == 2;
    }));
    assert(history->runs().size() == 1);

    QString rejected;
    QObject::connect(history, &RunHistoryController::validationFailed, [&](const QString& m) { rejected = m; });
    RunOptions wrong;
    wrong.processingMode = "audio_and_video";
    wrong.audioProvider = "voicekit";
    history->startRun(wrong);
    assert(rejected == "Provider voicekit cannot be used for audio_and_video.");
    assert(history->state() == State::Loaded);

    ProcessingRun started;
    QObject::connect(history, &RunHistoryController::runStarted, [&](const ProcessingRun& r) { started = r; });
    RunOptions opt;
    opt.processingMode = "audio_only";
    opt.audioProvider = "voicekit";
    history->startRun(opt);
    assert(history->state() == State::Loading);
    assert(waitUntil([&]() { return history->state() == State::Loaded && history->runs().size() == 2; }));
    assert(started.status == "started");
    assert(history->runs().first().id == started.id);
    assert(history->runs().first().provider == "voicekit");
    assert(mock.lastStartBody()["processing_mode"] == "audio_only");

    nav.navigate(Navigator::Screen::ProjectList);
    assert(waitUntil([&]() { return nav.projectList()->state() == State::Loaded; }));
    assert(nav.projectList()->latestRun(createdId).id == started.id);
    assert(!history->isActive());
    assert(history->runs().isEmpty());

    assert(screens.first() == Navigator::Screen::Login);
    assert(screens.last() == Navigator::Screen::ProjectList);
    std::cout << "[OK] sign in, create a project, start a run, see it listed\n";
}

static void test_remembered_session_restores(MockBackend& mock, const QString& dir) {
    // test_end_to_end signed in with remember=true against the same data dir
    AppContext ctx(mock.config(dir));
    Navigator nav(&ctx);
    nav.start();
    assert(nav.login()->state() == State::Loading);
    assert(waitUntil([&]() { return nav.current() == Navigator::Screen::ProjectList; }));
    assert(ctx.currentUser().login == "alice");
    assert(ctx.sessions()->current().remembered);
    assert(!ctx.api()->sessionToken().isEmpty());
    std::cout << "[OK] remembered session is restored on the next start\n";
}

static void test_session_not_remembered(MockBackend& mock, const QString& dir) {
    {
        AppContext ctx(mock.config(dir));
        Navigator nav(&ctx);
        nav.start();
        nav.login()->signIn("alice", "password1", false);
        assert(waitUntil([&]() { return nav.current() == Navigator::Screen::ProjectList; }));
        assert(!ctx.sessions()->current().remembered);
    }
    AppContext ctx(mock.config(dir));
    Navigator nav(&ctx);
    nav.start();
    assert(nav.current() == Navigator::Screen::Login);
    assert(nav.login()->state() == State::Idle);
    assert(!ctx.isLoggedIn());
    assert(nav.login()->lastLogin() == "alice");
    std::cout << "[OK] a session without remember is not restored\n";
}

static void test_registration(MockBackend& mock, const QString& dir) {
    AppContext ctx(mock.config(dir));
    Navigator nav(&ctx);
    nav.start();

    nav.login()->registerAccount("alice", "a@example.com", "password1", "password1");
    assert(waitUntil([&]() { return nav.login()->state() == State::Error; }));
    assert(nav.login()->errorMessage() == "Login already taken");
    assert(nav.current() == Navigator::Screen::Login);

    nav.login()->registerAccount("bob", "bob@example.com", "password2", "password2");
    assert(waitUntil([&]() { return nav.current() == Navigator::Screen::ProjectList; }));
    assert(ctx.currentUser().login == "bob");
    assert(ctx.sessions()->current().remembered);
    std::cout << "[OK] registration signs the new account in\n";
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QTemporaryDir dir;
    assert(dir.isValid());

    MockBackend mock;
    mock.addUser("alice", "password1");
    const std::string lecture = mock.addProject("Lecture", "first", "draft");
    mock.addProject("Interview", "second", "in_progress");
    mock.addRun(lecture, "completed");
    mock.addAudioProvider(json{{"code", "voicekit"}, {"title", "Voice Kit"},
                               {"supports_audio", true}, {"supports_video", false}});
    mock.addAudioProvider(json{{"code", "avatarify"}, {"title", "Avatarify"}, {"supports_audio", true},
                               {"supports_video", true}, {"is_video_provider", true}});
    assert(mock.start());

    test_form_validation(dir.path());
    test_state_transitions(mock, dir.path());
    test_late_reply_discarded(mock, dir.path());
    test_timeout_then_retry(mock, dir.path());
    test_refresh_reloads_choices(mock, dir.path(), lecture);

    QTemporaryDir sessionDir;
    test_end_to_end(mock, sessionDir.path());
    test_remembered_session_restores(mock, sessionDir.path());

    QTemporaryDir otherDir;
    test_session_not_remembered(mock, otherDir.path());
    QTemporaryDir regDir;
    test_registration(mock, regDir.path());

    mock.stop();
    std::cout << "All controller tests passed.\n";
    return 0;
}
