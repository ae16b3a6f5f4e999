#include "controllers/project_list_controller.h"

#include <algorithm>

#include "log/logger.h"
#include "net/api_client.h"

ProjectListController::ProjectListController(ApiClient* api, QObject* parent)
    : ScreenController(api, parent)
{
}

void ProjectListController::onDeactivated()
{
    // nothing survives the screen
    m_projects.clear();
    m_latestRuns.clear();
    m_pendingRuns = 0;
}

void ProjectListController::reload()
{
    setState(State::Loading);
    m_pendingRuns = 0;

    ProjectQuery q;
    q.limit = kProjectLimit;
    api()->listProjects(q, token(), [this](const ApiResult<ProjectsPage>& r) {
        if (!r.ok) {
            fail(r.error);
            return;
        }
        m_projects = r.value.items;
        m_latestRuns.clear();
        fetchLatestRuns_();
    });
}

void ProjectListController::fetchLatestRuns_()
{
    const int n = std::min<int>(kLatestRunProjects, m_projects.size());
    if (n == 0) {
        setState(State::Loaded);
        emit dataChanged();
        return;
    }

    m_pendingRuns = n;
    for (int i = 0; i < n; ++i) {
        const QString projectId = m_projects.at(i).id;
        api()->listRuns(projectId, 1, 0, token(), [this, projectId](const ApiResult<ProcessingRunsPage>& r) {
            if (state() != State::Loading) return;
            if (!r.ok) {
                if (r.error.isAuth()) {
                    m_pendingRuns = 0;
                    fail(r.error);
                    return;
                }
                gme::Logger::debug(("latest run of " + projectId + " unavailable: " + r.error.message)
                                       .toStdString(), "ui");
            } else if (!r.value.items.isEmpty()) {
                m_latestRuns.insert(projectId, r.value.items.first());
            }
            runFetched_();
        });
    }
}

void ProjectListController::runFetched_()
{
    if (--m_pendingRuns > 0) return;
    setState(State::Loaded);
    emit dataChanged();
}

Project ProjectListController::projectById(const QString& id) const
{
    for (const auto& p : m_projects) {
        if (p.id == id) return p;
    }
    return {};
}

bool ProjectListController::matchesFilter(const Project& p, const QString& filter)
{
    const QString f = filter.trimmed();
    if (f.isEmpty()) return true;
    return p.name.contains(f, Qt::CaseInsensitive) || p.description.contains(f, Qt::CaseInsensitive);
}

QList<Project> ProjectListController::filteredProjects() const
{
    QList<Project> out;
    for (const auto& p : m_projects) {
        if (matchesFilter(p, m_filter)) out.append(p);
    }
    return out;
}

void ProjectListController::setFilter(const QString& text)
{
    if (text == m_filter) return;
    m_filter = text;
    emit filterChanged(m_filter);
}

ProjectMetrics ProjectListController::metrics() const
{
    ProjectMetrics m;
    m.total = m_projects.size();
    for (const auto& p : m_projects) {
        if (p.isActive()) ++m.active;
        if (p.status == "done") ++m.done;
        if (m_latestRuns.contains(p.id)) ++m.withRuns;
    }
    return m;
}

QList<RecentRun> ProjectListController::recentRuns() const
{
    QList<RecentRun> out;
    for (const auto& p : m_projects) {
        auto it = m_latestRuns.constFind(p.id);
        if (it == m_latestRuns.constEnd()) continue;
        out.append(RecentRun{it.value(), p.name});
    }
    std::stable_sort(out.begin(), out.end(), [](const RecentRun& a, const RecentRun& b) {
        return a.run.startedAt > b.run.startedAt;
    });
    if (out.size() > kRecentRunRows) out = out.mid(0, kRecentRunRows);
    return out;
}
