#pragma once
#include <QHash>
#include <QList>

#include "controllers/screen_controller.h"
#include "models/processing_run.h"
#include "models/project.h"

struct ProjectMetrics {
    int total = 0;
    int active = 0;       // draft + in_progress
    int done = 0;
    int withRuns = 0;
};

struct RecentRun {
    ProcessingRun run;
    QString projectName;
};

// Dashboard: the user's projects, the latest run of each, a text filter over
// title/description and the summary counters shown above the tables.
class ProjectListController : public ScreenController {
    Q_OBJECT
public:
    static constexpr int kProjectLimit = 100;
    static constexpr int kLatestRunProjects = 30;
    static constexpr int kRecentRunRows = 20;

    explicit ProjectListController(ApiClient* api, QObject* parent = nullptr);

    void refresh() { retry(); }

    const QList<Project>& projects() const { return m_projects; }
    QList<Project> filteredProjects() const;
    bool hasLatestRun(const QString& projectId) const { return m_latestRuns.contains(projectId); }
    ProcessingRun latestRun(const QString& projectId) const { return m_latestRuns.value(projectId); }
    Project projectById(const QString& id) const;

    void setFilter(const QString& text);
    QString filter() const { return m_filter; }

    ProjectMetrics metrics() const;
    QList<RecentRun> recentRuns() const;

    static bool matchesFilter(const Project& p, const QString& filter);

signals:
    void dataChanged();
    void filterChanged(const QString& text);

protected:
    void onActivated() override { reload(); }
    void onDeactivated() override;
    void reload() override;

private:
    void fetchLatestRuns_();
    void runFetched_();

private:
    QList<Project> m_projects;
    QHash<QString, ProcessingRun> m_latestRuns;
    QString m_filter;
    int m_pendingRuns = 0;
};
