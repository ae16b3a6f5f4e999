#pragma once
#include <QList>
#include <QStringList>

#include "controllers/screen_controller.h"
#include "models/audio_provider.h"
#include "models/processing_run.h"
#include "models/project.h"

struct RunOptions;

// Runs of one project plus the choices needed to start a new one (audio
// providers, video models). Providers and models are best effort: their
// failures are logged and leave the lists empty.
class RunHistoryController : public ScreenController {
    Q_OBJECT
public:
    static constexpr int kRunLimit = 20;

    explicit RunHistoryController(ApiClient* api, QObject* parent = nullptr);

    // set before activate(); the navigator passes it as a route parameter
    void setProject(const Project& project) { m_project = project; }
    const Project& project() const { return m_project; }

    const QList<ProcessingRun>& runs() const { return m_runs; }
    int totalRuns() const { return m_total; }
    const QList<AudioProvider>& audioProviders() const { return m_providers; }
    const QStringList& videoModels() const { return m_models; }

    // Empty string when the options are acceptable.
    QString validate(const RunOptions& options) const;
    void startRun(const RunOptions& options);
    void refresh() { retry(); }

signals:
    void runsChanged();
    void providersChanged();
    void runStarted(const ProcessingRun& run);
    void validationFailed(const QString& message);

protected:
    void onActivated() override;
    void onDeactivated() override;
    void reload() override;

private:
    void loadRuns_();
    void loadChoices_();

private:
    Project m_project;
    QList<ProcessingRun> m_runs;
    int m_total = 0;
    QList<AudioProvider> m_providers;
    QStringList m_models;
};
