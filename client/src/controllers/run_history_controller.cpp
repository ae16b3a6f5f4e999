#include "controllers/run_history_controller.h"

#include "log/logger.h"
#include "net/api_client.h"

RunHistoryController::RunHistoryController(ApiClient* api, QObject* parent)
    : ScreenController(api, parent)
{
}

void RunHistoryController::onActivated()
{
    m_runs.clear();
    m_total = 0;
    reload();
}

void RunHistoryController::onDeactivated()
{
    m_runs.clear();
    m_providers.clear();
    m_models.clear();
}

void RunHistoryController::reload()
{
    if (m_project.id.isEmpty()) {
        fail(ApiError::api(0, "No project selected."));
        return;
    }
    setState(State::Loading);
    loadRuns_();
    // a refresh cancels whatever was in flight, choices included
    loadChoices_();
}

void RunHistoryController::loadRuns_()
{
    api()->listRuns(m_project.id, kRunLimit, 0, token(), [this](const ApiResult<ProcessingRunsPage>& r) {
        if (!r.ok) {
            fail(r.error);
            return;
        }
        m_runs = r.value.items;
        m_total = r.value.total;
        setState(State::Loaded);
        emit runsChanged();
    });
}

void RunHistoryController::loadChoices_()
{
    api()->listAudioProviders(token(), [this](const ApiResult<QList<AudioProvider>>& r) {
        if (!r.ok) {
            gme::Logger::warn(("audio providers unavailable: " + r.error.message).toStdString(), "ui");
            return;
        }
        m_providers.clear();
        for (const auto& p : r.value) {
            if (!p.code.isEmpty()) m_providers.append(p);
        }
        emit providersChanged();
    });

    api()->listVideoModels(token(), [this](const ApiResult<QStringList>& r) {
        if (!r.ok) {
            gme::Logger::warn(("video models unavailable: " + r.error.message).toStdString(), "ui");
            return;
        }
        m_models = r.value;
        emit providersChanged();
    });
}

QString RunHistoryController::validate(const RunOptions& options) const
{
    if (m_project.id.isEmpty()) return QStringLiteral("No project selected.");
    const QString mode = options.processingMode;
    const bool needsAudio = mode == "audio_only" || mode == "audio_and_video";
    if (needsAudio) {
        if (options.audioProvider.isEmpty()) {
            return QStringLiteral("No audio provider fits the selected mode.");
        }
        bool known = m_providers.isEmpty();
        for (const auto& p : providersForMode(m_providers, mode)) {
            if (p.code == options.audioProvider) known = true;
        }
        if (!known) {
            return QString("Provider %1 cannot be used for %2.").arg(options.audioProvider, mode);
        }
    }
    return {};
}

void RunHistoryController::startRun(const RunOptions& options)
{
    if (!isActive() || state() == State::Loading) return;
    const QString problem = validate(options);
    if (!problem.isEmpty()) {
        emit validationFailed(problem);
        return;
    }

    setState(State::Loading);
    api()->startRun(m_project.id, options, token(), [this](const ApiResult<ProcessingRun>& r) {
        if (!r.ok) {
            fail(r.error);
            return;
        }
        gme::Logger::info(("run started for project " + m_project.id + ", status " + r.value.status)
                              .toStdString(), "ui");
        emit runStarted(r.value);
        loadRuns_();
    });
}
