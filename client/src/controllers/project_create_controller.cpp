#include "controllers/project_create_controller.h"

#include <QFileInfo>

#include "log/logger.h"
#include "net/api_client.h"

ProjectCreateController::ProjectCreateController(ApiClient* api, QObject* parent)
    : ScreenController(api, parent)
{
}

QString ProjectCreateController::validate(const NewProject& draft)
{
    if (draft.name.trimmed().size() < kMinNameLength) {
        return QString("Project name must be at least %1 characters.").arg(kMinNameLength);
    }
    const QString path = draft.videoPath.trimmed();
    if (!path.isEmpty()) {
        const QFileInfo info(path);
        if (!info.exists() || !info.isFile()) {
            return QString("Video file not found: %1").arg(path);
        }
        if (!info.isReadable()) {
            return QString("Cannot read video file: %1").arg(path);
        }
    }
    if (draft.startProcessing && path.isEmpty()) {
        return QStringLiteral("Select a video to start processing right away.");
    }
    return {};
}

void ProjectCreateController::submit(const NewProject& draft)
{
    if (!isActive() || state() == State::Loading) return;
    const QString problem = validate(draft);
    if (!problem.isEmpty()) {
        emit validationFailed(problem);
        return;
    }

    m_draft = draft;
    setState(State::Loading);
    api()->createProject(draft, token(), [this](const ApiResult<Project>& r) {
        if (!r.ok) {
            fail(r.error);
            return;
        }
        m_created = r.value;
        gme::Logger::info(("project created: " + m_created.id + " " + m_created.name).toStdString(), "ui");
        setState(State::Loaded);
        emit projectCreated(m_created);
    });
}

void ProjectCreateController::reload()
{
    if (m_draft.name.isEmpty()) return;
    submit(m_draft);
}
