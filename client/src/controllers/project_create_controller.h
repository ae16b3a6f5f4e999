#pragma once
#include "controllers/screen_controller.h"
#include "models/project.h"
#include "net/api_client.h"

class ProjectCreateController : public ScreenController {
    Q_OBJECT
public:
    static constexpr int kMinNameLength = 3;

    explicit ProjectCreateController(ApiClient* api, QObject* parent = nullptr);

    // Empty string when the form is acceptable.
    static QString validate(const NewProject& draft);

    void submit(const NewProject& draft);

    const Project& created() const { return m_created; }

signals:
    void validationFailed(const QString& message);
    void projectCreated(const Project& project);

protected:
    void onActivated() override { m_created = Project{}; m_draft = NewProject{}; }
    // resubmits the last draft
    void reload() override;

private:
    Project m_created;
    NewProject m_draft;
};
