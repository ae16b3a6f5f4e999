#pragma once

#include <QJsonObject>
#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>
#include <functional>

#include "core/cancel_token.h"
#include "net/api_error.h"
#include "net/request_dispatcher.h"
#include "models/audio_provider.h"
#include "models/processing_run.h"
#include "models/project.h"
#include "models/user.h"

namespace gme { class Config; }

struct ProjectQuery {
    QString search;
    int limit = 100;
    int offset = 0;
};

struct NewProject {
    QString name;
    QString description;
    QString videoPath;          // local file, optional
    bool startProcessing = false;
};

struct RunOptions {
    QString launchMode = "immediate";
    QString processingMode;     // video_only / audio_only / audio_and_video; empty = backend default
    QString audioProvider;
    QString model;
};

// Typed operations against the management, video and audio services. Every
// call takes a CancelToken and a callback that receives exactly one
// ApiResult on the UI thread, unless the token was cancelled first.
class ApiClient : public QObject {
    Q_OBJECT
public:
    template <typename T>
    using Callback = std::function<void(const ApiResult<T>&)>;

    explicit ApiClient(const gme::Config& cfg, QObject* parent = nullptr);

    QString baseUrl() const { return baseUrl_; }
    QString videoServiceUrl() const { return videoUrl_; }
    QString audioServiceUrl() const { return audioUrl_; }
    QString cookieName() const { return cookieName_; }

    void setSessionToken(const QString& token);
    QString sessionToken() const { return token_; }
    void clearSessionToken();

    RequestDispatcher* dispatcher() const { return dispatcher_; }

    void registerUser(const QString& login, const QString& password, const QString& email,
                      const CancelToken& token, Callback<QJsonObject> cb);
    void login(const QString& login, const QString& password,
               const CancelToken& token, Callback<UserSummary> cb);
    void logout(const CancelToken& token, Callback<bool> cb);
    void currentUser(const CancelToken& token, Callback<UserProfile> cb);

    void listProjects(const ProjectQuery& query, const CancelToken& token, Callback<ProjectsPage> cb);
    void createProject(const NewProject& project, const CancelToken& token, Callback<Project> cb);

    void startRun(const QString& projectId, const RunOptions& options,
                  const CancelToken& token, Callback<ProcessingRun> cb);
    void listRuns(const QString& projectId, int limit, int offset,
                  const CancelToken& token, Callback<ProcessingRunsPage> cb);

    void listVideoModels(const CancelToken& token, Callback<QStringList> cb);
    void listAudioProviders(const CancelToken& token, Callback<QList<AudioProvider>> cb);

signals:
    void unauthorized();

private:
    QUrl managementUrl_(const QString& path) const;
    QByteArray sessionCookieHeader_() const;
    void resetCookieJar_();

    template <typename T>
    void sendDecoded_(const HttpCall& call, const CancelToken& token, Callback<T> cb,
                      std::function<ApiResult<T>(const HttpReply&)> decode);

private:
    RequestDispatcher* dispatcher_ = nullptr;
    QString baseUrl_;
    QString videoUrl_;
    QString audioUrl_;
    QString audioApiKey_;
    QString cookieName_;
    QString token_;
};
