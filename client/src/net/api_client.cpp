#include "net/api_client.h"

#include <QFile>
#include <QFileInfo>
#include <QHttpMultiPart>
#include <QHttpPart>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMimeDatabase>
#include <QNetworkAccessManager>
#include <QNetworkCookieJar>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrlQuery>

#include "core/config.h"
#include "log/logger.h"

namespace {

constexpr const char* kApiKeyHeaderName = "X-API-Key";

QByteArray compactJson(const QJsonObject& obj)
{
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

QHttpPart textPart(const QString& name, const QString& value)
{
    QHttpPart part;
    part.setHeader(QNetworkRequest::ContentDispositionHeader,
                   QString("form-data; name=\"%1\"").arg(name));
    part.setBody(value.toUtf8());
    return part;
}

ApiError unexpectedPayload(const QString& what)
{
    return ApiError::api(0, QString("Unexpected response from the server: %1").arg(what));
}

} // namespace

ApiClient::ApiClient(const gme::Config& cfg, QObject* parent)
    : QObject(parent),
      baseUrl_(cfg.management_url()),
      videoUrl_(cfg.video_service_url()),
      audioUrl_(cfg.audio_service_url()),
      audioApiKey_(cfg.audio_service_api_key()),
      cookieName_(cfg.session_cookie_name())
{
    RequestDispatcher::Options opt;
    opt.timeoutMs = cfg.timeout_ms();
    opt.maxRetries = cfg.max_retries();
    opt.retryBackoffMs = cfg.retry_backoff_ms();
    dispatcher_ = new RequestDispatcher(opt, this);
    resetCookieJar_();

    connect(dispatcher_, &RequestDispatcher::unauthorized, this, &ApiClient::unauthorized);
}

void ApiClient::resetCookieJar_()
{
    // the manager takes ownership and deletes the previous jar
    dispatcher_->network()->setCookieJar(new QNetworkCookieJar(dispatcher_->network()));
}

void ApiClient::setSessionToken(const QString& token)
{
    resetCookieJar_();
    token_ = token;
    if (!token_.isEmpty()) {
        QNetworkCookie cookie(cookieName_.toUtf8(), token_.toUtf8());
        cookie.setPath("/");
        dispatcher_->network()->cookieJar()->setCookiesFromUrl({cookie}, QUrl(baseUrl_));
    }
}

void ApiClient::clearSessionToken()
{
    setSessionToken(QString());
}

QUrl ApiClient::managementUrl_(const QString& path) const
{
    QString p = path;
    while (p.startsWith('/')) p.remove(0, 1);
    return QUrl(baseUrl_ + "/" + p);
}

QByteArray ApiClient::sessionCookieHeader_() const
{
    if (token_.isEmpty()) return {};
    return cookieName_.toUtf8() + "=" + token_.toUtf8();
}

template <typename T>
void ApiClient::sendDecoded_(const HttpCall& call, const CancelToken& token, Callback<T> cb,
                             std::function<ApiResult<T>(const HttpReply&)> decode)
{
    dispatcher_->send(call, token, [cb, decode](const HttpReply& r) {
        if (!cb) return;
        if (!r.ok()) {
            cb(ApiResult<T>::failure(r.error));
            return;
        }
        cb(decode(r));
    });
}

void ApiClient::registerUser(const QString& login, const QString& password, const QString& email,
                             const CancelToken& token, Callback<QJsonObject> cb)
{
    QJsonObject body;
    body["login"] = login;
    body["password"] = password;
    if (!email.trimmed().isEmpty()) body["email"] = email.trimmed();

    HttpCall call;
    call.apiName = "register";
    call.method = "POST";
    call.url = managementUrl_("/auth/register");
    call.contentType = "application/json";
    call.body = compactJson(body);
    call.expected = {201};
    call.authenticated = false;

    sendDecoded_<QJsonObject>(call, token, std::move(cb), [](const HttpReply& r) {
        return ApiResult<QJsonObject>::success(r.json.toObject());
    });
}

void ApiClient::login(const QString& login, const QString& password,
                      const CancelToken& token, Callback<UserSummary> cb)
{
    QJsonObject body;
    body["login"] = login;
    body["password"] = password;

    HttpCall call;
    call.apiName = "login";
    call.method = "POST";
    call.url = managementUrl_("/auth/login");
    call.contentType = "application/json";
    call.body = compactJson(body);
    call.expected = {200};
    call.authenticated = false;

    dispatcher_->send(call, token, [this, cb](const HttpReply& r) {
        if (!cb) return;
        if (!r.ok()) {
            ApiError e = r.error;
            if (e.isAuth() && e.message.startsWith("HTTP ")) {
                e.message = QStringLiteral("Invalid login or password.");
            }
            cb(ApiResult<UserSummary>::failure(e));
            return;
        }

        QString sessionValue;
        for (const auto& c : r.cookies) {
            if (QString::fromUtf8(c.name()) == cookieName_) {
                sessionValue = QString::fromUtf8(c.value());
            }
        }
        if (sessionValue.isEmpty()) {
            cb(ApiResult<UserSummary>::failure(
                unexpectedPayload(QString("missing %1 cookie in login response").arg(cookieName_))));
            return;
        }
        const QJsonObject root = r.json.toObject();
        if (!root.value("user").isObject()) {
            cb(ApiResult<UserSummary>::failure(unexpectedPayload("login data has no user object")));
            return;
        }

        setSessionToken(sessionValue);
        cb(ApiResult<UserSummary>::success(UserSummary::fromJson(root.value("user").toObject())));
    });
}

void ApiClient::logout(const CancelToken& token, Callback<bool> cb)
{
    HttpCall call;
    call.apiName = "logout";
    call.method = "POST";
    call.url = managementUrl_("/auth/logout");
    call.expected = {200, 204};
    // the session is being dropped anyway; a 401 here must not bounce the UI
    call.authenticated = false;

    dispatcher_->send(call, token, [cb](const HttpReply& r) {
        if (!cb) return;
        if (!r.ok() && r.error.httpStatus != 401 && r.error.httpStatus != 403) {
            cb(ApiResult<bool>::failure(r.error));
            return;
        }
        cb(ApiResult<bool>::success(true));
    });
}

void ApiClient::currentUser(const CancelToken& token, Callback<UserProfile> cb)
{
    HttpCall call;
    call.apiName = "currentUser";
    call.url = managementUrl_("/users/me");

    sendDecoded_<UserProfile>(call, token, std::move(cb), [](const HttpReply& r) {
        if (!r.json.isObject()) {
            return ApiResult<UserProfile>::failure(unexpectedPayload("profile is not an object"));
        }
        return ApiResult<UserProfile>::success(UserProfile::fromJson(r.json.toObject()));
    });
}

void ApiClient::listProjects(const ProjectQuery& query, const CancelToken& token, Callback<ProjectsPage> cb)
{
    QUrlQuery q;
    q.addQueryItem("limit", QString::number(query.limit));
    q.addQueryItem("offset", QString::number(query.offset));
    if (!query.search.trimmed().isEmpty()) q.addQueryItem("q", query.search.trimmed());

    QUrl url = managementUrl_("/projects");
    url.setQuery(q);

    HttpCall call;
    call.apiName = "listProjects";
    call.url = url;

    sendDecoded_<ProjectsPage>(call, token, std::move(cb), [](const HttpReply& r) {
        if (!r.json.isObject()) {
            return ApiResult<ProjectsPage>::failure(unexpectedPayload("projects page is not an object"));
        }
        return ApiResult<ProjectsPage>::success(projectsPageFromJson(r.json.toObject()));
    });
}

void ApiClient::createProject(const NewProject& project, const CancelToken& token, Callback<Project> cb)
{
    const QString videoPath = project.videoPath.trimmed();
    QString localProblem;
    if (!videoPath.isEmpty()) {
        QFile video(videoPath);
        if (!QFileInfo::exists(videoPath)) {
            localProblem = QString("File not found: %1").arg(videoPath);
        } else if (!video.open(QIODevice::ReadOnly)) {
            localProblem = QString("Cannot read video file: %1").arg(videoPath);
        }
    }
    if (!localProblem.isEmpty()) {
        const ApiError err = ApiError::api(0, localProblem);
        gme::Logger::warn(("createProject rejected: " + err.message).toStdString(), "http");
        // asynchronous like a network failure, and still subject to cancellation
        QTimer::singleShot(0, this, [cb, err, token]() {
            if (cb && !token.isCancelled()) cb(ApiResult<Project>::failure(err));
        });
        return;
    }

    const NewProject p = project;
    HttpCall call;
    call.apiName = "createProject";
    call.method = "POST";
    call.url = managementUrl_("/projects");
    call.expected = {201};
    call.multipart = [p, videoPath]() -> QHttpMultiPart* {
        auto* multi = new QHttpMultiPart(QHttpMultiPart::FormDataType);
        multi->append(textPart("title", p.name.trimmed()));
        multi->append(textPart("description", p.description.trimmed()));
        multi->append(textPart("start_processing", p.startProcessing ? "true" : "false"));
        multi->append(textPart("launch_mode", "immediate"));

        if (!videoPath.isEmpty()) {
            auto* file = new QFile(videoPath, multi);
            if (!file->open(QIODevice::ReadOnly)) {
                // never create the project without the video the user picked
                gme::Logger::error(("cannot open video for upload: " + videoPath).toStdString(), "http");
                delete multi;
                return nullptr;
            }
            const QFileInfo info(videoPath);
            QString mime = QMimeDatabase().mimeTypeForFile(info).name();
            if (mime.isEmpty() || mime == "application/octet-stream") mime = "video/mp4";

            QHttpPart video;
            video.setHeader(QNetworkRequest::ContentTypeHeader, mime);
            video.setHeader(QNetworkRequest::ContentDispositionHeader,
                            QString("form-data; name=\"video\"; filename=\"%1\"").arg(info.fileName()));
            video.setBodyDevice(file);
            multi->append(video);
        }
        return multi;
    };

    sendDecoded_<Project>(call, token, std::move(cb), [](const HttpReply& r) {
        if (!r.json.isObject()) {
            return ApiResult<Project>::failure(unexpectedPayload("created project is not an object"));
        }
        return ApiResult<Project>::success(Project::fromJson(r.json.toObject()));
    });
}

void ApiClient::startRun(const QString& projectId, const RunOptions& options,
                         const CancelToken& token, Callback<ProcessingRun> cb)
{
    QJsonObject body;
    body["launch_mode"] = options.launchMode.isEmpty() ? QString("immediate") : options.launchMode;
    if (!options.processingMode.isEmpty()) body["processing_mode"] = options.processingMode;
    if (!options.audioProvider.isEmpty()) body["audio_provider"] = options.audioProvider;
    if (!options.model.isEmpty()) body["model_name"] = options.model;

    HttpCall call;
    call.apiName = "startRun";
    call.method = "POST";
    call.url = managementUrl_(QString("/projects/%1/processing/start")
                                  .arg(QString::fromUtf8(QUrl::toPercentEncoding(projectId))));
    call.contentType = "application/json";
    call.body = compactJson(body);
    call.expected = {200, 201, 202};

    sendDecoded_<ProcessingRun>(call, token, std::move(cb), [projectId](const HttpReply& r) {
        ProcessingRun run;
        if (r.json.isObject()) {
            run = ProcessingRun::fromJson(r.json.toObject());
        }
        if (run.projectId.isEmpty()) run.projectId = projectId;
        return ApiResult<ProcessingRun>::success(run);
    });
}

void ApiClient::listRuns(const QString& projectId, int limit, int offset,
                         const CancelToken& token, Callback<ProcessingRunsPage> cb)
{
    QUrlQuery q;
    q.addQueryItem("limit", QString::number(limit));
    q.addQueryItem("offset", QString::number(offset));

    QUrl url = managementUrl_(QString("/projects/%1/processing")
                                  .arg(QString::fromUtf8(QUrl::toPercentEncoding(projectId))));
    url.setQuery(q);

    HttpCall call;
    call.apiName = "listRuns";
    call.url = url;

    sendDecoded_<ProcessingRunsPage>(call, token, std::move(cb), [](const HttpReply& r) {
        if (!r.json.isObject()) {
            return ApiResult<ProcessingRunsPage>::failure(unexpectedPayload("runs page is not an object"));
        }
        return ApiResult<ProcessingRunsPage>::success(processingRunsPageFromJson(r.json.toObject()));
    });
}

void ApiClient::listVideoModels(const CancelToken& token, Callback<QStringList> cb)
{
    HttpCall call;
    call.apiName = "listVideoModels";
    call.url = QUrl(videoUrl_ + "/models");
    const QByteArray cookie = sessionCookieHeader_();
    if (!cookie.isEmpty()) call.headers.append({"Cookie", cookie});

    sendDecoded_<QStringList>(call, token, std::move(cb), [](const HttpReply& r) {
        // either ["a","b"] or {"models": ["a","b"]}
        const QJsonArray arr = r.json.isArray() ? r.json.toArray()
                                                : r.json.toObject().value("models").toArray();
        QStringList names;
        for (const auto& v : arr) {
            const QString name = v.isString() ? v.toString() : v.toObject().value("name").toString();
            if (!name.trimmed().isEmpty()) names << name.trimmed();
        }
        return ApiResult<QStringList>::success(names);
    });
}

void ApiClient::listAudioProviders(const CancelToken& token, Callback<QList<AudioProvider>> cb)
{
    HttpCall call;
    call.apiName = "listAudioProviders";
    call.url = QUrl(audioUrl_ + "/providers");
    if (!audioApiKey_.isEmpty()) {
        call.headers.append({kApiKeyHeaderName, audioApiKey_.toUtf8()});
        call.authenticated = false;
        call.sendCookies = false;
    } else {
        const QByteArray cookie = sessionCookieHeader_();
        if (!cookie.isEmpty()) call.headers.append({"Cookie", cookie});
    }

    sendDecoded_<QList<AudioProvider>>(call, token, std::move(cb), [](const HttpReply& r) {
        const QJsonArray arr = r.json.isArray() ? r.json.toArray()
                                                : r.json.toObject().value("items").toArray();
        return ApiResult<QList<AudioProvider>>::success(audioProvidersFromJson(arr));
    });
}
