#pragma once
#include <QByteArray>
#include <QJsonValue>
#include <QList>
#include <QNetworkCookie>
#include <QObject>
#include <QPair>
#include <QUrl>
#include <functional>
#include <memory>

#include "core/cancel_token.h"
#include "net/api_error.h"

class QHttpMultiPart;
class QNetworkAccessManager;
class QNetworkReply;

// One HTTP exchange as the API client describes it.
struct HttpCall {
    QString apiName;                  // for logs: "login", "listProjects" ...
    QByteArray method = "GET";
    QUrl url;
    QList<QPair<QByteArray, QByteArray>> headers;
    QByteArray body;
    QByteArray contentType;
    // Built once per attempt; the dispatcher parents it to the reply.
    std::function<QHttpMultiPart*()> multipart;
    QList<int> expected{200};
    // A 401 on an authenticated call means the session is gone.
    bool authenticated = true;
    // false: the cookie jar is not consulted (calls authenticated by API key)
    bool sendCookies = true;

    bool idempotent() const { return method == "GET" && !multipart; }
};

struct HttpReply {
    int httpStatus = 0;
    QByteArray body;
    QJsonValue json;                  // Null for empty bodies, String for non-JSON text
    QList<QNetworkCookie> cookies;    // Set-Cookie of this response
    ApiError error;
    qint64 elapsedMs = 0;
    int attempts = 0;                 // sends made, retries included

    bool ok() const { return !error.isError(); }
};

// Sends requests on the UI event loop and posts exactly one HttpReply back
// per call. Applies the request timeout, the optional retry policy and the
// caller's cancellation token; classifies failures into ApiError kinds.
class RequestDispatcher : public QObject {
    Q_OBJECT
public:
    struct Options {
        int timeoutMs = 15000;        // without any transfer progress
        int maxRetries = 0;           // network failures of idempotent calls only
        int retryBackoffMs = 500;     // linear: attempt * backoff
        QByteArray userAgent = "gme-client/0.1.0";
    };

    using ReplyHandler = std::function<void(const HttpReply&)>;

    explicit RequestDispatcher(Options opt, QObject* parent = nullptr);

    void send(const HttpCall& call, const CancelToken& token, ReplyHandler handler);

    QNetworkAccessManager* network() const { return nam_; }
    const Options& options() const { return opt_; }
    int inFlight() const { return inFlight_; }

    // Decode a non-2xx body: JSON "detail" (else "message"), JSON "code";
    // plain text is truncated to 400 characters.
    static ApiError errorFromResponse(int httpStatus, const QByteArray& body, bool authenticated);

signals:
    void unauthorized();

private:
    struct Pending;

    void startAttempt_(const std::shared_ptr<Pending>& p);
    void onFinished_(const std::shared_ptr<Pending>& p, QNetworkReply* reply);
    void deliver_(const std::shared_ptr<Pending>& p, const HttpReply& r);

private:
    QNetworkAccessManager* nam_ = nullptr;
    Options opt_;
    int inFlight_ = 0;
};
