#include "net/request_dispatcher.h"

#include <QElapsedTimer>
#include <QHttpMultiPart>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QTimer>

#include "log/logger.h"

namespace {
constexpr const char* kTimedOutProperty = "gme_timed_out";
constexpr const char* kCancelledProperty = "gme_cancelled";
constexpr int kMaxPlainErrorChars = 400;
}

struct RequestDispatcher::Pending {
    HttpCall call;
    CancelToken token;
    ReplyHandler handler;
    int attempt = 0;
    QElapsedTimer clock;
};

RequestDispatcher::RequestDispatcher(Options opt, QObject* parent)
    : QObject(parent),
      nam_(new QNetworkAccessManager(this)),
      opt_(std::move(opt))
{
}

void RequestDispatcher::send(const HttpCall& call, const CancelToken& token, ReplyHandler handler)
{
    auto p = std::make_shared<Pending>();
    p->call = call;
    p->token = token;
    p->handler = std::move(handler);
    p->clock.start();

    if (token.isCancelled()) {
        gme::Logger::debug(QString("%1 %2 not sent (cancelled)")
                               .arg(QString::fromLatin1(call.method), call.url.toString())
                               .toStdString(), "http");
        return;
    }

    if (!call.url.isValid() || call.url.scheme().isEmpty()) {
        HttpReply r;
        r.error = ApiError::network(QString("Invalid service URL: %1").arg(call.url.toString()));
        // keep delivery asynchronous like every other outcome
        QTimer::singleShot(0, this, [this, p, r]() { deliver_(p, r); });
        return;
    }

    ++inFlight_;
    startAttempt_(p);
}

void RequestDispatcher::startAttempt_(const std::shared_ptr<Pending>& p)
{
    ++p->attempt;

    QNetworkRequest req(p->call.url);
    req.setRawHeader("Accept", "application/json");
    req.setRawHeader("User-Agent", opt_.userAgent);
    if (!p->call.contentType.isEmpty()) {
        req.setHeader(QNetworkRequest::ContentTypeHeader, p->call.contentType);
    }
    for (const auto& h : p->call.headers) {
        req.setRawHeader(h.first, h.second);
    }

    if (!p->call.sendCookies) {
        req.setAttribute(QNetworkRequest::CookieLoadControlAttribute, QNetworkRequest::Manual);
    }

    QNetworkReply* reply = nullptr;
    if (p->call.multipart) {
        QHttpMultiPart* multi = p->call.multipart();
        if (!multi) {
            HttpReply r;
            r.error = ApiError::api(0, QString("Cannot prepare the %1 request body.").arg(p->call.apiName));
            r.elapsedMs = p->clock.elapsed();
            r.attempts = p->attempt;
            QTimer::singleShot(0, this, [this, p, r]() {
                --inFlight_;
                deliver_(p, r);
            });
            return;
        }
        reply = nam_->post(req, multi);
        multi->setParent(reply);
    } else if (p->call.method == "GET") {
        reply = nam_->get(req);
    } else {
        reply = nam_->sendCustomRequest(req, p->call.method, p->call.body);
    }

    // inactivity timeout: any upload or download progress restarts it
    auto* timer = new QTimer(reply);
    timer->setSingleShot(true);
    timer->setInterval(opt_.timeoutMs);
    connect(timer, &QTimer::timeout, reply, [reply]() {
        reply->setProperty(kTimedOutProperty, true);
        reply->abort();
    });
    connect(reply, &QNetworkReply::uploadProgress, timer, [timer](qint64 sent, qint64) {
        if (sent > 0) timer->start();
    });
    connect(reply, &QNetworkReply::downloadProgress, timer, [timer](qint64 received, qint64) {
        if (received > 0) timer->start();
    });
    timer->start();

    connect(reply, &QNetworkReply::finished, this, [this, p, reply]() {
        onFinished_(p, reply);
    });

    QPointer<QNetworkReply> guard(reply);
    p->token.onCancel([guard]() {
        if (guard && guard->isRunning()) {
            guard->setProperty(kCancelledProperty, true);
            guard->abort();
        }
    });
}

void RequestDispatcher::onFinished_(const std::shared_ptr<Pending>& p, QNetworkReply* reply)
{
    reply->deleteLater();

    HttpReply r;
    r.httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    r.body = reply->readAll();
    r.elapsedMs = p->clock.elapsed();
    r.attempts = p->attempt;

    const bool timedOut = reply->property(kTimedOutProperty).toBool();
    const bool cancelled = reply->property(kCancelledProperty).toBool() || p->token.isCancelled();

    if (cancelled) {
        --inFlight_;
        gme::Logger::debug(QString("%1 %2 discarded (cancelled)")
                               .arg(QString::fromLatin1(p->call.method), p->call.url.toString())
                               .toStdString(), "http");
        return;
    }

    if (timedOut) {
        r.httpStatus = 0;
        r.body.clear();
        r.error = ApiError::timeout(opt_.timeoutMs);
    } else if (r.httpStatus == 0) {
        r.error = ApiError::network(
            QString("Could not reach the service (%1). Check the URL and that it is running.")
                .arg(reply->errorString()));
    } else if (!p->call.expected.contains(r.httpStatus)) {
        r.error = errorFromResponse(r.httpStatus, r.body, p->call.authenticated);
    } else {
        const QVariant setCookies = reply->header(QNetworkRequest::SetCookieHeader);
        if (setCookies.isValid()) {
            r.cookies = setCookies.value<QList<QNetworkCookie>>();
        }
        if (r.httpStatus != 204 && !r.body.isEmpty()) {
            QJsonParseError pe;
            const QJsonDocument doc = QJsonDocument::fromJson(r.body, &pe);
            if (pe.error == QJsonParseError::NoError) {
                r.json = doc.isArray() ? QJsonValue(doc.array()) : QJsonValue(doc.object());
            } else {
                r.json = QJsonValue(QString::fromUtf8(r.body));
            }
        }
    }

    if (r.error.isNetwork() && p->call.idempotent() && p->attempt <= opt_.maxRetries) {
        const int delay = opt_.retryBackoffMs * p->attempt;
        gme::Logger::warn(QString("%1 %2 failed (%3), retry %4/%5 in %6 ms")
                              .arg(QString::fromLatin1(p->call.method), p->call.url.toString(),
                                   r.error.message)
                              .arg(p->attempt).arg(opt_.maxRetries).arg(delay)
                              .toStdString(), "http");
        QTimer::singleShot(delay, this, [this, p]() {
            if (p->token.isCancelled()) {
                --inFlight_;
                return;
            }
            startAttempt_(p);
        });
        return;
    }

    --inFlight_;

    const gme::Logger::Fields fields{
        {"api", p->call.apiName.toStdString()},
        {"elapsed_ms", std::to_string(r.elapsedMs)},
        {"attempt", std::to_string(r.attempts)},
    };
    const QString line = QString("%1 %2 -> %3")
                             .arg(QString::fromLatin1(p->call.method), p->call.url.toString(),
                                  r.ok() ? QString::number(r.httpStatus)
                                         : r.error.kindName() + " " + r.error.toString());
    gme::Logger::write(r.ok() ? gme::LogLevel::Info : gme::LogLevel::Warn, "http",
                       line.toStdString(), fields);

    if (r.error.isAuth() && p->call.authenticated) {
        // listeners tear the session down; that cancels tokens of live screens
        emit unauthorized();
        if (p->token.isCancelled()) return;
    }

    deliver_(p, r);
}

void RequestDispatcher::deliver_(const std::shared_ptr<Pending>& p, const HttpReply& r)
{
    if (p->token.isCancelled()) return;
    if (p->handler) p->handler(r);
}

ApiError RequestDispatcher::errorFromResponse(int httpStatus, const QByteArray& body, bool authenticated)
{
    QString detail = QString("HTTP %1").arg(httpStatus);
    QString code;

    QJsonParseError pe;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &pe);
    if (pe.error == QJsonParseError::NoError && doc.isObject()) {
        const QJsonObject obj = doc.object();
        const QJsonValue d = obj.value("detail");
        if (d.isString() && !d.toString().isEmpty()) {
            detail = d.toString();
        } else if (!d.isUndefined() && !d.isNull()) {
            // validation errors come back as structured detail
            const QJsonDocument detailDoc = d.isArray() ? QJsonDocument(d.toArray())
                                                        : QJsonDocument(d.toObject());
            detail = QString::fromUtf8(detailDoc.toJson(QJsonDocument::Compact));
        } else if (obj.value("message").isString()) {
            detail = obj.value("message").toString();
        }
        const QJsonValue c = obj.value("code");
        if (c.isString()) code = c.toString();
        else if (c.isDouble()) code = QString::number(c.toInt());
    } else if (!body.isEmpty()) {
        detail = QString::fromUtf8(body).left(kMaxPlainErrorChars);
    }

    if (httpStatus == 401) {
        if (!authenticated) return ApiError::auth(httpStatus, detail, code);
        return ApiError::auth(httpStatus, detail.startsWith("HTTP ")
                                              ? QStringLiteral("Your session has expired. Please sign in again.")
                                              : detail,
                              code);
    }
    return ApiError::api(httpStatus, detail, code);
}
