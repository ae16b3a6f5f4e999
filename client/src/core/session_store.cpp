#include "core/session_store.h"

#include <QDir>
#include <QFileInfo>
#include <QSettings>

#include "log/logger.h"

namespace {
constexpr const char* kGroup = "session";
constexpr const char* kApiBaseUrlKey = "api_base_url";
constexpr const char* kLoginKey = "user_login";
constexpr const char* kLastLoginKey = "ui/last_login";
}

SessionStore::SessionStore(const QString& filePath, const QString& cookieName,
                           const QString& apiBaseUrl, QObject* parent)
    : QObject(parent),
      filePath_(filePath),
      cookieName_(cookieName),
      apiBaseUrl_(apiBaseUrl)
{
    QDir().mkpath(QFileInfo(filePath_).absolutePath());
}

void SessionStore::begin(const Session& session)
{
    if (isActive()) {
        end();
    }

    current_ = session;
    if (current_.apiBaseUrl.isEmpty()) current_.apiBaseUrl = apiBaseUrl_;
    if (!current_.startedAt.isValid()) current_.startedAt = QDateTime::currentDateTime();

    if (current_.remembered) {
        persist_(current_);
    } else {
        clearPersisted_();
    }

    QSettings s(filePath_, QSettings::IniFormat);
    s.setValue(kLastLoginKey, current_.login);
    s.sync();

    gme::Logger::write(gme::LogLevel::Info, "session", "session started",
                       {{"login", current_.login.toStdString()},
                        {"remembered", current_.remembered ? "true" : "false"}});
    emit sessionStarted(current_);
}

std::optional<Session> SessionStore::restore()
{
    QSettings s(filePath_, QSettings::IniFormat);
    s.beginGroup(kGroup);
    const QString token = s.value(cookieName_).toString();
    const QString login = s.value(kLoginKey).toString();
    const QString baseUrl = s.value(kApiBaseUrlKey).toString();
    s.endGroup();

    if (token.isEmpty()) {
        return std::nullopt;
    }
    if (baseUrl != apiBaseUrl_) {
        gme::Logger::info(QString("persisted session belongs to %1, not %2; dropping it")
                              .arg(baseUrl, apiBaseUrl_).toStdString(), "session");
        clearPersisted_();
        return std::nullopt;
    }

    Session restored;
    restored.token = token;
    restored.login = login;
    restored.apiBaseUrl = baseUrl;
    restored.remembered = true;
    gme::Logger::debug("restored persisted session for " + login.toStdString(), "session");
    return restored;
}

void SessionStore::end()
{
    const bool wasActive = isActive();
    const QString login = current_.login;
    current_ = Session{};
    clearPersisted_();

    if (wasActive) {
        gme::Logger::info("session ended for " + login.toStdString(), "session");
        emit sessionEnded();
    }
}

QString SessionStore::lastLogin() const
{
    QSettings s(filePath_, QSettings::IniFormat);
    return s.value(kLastLoginKey).toString();
}

void SessionStore::persist_(const Session& sess)
{
    QSettings s(filePath_, QSettings::IniFormat);
    s.beginGroup(kGroup);
    s.setValue(cookieName_, sess.token);
    s.setValue(kLoginKey, sess.login);
    s.setValue(kApiBaseUrlKey, sess.apiBaseUrl);
    s.endGroup();
    s.sync();
    if (s.status() != QSettings::NoError) {
        gme::Logger::error("cannot write session file " + filePath_.toStdString(), "session");
    }
}

void SessionStore::clearPersisted_()
{
    QSettings s(filePath_, QSettings::IniFormat);
    s.remove(kGroup);
    s.sync();
}
