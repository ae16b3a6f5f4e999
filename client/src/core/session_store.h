#pragma once
#include <QObject>
#include <QString>
#include <optional>

#include "core/session.h"

// The single active session of the process. begin() replaces whatever was
// there before; a remembered session is written to an INI file so restore()
// can pick it up on the next launch.
class SessionStore : public QObject {
    Q_OBJECT
public:
    SessionStore(const QString& filePath, const QString& cookieName,
                 const QString& apiBaseUrl, QObject* parent = nullptr);

    void begin(const Session& session);
    std::optional<Session> restore();
    // logout / auth failure; clears memory and the persisted record
    void end();

    bool isActive() const { return current_.isValid(); }
    const Session& current() const { return current_; }

    // the login form is pre-filled with it even when the session was not remembered
    QString lastLogin() const;

    QString filePath() const { return filePath_; }

signals:
    void sessionStarted(const Session& session);
    void sessionEnded();

private:
    void persist_(const Session& s);
    void clearPersisted_();

private:
    QString filePath_;
    QString cookieName_;
    QString apiBaseUrl_;
    Session current_;
};
