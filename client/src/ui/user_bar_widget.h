#pragma once
#include <QWidget>
#include <QDateTime>

class QLabel;
class QPushButton;

// Top bar: signed-in user, login time and the server in use, with the
// projects shortcut and logout.
class UserBarWidget : public QWidget {
    Q_OBJECT
public:
    explicit UserBarWidget(QWidget* parent = nullptr);

    void setUsername(const QString& username);
    void setRole(const QString& role);
    void setLoginTime(const QDateTime& dt);
    void setServer(const QString& url);
    void setSignedIn(bool on);

signals:
    void projectsClicked();
    void logoutClicked();

private:
    QLabel* usernameLabel_ = nullptr;
    QLabel* loginTimeLabel_ = nullptr;
    QLabel* serverLabel_ = nullptr;
    QPushButton* projectsBtn_ = nullptr;
    QPushButton* logoutBtn_ = nullptr;
    QString role_;
    QString username_;
};
