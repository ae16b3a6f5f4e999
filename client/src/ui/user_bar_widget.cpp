#include "ui/user_bar_widget.h"

#include <QHBoxLayout>
#include <QLabel>
#include <QPushButton>

namespace {
QString formatLoginTime(const QDateTime& dt) {
    return dt.isValid() ? dt.toString("yyyy-MM-dd HH:mm:ss") : QStringLiteral("-");
}
} // namespace

UserBarWidget::UserBarWidget(QWidget* parent)
    : QWidget(parent)
{
    auto* layout = new QHBoxLayout(this);
    layout->setContentsMargins(8, 4, 8, 4);
    layout->setSpacing(12);

    usernameLabel_ = new QLabel(tr("User: -"), this);
    loginTimeLabel_ = new QLabel(tr("Login Time: -"), this);
    serverLabel_ = new QLabel(this);
    serverLabel_->setStyleSheet("color: #6b7280;");

    projectsBtn_ = new QPushButton(tr("Projects"), this);
    logoutBtn_ = new QPushButton(tr("Logout"), this);

    layout->addWidget(usernameLabel_);
    layout->addWidget(loginTimeLabel_);
    layout->addStretch();
    layout->addWidget(serverLabel_);
    layout->addWidget(projectsBtn_);
    layout->addWidget(logoutBtn_);

    connect(projectsBtn_, &QPushButton::clicked, this, &UserBarWidget::projectsClicked);
    connect(logoutBtn_, &QPushButton::clicked, this, &UserBarWidget::logoutClicked);

    setUsername(QString());
    setLoginTime(QDateTime());
    setSignedIn(false);
}

void UserBarWidget::setUsername(const QString& username) {
    username_ = username;
    const QString name = username.isEmpty() ? tr("-") : username;
    usernameLabel_->setText(role_.isEmpty() ? tr("User: %1").arg(name)
                                            : tr("User: %1 (%2)").arg(name, role_));
}

void UserBarWidget::setRole(const QString& role) {
    role_ = role;
    setUsername(username_);
}

void UserBarWidget::setLoginTime(const QDateTime& dt) {
    loginTimeLabel_->setText(tr("Login Time: %1").arg(formatLoginTime(dt)));
}

void UserBarWidget::setServer(const QString& url) {
    serverLabel_->setText(url);
}

void UserBarWidget::setSignedIn(bool on) {
    projectsBtn_->setEnabled(on);
    logoutBtn_->setEnabled(on);
}
