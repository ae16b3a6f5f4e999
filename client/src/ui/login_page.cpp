#include "ui/login_page.h"

#include <QCheckBox>
#include <QFormLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QTabWidget>
#include <QVBoxLayout>

#include "controllers/login_controller.h"

LoginPage::LoginPage(LoginController* controller, QWidget* parent)
    : QWidget(parent),
      controller_(controller)
{
    auto* root = new QVBoxLayout(this);
    root->setContentsMargins(26, 24, 26, 24);
    root->addStretch(1);

    auto* title = new QLabel(tr("GME"), this);
    QFont f = title->font();
    f.setPointSize(f.pointSize() + 8);
    f.setBold(true);
    title->setFont(f);
    title->setAlignment(Qt::AlignCenter);
    root->addWidget(title);

    noticeLabel_ = new QLabel(this);
    noticeLabel_->setAlignment(Qt::AlignCenter);
    noticeLabel_->setWordWrap(true);
    noticeLabel_->hide();
    root->addWidget(noticeLabel_);

    tabs_ = new QTabWidget(this);
    tabs_->setMaximumWidth(520);
    tabs_->addTab(buildLoginTab(), tr("Sign in"));
    tabs_->addTab(buildRegisterTab(), tr("Register"));
    root->addWidget(tabs_, 0, Qt::AlignHCenter);

    busyLabel_ = new QLabel(this);
    busyLabel_->setAlignment(Qt::AlignCenter);
    root->addWidget(busyLabel_);
    root->addStretch(1);

    connect(controller_, &LoginController::stateChanged, this, [this](ScreenController::State s) {
        updateBusy();
        if (s == ScreenController::State::Loaded) m_editPassword->clear();
    });
    connect(controller_, &LoginController::errorOccurred, this, [this](const QString& msg) {
        showNotice(msg, true);
    });
    connect(controller_, &LoginController::validationFailed, this, [this](const QString& msg) {
        showNotice(msg, true);
    });
}

QWidget* LoginPage::buildLoginTab()
{
    auto* page = new QWidget(this);
    auto* form = new QFormLayout(page);
    form->setContentsMargins(22, 22, 22, 22);

    m_editLogin = new QLineEdit(page);
    m_editPassword = new QLineEdit(page);
    m_editPassword->setEchoMode(QLineEdit::Password);
    m_checkRemember = new QCheckBox(tr("Remember me"), page);
    m_buttonLogin = new QPushButton(tr("Sign in"), page);
    m_buttonLogin->setDefault(true);

    form->addRow(tr("Login:"), m_editLogin);
    form->addRow(tr("Password:"), m_editPassword);
    form->addRow(QString(), m_checkRemember);
    form->addRow(QString(), m_buttonLogin);

    connect(m_buttonLogin, &QPushButton::clicked, this, &LoginPage::onLoginClicked);
    connect(m_editPassword, &QLineEdit::returnPressed, this, &LoginPage::onLoginClicked);
    return page;
}

QWidget* LoginPage::buildRegisterTab()
{
    auto* page = new QWidget(this);
    auto* form = new QFormLayout(page);
    form->setContentsMargins(22, 22, 22, 22);

    m_editRegLogin = new QLineEdit(page);
    m_editRegEmail = new QLineEdit(page);
    m_editRegEmail->setPlaceholderText(tr("optional"));
    m_editRegPassword = new QLineEdit(page);
    m_editRegPassword->setEchoMode(QLineEdit::Password);
    m_editRegConfirm = new QLineEdit(page);
    m_editRegConfirm->setEchoMode(QLineEdit::Password);
    m_buttonRegister = new QPushButton(tr("Create account"), page);

    form->addRow(tr("Login:"), m_editRegLogin);
    form->addRow(tr("Email:"), m_editRegEmail);
    form->addRow(tr("Password:"), m_editRegPassword);
    form->addRow(tr("Repeat password:"), m_editRegConfirm);
    form->addRow(QString(), m_buttonRegister);

    connect(m_buttonRegister, &QPushButton::clicked, this, &LoginPage::onRegisterClicked);
    return page;
}

void LoginPage::prepare()
{
    if (m_editLogin->text().isEmpty()) m_editLogin->setText(controller_->lastLogin());
    m_editPassword->clear();
    m_editRegPassword->clear();
    m_editRegConfirm->clear();
    updateBusy();
    (m_editLogin->text().isEmpty() ? m_editLogin : m_editPassword)->setFocus();
}

void LoginPage::showNotice(const QString& message, bool isError)
{
    noticeLabel_->setText(message);
    noticeLabel_->setStyleSheet(isError ? "color: #b91c1c;" : "color: #047857;");
    noticeLabel_->setVisible(!message.isEmpty());
}

void LoginPage::updateBusy()
{
    const bool busy = controller_->state() == ScreenController::State::Loading;
    busyLabel_->setText(busy ? controller_->busyText() : QString());
    tabs_->setEnabled(!busy);
}

void LoginPage::onLoginClicked()
{
    showNotice(QString(), false);
    controller_->signIn(m_editLogin->text(), m_editPassword->text(), m_checkRemember->isChecked());
}

void LoginPage::onRegisterClicked()
{
    showNotice(QString(), false);
    controller_->registerAccount(m_editRegLogin->text(), m_editRegEmail->text(),
                                 m_editRegPassword->text(), m_editRegConfirm->text());
}
