#pragma once
#include <QWidget>

class LoginController;
class QCheckBox;
class QLabel;
class QLineEdit;
class QPushButton;
class QTabWidget;

class LoginPage : public QWidget {
    Q_OBJECT
public:
    explicit LoginPage(LoginController* controller, QWidget* parent = nullptr);

    void showNotice(const QString& message, bool isError);
    // called when the page becomes current
    void prepare();

private slots:
    void onLoginClicked();
    void onRegisterClicked();

private:
    QWidget* buildLoginTab();
    QWidget* buildRegisterTab();
    void updateBusy();

    LoginController* controller_ = nullptr;

    QTabWidget* tabs_ = nullptr;
    QLabel* noticeLabel_ = nullptr;
    QLabel* busyLabel_ = nullptr;

    QLineEdit* m_editLogin = nullptr;
    QLineEdit* m_editPassword = nullptr;
    QCheckBox* m_checkRemember = nullptr;
    QPushButton* m_buttonLogin = nullptr;

    QLineEdit* m_editRegLogin = nullptr;
    QLineEdit* m_editRegEmail = nullptr;
    QLineEdit* m_editRegPassword = nullptr;
    QLineEdit* m_editRegConfirm = nullptr;
    QPushButton* m_buttonRegister = nullptr;
};
