#pragma once
#include <QWidget>

class ProjectCreateController;
class QCheckBox;
class QLineEdit;
class QPlainTextEdit;
class QPushButton;
class StateBanner;

class CreateProjectPage : public QWidget {
    Q_OBJECT
public:
    explicit CreateProjectPage(ProjectCreateController* controller, QWidget* parent = nullptr);

    void reset();

signals:
    void cancelled();

private slots:
    void onBrowse();
    void onSubmit();

private:
    ProjectCreateController* controller_ = nullptr;
    StateBanner* banner_ = nullptr;
    QLineEdit* nameEdit_ = nullptr;
    QPlainTextEdit* descriptionEdit_ = nullptr;
    QLineEdit* videoEdit_ = nullptr;
    QPushButton* browseBtn_ = nullptr;
    QCheckBox* startCheck_ = nullptr;
    QPushButton* submitBtn_ = nullptr;
    QPushButton* cancelBtn_ = nullptr;
};
