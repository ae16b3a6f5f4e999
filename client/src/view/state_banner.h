#pragma once
#include <QWidget>

class QLabel;
class QPushButton;
class ScreenController;

// Loading / error strip shown above a page's content. In Error it offers a
// retry that calls back into the controller.
class StateBanner : public QWidget {
    Q_OBJECT
public:
    explicit StateBanner(ScreenController* controller, QWidget* parent = nullptr);

    void setLoadingText(const QString& text) { loadingText_ = text; }
    void showMessage(const QString& text, bool isError);

private:
    void sync();

    ScreenController* controller_ = nullptr;
    QLabel* label_ = nullptr;
    QPushButton* retryBtn_ = nullptr;
    QString loadingText_;
};
