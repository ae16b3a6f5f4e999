#include "view/state_banner.h"

#include <QHBoxLayout>
#include <QLabel>
#include <QPushButton>

#include "controllers/screen_controller.h"

StateBanner::StateBanner(ScreenController* controller, QWidget* parent)
    : QWidget(parent),
      controller_(controller),
      loadingText_(tr("Loading..."))
{
    auto* layout = new QHBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    label_ = new QLabel(this);
    label_->setWordWrap(true);
    retryBtn_ = new QPushButton(tr("Retry"), this);
    layout->addWidget(label_, 1);
    layout->addWidget(retryBtn_);

    connect(retryBtn_, &QPushButton::clicked, controller_, &ScreenController::retry);
    connect(controller_, &ScreenController::stateChanged, this, [this]() { sync(); });
    connect(controller_, &ScreenController::errorOccurred, this, [this]() { sync(); });
    sync();
}

void StateBanner::showMessage(const QString& text, bool isError)
{
    label_->setText(text);
    label_->setStyleSheet(isError ? "color: #b91c1c;" : "color: #047857;");
    retryBtn_->hide();
    setVisible(!text.isEmpty());
}

void StateBanner::sync()
{
    switch (controller_->state()) {
    case ScreenController::State::Loading:
        label_->setText(loadingText_);
        label_->setStyleSheet("color: #6b7280;");
        retryBtn_->hide();
        show();
        break;
    case ScreenController::State::Error:
        label_->setText(controller_->errorMessage());
        label_->setStyleSheet("color: #b91c1c;");
        retryBtn_->show();
        show();
        break;
    default:
        hide();
        break;
    }
}
