#include "view/create_project_page.h"

#include <QCheckBox>
#include <QFileDialog>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLineEdit>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QVBoxLayout>

#include "controllers/project_create_controller.h"
#include "view/state_banner.h"

CreateProjectPage::CreateProjectPage(ProjectCreateController* controller, QWidget* parent)
    : QWidget(parent),
      controller_(controller)
{
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(16, 16, 16, 16);

    banner_ = new StateBanner(controller_, this);
    banner_->setLoadingText(tr("Creating project..."));
    layout->addWidget(banner_);

    auto* form = new QFormLayout();
    nameEdit_ = new QLineEdit(this);
    descriptionEdit_ = new QPlainTextEdit(this);
    descriptionEdit_->setMaximumHeight(120);

    videoEdit_ = new QLineEdit(this);
    videoEdit_->setPlaceholderText(tr("optional .mp4 / .mov / .mkv"));
    browseBtn_ = new QPushButton(tr("Browse..."), this);
    auto* videoRow = new QHBoxLayout();
    videoRow->addWidget(videoEdit_, 1);
    videoRow->addWidget(browseBtn_);

    startCheck_ = new QCheckBox(tr("Start processing after upload"), this);

    form->addRow(tr("Title:"), nameEdit_);
    form->addRow(tr("Description:"), descriptionEdit_);
    form->addRow(tr("Video:"), videoRow);
    form->addRow(QString(), startCheck_);
    layout->addLayout(form);

    auto* buttons = new QHBoxLayout();
    buttons->addStretch(1);
    cancelBtn_ = new QPushButton(tr("Cancel"), this);
    submitBtn_ = new QPushButton(tr("Create"), this);
    submitBtn_->setDefault(true);
    buttons->addWidget(cancelBtn_);
    buttons->addWidget(submitBtn_);
    layout->addLayout(buttons);
    layout->addStretch(1);

    connect(browseBtn_, &QPushButton::clicked, this, &CreateProjectPage::onBrowse);
    connect(submitBtn_, &QPushButton::clicked, this, &CreateProjectPage::onSubmit);
    connect(cancelBtn_, &QPushButton::clicked, this, &CreateProjectPage::cancelled);
    connect(controller_, &ProjectCreateController::validationFailed, this, [this](const QString& msg) {
        banner_->showMessage(msg, true);
    });
    connect(controller_, &ScreenController::stateChanged, this, [this](ScreenController::State s) {
        const bool busy = s == ScreenController::State::Loading;
        submitBtn_->setEnabled(!busy);
        nameEdit_->setEnabled(!busy);
        videoEdit_->setEnabled(!busy);
        browseBtn_->setEnabled(!busy);
    });
}

void CreateProjectPage::reset()
{
    nameEdit_->clear();
    descriptionEdit_->clear();
    videoEdit_->clear();
    startCheck_->setChecked(false);
    banner_->showMessage(QString(), false);
    nameEdit_->setFocus();
}

void CreateProjectPage::onBrowse()
{
    const QString path = QFileDialog::getOpenFileName(this, tr("Select video"), QString(),
                                                      tr("Video (*.mp4 *.mov *.mkv *.avi *.webm);;All files (*)"));
    if (!path.isEmpty()) videoEdit_->setText(path);
}

void CreateProjectPage::onSubmit()
{
    NewProject draft;
    draft.name = nameEdit_->text();
    draft.description = descriptionEdit_->toPlainText();
    draft.videoPath = videoEdit_->text();
    draft.startProcessing = startCheck_->isChecked();
    controller_->submit(draft);
}
