#include "view/run_history_page.h"

#include <QComboBox>
#include <QHeaderView>
#include <QHBoxLayout>
#include <QLabel>
#include <QPushButton>
#include <QTableView>
#include <QVBoxLayout>

#include "controllers/run_history_controller.h"
#include "models/json_fields.h"
#include "models/run_table_model.h"
#include "models/status_text.h"
#include "net/api_client.h"
#include "view/state_banner.h"

RunHistoryPage::RunHistoryPage(RunHistoryController* controller, QWidget* parent)
    : QWidget(parent),
      controller_(controller)
{
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(8, 8, 8, 8);
    layout->setSpacing(6);

    auto* header = new QHBoxLayout();
    backBtn_ = new QPushButton(tr("< Projects"), this);
    titleLabel_ = new QLabel(this);
    QFont f = titleLabel_->font();
    f.setPointSize(f.pointSize() + 3);
    f.setBold(true);
    titleLabel_->setFont(f);
    header->addWidget(backBtn_);
    header->addWidget(titleLabel_, 1);
    layout->addLayout(header);

    detailsLabel_ = new QLabel(this);
    detailsLabel_->setWordWrap(true);
    layout->addWidget(detailsLabel_);

    banner_ = new StateBanner(controller_, this);
    banner_->setLoadingText(tr("Loading runs..."));
    layout->addWidget(banner_);

    auto* controls = new QHBoxLayout();
    controls->setSpacing(8);
    modeCombo_ = new QComboBox(this);
    for (const QString& mode : {QString("video_only"), QString("audio_only"), QString("audio_and_video")}) {
        modeCombo_->addItem(status_text::processingModeLabel(mode), mode);
    }
    modelCombo_ = new QComboBox(this);
    modelCombo_->setMinimumWidth(140);
    providerCombo_ = new QComboBox(this);
    providerCombo_->setMinimumWidth(140);
    startBtn_ = new QPushButton(tr("Start processing"), this);
    refreshBtn_ = new QPushButton(tr("Refresh"), this);
    controls->addWidget(new QLabel(tr("Mode"), this));
    controls->addWidget(modeCombo_);
    controls->addWidget(new QLabel(tr("Model"), this));
    controls->addWidget(modelCombo_);
    controls->addWidget(new QLabel(tr("Audio provider"), this));
    controls->addWidget(providerCombo_);
    controls->addStretch(1);
    controls->addWidget(refreshBtn_);
    controls->addWidget(startBtn_);
    layout->addLayout(controls);

    table_ = new QTableView(this);
    model_ = new RunTableModel(false, this);
    table_->setModel(model_);
    table_->verticalHeader()->setVisible(false);
    table_->setSelectionBehavior(QAbstractItemView::SelectRows);
    table_->setSelectionMode(QAbstractItemView::SingleSelection);
    table_->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);
    layout->addWidget(table_, 1);

    connect(backBtn_, &QPushButton::clicked, this, &RunHistoryPage::backRequested);
    connect(refreshBtn_, &QPushButton::clicked, controller_, &RunHistoryController::refresh);
    connect(startBtn_, &QPushButton::clicked, this, &RunHistoryPage::onStartClicked);
    connect(modeCombo_, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &RunHistoryPage::onModeChanged);
    connect(controller_, &RunHistoryController::runsChanged, this, &RunHistoryPage::onRunsChanged);
    connect(controller_, &RunHistoryController::providersChanged, this, &RunHistoryPage::onChoicesChanged);
    connect(controller_, &RunHistoryController::validationFailed, this, [this](const QString& msg) {
        banner_->showMessage(msg, true);
    });
    connect(controller_, &RunHistoryController::runStarted, this, [this](const ProcessingRun& run) {
        banner_->showMessage(tr("Processing started (%1).").arg(status_text::runLabel(run.status)), false);
    });
    connect(controller_, &ScreenController::stateChanged, this, [this](ScreenController::State s) {
        const bool busy = s == ScreenController::State::Loading;
        startBtn_->setEnabled(!busy);
        refreshBtn_->setEnabled(!busy);
    });
}

void RunHistoryPage::prepare()
{
    const Project& p = controller_->project();
    titleLabel_->setText(p.name);
    detailsLabel_->setText(tr("Status: %1    Created: %2    Video: %3\n%4")
                               .arg(status_text::projectLabel(p.status),
                                    json_fields::formatDateTime(p.createdAt),
                                    p.videoReference.isEmpty() ? QStringLiteral("-") : p.videoReference,
                                    p.description));
    model_->setRuns({});
    modelCombo_->clear();
    providerCombo_->clear();
    onModeChanged();
}

void RunHistoryPage::onRunsChanged()
{
    model_->setRuns(controller_->runs());
}

void RunHistoryPage::onChoicesChanged()
{
    const QString selectedModel = modelCombo_->currentText();
    modelCombo_->clear();
    modelCombo_->addItems(controller_->videoModels());
    const int idx = modelCombo_->findText(selectedModel);
    if (idx >= 0) modelCombo_->setCurrentIndex(idx);
    onModeChanged();
}

void RunHistoryPage::onModeChanged()
{
    const QString mode = modeCombo_->currentData().toString();
    const bool video = mode == "video_only" || mode == "audio_and_video";
    const bool audio = mode == "audio_only" || mode == "audio_and_video";

    const QString selected = providerCombo_->currentData().toString();
    providerCombo_->clear();
    for (const auto& p : providersForMode(controller_->audioProviders(), mode)) {
        providerCombo_->addItem(p.title.isEmpty() ? p.code : p.title, p.code);
    }
    const int idx = providerCombo_->findData(selected);
    if (idx >= 0) providerCombo_->setCurrentIndex(idx);

    modelCombo_->setEnabled(video && modelCombo_->count() > 0);
    providerCombo_->setEnabled(audio && providerCombo_->count() > 0);
}

void RunHistoryPage::onStartClicked()
{
    RunOptions opt;
    opt.processingMode = modeCombo_->currentData().toString();
    const bool video = opt.processingMode == "video_only" || opt.processingMode == "audio_and_video";
    const bool audio = opt.processingMode == "audio_only" || opt.processingMode == "audio_and_video";
    if (video) opt.model = modelCombo_->currentText();
    if (audio) opt.audioProvider = providerCombo_->currentData().toString();
    controller_->startRun(opt);
}
