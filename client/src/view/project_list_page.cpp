#include "view/project_list_page.h"

#include <QHeaderView>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QStandardItemModel>
#include <QTableView>
#include <QVBoxLayout>

#include "controllers/project_list_controller.h"
#include "models/json_fields.h"
#include "models/run_table_model.h"
#include "models/status_text.h"
#include "view/state_banner.h"

namespace {
constexpr int kProjectIdRole = Qt::UserRole + 1;
constexpr int kSortRole = Qt::UserRole + 2;
}

ProjectListPage::ProjectListPage(ProjectListController* controller, QWidget* parent)
    : QWidget(parent),
      controller_(controller)
{
    buildUi();

    connect(controller_, &ProjectListController::dataChanged, this, &ProjectListPage::onDataChanged);
    connect(controller_, &ProjectListController::filterChanged, this, [this]() { fillProjects(); });
    connect(controller_, &ScreenController::stateChanged, this, [this](ScreenController::State s) {
        refreshBtn_->setEnabled(s != ScreenController::State::Loading);
        if (s == ScreenController::State::Idle) onDataChanged();
    });
}

void ProjectListPage::buildUi()
{
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(8, 8, 8, 8);
    layout->setSpacing(6);

    banner_ = new StateBanner(controller_, this);
    banner_->setLoadingText(tr("Loading projects..."));
    layout->addWidget(banner_);

    metricsLabel_ = new QLabel(this);
    layout->addWidget(metricsLabel_);

    auto* filters = new QHBoxLayout();
    filters->setContentsMargins(0, 0, 0, 0);
    filters->setSpacing(8);
    filterEdit_ = new QLineEdit(this);
    filterEdit_->setPlaceholderText(tr("Filter by title or description"));
    filterEdit_->setClearButtonEnabled(true);
    refreshBtn_ = new QPushButton(tr("Refresh"), this);
    createBtn_ = new QPushButton(tr("New project"), this);
    filters->addWidget(new QLabel(tr("Search"), this));
    filters->addWidget(filterEdit_, 1);
    filters->addWidget(refreshBtn_);
    filters->addWidget(createBtn_);
    layout->addLayout(filters);

    projectsTable_ = new QTableView(this);
    projectsModel_ = new QStandardItemModel(this);
    projectsModel_->setHorizontalHeaderLabels({
        tr("Title"), tr("Status"), tr("Created"), tr("Updated"), tr("Latest run"), tr("Description")
    });
    projectsModel_->setSortRole(kSortRole);
    projectsTable_->setModel(projectsModel_);
    projectsTable_->verticalHeader()->setVisible(false);
    projectsTable_->setSelectionBehavior(QAbstractItemView::SelectRows);
    projectsTable_->setSelectionMode(QAbstractItemView::SingleSelection);
    projectsTable_->setEditTriggers(QAbstractItemView::NoEditTriggers);
    projectsTable_->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);
    projectsTable_->setSortingEnabled(true);
    layout->addWidget(projectsTable_, 3);

    layout->addWidget(new QLabel(tr("Recent runs"), this));
    runsTable_ = new QTableView(this);
    runsModel_ = new RunTableModel(true, this);
    runsTable_->setModel(runsModel_);
    runsTable_->verticalHeader()->setVisible(false);
    runsTable_->setSelectionBehavior(QAbstractItemView::SelectRows);
    runsTable_->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);
    layout->addWidget(runsTable_, 2);

    connect(filterEdit_, &QLineEdit::textChanged, controller_, &ProjectListController::setFilter);
    connect(refreshBtn_, &QPushButton::clicked, controller_, &ProjectListController::refresh);
    connect(createBtn_, &QPushButton::clicked, this, &ProjectListPage::createRequested);
    connect(projectsTable_, &QTableView::doubleClicked, this, &ProjectListPage::onRowDoubleClicked);
}

void ProjectListPage::onDataChanged()
{
    const ProjectMetrics m = controller_->metrics();
    metricsLabel_->setText(tr("Projects: %1    Active: %2    Done: %3    With runs: %4")
                               .arg(m.total).arg(m.active).arg(m.done).arg(m.withRuns));
    fillProjects();

    const QList<RecentRun> recent = controller_->recentRuns();
    QList<ProcessingRun> runs;
    QStringList names;
    for (const auto& r : recent) {
        runs << r.run;
        names << r.projectName;
    }
    runsModel_->setRuns(runs, names);
}

void ProjectListPage::fillProjects()
{
    const QList<Project> projects = controller_->filteredProjects();
    projectsTable_->setSortingEnabled(false);
    projectsModel_->removeRows(0, projectsModel_->rowCount());
    for (int i = 0; i < projects.size(); ++i) {
        fillRow(i, projects.at(i));
    }
    projectsTable_->setSortingEnabled(true);
}

void ProjectListPage::fillRow(int row, const Project& p)
{
    QList<QStandardItem*> items;
    auto* titleItem = new QStandardItem(p.name);
    titleItem->setData(p.id, kProjectIdRole);
    titleItem->setData(p.name.toLower(), kSortRole);
    items << titleItem;

    auto* statusItem = new QStandardItem(status_text::projectLabel(p.status));
    statusItem->setData(p.status, kSortRole);
    const QColor color = status_text::projectColor(p.status);
    if (color.isValid()) statusItem->setForeground(color);
    items << statusItem;

    auto* createdItem = new QStandardItem(json_fields::formatDateTime(p.createdAt));
    createdItem->setData(p.createdAt, kSortRole);
    items << createdItem;
    auto* updatedItem = new QStandardItem(json_fields::formatDateTime(p.updatedAt));
    updatedItem->setData(p.updatedAt, kSortRole);
    items << updatedItem;

    QString latest = "-";
    if (controller_->hasLatestRun(p.id)) {
        latest = status_text::runLabel(controller_->latestRun(p.id).status);
    }
    auto* runItem = new QStandardItem(latest);
    runItem->setData(latest, kSortRole);
    items << runItem;

    auto* descItem = new QStandardItem(p.description);
    descItem->setData(p.description, kSortRole);
    descItem->setToolTip(p.description);
    items << descItem;

    for (auto* it : items) it->setEditable(false);
    projectsModel_->insertRow(row, items);
}

void ProjectListPage::onRowDoubleClicked(const QModelIndex& index)
{
    if (!index.isValid()) return;
    const QString id = projectsModel_->item(index.row(), 0)->data(kProjectIdRole).toString();
    const Project p = controller_->projectById(id);
    if (!p.id.isEmpty()) emit projectOpened(p);
}
