#pragma once
#include <QWidget>

#include "models/project.h"

class ProjectListController;
class QLabel;
class QLineEdit;
class QPushButton;
class QStandardItemModel;
class QTableView;
class RunTableModel;
class StateBanner;

class ProjectListPage : public QWidget {
    Q_OBJECT
public:
    explicit ProjectListPage(ProjectListController* controller, QWidget* parent = nullptr);

signals:
    void createRequested();
    void projectOpened(const Project& project);

private slots:
    void onDataChanged();
    void onRowDoubleClicked(const QModelIndex& index);

private:
    void buildUi();
    void fillProjects();
    void fillRow(int row, const Project& p);

    ProjectListController* controller_ = nullptr;

    StateBanner* banner_ = nullptr;
    QLabel* metricsLabel_ = nullptr;
    QLineEdit* filterEdit_ = nullptr;
    QPushButton* refreshBtn_ = nullptr;
    QPushButton* createBtn_ = nullptr;
    QTableView* projectsTable_ = nullptr;
    QStandardItemModel* projectsModel_ = nullptr;
    QTableView* runsTable_ = nullptr;
    RunTableModel* runsModel_ = nullptr;
};
