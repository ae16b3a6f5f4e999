#pragma once
#include <QAbstractTableModel>
#include <QList>
#include <QStringList>

#include "models/processing_run.h"

// Runs as a table. The project column is only shown on the dashboard, where
// runs of several projects are mixed.
class RunTableModel : public QAbstractTableModel {
    Q_OBJECT
public:
    enum Column {
        ProjectCol = 0,
        StartedCol,
        StatusCol,
        ProviderCol,
        LaunchCol,
        ResultCol,
        ColumnCount
    };

    explicit RunTableModel(bool showProject, QObject* parent = nullptr);

    void setRuns(const QList<ProcessingRun>& runs, const QStringList& projectNames = {});
    ProcessingRun runAt(int row) const;
    int rowById(const QString& id) const;

    int rowCount(const QModelIndex& parent = {}) const override;
    int columnCount(const QModelIndex& parent = {}) const override;
    QVariant data(const QModelIndex& index, int role) const override;
    QVariant headerData(int section, Qt::Orientation, int role) const override;

private:
    int toColumn(int section) const { return m_showProject ? section : section + 1; }

    bool m_showProject = false;
    QList<ProcessingRun> m_runs;
    QStringList m_projectNames;
};
