#include "models/run_table_model.h"

#include <QBrush>

#include "models/json_fields.h"
#include "models/status_text.h"

RunTableModel::RunTableModel(bool showProject, QObject *parent)
    : QAbstractTableModel(parent),
      m_showProject(showProject)
{}

void RunTableModel::setRuns(const QList<ProcessingRun>& runs, const QStringList& projectNames)
{
    beginResetModel();
    m_runs = runs;
    m_projectNames = projectNames;
    endResetModel();
}

ProcessingRun RunTableModel::runAt(int row) const
{
    if (row < 0 || row >= m_runs.size()) return {};
    return m_runs.at(row);
}

int RunTableModel::rowById(const QString& id) const
{
    for (int i = 0; i < m_runs.size(); ++i) {
        if (m_runs[i].id == id) {
            return i;
        }
    }
    return -1;
}

int RunTableModel::rowCount(const QModelIndex &parent) const
{
    return parent.isValid() ? 0 : m_runs.size();
}

int RunTableModel::columnCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return m_showProject ? ColumnCount : ColumnCount - 1;
}

QVariant RunTableModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= m_runs.size())
        return QVariant();

    const auto& r = m_runs[index.row()];
    const int col = toColumn(index.column());

    if (role == Qt::ForegroundRole && col == StatusCol) {
        const QColor c = status_text::runColor(r.status);
        return c.isValid() ? QVariant(QBrush(c)) : QVariant();
    }

    if (role == Qt::ToolTipRole && col == ResultCol) {
        return r.resultSummary;
    }

    if (role == Qt::UserRole) {
        return r.id;
    }

    if (role == Qt::DisplayRole) {
        switch (col) {
        case ProjectCol:  return m_projectNames.value(index.row(), r.projectId);
        case StartedCol:  return json_fields::formatDateTime(r.startedAt);
        case StatusCol:   return status_text::runLabel(r.status);
        case ProviderCol: return r.provider.isEmpty() ? QStringLiteral("-") : r.provider;
        case LaunchCol:   return r.launchMode.isEmpty() ? QStringLiteral("-") : r.launchMode;
        case ResultCol:   return r.resultSummary;
        }
    }

    return {};
}

QVariant RunTableModel::headerData(int section, Qt::Orientation orientation, int role) const
{
    if (role != Qt::DisplayRole || orientation != Qt::Horizontal)
        return QVariant();

    switch (toColumn(section)) {
    case ProjectCol:
        return tr("Project");
    case StartedCol:
        return tr("Started");
    case StatusCol:
        return tr("Status");
    case ProviderCol:
        return tr("Provider");
    case LaunchCol:
        return tr("Launch");
    case ResultCol:
        return tr("Result");
    default:
        return QVariant();
    }
}
