#pragma once
#include <QWidget>

class QComboBox;
class QLabel;
class QPushButton;
class QTableView;
class RunHistoryController;
class RunTableModel;
class StateBanner;

class RunHistoryPage : public QWidget {
    Q_OBJECT
public:
    explicit RunHistoryPage(RunHistoryController* controller, QWidget* parent = nullptr);

    void prepare();

signals:
    void backRequested();

private slots:
    void onRunsChanged();
    void onChoicesChanged();
    void onModeChanged();
    void onStartClicked();

private:
    RunHistoryController* controller_ = nullptr;
    StateBanner* banner_ = nullptr;
    QLabel* titleLabel_ = nullptr;
    QLabel* detailsLabel_ = nullptr;
    QComboBox* modeCombo_ = nullptr;
    QComboBox* modelCombo_ = nullptr;
    QComboBox* providerCombo_ = nullptr;
    QPushButton* startBtn_ = nullptr;
    QPushButton* refreshBtn_ = nullptr;
    QPushButton* backBtn_ = nullptr;
    QTableView* table_ = nullptr;
    RunTableModel* model_ = nullptr;
};
