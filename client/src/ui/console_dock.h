#pragma once
#include <QDockWidget>
#include <QPointer>
#include <QStringList>
#include <memory>

#include "log/log_sink.h"

class QPlainTextEdit;
class QTabWidget;
class QLineEdit;
class QPushButton;
class QWidget;

// Bottom dock mirroring the client log. "Log" shows every record, "HTTP"
// only the request lines.
class ConsoleDock : public QDockWidget {
    Q_OBJECT
public:
    explicit ConsoleDock(QWidget* parent = nullptr);

    // lines kept per tab, both in the widget and in the search cache
    static constexpr int kMaxLines = 5000;

    void appendInfo(const QString& msg);
    void appendError(const QString& msg);
    void filterCurrent(const QString& text);
    void clearCurrent();

public slots:
    // thread-safe entry for the log sink (queued)
    void appendRecord(int level, const QString& source, const QString& line);

private:
    QPlainTextEdit* currentEdit() const;
    void appendLine(QPlainTextEdit* edit, QStringList& cache, const QString& line);

private:
    QWidget* container_ = nullptr;
    QLineEdit* searchEdit_ = nullptr;
    QPushButton* clearBtn_ = nullptr;
    QTabWidget* tabs_ = nullptr;
    QPlainTextEdit* logEdit_ = nullptr;
    QPlainTextEdit* httpEdit_ = nullptr;
    QStringList logCache_;
    QStringList httpCache_;
};

// Forwards log records to a ConsoleDock. Records may come from any thread;
// they are queued to the dock's thread and dropped once the dock is gone.
class ConsoleDockLogSink : public gme::ILogSink {
public:
    explicit ConsoleDockLogSink(ConsoleDock* dock) : dock_(dock) {}
    void consume(const gme::LogRecord& rec) override;

private:
    QPointer<ConsoleDock> dock_;
};
