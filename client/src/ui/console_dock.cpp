#include "ui/console_dock.h"

#include <QDateTime>
#include <QHBoxLayout>
#include <QLineEdit>
#include <QMetaObject>
#include <QPushButton>
#include <QTabWidget>
#include <QPlainTextEdit>
#include <QVBoxLayout>

#include "log/log_formatter.h"

namespace {
QString levelPrefix(gme::LogLevel level) {
    switch (level) {
    case gme::LogLevel::Debug: return "[D]";
    case gme::LogLevel::Info:  return "[I]";
    case gme::LogLevel::Warn:  return "[W]";
    case gme::LogLevel::Error: return "[E]";
    }
    return "[I]";
}
} // namespace

ConsoleDock::ConsoleDock(QWidget *parent)
    : QDockWidget(parent)
{
    setObjectName("consoleDock");
    container_ = new QWidget(this);
    auto* vbox = new QVBoxLayout(container_);
    vbox->setContentsMargins(4, 4, 4, 4);
    vbox->setSpacing(4);

    auto* topBar = new QHBoxLayout();
    topBar->setSpacing(6);
    searchEdit_ = new QLineEdit(container_);
    searchEdit_->setPlaceholderText(tr("Search current tab..."));
    clearBtn_ = new QPushButton(tr("Clear"), container_);
    topBar->addWidget(searchEdit_, 1);
    topBar->addWidget(clearBtn_);
    vbox->addLayout(topBar);

    tabs_ = new QTabWidget(container_);
    logEdit_ = new QPlainTextEdit(this);
    httpEdit_ = new QPlainTextEdit(this);
    for (QPlainTextEdit* edit : {logEdit_, httpEdit_}) {
        edit->setReadOnly(true);
        edit->setMaximumBlockCount(kMaxLines);
    }

    tabs_->addTab(logEdit_, tr("Log"));
    tabs_->addTab(httpEdit_, tr("HTTP"));
    tabs_->setDocumentMode(true);
    vbox->addWidget(tabs_);

    setWidget(container_);
    setTitleBarWidget(new QWidget(this)); // hide dock title bar

    connect(searchEdit_, &QLineEdit::textChanged, this, &ConsoleDock::filterCurrent);
    connect(clearBtn_, &QPushButton::clicked, this, &ConsoleDock::clearCurrent);
}

void ConsoleDock::appendLine(QPlainTextEdit* edit, QStringList& cache, const QString& line)
{
    cache.append(line);
    if (cache.size() > kMaxLines) cache.erase(cache.begin(), cache.begin() + (cache.size() - kMaxLines));

    const QString filter = searchEdit_->text();
    if (edit == currentEdit() && !filter.isEmpty() && !line.contains(filter, Qt::CaseInsensitive)) return;
    edit->appendPlainText(line);
}

void ConsoleDock::appendInfo(const QString& msg) {
    const QString ts = QDateTime::currentDateTime().toString("HH:mm:ss.zzz");
    appendLine(logEdit_, logCache_, QString("[%1] [I] %2").arg(ts, msg));
}

void ConsoleDock::appendError(const QString& msg) {
    const QString ts = QDateTime::currentDateTime().toString("HH:mm:ss.zzz");
    appendLine(logEdit_, logCache_, QString("[%1] [E] %2").arg(ts, msg));
}

void ConsoleDock::appendRecord(int level, const QString& source, const QString& line)
{
    const QString text = levelPrefix(static_cast<gme::LogLevel>(level)) + " " + line;
    appendLine(logEdit_, logCache_, text);
    if (source == "http") appendLine(httpEdit_, httpCache_, text);
}

QPlainTextEdit* ConsoleDock::currentEdit() const {
    return tabs_ ? qobject_cast<QPlainTextEdit*>(tabs_->currentWidget()) : nullptr;
}

void ConsoleDock::filterCurrent(const QString& text) {
    QPlainTextEdit* edit = currentEdit();
    if (!edit) return;
    const QStringList& source = (edit == httpEdit_) ? httpCache_ : logCache_;
    if (text.isEmpty()) {
        edit->setPlainText(source.join('\n'));
    } else {
        QStringList filtered;
        for (const auto& line : source) {
            if (line.contains(text, Qt::CaseInsensitive)) filtered << line;
        }
        edit->setPlainText(filtered.join('\n'));
    }
    edit->moveCursor(QTextCursor::End);
}

void ConsoleDock::clearCurrent() {
    QPlainTextEdit* edit = currentEdit();
    if (edit == logEdit_) { logCache_.clear(); logEdit_->clear(); }
    else if (edit == httpEdit_) { httpCache_.clear(); httpEdit_->clear(); }
}

void ConsoleDockLogSink::consume(const gme::LogRecord& rec)
{
    if (!dock_) return;
    const QString line = QString::fromStdString(gme::LogFormatter::instance().formatLine(rec));
    const QString source = QString::fromStdString(rec.source);
    const int level = static_cast<int>(rec.level);
    QMetaObject::invokeMethod(dock_.data(), "appendRecord", Qt::QueuedConnection,
                              Q_ARG(int, level), Q_ARG(QString, source), Q_ARG(QString, line));
}
