#undef NDEBUG
#include <cassert>
#include <iostream>

#include <QApplication>
#include <QPlainTextEdit>
#include <QTabWidget>

#include "log/log_record.h"
#include "ui/console_dock.h"

static void test_line_limit_and_filter() {
    ConsoleDock dock;
    auto* tabs = dock.findChild<QTabWidget*>();
    assert(tabs && tabs->count() == 2);
    auto* log = qobject_cast<QPlainTextEdit*>(tabs->widget(0));
    auto* http = qobject_cast<QPlainTextEdit*>(tabs->widget(1));
    assert(log && http);

    const int total = ConsoleDock::kMaxLines + 250;
    for (int i = 0; i < total; ++i) {
        dock.appendRecord(static_cast<int>(gme::LogLevel::Info), i % 2 ? "http" : "ui",
                          QString("line %1").arg(i));
    }
    assert(log->document()->blockCount() == ConsoleDock::kMaxLines);
    assert(log->toPlainText().startsWith("[I] line 250\n"));
    assert(log->toPlainText().endsWith(QString("line %1").arg(total - 1)));
    assert(http->document()->blockCount() == total / 2);

    // the search rebuilds from the capped cache, oldest lines stay dropped
    dock.filterCurrent("line 2");
    assert(!log->toPlainText().contains("[I] line 2\n"));
    assert(log->toPlainText().contains("[I] line 250\n"));
    dock.filterCurrent("");
    assert(log->document()->blockCount() == ConsoleDock::kMaxLines);

    dock.clearCurrent();
    assert(log->toPlainText().isEmpty());
    assert(!http->toPlainText().isEmpty());
    std::cout << "[OK] console keeps a bounded number of lines\n";
}

int main(int argc, char** argv) {
    QApplication app(argc, argv);
    test_line_limit_and_filter();
    std::cout << "All console dock tests passed.\n";
    return 0;
}
