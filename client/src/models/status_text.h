#pragma once
#include <QColor>
#include <QString>

// Display labels and colors for backend status values. Unknown values are
// shown as they arrive, with no color.
namespace status_text {

QString projectLabel(const QString& status);
QColor projectColor(const QString& status);

QString runLabel(const QString& status);
QColor runColor(const QString& status);

QString processingModeLabel(const QString& mode);

} // namespace status_text
