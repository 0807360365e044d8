// ============================================================================
// InkSettings - Implementation
// ============================================================================

#include "InkSettings.h"

#include <QDebug>
#include <QFileInfo>
#include <QSettings>

namespace {

const QString KEY_CANVAS_WIDTH = QStringLiteral("canvas/width");
const QString KEY_CANVAS_HEIGHT = QStringLiteral("canvas/height");
const QString KEY_REGION_CAPACITY = QStringLiteral("index/regionCapacity");
const QString KEY_ERASER_WIDTH = QStringLiteral("eraser/width");
const QString KEY_ERASER_HEIGHT = QStringLiteral("eraser/height");

// Keep @p current if the stored value is missing or not positive
qreal positiveReal(QSettings& settings, const QString& key, qreal current)
{
    if (!settings.contains(key)) {
        return current;
    }
    bool ok = false;
    const qreal value = settings.value(key).toDouble(&ok);
    if (!ok || value <= 0.0) {
        qWarning() << "InkSettings: ignoring invalid value for" << key << settings.value(key);
        return current;
    }
    return value;
}

} // namespace

void InkSettings::load(QSettings& settings)
{
    canvasWidth = positiveReal(settings, KEY_CANVAS_WIDTH, canvasWidth);
    canvasHeight = positiveReal(settings, KEY_CANVAS_HEIGHT, canvasHeight);
    eraserWidth = positiveReal(settings, KEY_ERASER_WIDTH, eraserWidth);
    eraserHeight = positiveReal(settings, KEY_ERASER_HEIGHT, eraserHeight);

    if (settings.contains(KEY_REGION_CAPACITY)) {
        bool ok = false;
        const int capacity = settings.value(KEY_REGION_CAPACITY).toInt(&ok);
        if (ok && capacity > 0) {
            regionCapacity = capacity;
        } else {
            qWarning() << "InkSettings: ignoring invalid region capacity"
                       << settings.value(KEY_REGION_CAPACITY);
        }
    }
}

void InkSettings::save(QSettings& settings) const
{
    settings.setValue(KEY_CANVAS_WIDTH, canvasWidth);
    settings.setValue(KEY_CANVAS_HEIGHT, canvasHeight);
    settings.setValue(KEY_REGION_CAPACITY, regionCapacity);
    settings.setValue(KEY_ERASER_WIDTH, eraserWidth);
    settings.setValue(KEY_ERASER_HEIGHT, eraserHeight);
}

InkSettings InkSettings::fromFile(const QString& iniPath, bool* ok)
{
    InkSettings result;
    if (!QFileInfo::exists(iniPath)) {
        qWarning() << "InkSettings: config file not found" << iniPath;
        if (ok) {
            *ok = false;
        }
        return result;
    }

    QSettings settings(iniPath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        qWarning() << "InkSettings: cannot read config file" << iniPath;
        if (ok) {
            *ok = false;
        }
        return result;
    }

    result.load(settings);
    if (ok) {
        *ok = true;
    }
    return result;
}
