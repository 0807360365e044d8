#pragma once

// ============================================================================
// InkSettings - Tunable parameters of an ink document
// ============================================================================
// Part of the SpeedyInk document model
//
// Values are read from QSettings (application settings or an INI file given
// on the command line). Missing keys fall back to the defaults below.
// ============================================================================

#include <QString>
#include <QtGlobal>

class QSettings;

/**
 * @brief Canvas extent, index tuning and eraser geometry.
 *
 * Canvas width/height are fixed once a document is created with them.
 */
struct InkSettings {
    qreal canvasWidth = 8000.0;         ///< Document extent, also the index root
    qreal canvasHeight = 8000.0;
    int regionCapacity = 256;           ///< Points per quad region before it splits
    qreal eraserWidth = 32.0;           ///< Eraser hit-test box size in canvas units
    qreal eraserHeight = 20.0;

    /**
     * @brief Read values from @p settings, keeping defaults for missing keys.
     *
     * Non-positive sizes and capacities are rejected with a warning.
     */
    void load(QSettings& settings);

    /**
     * @brief Write all values to @p settings.
     */
    void save(QSettings& settings) const;

    /**
     * @brief Load settings from an INI file.
     * @param iniPath Path to the INI file.
     * @param ok Set to false if the file is missing or unreadable.
     */
    static InkSettings fromFile(const QString& iniPath, bool* ok = nullptr);
};
