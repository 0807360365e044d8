#include "CliHandler.h"
#include "../core/InkDocument.h"
#include "../core/InkOperation.h"
#include "../core/InkSettings.h"
#include "../core/LocalSequencer.h"

#include <QCoreApplication>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QTextStream>

/**
 * @file CliHandler.cpp
 * @brief Implementation of CLI command handlers.
 *
 * @see CliHandler.h for API documentation
 */

namespace Cli {

// =============================================================================
// Helper Functions
// =============================================================================

OutputMode getOutputMode(const QCommandLineParser& parser)
{
    if (parser.isSet(QStringLiteral("json"))) {
        return OutputMode::Json;
    }
    if (parser.isSet(QStringLiteral("verbose"))) {
        return OutputMode::Verbose;
    }
    return OutputMode::Simple;
}

bool parseRect(const QString& text, Rectangle* rect)
{
    const QStringList parts = text.split(QLatin1Char(','));
    if (parts.size() != 4) {
        return false;
    }

    qreal values[4];
    for (int i = 0; i < 4; ++i) {
        bool ok = false;
        values[i] = parts[i].trimmed().toDouble(&ok);
        if (!ok) {
            return false;
        }
    }
    if (values[2] <= 0.0 || values[3] <= 0.0) {
        return false;
    }

    *rect = Rectangle(values[0], values[1], values[2], values[3]);
    return true;
}

static void reportError(const QString& message)
{
    QTextStream err(stderr);
    err << QCoreApplication::translate("CLI", "Error: ") << message << "\n";
}

static void printJson(const QJsonObject& obj)
{
    QTextStream out(stdout);
    out << QJsonDocument(obj).toJson(QJsonDocument::Indented);
}

/**
 * @brief Settings from --config, or defaults.
 * @return False (after reporting) if --config was given but unreadable.
 */
static bool loadSettings(const QCommandLineParser& parser, InkSettings* settings)
{
    const QString configPath = parser.value(QStringLiteral("config"));
    if (configPath.isEmpty()) {
        *settings = InkSettings();
        return true;
    }

    bool ok = false;
    *settings = InkSettings::fromFile(configPath, &ok);
    if (!ok) {
        reportError(QCoreApplication::translate("CLI", "Cannot read config file: %1").arg(configPath));
    }
    return ok;
}

/**
 * @brief Load the snapshot named by the first positional argument.
 * @param exitCode Receives the exit code on failure.
 */
static std::unique_ptr<InkDocument> loadSnapshotArg(const QCommandLineParser& parser, int* exitCode)
{
    const QStringList inputs = parser.positionalArguments();
    if (inputs.size() != 1) {
        reportError(QCoreApplication::translate("CLI", "Exactly one snapshot file is required."));
        *exitCode = ExitCode::InvalidArgs;
        return nullptr;
    }

    InkSettings settings;
    if (!loadSettings(parser, &settings)) {
        *exitCode = ExitCode::IoError;
        return nullptr;
    }

    auto doc = InkDocument::loadFromFile(inputs.first(), settings);
    if (!doc) {
        reportError(QCoreApplication::translate("CLI", "Cannot load snapshot: %1").arg(inputs.first()));
        *exitCode = ExitCode::IoError;
    }
    return doc;
}

// =============================================================================
// Replay Handler
// =============================================================================

int handleReplay(const QCommandLineParser& parser)
{
    const OutputMode outputMode = getOutputMode(parser);

    const QStringList inputs = parser.positionalArguments();
    if (inputs.size() != 1) {
        reportError(QCoreApplication::translate("CLI",
            "Exactly one operation log is required. Use 'speedyink replay --help' for usage."));
        return ExitCode::InvalidArgs;
    }

    const QString outputPath = parser.value(QStringLiteral("output"));
    if (outputPath.isEmpty()) {
        reportError(QCoreApplication::translate("CLI",
            "Output path required. Use -o or --output to specify the snapshot file."));
        return ExitCode::InvalidArgs;
    }

    bool replicasOk = false;
    const int replicaCount = parser.value(QStringLiteral("replicas")).toInt(&replicasOk);
    if (!replicasOk || replicaCount < 1) {
        reportError(QCoreApplication::translate("CLI", "--replicas must be a positive integer."));
        return ExitCode::InvalidArgs;
    }

    InkSettings settings;
    if (!loadSettings(parser, &settings)) {
        return ExitCode::IoError;
    }

    QFile logFile(inputs.first());
    if (!logFile.open(QIODevice::ReadOnly | QIODevice::Text)) {
        reportError(QCoreApplication::translate("CLI", "Cannot open operation log: %1 (%2)")
            .arg(inputs.first(), logFile.errorString()));
        return ExitCode::IoError;
    }

    // Every replica starts empty and sees the log as remote operations
    LocalSequencer sequencer;
    std::vector<std::unique_ptr<InkDocument>> replicas;
    for (int i = 0; i < replicaCount; ++i) {
        replicas.push_back(std::make_unique<InkDocument>(settings));
        sequencer.connectReplica(replicas.back().get());
    }

    int lineNumber = 0;
    int skipped = 0;
    QTextStream err(stderr);
    while (!logFile.atEnd()) {
        const QByteArray line = logFile.readLine().trimmed();
        ++lineNumber;
        if (line.isEmpty()) {
            continue;
        }

        QJsonParseError parseError;
        const QJsonDocument json = QJsonDocument::fromJson(line, &parseError);
        std::optional<InkOperation> op;
        if (parseError.error == QJsonParseError::NoError && json.isObject()) {
            op = operationFromJson(json.object());
        }
        if (!op) {
            ++skipped;
            if (outputMode != OutputMode::Json) {
                err << QCoreApplication::translate("CLI", "Skipping line %1: not a valid operation")
                           .arg(lineNumber) << "\n";
            }
            continue;
        }

        sequencer.inject(*op);
        if (outputMode == OutputMode::Verbose) {
            QTextStream(stdout) << sequencer.sequenceNumber() << " " << operationType(*op) << "\n";
        }
    }

    const int applied = sequencer.deliverAll();

    const QByteArray reference = replicas.front()->snapshot();
    bool converged = true;
    for (const auto& replica : replicas) {
        if (replica->snapshot() != reference) {
            converged = false;
        }
    }

    if (!replicas.front()->saveToFile(outputPath)) {
        reportError(QCoreApplication::translate("CLI", "Cannot write snapshot: %1").arg(outputPath));
        return ExitCode::IoError;
    }

    int pointCount = 0;
    for (const InkStroke* stroke : replicas.front()->strokes()) {
        pointCount += stroke->points.size();
    }

    if (outputMode == OutputMode::Json) {
        QJsonObject obj;
        obj["operations"] = applied;
        obj["skipped"] = skipped;
        obj["replicas"] = replicaCount;
        obj["converged"] = converged;
        obj["strokes"] = replicas.front()->strokeCount();
        obj["points"] = pointCount;
        obj["output"] = outputPath;
        printJson(obj);
    } else {
        QTextStream out(stdout);
        out << QCoreApplication::translate("CLI", "Replayed %1 operations (%2 skipped) into %3 replica(s)")
                   .arg(applied).arg(skipped).arg(replicaCount) << "\n";
        out << QCoreApplication::translate("CLI", "%1 strokes, %2 points -> %3")
                   .arg(replicas.front()->strokeCount()).arg(pointCount).arg(outputPath) << "\n";
    }

    if (!converged) {
        reportError(QCoreApplication::translate("CLI", "Replicas diverged after replay."));
        return ExitCode::TotalFailure;
    }
    if (applied == 0 && skipped > 0) {
        return ExitCode::TotalFailure;
    }
    return skipped > 0 ? ExitCode::PartialFailure : ExitCode::Success;
}

// =============================================================================
// Query Handler
// =============================================================================

int handleQuery(const QCommandLineParser& parser)
{
    const OutputMode outputMode = getOutputMode(parser);

    Rectangle rect;
    if (!parseRect(parser.value(QStringLiteral("rect")), &rect)) {
        reportError(QCoreApplication::translate("CLI", "--rect x,y,width,height is required."));
        return ExitCode::InvalidArgs;
    }

    int exitCode = ExitCode::Success;
    auto doc = loadSnapshotArg(parser, &exitCode);
    if (!doc) {
        return exitCode;
    }

    const QStringList ids = doc->hitTest(rect, parser.isSet(QStringLiteral("include-erased")));

    if (outputMode == OutputMode::Json) {
        QJsonObject obj;
        obj["rect"] = rect.toJson();
        obj["strokes"] = QJsonArray::fromStringList(ids);
        printJson(obj);
        return ExitCode::Success;
    }

    QTextStream out(stdout);
    for (const QString& id : ids) {
        if (outputMode == OutputMode::Verbose) {
            const InkStroke* stroke = doc->stroke(id);
            out << id << "  points=" << stroke->points.size()
                << (stroke->inactive ? "  erased" : "") << "\n";
        } else {
            out << id << "\n";
        }
    }
    return ExitCode::Success;
}

// =============================================================================
// Partitions Handler
// =============================================================================

int handlePartitions(const QCommandLineParser& parser)
{
    const OutputMode outputMode = getOutputMode(parser);

    int exitCode = ExitCode::Success;
    auto doc = loadSnapshotArg(parser, &exitCode);
    if (!doc) {
        return exitCode;
    }

    Rectangle viewport(0, 0, doc->width(), doc->height());
    if (parser.isSet(QStringLiteral("rect")) &&
        !parseRect(parser.value(QStringLiteral("rect")), &viewport)) {
        reportError(QCoreApplication::translate("CLI", "--rect must be x,y,width,height."));
        return ExitCode::InvalidArgs;
    }

    QVector<Rectangle> rects;
    doc->gatherViewportRects(viewport, rects);

    if (outputMode == OutputMode::Json) {
        QJsonArray rectsArray;
        for (const auto& r : rects) {
            rectsArray.append(r.toJson());
        }
        QJsonObject obj;
        obj["viewport"] = viewport.toJson();
        obj["regions"] = rectsArray;
        printJson(obj);
        return ExitCode::Success;
    }

    QTextStream out(stdout);
    if (outputMode == OutputMode::Verbose) {
        out << QCoreApplication::translate("CLI", "%1 regions intersect the viewport").arg(rects.size()) << "\n";
    }
    for (const auto& r : rects) {
        out << r.x << "," << r.y << "," << r.width << "," << r.height << "\n";
    }
    return ExitCode::Success;
}

// =============================================================================
// Info Handler
// =============================================================================

int handleInfo(const QCommandLineParser& parser)
{
    const OutputMode outputMode = getOutputMode(parser);

    int exitCode = ExitCode::Success;
    auto doc = loadSnapshotArg(parser, &exitCode);
    if (!doc) {
        return exitCode;
    }

    int pointCount = 0;
    int activeCount = 0;
    for (const InkStroke* stroke : doc->strokes()) {
        pointCount += stroke->points.size();
        if (!stroke->inactive) {
            ++activeCount;
        }
    }
    const QuadTree& index = doc->strokeIndex();

    if (outputMode == OutputMode::Json) {
        QJsonObject obj;
        obj["width"] = doc->width();
        obj["height"] = doc->height();
        obj["strokes"] = doc->strokeCount();
        obj["activeStrokes"] = activeCount;
        obj["points"] = pointCount;
        obj["indexedPoints"] = index.pointCount();
        obj["leaves"] = index.leafCount();
        obj["depth"] = index.depth();
        printJson(obj);
        return ExitCode::Success;
    }

    QTextStream out(stdout);
    out << "canvas:   " << doc->width() << " x " << doc->height() << "\n";
    out << "strokes:  " << doc->strokeCount() << " (" << activeCount << " active)\n";
    out << "points:   " << pointCount << " (" << index.pointCount() << " indexed)\n";
    out << "regions:  " << index.leafCount() << " leaves, depth " << index.depth() << "\n";
    return ExitCode::Success;
}

} // namespace Cli
