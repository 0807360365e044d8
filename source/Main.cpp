// ============================================================================
// SpeedyInk - Main Entry Point
// ============================================================================

#include <QCoreApplication>
#include <QTest>

#include "cli/CliParser.h"
#include "core/InkOperation.h"

// Test includes
#include "geometry/RectangleTests.h"
#include "index/QuadTreeTests.h"
#include "core/InkDocumentTests.h"
#include "core/ReplicationTests.h"

// ============================================================================
// Test Runners
// ============================================================================

static int runTests(const QString& testType)
{
    if (testType == "rectangle") {
        RectangleTests tests;
        return QTest::qExec(&tests);
    }
    if (testType == "quadtree") {
        QuadTreeTests tests;
        return QTest::qExec(&tests);
    }
    if (testType == "document") {
        InkDocumentTests tests;
        return QTest::qExec(&tests);
    }
    if (testType == "replication") {
        ReplicationTests tests;
        return QTest::qExec(&tests);
    }

    // "all"
    int failures = 0;
    for (const char* suite : {"rectangle", "quadtree", "document", "replication"}) {
        failures += runTests(QString::fromLatin1(suite));
    }
    return failures == 0 ? 0 : 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("SpeedyInk");
    app.setApplicationName("speedyink");
    app.setApplicationVersion("0.3.0");

    qRegisterMetaType<ClearOperation>();
    qRegisterMetaType<CreateStrokeOperation>();
    qRegisterMetaType<StylusOperation>();
    qRegisterMetaType<EraseStrokesOperation>();

    // ========== Test Commands ==========
    QString testToRun;
    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == "--test-rectangle") {
            testToRun = "rectangle";
        } else if (arg == "--test-quadtree") {
            testToRun = "quadtree";
        } else if (arg == "--test-document") {
            testToRun = "document";
        } else if (arg == "--test-replication") {
            testToRun = "replication";
        } else if (arg == "--test-all") {
            testToRun = "all";
        }
    }

    if (!testToRun.isEmpty()) {
        return runTests(testToRun);
    }

    // ========== Command Line Tools ==========
    return Cli::run(app);
}
