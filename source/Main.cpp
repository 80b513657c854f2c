// ============================================================================
// Brushwork - Main Entry Point
// ============================================================================
// The paint core has no window of its own. The executable runs the test
// suites: brushwork --test-<math|history|selection|effects|sprite|all>
// ============================================================================

#include <QGuiApplication>
#include <QStringList>
#include <QTest>
#include <QTextStream>

#include "math/TransformMathTests.h"
#include "core/UndoHistoryTests.h"
#include "rendering/SelectionClipperTests.h"
#include "rendering/EffectCacheTests.h"
#include "viewport/LayerSpriteTests.h"

// ============================================================================
// Test Runner
// ============================================================================

static int runSuite(QObject& suite, const QStringList& testArgs)
{
    return QTest::qExec(&suite, testArgs);
}

static int runTests(const QString& testType, const QStringList& testArgs)
{
    const bool all = testType == "all";
    int failures = 0;

    if (all || testType == "math") {
        TransformMathTests tests;
        failures += runSuite(tests, testArgs);
    }
    if (all || testType == "history") {
        UndoHistoryTests tests;
        failures += runSuite(tests, testArgs);
    }
    if (all || testType == "selection") {
        SelectionClipperTests tests;
        failures += runSuite(tests, testArgs);
    }
    if (all || testType == "effects") {
        EffectCacheTests tests;
        failures += runSuite(tests, testArgs);
    }
    if (all || testType == "sprite") {
        LayerSpriteTests tests;
        failures += runSuite(tests, testArgs);
    }

    return failures == 0 ? 0 : 1;
}

static void printUsage()
{
    QTextStream out(stdout);
    out << "Usage: brushwork --test-<suite> [QTest options]\n"
        << "Suites: math, history, selection, effects, sprite, all\n";
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QGuiApplication app(argc, argv);
    app.setOrganizationName("Brushwork");
    app.setApplicationName("Brushwork");

    // ========== Parse Command Line Arguments ==========
    static const QStringList suites = { "math", "history", "selection", "effects", "sprite", "all" };
    QString testToRun;
    QStringList testArgs = { QString::fromLocal8Bit(argv[0]) };

    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg.startsWith("--test-") && suites.contains(arg.mid(7))) {
            testToRun = arg.mid(7);
        } else {
            // everything else is handed to QTest (-v2, -o, function names...)
            testArgs << arg;
        }
    }

    if (testToRun.isEmpty()) {
        printUsage();
        return 2;
    }
    return runTests(testToRun, testArgs);
}
