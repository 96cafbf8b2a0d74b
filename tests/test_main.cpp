#include <QtTest/QtTest>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>

#include "utils/TestUtils.hpp"
#include "../src/core/common/Logger.hpp"

// Forward declarations of test classes that are defined in separate compilation units
extern int runTestExpected(int argc, char** argv);
extern int runTestConfig(int argc, char** argv);
extern int runTestStateMachine(int argc, char** argv);
extern int runTestModelRegistry(int argc, char** argv);
extern int runTestModelAssetManager(int argc, char** argv);
extern int runTestModelDownloadWorker(int argc, char** argv);
extern int runTestAudioSegmenter(int argc, char** argv);
extern int runTestFFmpegAudioDecoder(int argc, char** argv);
extern int runTestWhisperSpeechModel(int argc, char** argv);
extern int runTestChunkedExecutor(int argc, char** argv);
extern int runTestJobController(int argc, char** argv);

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    VoiceScribe::Logger::instance().initialize("voicescribe-tests.log", VoiceScribe::Logger::Level::Trace);
    VoiceScribe::Test::TestUtils::initializeTestEnvironment();

    int totalResult = 0;
    int testCount = 0;
    int passedTests = 0;

    struct TestInfo {
        const char* name;
        int (*function)(int, char**);
    };

    TestInfo tests[] = {
        {"Expected", runTestExpected},
        {"Config", runTestConfig},
        {"StateMachine", runTestStateMachine},
        {"ModelRegistry", runTestModelRegistry},
        {"ModelAssetManager", runTestModelAssetManager},
        {"ModelDownloadWorker", runTestModelDownloadWorker},
        {"AudioSegmenter", runTestAudioSegmenter},
        {"FFmpegAudioDecoder", runTestFFmpegAudioDecoder},
        {"WhisperSpeechModel", runTestWhisperSpeechModel},
        {"ChunkedExecutor", runTestChunkedExecutor},
        {"JobController", runTestJobController}
    };

    for (const auto& test : tests) {
        qDebug() << "\n========================================";
        qDebug() << "Running test suite:" << test.name;
        qDebug() << "========================================";

        testCount++;
        int result = test.function(argc, argv);

        if (result == 0) {
            qDebug() << "Test suite" << test.name << "PASSED";
            passedTests++;
        } else {
            qDebug() << "Test suite" << test.name << "FAILED with code" << result;
            totalResult |= result;
        }
    }

    VoiceScribe::Test::TestUtils::cleanupTestEnvironment();

    // Summary
    qDebug() << "\n========================================";
    qDebug() << "TEST SUMMARY";
    qDebug() << "========================================";
    qDebug() << "Total test suites:" << testCount;
    qDebug() << "Passed:" << passedTests;
    qDebug() << "Failed:" << (testCount - passedTests);
    qDebug() << "Overall result:" << (totalResult == 0 ? "PASS" : "FAIL");

    return totalResult;
}
