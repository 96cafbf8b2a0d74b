#include <QtTest/QtTest>
#include <QtConcurrent/QtConcurrent>
#include <atomic>

#include "../src/core/transcription/TranscriptionStateMachine.hpp"
#include "utils/TestUtils.hpp"

using namespace VoiceScribe;
using namespace VoiceScribe::Test;

using S = TranscriptionState;

class TestStateMachine : public QObject {
    Q_OBJECT

private slots:
    void testInitialState();
    void testFullHappyPath();
    void testDetectionCanBeSkipped();
    void testRejectedTransitionLeavesStateUnchanged();
    void testTerminalStatesOnlyReturnToReady();
    void testTransitionTableIsComplete();
    void testPercentageIsClamped();
    void testUpdateProgressOnlyWhileActive();
    void testStatusMessages();
    void testResetClearsHistory();
    void testConcurrentReadersSeeConsistentSnapshots();
};

void TestStateMachine::testInitialState() {
    TranscriptionStateMachine machine;
    QVERIFY(machine.state() == S::Ready);
    QVERIFY(!machine.isActive());
    QVERIFY(!machine.isTerminal());
    QCOMPARE(machine.progressPercentage(), 0);
    QVERIFY(machine.history().isEmpty());
}

void TestStateMachine::testFullHappyPath() {
    TranscriptionStateMachine machine;

    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Preparing));
    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::DetectingLanguage, ProgressUpdate{5, "Detecting"}));
    QVERIFY(machine.isActive());
    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Transcribing, ProgressUpdate{10, "Transcribing", 0, 3}));
    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::PostProcessing, ProgressUpdate{95}));
    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Completed, ProgressUpdate{100, "Done"}));

    QVERIFY(machine.isTerminal());
    QVERIFY(!machine.isActive());

    const QList<TranscriptionProgress> history = machine.history();
    QCOMPARE(history.size(), 5);
    QVERIFY(history.at(0).state == S::Preparing);
    QVERIFY(history.at(2).state == S::Transcribing);
    QCOMPARE(history.at(2).totalChunks, 3);
    QVERIFY(history.last().state == S::Completed);
    QCOMPARE(history.last().percentage, 100);
}

void TestStateMachine::testDetectionCanBeSkipped() {
    TranscriptionStateMachine machine;
    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Preparing));
    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Transcribing));
    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Completed, ProgressUpdate{100}));
    QVERIFY(machine.state() == S::Completed);
}

void TestStateMachine::testRejectedTransitionLeavesStateUnchanged() {
    TranscriptionStateMachine machine;
    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Preparing, ProgressUpdate{3, "Preparing"}));

    auto result = machine.transitionTo(S::Completed, ProgressUpdate{100, "Nope"});
    ASSERT_EXPECTED_ERROR(result, TranscriptionError::InvalidTransition);

    QVERIFY(machine.state() == S::Preparing);
    QCOMPARE(machine.progressPercentage(), 3);
    QCOMPARE(machine.statusMessage(), QString("Preparing"));
    QCOMPARE(machine.history().size(), 1);

    // Same-state transitions are not in the table
    ASSERT_EXPECTED_ERROR(machine.transitionTo(S::Preparing), TranscriptionError::InvalidTransition);
}

void TestStateMachine::testTerminalStatesOnlyReturnToReady() {
    const QList<S> terminals = {S::Completed, S::Failed, S::Cancelled};
    const QList<S> all = {S::Ready, S::Preparing, S::DetectingLanguage, S::Transcribing,
                          S::PostProcessing, S::Completed, S::Failed, S::Cancelled};

    for (S terminal : terminals) {
        QVERIFY(TranscriptionStateMachine::isTerminalState(terminal));
        for (S target : all) {
            QCOMPARE(TranscriptionStateMachine::isTransitionAllowed(terminal, target), target == S::Ready);
        }
    }

    TranscriptionStateMachine machine;
    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Preparing));
    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Failed));
    ASSERT_EXPECTED_ERROR(machine.transitionTo(S::Preparing), TranscriptionError::InvalidTransition);
    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Ready));
    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Preparing));
}

void TestStateMachine::testTransitionTableIsComplete() {
    QVERIFY(TranscriptionStateMachine::allowedTransitions(S::Ready) == (QList<S>{S::Preparing, S::Cancelled}));
    QVERIFY(TranscriptionStateMachine::allowedTransitions(S::Preparing) == (QList<S>{S::DetectingLanguage, S::Transcribing, S::Failed, S::Cancelled}));
    QVERIFY(TranscriptionStateMachine::allowedTransitions(S::DetectingLanguage) == (QList<S>{S::Transcribing, S::Failed, S::Cancelled}));
    QVERIFY(TranscriptionStateMachine::allowedTransitions(S::Transcribing) == (QList<S>{S::PostProcessing, S::Completed, S::Failed, S::Cancelled}));
    QVERIFY(TranscriptionStateMachine::allowedTransitions(S::PostProcessing) == (QList<S>{S::Completed, S::Failed, S::Cancelled}));
}

void TestStateMachine::testPercentageIsClamped() {
    TranscriptionStateMachine machine;
    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Preparing, ProgressUpdate{-20}));
    QCOMPARE(machine.progressPercentage(), 0);

    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Transcribing, ProgressUpdate{250}));
    QCOMPARE(machine.progressPercentage(), 100);
    QCOMPARE(machine.history().last().percentage, 100);
}

void TestStateMachine::testUpdateProgressOnlyWhileActive() {
    TranscriptionStateMachine machine;
    ASSERT_EXPECTED_ERROR(machine.updateProgress(ProgressUpdate{10}), TranscriptionError::InvalidTransition);

    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Preparing));
    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Transcribing, ProgressUpdate{10, QString(), 0, 4}));

    ProgressUpdate update;
    update.percentage = 40;
    update.currentChunk = 2;
    update.totalChunks = 4;
    update.estimatedTimeRemaining = 30;
    update.message = "Transcribing chunk 2 of 4...";
    ASSERT_EXPECTED_VALUE(machine.updateProgress(update));

    const TranscriptionProgress progress = machine.progress();
    QVERIFY(progress.state == S::Transcribing);
    QCOMPARE(progress.percentage, 40);
    QCOMPARE(progress.currentChunk, 2);
    QCOMPARE(progress.estimatedTimeRemaining, 30);
    QCOMPARE(machine.history().size(), 2);

    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Cancelled));
    ASSERT_EXPECTED_ERROR(machine.updateProgress(update), TranscriptionError::InvalidTransition);
}

void TestStateMachine::testStatusMessages() {
    TranscriptionStateMachine machine;
    QCOMPARE(machine.statusMessage(), QString("Ready to start transcription"));

    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Preparing));
    QCOMPARE(machine.statusMessage(), QString("Preparing transcription resources..."));

    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Transcribing, ProgressUpdate{42}));
    QCOMPARE(machine.statusMessage(), QString("Transcribing audio... (42%)"));

    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Failed, ProgressUpdate{42, "Audio file not found or inaccessible"}));
    QCOMPARE(machine.statusMessage(), QString("Audio file not found or inaccessible"));

    QCOMPARE(stateToString(S::DetectingLanguage), QString("Detecting Language"));
    QCOMPARE(stateToString(S::PostProcessing), QString("Post-processing"));
}

void TestStateMachine::testResetClearsHistory() {
    TranscriptionStateMachine machine;
    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Preparing));
    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Cancelled));

    machine.reset();
    QVERIFY(machine.state() == S::Ready);
    QVERIFY(machine.history().isEmpty());
    QCOMPARE(machine.progressPercentage(), 0);
}

void TestStateMachine::testConcurrentReadersSeeConsistentSnapshots() {
    TranscriptionStateMachine machine;
    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Preparing, ProgressUpdate{0, "p"}));
    ASSERT_EXPECTED_VALUE(machine.transitionTo(S::Transcribing, ProgressUpdate{10, "t"}));

    std::atomic<bool> stop{false};
    std::atomic<int> inconsistent{0};
    QFuture<void> reader = QtConcurrent::run([&]() {
        while (!stop.load()) {
            const TranscriptionProgress snapshot = machine.progress();
            // Writers keep message == percentage for every snapshot
            if (snapshot.state == S::Transcribing && snapshot.message != QString::number(snapshot.percentage)
                && snapshot.message != "t") {
                ++inconsistent;
            }
        }
    });

    for (int i = 0; i <= 100; ++i) {
        ProgressUpdate update;
        update.percentage = i;
        update.message = QString::number(i);
        ASSERT_EXPECTED_VALUE(machine.updateProgress(update));
    }
    stop = true;
    reader.waitForFinished();

    QCOMPARE(inconsistent.load(), 0);
}

int runTestStateMachine(int argc, char** argv) {
    TestStateMachine test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_state_machine.moc"
