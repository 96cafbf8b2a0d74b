#include <QtTest/QtTest>

#include "../src/core/transcription/TranscriptionJobController.hpp"
#include "../src/core/transcription/WhisperSpeechModel.hpp"
#include "utils/TestUtils.hpp"

using namespace VoiceScribe;
using namespace VoiceScribe::Test;

class TestWhisperSpeechModel : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();

    void testMissingModelFile();
    void testDirectoryIsNotAModel();
    void testTruncatedModelFile();
    void testCorruptModelFile();
    void testFactoryReportsLoadErrors();

private:
    QString tempDir_;
};

void TestWhisperSpeechModel::initTestCase() {
    tempDir_ = TestUtils::createTempDirectory("whisper");
}

void TestWhisperSpeechModel::cleanupTestCase() {
    TestUtils::cleanupTempDirectory(tempDir_);
}

void TestWhisperSpeechModel::testMissingModelFile() {
    auto model = WhisperSpeechModel::load(tempDir_ + "/ggml-missing.bin");
    ASSERT_EXPECTED_ERROR(model, SpeechModelError::ModelLoadFailed);
}

void TestWhisperSpeechModel::testDirectoryIsNotAModel() {
    ASSERT_EXPECTED_ERROR(WhisperSpeechModel::load(tempDir_), SpeechModelError::ModelLoadFailed);
}

void TestWhisperSpeechModel::testTruncatedModelFile() {
    const QString path = tempDir_ + "/ggml-small.bin";
    TestUtils::createModelFile(path, 4096);
    ASSERT_EXPECTED_ERROR(WhisperSpeechModel::load(path), SpeechModelError::InvalidModel);
}

void TestWhisperSpeechModel::testCorruptModelFile() {
    // Large enough to pass the size check, but without a ggml header
    const QString path = tempDir_ + "/ggml-garbage.bin";
    TestUtils::createModelFile(path, 2 * 1024 * 1024);
    ASSERT_EXPECTED_ERROR(WhisperSpeechModel::load(path, 1), SpeechModelError::ModelLoadFailed);
}

void TestWhisperSpeechModel::testFactoryReportsLoadErrors() {
    SpeechModelFactory factory = TranscriptionJobController::whisperModelFactory(2);
    auto model = factory(tempDir_ + "/ggml-missing.bin");
    ASSERT_EXPECTED_ERROR(model, SpeechModelError::ModelLoadFailed);
}

int runTestWhisperSpeechModel(int argc, char** argv) {
    TestWhisperSpeechModel test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_whisper_speech_model.moc"
