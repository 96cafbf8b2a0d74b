#include "MockComponents.hpp"

#include <QtCore/QMutexLocker>
#include <QtCore/QThread>
#include <cmath>

namespace VoiceScribe {
namespace Test {

namespace {

qint64 startKey(double seconds) {
    return static_cast<qint64>(std::llround(seconds * 1000.0));
}

// Non-owning SpeechModel forwarding to a shared mock
class SharedSpeechModel : public SpeechModel {
public:
    explicit SharedSpeechModel(std::shared_ptr<MockSpeechModel> target)
        : target_(std::move(target)) {
    }

    Expected<QString, SpeechModelError> detectLanguage(const PcmBuffer& samples) override {
        return target_->detectLanguage(samples);
    }

    Expected<QString, SpeechModelError> transcribe(const PcmBuffer& samples,
                                                   const QString& languageHint) override {
        return target_->transcribe(samples, languageHint);
    }

private:
    std::shared_ptr<MockSpeechModel> target_;
};

}

// MockAudioDecoder implementation
void MockAudioDecoder::setDuration(double seconds) {
    QMutexLocker locker(&mutex_);
    duration_ = seconds;
    durationFails_ = false;
}

void MockAudioDecoder::setDurationError(AudioError error) {
    QMutexLocker locker(&mutex_);
    durationFails_ = true;
    durationError_ = error;
}

void MockAudioDecoder::failExtractionAt(double startSeconds, AudioError error) {
    QMutexLocker locker(&mutex_);
    failingStarts_.insert(startKey(startSeconds), error);
}

Expected<double, AudioError> MockAudioDecoder::probeDuration(const QString& filePath) {
    Q_UNUSED(filePath)
    QMutexLocker locker(&mutex_);
    ++probes_;
    if (durationFails_) {
        return makeUnexpected(durationError_);
    }
    return duration_;
}

Expected<PcmBuffer, AudioError> MockAudioDecoder::extractPcm(const QString& filePath,
                                                             double startSeconds,
                                                             double durationSeconds) {
    Q_UNUSED(filePath)
    QMutexLocker locker(&mutex_);
    extracted_.append(qMakePair(startSeconds, durationSeconds));

    const qint64 key = startKey(startSeconds);
    if (failingStarts_.contains(key)) {
        return makeUnexpected(failingStarts_.value(key));
    }
    if (durationSeconds <= 0.0) {
        return makeUnexpected(AudioError::InvalidRange);
    }
    // Keep buffers small; only the length ratio matters to the mocks
    return PcmBuffer(static_cast<size_t>(std::ceil(durationSeconds * 10.0)), qint16(0));
}

QList<QPair<double, double>> MockAudioDecoder::extractedRanges() const {
    QMutexLocker locker(&mutex_);
    return extracted_;
}

int MockAudioDecoder::probeCount() const {
    QMutexLocker locker(&mutex_);
    return probes_;
}

// MockSpeechModel implementation
void MockSpeechModel::setDetectedLanguage(const QString& language) {
    QMutexLocker locker(&mutex_);
    detectedLanguage_ = language;
    detectionFails_ = false;
}

void MockSpeechModel::setDetectionError(SpeechModelError error) {
    QMutexLocker locker(&mutex_);
    detectionFails_ = true;
    detectionError_ = error;
}

void MockSpeechModel::failTranscriptionCall(int callNumber, SpeechModelError error) {
    QMutexLocker locker(&mutex_);
    failingCalls_.insert(callNumber, error);
}

void MockSpeechModel::setBlocking(bool blocking) {
    blocking_ = blocking;
}

void MockSpeechModel::release() {
    blocking_ = false;
}

Expected<QString, SpeechModelError> MockSpeechModel::detectLanguage(const PcmBuffer& samples) {
    QMutexLocker locker(&mutex_);
    ++detections_;
    lastDetectionSamples_ = static_cast<qint64>(samples.size());
    if (detectionFails_) {
        return makeUnexpected(detectionError_);
    }
    return detectedLanguage_;
}

Expected<QString, SpeechModelError> MockSpeechModel::transcribe(const PcmBuffer& samples,
                                                               const QString& languageHint) {
    ++waiting_;
    while (blocking_.load()) {
        QThread::msleep(5);
    }
    --waiting_;

    QMutexLocker locker(&mutex_);
    const int call = ++transcriptions_;
    hints_.append(languageHint);
    if (samples.empty()) {
        return makeUnexpected(SpeechModelError::InvalidInput);
    }
    if (failingCalls_.contains(call)) {
        return makeUnexpected(failingCalls_.value(call));
    }
    return QString("chunk %1").arg(call);
}

QStringList MockSpeechModel::languageHints() const {
    QMutexLocker locker(&mutex_);
    return hints_;
}

int MockSpeechModel::detectionCount() const {
    QMutexLocker locker(&mutex_);
    return detections_;
}

int MockSpeechModel::transcriptionCount() const {
    QMutexLocker locker(&mutex_);
    return transcriptions_;
}

qint64 MockSpeechModel::lastDetectionSampleCount() const {
    QMutexLocker locker(&mutex_);
    return lastDetectionSamples_;
}

SpeechModelFactory mockSpeechModelFactory(std::shared_ptr<MockSpeechModel> model) {
    return [model](const QString& modelPath) -> Expected<std::unique_ptr<SpeechModel>, SpeechModelError> {
        Q_UNUSED(modelPath)
        return std::unique_ptr<SpeechModel>(new SharedSpeechModel(model));
    };
}

SpeechModelFactory failingSpeechModelFactory(SpeechModelError error) {
    return [error](const QString& modelPath) -> Expected<std::unique_ptr<SpeechModel>, SpeechModelError> {
        Q_UNUSED(modelPath)
        return makeUnexpected(error);
    };
}

} // namespace Test
} // namespace VoiceScribe
