#include "WhisperSpeechModel.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QFileInfo>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QElapsedTimer>

#include <whisper.h>
#include <mutex>
#include <string>

namespace VoiceScribe {

struct WhisperSpeechModel::WhisperSpeechModelPrivate {
    whisper_context* ctx = nullptr;
    QString modelPath;
    int threads = 4;
    QMutex inferenceMutex;
};

WhisperSpeechModel::WhisperSpeechModel()
    : d(std::make_unique<WhisperSpeechModelPrivate>()) {
}

WhisperSpeechModel::~WhisperSpeechModel() {
    if (d->ctx) {
        whisper_free(d->ctx);
        d->ctx = nullptr;
        Logger::instance().info("Speech model unloaded: {}", d->modelPath.toStdString());
    }
}

void WhisperSpeechModel::installLogHandler() {
    static std::once_flag installed;
    std::call_once(installed, []() {
        whisper_log_set([](enum ggml_log_level level, const char* text, void* userData) {
            Q_UNUSED(userData)
            const QString message = QString::fromUtf8(text).trimmed();
            if (message.isEmpty()) {
                return;
            }

            switch (level) {
                case GGML_LOG_LEVEL_ERROR:
                    Logger::instance().error("{}", message.toStdString());
                    break;
                case GGML_LOG_LEVEL_WARN:
                    Logger::instance().warn("{}", message.toStdString());
                    break;
                default:
                    Logger::instance().debug("{}", message.toStdString());
                    break;
            }
        }, nullptr);
    });
}

Expected<std::unique_ptr<WhisperSpeechModel>, SpeechModelError> WhisperSpeechModel::load(const QString& modelPath,
                                                                                         int threads) {
    const QFileInfo modelFile(modelPath);
    if (!modelFile.exists() || !modelFile.isFile()) {
        Logger::instance().error("Model file not found: {}", modelPath.toStdString());
        return makeUnexpected(SpeechModelError::ModelLoadFailed);
    }

    if (modelFile.size() < MinimumModelBytes) {
        Logger::instance().error("Model file too small: {}", modelPath.toStdString());
        return makeUnexpected(SpeechModelError::InvalidModel);
    }

    installLogHandler();

    Logger::instance().info("Loading model: {}", modelPath.toStdString());
    const std::string modelPathStd = modelPath.toStdString();
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = true;

    whisper_context* ctx = whisper_init_from_file_with_params(modelPathStd.c_str(), cparams);
    if (!ctx) {
        Logger::instance().error("Failed to load model: {}", modelPath.toStdString());
        return makeUnexpected(SpeechModelError::ModelLoadFailed);
    }

    std::unique_ptr<WhisperSpeechModel> model(new WhisperSpeechModel());
    model->d->ctx = ctx;
    model->d->modelPath = modelPath;
    model->d->threads = threads > 0 ? threads : 1;

    Logger::instance().info("Model loaded: {} (vocab: {})",
                            modelFile.baseName().toStdString(), whisper_n_vocab(ctx));
    return model;
}

Expected<QString, SpeechModelError> WhisperSpeechModel::detectLanguage(const PcmBuffer& samples) {
    if (samples.empty()) {
        return makeUnexpected(SpeechModelError::InvalidInput);
    }

    QMutexLocker locker(&d->inferenceMutex);
    const std::vector<float> audio = toFloat(samples);

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.n_threads = d->threads;
    params.language = "auto";
    params.detect_language = true;
    params.single_segment = true;
    params.print_progress = false;
    params.print_timestamps = false;
    params.print_realtime = false;
    params.print_special = false;

    const int result = whisper_full(d->ctx, params, audio.data(), static_cast<int>(audio.size()));
    if (result != 0) {
        Logger::instance().warn("Language detection failed with code {}", result);
        return makeUnexpected(SpeechModelError::InferenceFailed);
    }

    const int langId = whisper_full_lang_id(d->ctx);
    const char* lang = langId >= 0 ? whisper_lang_str(langId) : nullptr;
    if (!lang) {
        return makeUnexpected(SpeechModelError::InferenceFailed);
    }
    return QString::fromUtf8(lang);
}

Expected<QString, SpeechModelError> WhisperSpeechModel::transcribe(const PcmBuffer& samples,
                                                                   const QString& languageHint) {
    if (samples.empty()) {
        return makeUnexpected(SpeechModelError::InvalidInput);
    }

    QMutexLocker locker(&d->inferenceMutex);
    const std::vector<float> audio = toFloat(samples);
    // whisper keeps the language pointer for the duration of whisper_full
    const std::string language = languageHint.toStdString();

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.n_threads = d->threads;
    params.language = language.empty() ? "en" : language.c_str();
    params.translate = false;
    params.print_progress = false;
    params.print_timestamps = false;
    params.print_realtime = false;
    params.print_special = false;

    QElapsedTimer timer;
    timer.start();

    const int result = whisper_full(d->ctx, params, audio.data(), static_cast<int>(audio.size()));
    if (result != 0) {
        Logger::instance().error("Transcription failed with code {}", result);
        return makeUnexpected(SpeechModelError::InferenceFailed);
    }

    QString text;
    const int segments = whisper_full_n_segments(d->ctx);
    for (int i = 0; i < segments; ++i) {
        const char* segment = whisper_full_get_segment_text(d->ctx, i);
        if (segment) {
            text += QString::fromUtf8(segment);
        }
    }

    Logger::instance().debug("Transcribed {} samples into {} segments in {}ms",
                             samples.size(), segments, timer.elapsed());
    return text.trimmed();
}

QString WhisperSpeechModel::modelPath() const {
    return d->modelPath;
}

std::vector<float> WhisperSpeechModel::toFloat(const PcmBuffer& samples) {
    std::vector<float> audio;
    audio.reserve(samples.size());
    for (qint16 sample : samples) {
        audio.push_back(static_cast<float>(sample) / 32768.0f);
    }
    return audio;
}

} // namespace VoiceScribe
