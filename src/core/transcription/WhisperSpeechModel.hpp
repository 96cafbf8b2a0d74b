#pragma once

#include <QtCore/QString>
#include <memory>
#include <vector>

#include "SpeechModel.hpp"

// Forward declare whisper.cpp types to avoid including the header here
struct whisper_context;

namespace VoiceScribe {

/**
 * @brief SpeechModel backed by a whisper.cpp ggml model file
 */
class WhisperSpeechModel : public SpeechModel {
public:
    static constexpr qint64 MinimumModelBytes = 1024 * 1024;

    ~WhisperSpeechModel() override;

    /**
     * @brief Load a ggml model from disk
     * @param modelPath Path to the model file
     * @param threads Inference thread count
     */
    static Expected<std::unique_ptr<WhisperSpeechModel>, SpeechModelError> load(const QString& modelPath,
                                                                                 int threads = 4);

    Expected<QString, SpeechModelError> detectLanguage(const PcmBuffer& samples) override;
    Expected<QString, SpeechModelError> transcribe(const PcmBuffer& samples,
                                                   const QString& languageHint) override;

    QString modelPath() const;

private:
    WhisperSpeechModel();

    static void installLogHandler();
    static std::vector<float> toFloat(const PcmBuffer& samples);

    struct WhisperSpeechModelPrivate;
    std::unique_ptr<WhisperSpeechModelPrivate> d;
};

} // namespace VoiceScribe
