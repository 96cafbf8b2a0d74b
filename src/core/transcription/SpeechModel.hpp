#pragma once

#include <QtCore/QString>

#include "../audio/AudioDecoder.hpp"
#include "../common/Expected.hpp"

namespace VoiceScribe {

enum class SpeechModelError {
    ModelLoadFailed,
    InvalidModel,
    InvalidInput,
    InferenceFailed
};

inline QString speechModelErrorToString(SpeechModelError error) {
    switch (error) {
        case SpeechModelError::ModelLoadFailed: return "Failed to load speech model";
        case SpeechModelError::InvalidModel: return "Speech model file is invalid";
        case SpeechModelError::InvalidInput: return "Invalid audio input";
        case SpeechModelError::InferenceFailed: return "Speech model inference failed";
    }
    return "Unknown speech model error";
}

/**
 * @brief Black-box speech recognition capability
 *
 * Both calls take PcmBuffer samples (mono, 16 kHz). Implementations may
 * serialise calls internally; the engine never calls them concurrently for
 * one job.
 */
class SpeechModel {
public:
    virtual ~SpeechModel() = default;

    // Returns an ISO 639-1 code such as "en"
    virtual Expected<QString, SpeechModelError> detectLanguage(const PcmBuffer& samples) = 0;

    // An empty languageHint lets the engine use its default language
    virtual Expected<QString, SpeechModelError> transcribe(const PcmBuffer& samples,
                                                           const QString& languageHint) = 0;
};

} // namespace VoiceScribe
