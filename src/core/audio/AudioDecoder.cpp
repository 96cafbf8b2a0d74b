#include "AudioDecoder.hpp"

namespace VoiceScribe {

QString audioErrorToString(AudioError error) {
    switch (error) {
        case AudioError::FileNotFound:
            return "Audio file not found or inaccessible";
        case AudioError::PermissionDenied:
            return "Permission denied accessing audio file";
        case AudioError::InvalidFile:
            return "Audio file is corrupted or invalid format";
        case AudioError::NoAudioStream:
            return "File contains no audio stream";
        case AudioError::DecoderUnavailable:
            return "No decoder available for audio codec";
        case AudioError::DecodingFailed:
            return "Audio decoding failed";
        case AudioError::ResamplingFailed:
            return "Audio resampling failed";
        case AudioError::InvalidRange:
            return "Requested audio range is outside the file";
    }
    return "Unknown audio error";
}

} // namespace VoiceScribe
