#include "TranscriptionTypes.hpp"

namespace VoiceScribe {

QString stateToString(TranscriptionState state) {
    switch (state) {
        case TranscriptionState::Ready: return "Ready";
        case TranscriptionState::Preparing: return "Preparing";
        case TranscriptionState::DetectingLanguage: return "Detecting Language";
        case TranscriptionState::Transcribing: return "Transcribing";
        case TranscriptionState::PostProcessing: return "Post-processing";
        case TranscriptionState::Completed: return "Completed";
        case TranscriptionState::Failed: return "Failed";
        case TranscriptionState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

QString errorToString(TranscriptionError error) {
    switch (error) {
        case TranscriptionError::InvalidTransition: return "Invalid state transition";
        case TranscriptionError::AudioUnreadable: return "Audio file could not be read";
        case TranscriptionError::ChunkTranscriptionError: return "Chunk transcription failed";
        case TranscriptionError::ModelNotFound: return "Model not found";
        case TranscriptionError::ModelNotDownloaded: return "Model is not downloaded";
        case TranscriptionError::DownloadFailed: return "Model download failed";
        case TranscriptionError::IntegrityCheckFailed: return "File integrity check failed";
        case TranscriptionError::Cancelled: return "Transcription cancelled";
        case TranscriptionError::JobAlreadyActive: return "A transcription job is already running";
        case TranscriptionError::ModelLoadFailed: return "Failed to load speech model";
        case TranscriptionError::SinkUnavailable: return "Transcript file could not be written";
    }
    return "Unknown error";
}

} // namespace VoiceScribe
