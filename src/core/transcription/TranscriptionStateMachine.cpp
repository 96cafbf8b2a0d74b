#include "TranscriptionStateMachine.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QMutexLocker>
#include <algorithm>

namespace VoiceScribe {

TranscriptionStateMachine::TranscriptionStateMachine() {
    current_.timestamp = QDateTime::currentDateTime();
}

TranscriptionState TranscriptionStateMachine::state() const {
    QMutexLocker locker(&mutex_);
    return current_.state;
}

TranscriptionProgress TranscriptionStateMachine::progress() const {
    QMutexLocker locker(&mutex_);
    return current_;
}

int TranscriptionStateMachine::progressPercentage() const {
    QMutexLocker locker(&mutex_);
    return current_.percentage;
}

QString TranscriptionStateMachine::statusMessage() const {
    QMutexLocker locker(&mutex_);
    if (!current_.message.isEmpty()) {
        return current_.message;
    }
    return defaultMessage(current_.state, current_.percentage);
}

QList<TranscriptionProgress> TranscriptionStateMachine::history() const {
    QMutexLocker locker(&mutex_);
    return history_;
}

Expected<void, TranscriptionError> TranscriptionStateMachine::transitionTo(TranscriptionState target,
                                                                          const ProgressUpdate& update) {
    QMutexLocker locker(&mutex_);

    if (!isTransitionAllowed(current_.state, target)) {
        Logger::instance().warn("Rejected transition {} -> {}",
                                stateToString(current_.state).toStdString(),
                                stateToString(target).toStdString());
        return makeUnexpected(TranscriptionError::InvalidTransition);
    }

    TranscriptionProgress next;
    next.state = target;
    next.percentage = clampPercentage(update.percentage);
    next.currentChunk = update.currentChunk;
    next.totalChunks = update.totalChunks;
    next.estimatedTimeRemaining = update.estimatedTimeRemaining;
    next.message = update.message;
    next.timestamp = QDateTime::currentDateTime();

    Logger::instance().debug("Transcription state {} -> {} ({}%)",
                             stateToString(current_.state).toStdString(),
                             stateToString(target).toStdString(),
                             next.percentage);

    current_ = next;
    history_.append(next);
    return {};
}

Expected<void, TranscriptionError> TranscriptionStateMachine::updateProgress(const ProgressUpdate& update) {
    QMutexLocker locker(&mutex_);

    if (!isActiveState(current_.state)) {
        return makeUnexpected(TranscriptionError::InvalidTransition);
    }

    current_.percentage = clampPercentage(update.percentage);
    current_.currentChunk = update.currentChunk;
    current_.totalChunks = update.totalChunks;
    current_.estimatedTimeRemaining = update.estimatedTimeRemaining;
    if (!update.message.isEmpty()) {
        current_.message = update.message;
    }
    current_.timestamp = QDateTime::currentDateTime();
    return {};
}

bool TranscriptionStateMachine::canTransitionTo(TranscriptionState target) const {
    QMutexLocker locker(&mutex_);
    return isTransitionAllowed(current_.state, target);
}

bool TranscriptionStateMachine::isActive() const {
    return isActiveState(state());
}

bool TranscriptionStateMachine::isTerminal() const {
    return isTerminalState(state());
}

void TranscriptionStateMachine::reset() {
    QMutexLocker locker(&mutex_);
    current_ = TranscriptionProgress();
    current_.timestamp = QDateTime::currentDateTime();
    history_.clear();
}

QList<TranscriptionState> TranscriptionStateMachine::allowedTransitions(TranscriptionState from) {
    using S = TranscriptionState;
    switch (from) {
        case S::Ready:
            return {S::Preparing, S::Cancelled};
        case S::Preparing:
            return {S::DetectingLanguage, S::Transcribing, S::Failed, S::Cancelled};
        case S::DetectingLanguage:
            return {S::Transcribing, S::Failed, S::Cancelled};
        case S::Transcribing:
            return {S::PostProcessing, S::Completed, S::Failed, S::Cancelled};
        case S::PostProcessing:
            return {S::Completed, S::Failed, S::Cancelled};
        case S::Completed:
        case S::Failed:
        case S::Cancelled:
            return {S::Ready};
    }
    return {};
}

bool TranscriptionStateMachine::isTransitionAllowed(TranscriptionState from, TranscriptionState to) {
    return allowedTransitions(from).contains(to);
}

bool TranscriptionStateMachine::isActiveState(TranscriptionState state) {
    return state == TranscriptionState::Preparing ||
           state == TranscriptionState::DetectingLanguage ||
           state == TranscriptionState::Transcribing ||
           state == TranscriptionState::PostProcessing;
}

bool TranscriptionStateMachine::isTerminalState(TranscriptionState state) {
    return state == TranscriptionState::Completed ||
           state == TranscriptionState::Failed ||
           state == TranscriptionState::Cancelled;
}

QString TranscriptionStateMachine::defaultMessage(TranscriptionState state, int percentage) {
    switch (state) {
        case TranscriptionState::Ready: return "Ready to start transcription";
        case TranscriptionState::Preparing: return "Preparing transcription resources...";
        case TranscriptionState::DetectingLanguage: return "Detecting audio language...";
        case TranscriptionState::Transcribing: return QString("Transcribing audio... (%1%)").arg(percentage);
        case TranscriptionState::PostProcessing: return "Processing transcript...";
        case TranscriptionState::Completed: return "Transcription completed successfully";
        case TranscriptionState::Failed: return "Transcription failed";
        case TranscriptionState::Cancelled: return "Transcription cancelled";
    }
    return QString();
}

int TranscriptionStateMachine::clampPercentage(int percentage) {
    return std::clamp(percentage, 0, 100);
}

} // namespace VoiceScribe
