#pragma once

#include <QtCore/QList>
#include <QtCore/QMutex>

#include "TranscriptionTypes.hpp"
#include "../common/Expected.hpp"

namespace VoiceScribe {

/**
 * @brief Lifecycle of a single transcription job
 *
 * The only writer of job-visible status. A transition outside the table
 * fails with InvalidTransition and leaves the state untouched. State and
 * progress fields are replaced together under one lock, so readers always
 * see a consistent snapshot.
 */
class TranscriptionStateMachine {
public:
    TranscriptionStateMachine();

    TranscriptionState state() const;
    TranscriptionProgress progress() const;
    int progressPercentage() const;
    QString statusMessage() const;
    QList<TranscriptionProgress> history() const;

    Expected<void, TranscriptionError> transitionTo(TranscriptionState target,
                                                    const ProgressUpdate& update = ProgressUpdate());

    // In-state progress (chunk counters, ETA); not recorded in history
    Expected<void, TranscriptionError> updateProgress(const ProgressUpdate& update);

    bool canTransitionTo(TranscriptionState target) const;
    bool isActive() const;
    bool isTerminal() const;

    // Back to Ready with an empty history
    void reset();

    static bool isTransitionAllowed(TranscriptionState from, TranscriptionState to);
    static QList<TranscriptionState> allowedTransitions(TranscriptionState from);
    static bool isActiveState(TranscriptionState state);
    static bool isTerminalState(TranscriptionState state);
    static QString defaultMessage(TranscriptionState state, int percentage);

private:
    static int clampPercentage(int percentage);

    mutable QMutex mutex_;
    TranscriptionProgress current_;
    QList<TranscriptionProgress> history_;
};

} // namespace VoiceScribe
