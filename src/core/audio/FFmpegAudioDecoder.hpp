#pragma once

#include "AudioDecoder.hpp"

namespace VoiceScribe {

struct DecodeContext;

/**
 * @brief AudioDecoder backed by libavformat/libavcodec/libswresample
 *
 * Every call opens its own demuxer and decoder, so one instance may be
 * shared between threads.
 */
class FFmpegAudioDecoder : public AudioDecoder {
public:
    FFmpegAudioDecoder();
    ~FFmpegAudioDecoder() override = default;

    Expected<double, AudioError> probeDuration(const QString& filePath) override;
    Expected<PcmBuffer, AudioError> extractPcm(const QString& filePath,
                                               double startSeconds,
                                               double durationSeconds) override;

private:
    Expected<void, AudioError> checkReadable(const QString& filePath) const;
    Expected<void, AudioError> openInput(DecodeContext& context, const QString& filePath) const;
    Expected<void, AudioError> openDecoder(DecodeContext& context) const;
    Expected<void, AudioError> openResampler(DecodeContext& context) const;
    Expected<double, AudioError> durationOf(const DecodeContext& context) const;

    static AudioError mapAVError(int averror);
    static QString avErrorString(int averror);
};

} // namespace VoiceScribe
