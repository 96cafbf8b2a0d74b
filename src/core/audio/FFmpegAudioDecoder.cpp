#include "FFmpegAudioDecoder.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QFileInfo>
#include <algorithm>
#include <cerrno>
#include <cmath>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace VoiceScribe {

struct DecodeContext {
    AVFormatContext* formatContext = nullptr;
    AVCodecContext* codecContext = nullptr;
    SwrContext* swrContext = nullptr;
    AVPacket* packet = nullptr;
    AVFrame* frame = nullptr;
    int streamIndex = -1;

    ~DecodeContext() {
        av_frame_free(&frame);
        av_packet_free(&packet);
        swr_free(&swrContext);
        avcodec_free_context(&codecContext);
        if (formatContext) {
            avformat_close_input(&formatContext);
        }
    }

    AVStream* stream() const {
        return formatContext->streams[streamIndex];
    }
};

namespace {

// Output positions are counted in 16 kHz samples from the start of the file
struct PcmWindow {
    qint64 firstSample = 0;
    qint64 endSample = 0;
    qint64 cursor = -1;
    PcmBuffer samples;

    bool isFull() const { return cursor >= endSample; }

    void append(const qint16* data, int count) {
        const qint64 begin = cursor;
        const qint64 end = cursor + count;
        const qint64 from = std::max(begin, firstSample);
        const qint64 to = std::min(end, endSample);
        if (to > from) {
            samples.insert(samples.end(), data + (from - begin), data + (to - begin));
        }
        cursor = end;
    }
};

qint64 toSamples(double seconds) {
    return static_cast<qint64>(std::llround(seconds * AudioDecoder::SampleRate));
}

} // namespace

FFmpegAudioDecoder::FFmpegAudioDecoder() {
    av_log_set_level(AV_LOG_ERROR);
}

Expected<double, AudioError> FFmpegAudioDecoder::probeDuration(const QString& filePath) {
    auto readable = checkReadable(filePath);
    if (readable.hasError()) {
        return makeUnexpected(readable.error());
    }

    DecodeContext context;
    auto opened = openInput(context, filePath);
    if (opened.hasError()) {
        return makeUnexpected(opened.error());
    }

    auto duration = durationOf(context);
    if (duration.hasValue()) {
        Logger::instance().debug("Probed {}: {:.2f}s", filePath.toStdString(), duration.value());
    }
    return duration;
}

Expected<PcmBuffer, AudioError> FFmpegAudioDecoder::extractPcm(const QString& filePath,
                                                              double startSeconds,
                                                              double durationSeconds) {
    if (startSeconds < 0.0 || durationSeconds <= 0.0) {
        return makeUnexpected(AudioError::InvalidRange);
    }

    auto readable = checkReadable(filePath);
    if (readable.hasError()) {
        return makeUnexpected(readable.error());
    }

    DecodeContext context;
    auto setup = openInput(context, filePath);
    if (setup.hasValue()) {
        setup = openDecoder(context);
    }
    if (setup.hasValue()) {
        setup = openResampler(context);
    }
    if (setup.hasError()) {
        return makeUnexpected(setup.error());
    }

    context.packet = av_packet_alloc();
    context.frame = av_frame_alloc();
    if (!context.packet || !context.frame) {
        return makeUnexpected(AudioError::DecodingFailed);
    }

    PcmWindow window;
    window.firstSample = toSamples(startSeconds);
    window.endSample = window.firstSample + toSamples(durationSeconds);
    window.samples.reserve(static_cast<size_t>(window.endSample - window.firstSample));

    bool seeked = false;
    if (startSeconds > 0.0) {
        const int64_t target = static_cast<int64_t>(startSeconds * AV_TIME_BASE);
        const int ret = av_seek_frame(context.formatContext, -1, target, AVSEEK_FLAG_BACKWARD);
        if (ret < 0) {
            Logger::instance().debug("Seek failed ({}), decoding from start", avErrorString(ret).toStdString());
        } else {
            seeked = true;
        }
    }

    AVStream* stream = context.stream();
    const int64_t streamStart = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;

    auto consumeFrames = [&]() -> Expected<void, AudioError> {
        while (!window.isFull()) {
            const int ret = avcodec_receive_frame(context.codecContext, context.frame);
            if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
                break;
            }
            if (ret < 0) {
                Logger::instance().warn("Audio decode error: {}", avErrorString(ret).toStdString());
                return makeUnexpected(AudioError::DecodingFailed);
            }

            if (window.cursor < 0) {
                const int64_t pts = context.frame->best_effort_timestamp;
                if (pts != AV_NOPTS_VALUE) {
                    const double seconds = (pts - streamStart) * av_q2d(stream->time_base);
                    window.cursor = std::max<qint64>(0, toSamples(seconds));
                } else {
                    window.cursor = seeked ? window.firstSample : 0;
                }
            }

            const int capacity = swr_get_out_samples(context.swrContext, context.frame->nb_samples);
            if (capacity < 0) {
                av_frame_unref(context.frame);
                return makeUnexpected(AudioError::ResamplingFailed);
            }
            PcmBuffer converted(static_cast<size_t>(capacity));
            uint8_t* output[1] = { reinterpret_cast<uint8_t*>(converted.data()) };
            const int count = swr_convert(context.swrContext, output, capacity,
                                          (const uint8_t**)context.frame->extended_data,
                                          context.frame->nb_samples);
            av_frame_unref(context.frame);
            if (count < 0) {
                Logger::instance().warn("Audio resample error: {}", avErrorString(count).toStdString());
                return makeUnexpected(AudioError::ResamplingFailed);
            }
            window.append(converted.data(), count);
        }
        return {};
    };

    int ret = 0;
    while (!window.isFull() && (ret = av_read_frame(context.formatContext, context.packet)) >= 0) {
        if (context.packet->stream_index == context.streamIndex) {
            const int sent = avcodec_send_packet(context.codecContext, context.packet);
            if (sent < 0 && sent != AVERROR(EAGAIN)) {
                // Corrupt packets are skipped
                Logger::instance().debug("Dropping audio packet: {}", avErrorString(sent).toStdString());
            } else {
                auto consumed = consumeFrames();
                if (consumed.hasError()) {
                    av_packet_unref(context.packet);
                    return makeUnexpected(consumed.error());
                }
            }
        }
        av_packet_unref(context.packet);
    }

    if (ret < 0 && ret != AVERROR_EOF) {
        Logger::instance().warn("Audio read error: {}", avErrorString(ret).toStdString());
        return makeUnexpected(mapAVError(ret));
    }

    if (!window.isFull()) {
        avcodec_send_packet(context.codecContext, nullptr);
        auto consumed = consumeFrames();
        if (consumed.hasError()) {
            return makeUnexpected(consumed.error());
        }

        if (window.cursor >= 0 && !window.isFull()) {
            const int tailCapacity = swr_get_out_samples(context.swrContext, 0);
            if (tailCapacity > 0) {
                PcmBuffer tail(static_cast<size_t>(tailCapacity));
                uint8_t* output[1] = { reinterpret_cast<uint8_t*>(tail.data()) };
                const int count = swr_convert(context.swrContext, output, tailCapacity, nullptr, 0);
                if (count > 0) {
                    window.append(tail.data(), count);
                }
            }
        }
    }

    if (window.samples.empty()) {
        auto duration = durationOf(context);
        if (duration.hasValue() && startSeconds >= duration.value()) {
            return makeUnexpected(AudioError::InvalidRange);
        }
        return makeUnexpected(AudioError::DecodingFailed);
    }

    return std::move(window.samples);
}

Expected<void, AudioError> FFmpegAudioDecoder::checkReadable(const QString& filePath) const {
    const QFileInfo info(filePath);
    if (!info.exists() || !info.isFile()) {
        return makeUnexpected(AudioError::FileNotFound);
    }
    if (!info.isReadable()) {
        return makeUnexpected(AudioError::PermissionDenied);
    }
    return {};
}

Expected<void, AudioError> FFmpegAudioDecoder::openInput(DecodeContext& context, const QString& filePath) const {
    int ret = avformat_open_input(&context.formatContext, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        context.formatContext = nullptr;
        Logger::instance().error("Failed to open audio file: {} ({})",
                                 filePath.toStdString(), avErrorString(ret).toStdString());
        return makeUnexpected(mapAVError(ret));
    }

    ret = avformat_find_stream_info(context.formatContext, nullptr);
    if (ret < 0) {
        Logger::instance().error("Failed to find stream info: {}", avErrorString(ret).toStdString());
        return makeUnexpected(mapAVError(ret));
    }

    ret = av_find_best_stream(context.formatContext, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (ret < 0) {
        Logger::instance().error("No audio stream in {}", filePath.toStdString());
        return makeUnexpected(ret == AVERROR_DECODER_NOT_FOUND ? AudioError::DecoderUnavailable
                                                               : AudioError::NoAudioStream);
    }
    context.streamIndex = ret;
    return {};
}

Expected<void, AudioError> FFmpegAudioDecoder::openDecoder(DecodeContext& context) const {
    const AVCodecParameters* parameters = context.stream()->codecpar;
    const AVCodec* decoder = avcodec_find_decoder(parameters->codec_id);
    if (!decoder) {
        return makeUnexpected(AudioError::DecoderUnavailable);
    }

    context.codecContext = avcodec_alloc_context3(decoder);
    if (!context.codecContext) {
        return makeUnexpected(AudioError::DecodingFailed);
    }

    int ret = avcodec_parameters_to_context(context.codecContext, parameters);
    if (ret < 0) {
        return makeUnexpected(mapAVError(ret));
    }

    ret = avcodec_open2(context.codecContext, decoder, nullptr);
    if (ret < 0) {
        Logger::instance().error("Failed to open audio decoder: {}", avErrorString(ret).toStdString());
        return makeUnexpected(AudioError::DecoderUnavailable);
    }
    return {};
}

Expected<void, AudioError> FFmpegAudioDecoder::openResampler(DecodeContext& context) const {
    AVChannelLayout inputLayout;
    if (av_channel_layout_copy(&inputLayout, &context.codecContext->ch_layout) < 0) {
        return makeUnexpected(AudioError::ResamplingFailed);
    }
    if (inputLayout.order == AV_CHANNEL_ORDER_UNSPEC) {
        const int channels = inputLayout.nb_channels > 0 ? inputLayout.nb_channels : 1;
        av_channel_layout_uninit(&inputLayout);
        av_channel_layout_default(&inputLayout, channels);
    }

    AVChannelLayout outputLayout = AV_CHANNEL_LAYOUT_MONO;
    int ret = swr_alloc_set_opts2(&context.swrContext,
                                  &outputLayout, AV_SAMPLE_FMT_S16, SampleRate,
                                  &inputLayout, context.codecContext->sample_fmt,
                                  context.codecContext->sample_rate,
                                  0, nullptr);
    av_channel_layout_uninit(&inputLayout);

    if (ret < 0 || !context.swrContext || (ret = swr_init(context.swrContext)) < 0) {
        Logger::instance().error("Failed to initialize audio resampler: {}", avErrorString(ret).toStdString());
        return makeUnexpected(AudioError::ResamplingFailed);
    }
    return {};
}

Expected<double, AudioError> FFmpegAudioDecoder::durationOf(const DecodeContext& context) const {
    if (context.formatContext->duration != AV_NOPTS_VALUE && context.formatContext->duration > 0) {
        return static_cast<double>(context.formatContext->duration) / AV_TIME_BASE;
    }

    const AVStream* stream = context.stream();
    if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
        return stream->duration * av_q2d(stream->time_base);
    }

    return makeUnexpected(AudioError::InvalidFile);
}

AudioError FFmpegAudioDecoder::mapAVError(int averror) {
    switch (averror) {
        case AVERROR(ENOENT):
            return AudioError::FileNotFound;
        case AVERROR(EACCES):
        case AVERROR(EPERM):
            return AudioError::PermissionDenied;
        case AVERROR_INVALIDDATA:
            return AudioError::InvalidFile;
        case AVERROR_DECODER_NOT_FOUND:
            return AudioError::DecoderUnavailable;
        case AVERROR_STREAM_NOT_FOUND:
            return AudioError::NoAudioStream;
        default:
            Logger::instance().warn("Unmapped FFmpeg error: {} ({})", averror, avErrorString(averror).toStdString());
            return AudioError::DecodingFailed;
    }
}

QString FFmpegAudioDecoder::avErrorString(int averror) {
    char buffer[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(averror, buffer, sizeof(buffer));
    return QString::fromUtf8(buffer);
}

} // namespace VoiceScribe
