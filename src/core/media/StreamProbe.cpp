#include "StreamProbe.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QStringList>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/pixdesc.h>
}

namespace Episodic {

namespace {

QString avErrorString(int errorCode) {
    char buffer[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(errorCode, buffer, sizeof(buffer));
    return QString::fromUtf8(buffer);
}

} // namespace

QString StreamSignature::describe() const {
    QStringList parts;
    if (hasVideo) {
        parts << QString("video %1 %2x%3 %4").arg(videoCodec).arg(width).arg(height).arg(pixelFormat);
    }
    if (hasAudio) {
        parts << QString("audio %1 %2 Hz %3 ch").arg(audioCodec).arg(sampleRate).arg(channels);
    }
    return parts.isEmpty() ? QString("no streams") : parts.join(", ");
}

bool StreamSignature::operator==(const StreamSignature& other) const {
    return hasVideo == other.hasVideo
        && videoCodec == other.videoCodec
        && width == other.width
        && height == other.height
        && pixelFormat == other.pixelFormat
        && hasAudio == other.hasAudio
        && audioCodec == other.audioCodec
        && sampleRate == other.sampleRate
        && channels == other.channels;
}

Expected<StreamSignature, MergeError> FFmpegStreamProbe::probe(const QString& filePath) {
    AVFormatContext* formatContext = nullptr;

    int ret = avformat_open_input(&formatContext, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        Logger::instance().error("FFmpegStreamProbe: cannot open {}: {}",
                                 filePath.toStdString(), avErrorString(ret).toStdString());
        return makeUnexpected(MergeError{MergeError::Kind::FormatIncompatible,
            QString("%1 is not readable media: %2").arg(filePath, avErrorString(ret))});
    }

    ret = avformat_find_stream_info(formatContext, nullptr);
    if (ret < 0) {
        avformat_close_input(&formatContext);
        Logger::instance().error("FFmpegStreamProbe: no stream info in {}: {}",
                                 filePath.toStdString(), avErrorString(ret).toStdString());
        return makeUnexpected(MergeError{MergeError::Kind::FormatIncompatible,
            QString("%1 has no stream info: %2").arg(filePath, avErrorString(ret))});
    }

    StreamSignature signature;
    for (unsigned int i = 0; i < formatContext->nb_streams; ++i) {
        const AVCodecParameters* codecParams = formatContext->streams[i]->codecpar;

        if (codecParams->codec_type == AVMEDIA_TYPE_VIDEO && !signature.hasVideo) {
            signature.hasVideo = true;
            signature.videoCodec = QString::fromUtf8(avcodec_get_name(codecParams->codec_id));
            signature.width = codecParams->width;
            signature.height = codecParams->height;
            const char* pixelFormat = av_get_pix_fmt_name(static_cast<AVPixelFormat>(codecParams->format));
            signature.pixelFormat = pixelFormat ? QString::fromUtf8(pixelFormat) : QString();
        } else if (codecParams->codec_type == AVMEDIA_TYPE_AUDIO && !signature.hasAudio) {
            signature.hasAudio = true;
            signature.audioCodec = QString::fromUtf8(avcodec_get_name(codecParams->codec_id));
            signature.sampleRate = codecParams->sample_rate;
            signature.channels = codecParams->ch_layout.nb_channels;
        }
    }

    // AV_TIME_BASE units, i.e. microseconds
    if (formatContext->duration != AV_NOPTS_VALUE && formatContext->duration > 0) {
        signature.durationUs = formatContext->duration;
    }

    avformat_close_input(&formatContext);

    if (!signature.hasVideo && !signature.hasAudio) {
        return makeUnexpected(MergeError{MergeError::Kind::FormatIncompatible,
            QString("%1 has no audio or video stream").arg(filePath)});
    }

    Logger::instance().debug("FFmpegStreamProbe: {}: {}", filePath.toStdString(), signature.describe().toStdString());
    return signature;
}

} // namespace Episodic
