#pragma once

#include <QtCore/QString>

#include "../common/Errors.hpp"
#include "../common/Expected.hpp"

namespace Episodic {

// Codec parameters that must agree between files concatenated by stream copy.
struct StreamSignature {
    bool hasVideo = false;
    QString videoCodec;
    int width = 0;
    int height = 0;
    QString pixelFormat;

    bool hasAudio = false;
    QString audioCodec;
    int sampleRate = 0;
    int channels = 0;

    // Container duration in microseconds, 0 when unknown. Not part of the comparison.
    qint64 durationUs = 0;

    QString describe() const;

    bool operator==(const StreamSignature& other) const;
    bool operator!=(const StreamSignature& other) const { return !(*this == other); }
};

class StreamProbe {
public:
    virtual ~StreamProbe() = default;

    // FormatIncompatible when the file cannot be read as media.
    virtual Expected<StreamSignature, MergeError> probe(const QString& filePath) = 0;
};

// Reads the first video and first audio stream with libavformat.
class FFmpegStreamProbe : public StreamProbe {
public:
    FFmpegStreamProbe() = default;

    Expected<StreamSignature, MergeError> probe(const QString& filePath) override;
};

} // namespace Episodic
