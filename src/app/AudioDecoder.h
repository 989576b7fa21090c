#pragma once

#include <vector>

#include <QString>
#include <QStringList>

/*! Turns an audio (or video) file into samples the speech engine can use.
 */
class AudioDecoder
{
public:
    AudioDecoder() = default;
    virtual ~AudioDecoder() = default;

    AudioDecoder(const AudioDecoder&) = delete;
    AudioDecoder& operator=(const AudioDecoder&) = delete;

    /*! Decode the file to mono float samples.
     *
     * Blocks until the whole file is decoded. Must not be called from the UI thread.
     *
     * @param path The input file.
     * @param sampleRate The sample rate of the output in Hz.
     * @throws std::runtime_error if the file cannot be decoded.
     */
    virtual std::vector<float> decode(const QString& path, int sampleRate) = 0;
};

/*! Decodes by running the external ffmpeg tool.
 *
 * ffmpeg writes raw 32 bit float samples to its stdout, which we collect.
 */
class FfmpegDecoder final : public AudioDecoder
{
public:
    /*! @param program ffmpeg executable. If empty, the `tools/ffmpeg` setting is used. */
    explicit FfmpegDecoder(QString program = {});

    std::vector<float> decode(const QString& path, int sampleRate) override;

    const QString& program() const noexcept {
        return program_;
    }

    static QStringList arguments(const QString& path, int sampleRate);

private:
    QString program_;
};
