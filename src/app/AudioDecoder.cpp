#include <bit>
#include <cstring>
#include <format>
#include <stdexcept>

#include <QProcess>
#include <QSettings>

#include "AudioDecoder.h"
#include "ScopedTimer.h"

#include "logging.h"

using namespace std;

// ffmpeg is asked for f32le, which is copied straight into floats
static_assert(std::endian::native == std::endian::little, "FfmpegDecoder requires a little-endian host");

FfmpegDecoder::FfmpegDecoder(QString program)
    : program_{std::move(program)}
{
    if (program_.isEmpty()) {
        program_ = QSettings{}.value("tools/ffmpeg", "ffmpeg").toString();
    }
}

QStringList FfmpegDecoder::arguments(const QString &path, int sampleRate)
{
    return {
        "-nostdin",
        "-hide_banner",
        "-loglevel", "error",
        "-i", path,
        "-vn",                          // ignore any video stream
        "-f", "f32le",                  // raw little-endian float samples
        "-acodec", "pcm_f32le",
        "-ac", "1",
        "-ar", QString::number(sampleRate),
        "-"                             // to stdout
    };
}

std::vector<float> FfmpegDecoder::decode(const QString &path, int sampleRate)
{
    const auto args = arguments(path, sampleRate);
    LOG_DEBUG_N << "Decoding " << path << " with: " << program_ << ' ' << args.join(' ');

    const ScopedTimer timer;
    QProcess proc;
    proc.setProcessChannelMode(QProcess::SeparateChannels);
    proc.start(program_, args, QIODevice::ReadOnly);

    if (!proc.waitForStarted(-1)) {
        throw runtime_error{format("Failed to start '{}': {}. Is FFmpeg installed and in the PATH?",
                                   program_.toStdString(), proc.errorString().toStdString())};
    }

    // No timeout. Long recordings take a while.
    if (!proc.waitForFinished(-1) && proc.state() != QProcess::NotRunning) {
        proc.kill();
        proc.waitForFinished(-1);
        throw runtime_error{format("'{}' did not finish: {}",
                                   program_.toStdString(), proc.errorString().toStdString())};
    }

    const QByteArray pcm = proc.readAllStandardOutput();
    const QString errors = QString::fromLocal8Bit(proc.readAllStandardError()).trimmed();

    if (proc.exitStatus() != QProcess::NormalExit) {
        throw runtime_error{format("'{}' crashed while decoding '{}'",
                                   program_.toStdString(), path.toStdString())};
    }

    if (const auto code = proc.exitCode(); code != 0) {
        throw runtime_error{format("'{}' failed with exit code {} while decoding '{}': {}",
                                   program_.toStdString(), code, path.toStdString(), errors.toStdString())};
    }

    if (pcm.size() < static_cast<qsizetype>(sizeof(float))) {
        throw runtime_error{format("No audio was decoded from '{}'", path.toStdString())};
    }

    if (!errors.isEmpty()) {
        LOG_WARN_N << "ffmpeg reported: " << errors;
    }

    std::vector<float> samples(static_cast<size_t>(pcm.size()) / sizeof(float));
    std::memcpy(samples.data(), pcm.constData(), samples.size() * sizeof(float));

    LOG_DEBUG_N << "Decoded " << samples.size() << " samples ("
                << (static_cast<double>(samples.size()) / sampleRate) << " seconds of audio) in "
                << timer.elapsed() << " seconds";
    return samples;
}
