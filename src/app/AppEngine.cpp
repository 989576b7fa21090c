#include <array>
#include <cassert>
#include <format>
#include <iostream>

#include <QClipboard>
#include <QFile>
#include <QFileInfo>
#include <QGuiApplication>
#include <QSaveFile>
#include <QSettings>
#include <QTimer>

#include "AppEngine.h"
#include "ModelMgr.h"

#include "logging.h"

using namespace std;

namespace {

using control_t = AppEngine::Control;

constexpr auto num_controls = static_cast<size_t>(control_t::Count);

// Which controls are enabled (or, for the busy indicator, visible) in each state
constexpr auto control_table = to_array<array<bool, num_controls>>({
    // AudioPath, Browse, ModelSelector, Start, BusyIndicator
    {true,  true,  true,  true,  false},   // Idle
    {false, false, false, false, true},    // Running
});

static_assert(control_table.size() == 2, "One row per UiState");

} // anon ns

ostream& operator << (ostream& os, AppEngine::UiState state) {
    constexpr auto states = to_array<string_view>({
        "Idle",
        "Running"
    });

    return os << states.at(static_cast<size_t>(state));
}

AppEngine::AppEngine(std::shared_ptr<ModelMgr> modelMgr,
                     std::shared_ptr<AudioDecoder> decoder,
                     QObject *parent)
    : QObject(parent)
    , model_mgr_{modelMgr ? std::move(modelMgr) : make_shared<ModelMgr>()}
    , decoder_{decoder ? std::move(decoder) : make_shared<FfmpegDecoder>()}
{
    qRegisterMetaType<TranscriptResult>();

    models_.setModels(model_mgr_->availableModels(), model_mgr_->defaultModel());

    connect(model_mgr_.get(), &ModelMgr::downloadProgressRatio,
            this, [this](const QString& name, double ratio) {
        LOG_TRACE_N << "Download progress for " << name << ": " << ratio;
        download_progress_ = ratio >= 1.0 ? -1.0 : ratio;
        emit downloadProgressChanged();
    });

    setTranscriptText(tr("Note: FFmpeg must be installed and available in the PATH "
                         "for audio decoding to work."));
}

AppEngine::~AppEngine()
{
    if (task_) {
        LOG_INFO_N << "Waiting for the active transcription to finish";
    }
}

void AppEngine::setAudioFile(const QUrl &url)
{
    setAudioPath(url.isLocalFile() ? url.toLocalFile() : url.toString());
}

void AppEngine::setAudioPath(const QString &path)
{
    if (audio_path_ != path) {
        audio_path_ = path;
        LOG_DEBUG_N << "Audio file: " << audio_path_;
        emit audioPathChanged();
    }
    setValidationMessage({});
}

void AppEngine::startTranscription()
{
    if (state_ == UiState::Running || task_) {
        LOG_DEBUG_N << "A transcription is already running. Ignoring.";
        return;
    }

    const auto path = audio_path_.trimmed();
    if (path.isEmpty() || !QFileInfo{path}.isFile()) {
        const auto msg = tr("Please select a valid audio file before starting transcription.");
        LOG_DEBUG_N << "Validation failed for path '" << path << "'";
        setValidationMessage(msg);
        emit validationFailed(msg);
        return;
    }

    setValidationMessage({});

    const auto model_name = models_.selectedModelName();
    LOG_INFO_N << "Starting transcription of " << path << " with model " << model_name;

    setState(UiState::Running);
    setTranscriptText({});
    setStatusText(tr("Starting process..."));

    TranscriptionTask::Config config;
    try {
        config = makeTaskConfig(model_name);
    } catch (const std::exception& ex) {
        LOG_ERROR_N << "Failed to prepare the transcription: " << ex.what();
        onFailed(tr("An unexpected error occurred: %1. Check FFmpeg installation and file permissions.")
                     .arg(QString::fromUtf8(ex.what())));
        return;
    }

    task_ = make_shared<TranscriptionTask>(std::move(config));
    connect(task_.get(), &TranscriptionTask::started, this, &AppEngine::onStarted);
    connect(task_.get(), &TranscriptionTask::progress, this, &AppEngine::onProgress);
    connect(task_.get(), &TranscriptionTask::completed, this, &AppEngine::onCompleted);
    connect(task_.get(), &TranscriptionTask::failed, this, &AppEngine::onFailed);

    task_->start();
}

void AppEngine::saveTranscriptToFile(const QUrl &path)
{
    const QString filename = path.isLocalFile() ? path.toLocalFile() : path.toString();

    QSaveFile f(filename);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Text)) {
        LOG_WARN_N << "Failed to open " << filename << ": " << f.errorString();
        emit errorOccurred(tr("Failed to save the transcript to %1: %2").arg(filename, f.errorString()));
        return;
    }

    f.write(transcript_text_.toUtf8());
    if (!f.commit()) {
        LOG_WARN_N << "Failed to save " << filename << ": " << f.errorString();
        emit errorOccurred(tr("Failed to save the transcript to %1: %2").arg(filename, f.errorString()));
        return;
    }

    LOG_INFO_N << "Saved the transcript to " << filename;
}

void AppEngine::copyTextToClipboard(const QString &text)
{
    if (auto *clipb = QGuiApplication::clipboard()) {
        clipb->setText(text);
    } else {
        LOG_WARN_N << "Clipboard not available";
    }
}

bool AppEngine::isEnabled(Control control) const noexcept
{
    const auto col = static_cast<size_t>(control);
    if (col >= num_controls) {
        return false;
    }
    return control_table[static_cast<size_t>(state_)][col];
}

QString AppEngine::startButtonText() const
{
    return state_ == UiState::Running ? tr("Processing...") : tr("Start Transcription");
}

void AppEngine::initLogging()
{
    QSettings settings{};

    if (!settings.contains("logging/applevel")) {
        settings.setValue("logging/applevel", 4); // INFO
    }

#ifdef Q_OS_LINUX
    if (const auto level = settings.value("logging/applevel", 4).toInt()) {
        logfault::LogManager::Instance().AddHandler(
            make_unique<logfault::StreamHandler>(clog, static_cast<logfault::LogLevel>(level)));
        LOG_INFO << "Logging to console";
    }
#endif

    if (const auto level = settings.value("logging/level", 0).toInt(); level > 0) {
        if (auto path = settings.value("logging/path", "").toString().toStdString(); !path.empty()) {
            const bool prune = settings.value("logging/prune", "").toString() == "true";
            logfault::LogManager::Instance().AddHandler(
                make_unique<logfault::StreamHandler>(path, static_cast<logfault::LogLevel>(level), prune));

            LOG_INFO << "Logging to: " << path;
        }
    }
}

void AppEngine::setState(UiState state)
{
    if (state_ != state) {
        LOG_DEBUG_N << "UI state changed from " << state_ << " to " << state;
        state_ = state;
        emit stateChanged(state);
        emit stateFlagsChanged();
    }
}

void AppEngine::setStatusText(const QString &text)
{
    if (status_text_ != text) {
        status_text_ = text;
        emit statusTextChanged();
    }
}

void AppEngine::setTranscriptText(const QString &text)
{
    if (transcript_text_ != text) {
        transcript_text_ = text;
        emit transcriptTextChanged();
    }
}

void AppEngine::setValidationMessage(const QString &text)
{
    if (validation_message_ != text) {
        validation_message_ = text;
        emit validationMessageChanged();
    }
}

TranscriptionTask::Config AppEngine::makeTaskConfig(const QString &modelName)
{
    QSettings settings;

    TranscriptionTask::Config config;
    config.job = {audio_path_.trimmed(), modelName};
    config.model_mgr = model_mgr_;
    config.engine = model_mgr_->engine();
    config.decoder = decoder_;
    config.output_dir = output_dir_;

    config.load_params.use_gpu = settings.value("whisper/use_gpu", false).toBool();
    config.load_params.gpu_device = settings.value("whisper/gpu_device", 0).toInt();
    config.load_params.flash_attn = settings.value("whisper/flash_attn", false).toBool();

    config.transcribe_params.language = settings.value("transcribe/language", "").toString().trimmed().toStdString();
    config.transcribe_params.threads = settings.value("whisper/threads", -1).toInt();

    return config;
}

void AppEngine::onStarted(const QString &message)
{
    setStatusText(message);
}

void AppEngine::onProgress(const QString &message)
{
    setStatusText(message);
}

void AppEngine::onCompleted(const TranscriptResult &result)
{
    LOG_INFO_N << "Transcription completed in " << result.elapsed_seconds << " seconds";
    setTranscriptText(TranscriptionTask::summary(result));
    setStatusText(tr("Transcription finished! Output saved to disk."));
    releaseTask();
    setState(UiState::Idle);
}

void AppEngine::onFailed(const QString &message)
{
    LOG_WARN_N << "Transcription failed: " << message;
    setStatusText(tr("ERROR: %1").arg(message));
    releaseTask();
    download_progress_ = -1.0;
    emit downloadProgressChanged();
    setState(UiState::Idle);
    emit errorOccurred(message);
}

void AppEngine::releaseTask()
{
    if (!task_) {
        return;
    }

    // The signal we react to is emitted from inside the task's own coroutine.
    // Delete it from the event loop once that has returned.
    task_->disconnect(this);
    QTimer::singleShot(0, this, [task = std::move(task_)]() mutable {
        LOG_TRACE_N << "Releasing finished task";
        task.reset();
    });
    assert(!task_);
}
