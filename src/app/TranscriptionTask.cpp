#include <array>
#include <cassert>
#include <ostream>
#include <format>
#include <stdexcept>
#include <string_view>

#include <QDir>
#include <QFileInfo>
#include <QPointer>
#include <QSaveFile>

#include <qcorofuture.h>

#include "TranscriptionTask.h"
#include "ModelMgr.h"
#include "ScopedTimer.h"
#include "logging.h"

using namespace std;

namespace logfault {
std::pair<bool /* json */, std::string /* content or json */> toLog(const TranscriptionTask& t, bool json) {
    const auto& job = t.job();
    if (json) {
        return make_pair(true, format(R"("task":"TranscriptionTask", "model":"{}", "file":"{}")",
                                      job.model_name.toStdString(),
                                      job.audio_path.toStdString()));
    }

    return make_pair(false, format("TranscriptionTask{{model={}, file={}}}",
                                   job.model_name.toStdString(),
                                   QFileInfo{job.audio_path}.fileName().toStdString()));
}
} // logfault ns

namespace {

QString unexpectedError(const QString& what) {
    return QObject::tr("An unexpected error occurred: %1. Check FFmpeg installation and file permissions.")
        .arg(what);
}

} // anon ns

std::ostream& operator << (std::ostream& os, TranscriptionTask::State state) {
    constexpr auto states = to_array<string_view>({
        "CREATED",
        "LOADING",
        "TRANSCRIBING",
        "DONE",
        "FAILED"
    });

    return os << states.at(static_cast<size_t>(state));
}

std::ostream& operator << (std::ostream& os, TranscriptionTask::CmdType cmd) {
    constexpr auto cmds = to_array<string_view>({
        "COMMAND",
        "EXIT"
    });

    return os << cmds.at(static_cast<size_t>(cmd));
}

TranscriptionTask::TranscriptionTask(Config config, QObject *parent)
    : QObject(parent), config_{std::move(config)}
{
    assert(config_.model_mgr);
    assert(config_.engine);
    assert(config_.decoder);
    worker_ = std::jthread([this] { workerLoop(); });
}

TranscriptionTask::~TranscriptionTask()
{
    LOG_DEBUG_EX(*this) << "Destroying task in state " << state();

    // There is no way to interrupt a running model load or inference.
    // Any operation in progress finishes before the thread joins.
    cmd_queue_.push(make_unique<Operation>(CmdType::EXIT));
    if (worker_ && worker_->joinable()) {
        worker_->join();
    }
}

void TranscriptionTask::start()
{
    if (state() != State::CREATED) {
        LOG_WARN_EX(*this) << "start() called in state " << state() << ". Ignoring.";
        return;
    }

    run();
}

QString TranscriptionTask::outputFileName(const QString &audioPath, const QString &modelName)
{
    return QStringLiteral("%1_%2_transcript.txt")
        .arg(QFileInfo{audioPath}.completeBaseName(), modelName);
}

QString TranscriptionTask::summary(const TranscriptResult &result)
{
    return tr("Transcription complete in %1 seconds.\nResult saved to: %2\n\nFull Transcript:\n%3")
        .arg(result.elapsed_seconds, 0, 'f', 2)
        .arg(result.output_path, result.text);
}

QCoro::Task<void> TranscriptionTask::run()
{
    // The owner may delete us while we wait for the worker
    QPointer<TranscriptionTask> self{this};
    const Job job = config_.job;

    if (!QFileInfo::exists(job.audio_path)) {
        fail(tr("Audio file not found at '%1'.").arg(job.audio_path));
        co_return;
    }

    setState(State::LOADING);
    emit started(tr("Loading Whisper model: %1...").arg(job.model_name));

    const auto model = config_.model_mgr->findModelByName(job.model_name);
    if (!model) {
        fail(unexpectedError(tr("Unknown model '%1'").arg(job.model_name)));
        co_return;
    }

    const auto model_path = co_await config_.model_mgr->makeAvailable(*model);
    if (!self) {
        co_return;
    }

    if (!model_path) {
        fail(unexpectedError(tr("Failed to download the model '%1'").arg(job.model_name)));
        co_return;
    }

    const auto loaded = co_await execute([this, path = *model_path] {
        loadModel(path);
    });

    if (!self) {
        co_return;
    }

    if (!loaded.ok) {
        fail(unexpectedError(loaded.error));
        co_return;
    }

    setState(State::TRANSCRIBING);
    emit progress(tr("Model loaded successfully. Running on device: %1. Starting transcription...")
                      .arg(device_));

    const auto transcribed = co_await execute([this] {
        transcribe();
    });

    if (!self) {
        co_return;
    }

    if (!transcribed.ok) {
        fail(unexpectedError(transcribed.error));
        co_return;
    }

    LOG_INFO_EX(*this) << "Transcription saved to " << result_.output_path
                       << " in " << result_.elapsed_seconds << " seconds";
    setState(State::DONE);
    emit completed(result_);
}

QCoro::Task<TranscriptionTask::OpResult> TranscriptionTask::execute(Operation::fn_t fn)
{
    auto op = make_unique<Operation>(std::move(fn));
    auto future = op->future();

    cmd_queue_.push(std::move(op));
    co_return co_await future;
}

void TranscriptionTask::setState(State state)
{
    if (state_ != state) {
        LOG_DEBUG_EX(*this) << "State changed from " << state_.load() << " to " << state;
        state_ = state;
    }
}

void TranscriptionTask::fail(const QString &why)
{
    LOG_WARN_EX(*this) << "Transcription failed: " << why;
    setState(State::FAILED);
    emit failed(why);
}

void TranscriptionTask::workerLoop() noexcept
{
    LOG_DEBUG_EX(*this) << "Worker thread started";

    while (true) {
        auto op = cmd_queue_.pop();
        if (!op) {
            LOG_ERROR_EX(*this) << "Empty command received, exiting...";
            break;
        }

        if (op->op() == CmdType::EXIT) {
            LOG_DEBUG_EX(*this) << "Exit command received";
            op->setResult({true, {}});
            break;
        }

        LOG_TRACE_EX(*this) << "Processing command: " << op->op();
        op->execute();
    }

    // Release the model in the thread that used it
    model_ctx_.reset();
    LOG_DEBUG_EX(*this) << "Worker thread done";
}

void TranscriptionTask::loadModel(const std::filesystem::path &modelPath)
{
    assert(worker_ && this_thread::get_id() == worker_->get_id());

    const auto& job = config_.job;
    const ScopedTimer timer;

    LOG_DEBUG_EX(*this) << "Loading model from " << modelPath;
    model_ctx_ = config_.engine->load(job.model_name.toStdString(), modelPath, config_.load_params);
    if (!model_ctx_) {
        auto why = config_.engine->lastError();
        if (why.empty()) {
            why = format("Failed to load the model from {}", modelPath.string());
        }
        throw runtime_error{why};
    }

    device_ = QString::fromStdString(model_ctx_->device());
    LOG_INFO_EX(*this) << "Loaded " << model_ctx_->info() << " in " << timer.elapsed() << " seconds";
}

void TranscriptionTask::transcribe()
{
    assert(worker_ && this_thread::get_id() == worker_->get_id());
    assert(model_ctx_);

    const auto& job = config_.job;
    const ScopedTimer timer;

    const auto samples = config_.decoder->decode(job.audio_path, config_.engine->sampleRate());

    auto session = model_ctx_->createSession();
    if (!session) {
        throw runtime_error{format("Failed to create a session: {}", config_.engine->lastError())};
    }

    qscribe::Transcript transcript;
    if (!session->transcribe(samples, config_.transcribe_params, transcript)) {
        throw runtime_error{format("Transcription failed: {}", config_.engine->lastError())};
    }

    const auto elapsed = timer.elapsed();
    LOG_DEBUG_EX(*this) << "Transcribed " << samples.size() << " samples, language="
                        << (transcript.language.empty() ? "unknown" : transcript.language);
    const auto text = QString::fromStdString(transcript.full_text);

    // Done with the model
    session.reset();
    model_ctx_.reset();

    writeTranscript(text);

    result_.elapsed_seconds = elapsed;
    result_.text = text;
}

void TranscriptionTask::writeTranscript(const QString &text)
{
    const auto& job = config_.job;
    const QDir dir{config_.output_dir.isEmpty() ? QDir::currentPath() : config_.output_dir};
    const auto name = outputFileName(job.audio_path, job.model_name);

    // QSaveFile only replaces the target when commit() succeeds
    QSaveFile file{dir.filePath(name)};
    if (!file.open(QIODevice::WriteOnly)) {
        throw runtime_error{format("Failed to open {} for writing: {}",
                                   file.fileName().toStdString(), file.errorString().toStdString())};
    }

    const auto data = text.toUtf8();
    if (file.write(data) != data.size()) {
        const auto why = file.errorString();
        file.cancelWriting();
        throw runtime_error{format("Failed to write {}: {}",
                                   file.fileName().toStdString(), why.toStdString())};
    }

    if (!file.commit()) {
        throw runtime_error{format("Failed to save {}: {}",
                                   file.fileName().toStdString(), file.errorString().toStdString())};
    }

    result_.output_path = name;
    LOG_DEBUG_EX(*this) << "Wrote " << data.size() << " bytes to " << file.fileName();
}

void TranscriptionTask::Operation::execute() noexcept
{
    try {
        if (fn_) {
            fn_();
        }
        setResult({true, {}});
    } catch (const exception& ex) {
        LOG_WARN_N << "Exception during operation execution: " << ex.what();
        setResult({false, QString::fromUtf8(ex.what())});
    }
}
