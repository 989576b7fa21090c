#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include <QFuture>
#include <QMetaType>
#include <QObject>
#include <QPromise>
#include <QString>

#include <qcorotask.h>

#include "qscribe/EngineBase.h"
#include "AudioDecoder.h"
#include "Queue.h"

class ModelMgr;

/*! One transcription run, bound to one input file and one model. */
struct Job {
    QString audio_path;
    QString model_name;
};

struct TranscriptResult {
    double elapsed_seconds{};
    QString output_path;
    QString text;
};

Q_DECLARE_METATYPE(TranscriptResult)

/*! Runs one Job.
 *
 *  The blocking work (model load, audio decoding, inference and writing the
 *  output file) runs on the task's own worker thread. The steps are driven
 *  by a coroutine on the thread that called start(), and all the signals are
 *  emitted from that thread, in this order:
 *
 *  started -> progress -> completed | failed
 *
 *  failed can come at any point; nothing is emitted after it. If the input
 *  file does not exist, failed is the only signal.
 */
class TranscriptionTask : public QObject
{
    Q_OBJECT

public:
    struct Config {
        Job job;
        std::shared_ptr<ModelMgr> model_mgr;
        std::shared_ptr<qscribe::EngineBase> engine;
        std::shared_ptr<AudioDecoder> decoder;
        QString output_dir;     // empty for the current working directory
        qscribe::EngineLoadParams load_params;
        qscribe::TranscribeParams transcribe_params;
    };

    enum class State {
        CREATED,
        LOADING,
        TRANSCRIBING,
        DONE,
        FAILED
    };

    // Command types for the worker thread
    enum class CmdType {
        COMMAND,
        EXIT
    };

    struct OpResult {
        bool ok{false};
        QString error;
    };

    class Operation {
    public:
        using fn_t = std::function<void()>;

        explicit Operation(CmdType type = CmdType::COMMAND)
            : type_{type} {}

        explicit Operation(fn_t && fn, CmdType type = CmdType::COMMAND)
            : type_{type}, fn_{std::move(fn)} {}

        ~Operation() {
            setResult({false, QStringLiteral("The operation was abandoned")});
        }

        Operation(const Operation&) = delete;
        Operation& operator=(const Operation&) = delete;
        Operation(Operation&&) = delete;
        Operation& operator=(Operation&&) = delete;

        CmdType op() const noexcept { return type_; }

        // Runs fn. Exceptions become a failed result with the exception's message.
        void execute() noexcept;

        void setResult(OpResult result) {
            std::call_once(promise_set_, [this, &result]() {
                promise_.start();
                promise_.addResult(std::move(result));
                promise_.finish();
            });
        }

        QFuture<OpResult> future() {
            return promise_.future();
        }

    private:
        QPromise<OpResult> promise_;
        std::once_flag promise_set_;
        CmdType type_;
        fn_t fn_;
    };

    using cmd_queue_t = Queue<std::unique_ptr<Operation>>;

    explicit TranscriptionTask(Config config, QObject *parent = nullptr);
    ~TranscriptionTask() override;

    TranscriptionTask(const TranscriptionTask&) = delete;
    TranscriptionTask& operator=(const TranscriptionTask&) = delete;

    /*! Start the job. Can only be called once. */
    void start();

    State state() const noexcept { return state_.load(); }
    const Job& job() const noexcept { return config_.job; }

    /*! "<complete base name of the input>_<model>_transcript.txt" */
    static QString outputFileName(const QString& audioPath, const QString& modelName);

    /*! Human readable summary of a successful run. */
    static QString summary(const TranscriptResult& result);

signals:
    void started(const QString& message);
    void progress(const QString& message);
    void completed(const TranscriptResult& result);
    void failed(const QString& message);

private:
    QCoro::Task<void> run();
    QCoro::Task<OpResult> execute(Operation::fn_t fn);
    void setState(State state);
    void fail(const QString& why);
    void workerLoop() noexcept;

    // Called in the worker thread
    void loadModel(const std::filesystem::path& modelPath);
    void transcribe();
    void writeTranscript(const QString& text);

    Config config_;
    std::atomic<State> state_{State::CREATED};
    cmd_queue_t cmd_queue_;
    std::optional<std::jthread> worker_;

    // Owned by the worker thread while an operation runs
    std::shared_ptr<qscribe::ModelCtx> model_ctx_;
    QString device_;
    TranscriptResult result_;
};

std::ostream& operator << (std::ostream& os, TranscriptionTask::State state);
