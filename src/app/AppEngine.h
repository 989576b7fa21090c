#pragma once

#include <array>
#include <memory>

#include <QObject>
#include <QUrl>

#include "AvailableModelsModel.h"
#include "AudioDecoder.h"
#include "TranscriptionTask.h"

class ModelMgr;

class AppEngine : public QObject
{
    Q_OBJECT

    Q_PROPERTY(UiState state READ state NOTIFY stateChanged)
    Q_PROPERTY(QString audioPath READ audioPath NOTIFY audioPathChanged)
    Q_PROPERTY(AvailableModelsModel *models READ models CONSTANT)
    Q_PROPERTY(QString statusText READ statusText NOTIFY statusTextChanged)
    Q_PROPERTY(QString transcriptText READ transcriptText NOTIFY transcriptTextChanged)
    Q_PROPERTY(QString validationMessage READ validationMessage NOTIFY validationMessageChanged)
    Q_PROPERTY(QString startButtonText READ startButtonText NOTIFY stateFlagsChanged)
    Q_PROPERTY(bool audioPathEnabled READ audioPathEnabled NOTIFY stateFlagsChanged)
    Q_PROPERTY(bool browseEnabled READ browseEnabled NOTIFY stateFlagsChanged)
    Q_PROPERTY(bool modelEnabled READ modelEnabled NOTIFY stateFlagsChanged)
    Q_PROPERTY(bool startEnabled READ startEnabled NOTIFY stateFlagsChanged)
    Q_PROPERTY(bool busyVisible READ busyVisible NOTIFY stateFlagsChanged)
    Q_PROPERTY(double downloadProgress READ downloadProgress NOTIFY downloadProgressChanged)

public:
    enum class UiState {
        Idle,
        Running
    };
    Q_ENUM(UiState)

    enum class Control {
        AudioPath,
        Browse,
        ModelSelector,
        Start,
        BusyIndicator,
        Count // meta
    };
    Q_ENUM(Control)

    /*! Create the shell.
     *
     * @param modelMgr Model manager to use. One is created if empty.
     * @param decoder Audio decoder for the tasks. FfmpegDecoder if empty.
     */
    explicit AppEngine(std::shared_ptr<ModelMgr> modelMgr = {},
                       std::shared_ptr<AudioDecoder> decoder = {},
                       QObject *parent = nullptr);
    ~AppEngine() override;

    Q_INVOKABLE void setAudioFile(const QUrl& url);
    Q_INVOKABLE void setAudioPath(const QString& path);
    Q_INVOKABLE void startTranscription();
    Q_INVOKABLE void saveTranscriptToFile(const QUrl &path);
    Q_INVOKABLE static void copyTextToClipboard(const QString& text);
    Q_INVOKABLE bool isEnabled(Control control) const noexcept;

    UiState state() const noexcept { return state_; }
    QString audioPath() const { return audio_path_; }
    AvailableModelsModel *models() { return &models_; }
    QString statusText() const { return status_text_; }
    QString transcriptText() const { return transcript_text_; }
    QString validationMessage() const { return validation_message_; }
    QString startButtonText() const;
    double downloadProgress() const noexcept { return download_progress_; }

    bool audioPathEnabled() const noexcept { return isEnabled(Control::AudioPath); }
    bool browseEnabled() const noexcept { return isEnabled(Control::Browse); }
    bool modelEnabled() const noexcept { return isEnabled(Control::ModelSelector); }
    bool startEnabled() const noexcept { return isEnabled(Control::Start); }
    bool busyVisible() const noexcept { return isEnabled(Control::BusyIndicator); }

    bool hasActiveTask() const noexcept { return task_ != nullptr; }

    // Directory for the transcript files. Empty for the current directory.
    void setOutputDir(const QString& dir) { output_dir_ = dir; }

    static void initLogging();

signals:
    void stateChanged(AppEngine::UiState newState);
    void stateFlagsChanged();
    void audioPathChanged();
    void statusTextChanged();
    void transcriptTextChanged();
    void validationMessageChanged();
    void validationFailed(const QString &message);
    void errorOccurred(const QString &message);
    void downloadProgressChanged();

private:
    void setState(UiState state);
    void setStatusText(const QString& text);
    void setTranscriptText(const QString& text);
    void setValidationMessage(const QString& text);
    TranscriptionTask::Config makeTaskConfig(const QString& modelName);
    void onStarted(const QString& message);
    void onProgress(const QString& message);
    void onCompleted(const TranscriptResult& result);
    void onFailed(const QString& message);
    void releaseTask();

    std::shared_ptr<ModelMgr> model_mgr_;
    std::shared_ptr<AudioDecoder> decoder_;
    AvailableModelsModel models_{"transcribe/model"};
    std::shared_ptr<TranscriptionTask> task_;
    UiState state_{UiState::Idle};
    QString audio_path_;
    QString status_text_;
    QString transcript_text_;
    QString validation_message_;
    QString output_dir_;
    double download_progress_{-1.0};
};

std::ostream& operator << (std::ostream& os, AppEngine::UiState state);
