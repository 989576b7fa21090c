#pragma once

#include <cassert>
#include <filesystem>
#include <memory>
#include <optional>

#include <QObject>
#include <QNetworkReply>
#include <QUrl>

#include <qcorotask.h>

#include "qscribe/EngineBase.h"
#include "ModelInfo.h"

class QNetworkAccessManager;

/*! Model Manager

 Owns the catalog of speech models, knows where their files live on disk,
 and downloads them on first use. Also owns the speech engine used to load
 them.

 Signals:
 - downloadProgressRatio(name, ratio): Emitted during model download (0..1).
 - modelDownloaded(id): Emitted when a model file has been downloaded.
*/

class ReplyEventProxy : public QObject {
    Q_OBJECT
public:
    enum class Event {
        ReadyRead,
        Finished,
        Error
    };
    Q_ENUM(Event)

    explicit ReplyEventProxy(QNetworkReply *reply, QObject *parent = nullptr);

signals:
    void event(ReplyEventProxy::Event ev);
};


class ModelMgr : public QObject
{
    Q_OBJECT

public:
    /*! Create the model manager.
     *
     * @param engine Speech engine to use. If empty, a whisper engine is
     *      created the first time engine() is called.
     */
    explicit ModelMgr(std::shared_ptr<qscribe::EngineBase> engine = {}, QObject *parent = nullptr);
    ~ModelMgr() override;

    static ModelMgr& instance() {
        assert(self_);
        return *self_;
    }

    model_list_t availableModels() const noexcept;
    const ModelInfo& defaultModel() const noexcept;
    std::optional<ModelInfo> findModelById(const QString& id) const noexcept;
    std::optional<ModelInfo> findModelByName(const QString& name) const noexcept;

    bool isDownloaded(const ModelInfo& mi) const;

    /*! Path to the model file. Creates the model directory if needed. */
    std::filesystem::path findModelPath(const ModelInfo& modelInfo) const;

    /*! Get the path to a model, downloading it first if it is not on disk.

     \param modelInfo The model to make available.
     \return A coro-task that resolves to the path, or to nullopt on failure.
    */
    QCoro::Task<std::optional<std::filesystem::path>> makeAvailable(ModelInfo modelInfo) noexcept;

    /*! The speech engine. Throws std::runtime_error if it cannot be created. */
    std::shared_ptr<qscribe::EngineBase> engine();

signals:
    void downloadProgressRatio(const QString& name, double ratio);
    void modelDownloaded(const QString& id);

private:
    QCoro::Task<bool> downloadModel(ModelInfo modelInfo, QString fullPath) noexcept;
    QCoro::Task<bool> downloadFile(QString name, QUrl url, QString fullPath) noexcept;

    QNetworkAccessManager *nam_{};
    std::shared_ptr<qscribe::EngineBase> engine_;
    static ModelMgr *self_;
};
