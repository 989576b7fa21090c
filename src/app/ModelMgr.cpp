// logfault must be seen before qscribe/log_wrapper.h to get forward_to_logfault()
#include "logging.h"

#include <array>
#include <format>
#include <stdexcept>

#include <QFile>
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QScopeGuard>
#include <QSettings>
#include <QStandardPaths>

#include <qcorosignal.h>

#include "qscribe/WhisperEngine.h"
#include "ModelMgr.h"

using namespace std;

namespace {

using mi_t = ModelInfo;
constexpr string_view whisper_download_url = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/";

// Ordered from the fastest to the most accurate
constexpr auto all_whisper_models = std::to_array<mi_t>({
    {"base", "base-q5_1", "ggml-base-q5_1.bin", 57, whisper_download_url},
    {"small", "small-q5_1", "ggml-small-q5_1.bin", 181, whisper_download_url},
    {"medium", "medium-q5_0", "ggml-medium-q5_0.bin", 514, whisper_download_url},
    {"large-v3", "large-v3-q5_0", "ggml-large-v3-q5_0.bin", 1080, whisper_download_url},
});

// The best trade-off between speed and accuracy on a CPU
constexpr size_t default_model_index = 2;

constexpr string_view model_dir_prefix = "whisper_models";

} // anon ns

std::ostream& operator<<(std::ostream &os, const ModelInfo& mi) {
    return os << mi.name << " (" << mi.id << ')';
}

ModelMgr *ModelMgr::self_{};

ModelMgr::ModelMgr(std::shared_ptr<qscribe::EngineBase> engine, QObject *parent)
    : QObject(parent), engine_{std::move(engine)}
{
    assert(!self_);
    self_ = this;
}

ModelMgr::~ModelMgr()
{
    if (self_ == this) {
        self_ = nullptr;
    }
}

model_list_t ModelMgr::availableModels() const noexcept
{
    return all_whisper_models;
}

const ModelInfo &ModelMgr::defaultModel() const noexcept
{
    return all_whisper_models[default_model_index];
}

std::optional<ModelInfo> ModelMgr::findModelById(const QString &id) const noexcept
{
    const auto model_id = id.toStdString();

    for (const auto &m : availableModels()) {
        if (m.id == model_id) {
            return m;
        }
    }

    LOG_WARN_N << "No model found matching id='" << model_id << "'";
    return std::nullopt;
}

std::optional<ModelInfo> ModelMgr::findModelByName(const QString &name) const noexcept
{
    const auto model_name = name.toStdString();

    for (const auto &m : availableModels()) {
        if (m.name == model_name) {
            return m;
        }
    }

    LOG_WARN_N << "No model found matching name='" << model_name << "'";
    return std::nullopt;
}

bool ModelMgr::isDownloaded(const ModelInfo &mi) const
{
    std::error_code ec;
    return filesystem::is_regular_file(findModelPath(mi), ec);
}

std::filesystem::path ModelMgr::findModelPath(const ModelInfo &modelInfo) const
{
    auto base = QSettings{}.value("models/path", "").toString().trimmed();
    if (base.isEmpty()) {
        // This is supposed to be set in main(). This is a fallback.
        LOG_WARN_N << "Model path not set in settings; using default.";
        base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation) + "/models";
    }

    filesystem::path model_dir = base.toStdString();
    model_dir /= model_dir_prefix;

    if (std::error_code ec; !filesystem::is_directory(model_dir, ec)) {
        LOG_INFO_N << "Creating model directory: " << model_dir;
        filesystem::create_directories(model_dir, ec);
        if (ec) {
            LOG_WARN_N << "Failed to create model directory " << model_dir << ": " << ec.message();
        }
    }

    return model_dir / modelInfo.filename;
}

QCoro::Task<std::optional<std::filesystem::path>> ModelMgr::makeAvailable(ModelInfo modelInfo) noexcept
{
    const auto model_path = findModelPath(modelInfo);

    LOG_DEBUG_N << "Making model available: " << modelInfo
                << ", path=" << model_path;

    if (std::error_code ec; filesystem::is_regular_file(model_path, ec)) {
        LOG_DEBUG_N << "Model file already exists on disk: " << model_path;
        co_return model_path;
    }

    if (!co_await downloadModel(modelInfo, QString::fromStdString(model_path.string()))) {
        co_return std::nullopt;
    }

    co_return model_path;
}

std::shared_ptr<qscribe::EngineBase> ModelMgr::engine()
{
    if (!engine_) {
        auto whisper = qscribe::WhisperEngine::create({});
        if (!whisper) {
            LOG_ERROR_N << "Failed to create Whisper engine instance.";
            throw std::runtime_error{"Failed to create Whisper engine instance."};
        }

        whisper->setLogger(logfault_fwd::forward_to_logfault,
                           static_cast<logfault_fwd::Level>(
                               ::logfault::LogManager::Instance().GetLoglevel()));

        if (!whisper->init()) {
            const auto why = format("Failed to initialize {}: {}", whisper->version(), whisper->lastError());
            LOG_ERROR_N << why;
            throw std::runtime_error{why};
        }

        LOG_INFO_N << "Using " << whisper->version();
        engine_ = std::move(whisper);
    }

    return engine_;
}

QCoro::Task<bool> ModelMgr::downloadModel(ModelInfo modelInfo, QString fullPath) noexcept
{
    // models/url overrides the base url of the catalog, for mirrors
    QString surl = QSettings{}.value("models/url", "").toString().trimmed();
    if (surl.isEmpty()) {
        surl = QString::fromUtf8(modelInfo.download_url);
    }

    if (surl.endsWith('/')) {
        surl += QString::fromUtf8(modelInfo.filename);
    }

    const QUrl url{surl};

    LOG_INFO_N << "Starting download of model " << modelInfo
               << " (" << modelInfo.size_mb << " MB)"
               << " from " << url.toString()
               << " to " << fullPath;

    if (!co_await downloadFile(QString::fromUtf8(modelInfo.name), url, fullPath)) {
        LOG_ERROR_N << "Failed to download model file: " << url.toString();
        co_return false;
    }

    LOG_INFO_N << "Model file downloaded successfully: " << fullPath;
    emit modelDownloaded(QString::fromUtf8(modelInfo.id));
    co_return true;
}

QCoro::Task<bool> ModelMgr::downloadFile(QString name, QUrl url, QString fullPath) noexcept
{
    if (!nam_) {
        nam_ = new QNetworkAccessManager(this);
    }

    const QString tmp_path = fullPath + ".part";

    QNetworkRequest request{url};
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    QNetworkReply *reply = nam_->get(request);

    // Ensure reply gets deleted and temp file cleaned up on early exit
    const auto guard = qScopeGuard([reply, tmp_path] {
        reply->deleteLater();
        if (QFile::exists(tmp_path)) {
            LOG_DEBUG_N << "Removing temporary file: " << tmp_path;
            QFile::remove(tmp_path);
        }
    });

    QFile out(tmp_path);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR_N << "Failed to open " << tmp_path << " for writing: " << out.errorString();
        reply->abort();
        co_return false;
    }

    connect(reply, &QNetworkReply::downloadProgress,
            this, [this, name](qint64 bytesReceived, qint64 bytesTotal) {
        if (bytesTotal > 0) {
            const double ratio = static_cast<double>(bytesReceived) / static_cast<double>(bytesTotal);
            emit downloadProgressRatio(name, ratio);
        }
    });

    ReplyEventProxy proxy{reply};
    bool write_error = false;

    auto drain_to_file = [&] {
        while (reply->bytesAvailable() > 0) {
            const QByteArray chunk = reply->read(64 * 1024);
            if (chunk.isEmpty()) {
                break;
            }

            if (out.write(chunk) != chunk.size()) {
                write_error = true;
                reply->abort();
                break;
            }
        }
    };

    while (true) {
        drain_to_file();
        if (write_error) {
            LOG_ERROR_N << "Disk write error while downloading " << url.toString()
                        << ": " << out.errorString();
            co_return false;
        }

        if (reply->isFinished() && reply->bytesAvailable() == 0) {
            break;
        }

        if (reply->error() != QNetworkReply::NoError) {
            LOG_ERROR_N << "Download error detected: " << reply->errorString();
            co_return false;
        }

        const auto ev = co_await qCoro(&proxy, &ReplyEventProxy::event);
        if (ev == ReplyEventProxy::Event::Error) {
            LOG_ERROR_N << "Download error signaled: " << reply->errorString();
            co_return false;
        }
    }

    if (!out.flush()) {
        LOG_ERROR_N << "Failed to flush " << tmp_path << ": " << out.errorString();
        co_return false;
    }
    out.close();

    if (reply->error() != QNetworkReply::NoError) {
        LOG_ERROR_N << "Network error while downloading " << url.toString()
                    << ": " << reply->errorString();
        co_return false;
    }

    const int http_status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (http_status < 200 || http_status >= 300) {
        LOG_ERROR_N << "Download of " << url.toString() << " failed with HTTP status " << http_status;
        co_return false;
    }

    QFile::remove(fullPath);
    if (!QFile::rename(tmp_path, fullPath)) {
        LOG_ERROR_N << "Failed to rename temporary file " << tmp_path
                    << " to final path " << fullPath;
        co_return false;
    }

    LOG_DEBUG_N << "File downloaded successfully: " << fullPath;
    emit downloadProgressRatio(name, 1.0);
    co_return true;
}

ReplyEventProxy::ReplyEventProxy(QNetworkReply *reply, QObject *parent)
    : QObject(parent)
{
    connect(reply, &QNetworkReply::readyRead,
            this, [this] {
                emit event(Event::ReadyRead);
            });

    connect(reply, &QNetworkReply::finished,
            this, [this] {
                LOG_TRACE_N << "ReplyEventProxy: finished signaled.";
                emit event(Event::Finished);
            });

    connect(reply, &QNetworkReply::errorOccurred,
            this, [this](QNetworkReply::NetworkError) {
                LOG_TRACE_N << "ReplyEventProxy: errorOccurred signaled.";
                emit event(Event::Error);
            });
}
