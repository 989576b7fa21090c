#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include <QDir>
#include <QFile>
#include <QSettings>
#include <QString>
#include <QHostAddress>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTemporaryDir>

#include "qscribe/EngineBase.h"
#include "AudioDecoder.h"

namespace test {

/*! Speech engine that never touches a real model. */
class FakeEngine : public qscribe::EngineBase {
public:
    struct Behavior {
        std::string text{"Hello from the fake engine."};
        std::string throw_on_transcribe;    // non-empty: transcribe() throws this
        bool fail_load{false};
        std::string device{"cpu"};
        std::optional<std::shared_future<void>> gate;   // transcribe() waits for it
    };

    explicit FakeEngine(Behavior behavior = {})
        : behavior_{std::move(behavior)} {}

    std::string version() const override { return "fake 1.0"; }
    bool init() override { return true; }

    std::string lastError() const override {
        std::lock_guard lock{mutex_};
        return error_;
    }

    int sampleRate() const noexcept override { return 16000; }

    std::shared_ptr<qscribe::ModelCtx> load(const std::string& modelId,
                                            const std::filesystem::path& /*modelPath*/,
                                            const qscribe::EngineLoadParams& /*params*/) override {
        ++loads;
        if (behavior_.fail_load) {
            std::lock_guard lock{mutex_};
            error_ = "corrupt model file";
            return {};
        }
        return std::make_shared<Model>(*this, modelId);
    }

    int numLoadedModels() const noexcept override { return loaded_.load(); }

    void setLogger(logfault_fwd::logfault_callback_t, logfault_fwd::Level) override {}

    std::atomic_int loads{0};
    std::atomic_int transcriptions{0};

private:
    class Session : public qscribe::SessionCtx {
    public:
        explicit Session(FakeEngine& engine) : engine_{engine} {}

        bool transcribe(std::span<const float> pcm,
                        const qscribe::TranscribeParams& /*params*/,
                        qscribe::Transcript& out) override {
            if (engine_.behavior_.gate) {
                engine_.behavior_.gate->wait();
            }

            ++engine_.transcriptions;
            if (!engine_.behavior_.throw_on_transcribe.empty()) {
                throw std::runtime_error{engine_.behavior_.throw_on_transcribe};
            }

            if (pcm.empty()) {
                std::lock_guard lock{engine_.mutex_};
                engine_.error_ = "No audio samples to transcribe";
                return false;
            }

            out.full_text = engine_.behavior_.text;
            out.language = "en";
            return true;
        }

    private:
        FakeEngine& engine_;
    };

    class Model : public qscribe::ModelCtx {
    public:
        Model(FakeEngine& engine, std::string id)
            : engine_{engine}, id_{std::move(id)} {
            ++engine_.loaded_;
        }

        ~Model() override { --engine_.loaded_; }

        std::string info() const override { return "fake model " + id_; }
        const std::string& modelId() const noexcept override { return id_; }
        std::string device() const override { return engine_.behavior_.device; }

        std::shared_ptr<qscribe::SessionCtx> createSession() override {
            return std::make_shared<Session>(engine_);
        }

    private:
        FakeEngine& engine_;
        const std::string id_;
    };

    Behavior behavior_;
    mutable std::mutex mutex_;
    std::string error_;
    std::atomic_int loaded_{0};
};

/*! Returns one second of silence, or throws. */
class FakeDecoder : public AudioDecoder {
public:
    explicit FakeDecoder(std::string error = {})
        : error_{std::move(error)} {}

    std::vector<float> decode(const QString& /*path*/, int sampleRate) override {
        ++calls;
        if (!error_.empty()) {
            throw std::runtime_error{error_};
        }
        return std::vector<float>(static_cast<size_t>(sampleRate), 0.0f);
    }

    std::atomic_int calls{0};

private:
    std::string error_;
};

/*! Points `models/path` at `dir` and puts a dummy file there for every
 *  catalog model, so nothing is downloaded. */
inline void prepareModelDir(const QTemporaryDir& dir, const QStringList& fileNames) {
    QSettings{}.setValue("models/path", dir.path());
    const QDir models{dir.filePath("whisper_models")};
    QDir{}.mkpath(models.path());
    for (const auto& name : fileNames) {
        QFile f{models.filePath(name)};
        if (f.open(QIODevice::WriteOnly)) {
            f.write("ggml");
        }
    }
}

inline QString createFile(const QDir& dir, const QString& name, const QByteArray& content = "RIFF") {
    const auto path = dir.filePath(name);
    QFile f{path};
    if (f.open(QIODevice::WriteOnly)) {
        f.write(content);
    }
    return path;
}

inline const QStringList& catalogFiles() {
    static const QStringList files{
        "ggml-base-q5_1.bin",
        "ggml-small-q5_1.bin",
        "ggml-medium-q5_0.bin",
        "ggml-large-v3-q5_0.bin"
    };
    return files;
}

/*! Minimal HTTP/1.1 server on localhost that answers every GET with the
 *  same status and body, then closes the connection. */
class LocalHttpServer {
public:
    LocalHttpServer(int status, QByteArray body)
        : status_{status}, body_{std::move(body)}
    {
        QObject::connect(&server_, &QTcpServer::newConnection, &server_, [this] {
            while (auto *socket = server_.nextPendingConnection()) {
                serve(socket);
            }
        });
        listening_ = server_.listen(QHostAddress::LocalHost);
    }

    bool isListening() const noexcept { return listening_; }

    // Base url for models/url
    QString baseUrl() const {
        return QStringLiteral("http://127.0.0.1:%1/models/").arg(server_.serverPort());
    }

    int requests() const noexcept { return requests_; }
    const QByteArray& lastPath() const noexcept { return last_path_; }

private:
    void serve(QTcpSocket *socket) {
        auto request = std::make_shared<QByteArray>();
        QObject::connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
        QObject::connect(socket, &QTcpSocket::readyRead, socket, [this, socket, request] {
            *request += socket->readAll();
            if (!request->contains("\r\n\r\n")) {
                return;
            }

            ++requests_;
            const auto request_line = request->left(request->indexOf("\r\n")).split(' ');
            last_path_ = request_line.size() > 1 ? request_line.at(1) : QByteArray{};

            const QByteArray reason = status_ == 200 ? "OK" : "Not Found";
            QByteArray reply = "HTTP/1.1 " + QByteArray::number(status_) + ' ' + reason + "\r\n"
                + "Content-Type: application/octet-stream\r\n"
                + "Content-Length: " + QByteArray::number(body_.size()) + "\r\n"
                + "Connection: close\r\n\r\n"
                + body_;
            socket->write(reply);
            socket->disconnectFromHost();
        });
    }

    QTcpServer server_;
    const int status_;
    const QByteArray body_;
    bool listening_{false};
    int requests_{0};
    QByteArray last_path_;
};

} // test ns
