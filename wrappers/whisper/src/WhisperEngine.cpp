#include <atomic>
#include <cassert>
#include <format>
#include <memory>
#include <mutex>
#include <thread>

#include "qscribe/WhisperEngine.h"
#include "qscribe/log_wrapper.h"

#include <whisper.h>

using namespace std;

namespace qscribe {

namespace {

class WhisperImpl;
class WhisperCtxImpl;

void whisperLogger(ggml_log_level level, const char *msg, void *) {
    string_view message(msg ? msg : "");
    if (message.ends_with('\n')) {
        message.remove_suffix(1);
    }

    switch(level) {
    case GGML_LOG_LEVEL_ERROR:
        LOG_ERROR << "[whisper] " << message;
        break;
    case GGML_LOG_LEVEL_WARN:
        LOG_WARN << "[whisper] " << message;
        break;
    case GGML_LOG_LEVEL_INFO:
        LOG_DEBUG << "[whisper] " << message;
        break;
    case GGML_LOG_LEVEL_DEBUG:
    case GGML_LOG_LEVEL_CONT:
        LOG_TRACE << "[whisper] " << message;
        break;
    case GGML_LOG_LEVEL_NONE:
        break;
    }
}

int defaultThreads() {
    const auto thds = std::thread::hardware_concurrency();
    if (thds > 32) {
        return static_cast<int>(thds - 4);
    }
    if (thds > 4) {
        return static_cast<int>(thds - 1);
    }
    return 4;
}

class WhisperSessionCtxImpl final : public SessionCtx {
public:
    WhisperSessionCtxImpl(shared_ptr<WhisperCtxImpl> modelCtx, whisper_state *state);
    ~WhisperSessionCtxImpl() override;

    bool transcribe(std::span<const float> pcm, const TranscribeParams &params, Transcript& out) override;

private:
    shared_ptr<WhisperCtxImpl> model_ctx_;
    whisper_state *state_{nullptr};
};

class WhisperCtxImpl final : public ModelCtx, public enable_shared_from_this<WhisperCtxImpl> {
public:
    WhisperCtxImpl(WhisperImpl& engine, string_view modelId, whisper_context *ctx, string device)
        : engine_{engine}, model_id_{modelId}, ctx_{ctx}, device_{std::move(device)}
    {
        assert(ctx_ != nullptr);
    }

    ~WhisperCtxImpl() override;

    string info() const override;

    const string &modelId() const noexcept override {
        return model_id_;
    }

    string device() const override {
        return device_;
    }

    std::shared_ptr<SessionCtx> createSession() override;

    whisper_context *ctx() noexcept {
        return ctx_;
    }

    WhisperImpl& wengine() noexcept {
        return engine_;
    }

    const WhisperImpl& wengine() const noexcept {
        return engine_;
    }

private:
    WhisperImpl& engine_;
    const std::string model_id_;
    whisper_context *ctx_{nullptr};
    const std::string device_;
};

class WhisperImpl final : public WhisperEngine {
public:
    explicit WhisperImpl(const WhisperCreateParams& /*params*/)
    {
        LOG_DEBUG << "Creating Whisper engine";
        whisper_log_set(whisperLogger, nullptr);
    }

    ~WhisperImpl() override {
        LOG_DEBUG << "Destroying Whisper engine with " << num_loaded_models_ << " loaded models";
    }

    int numLoadedModels() const noexcept override {
        return num_loaded_models_.load();
    }

    string version() const override {
        string_view v{"unknown"};
        if (const auto *p = whisper_version()) {
            v = p;
        }

        return format("whisper.cpp {}", v);
    }

    bool init() override {
        LOG_INFO << version() << " initialized. " << whisper_print_system_info();
        clearError();
        return true;
    }

    string lastError() const override {
        lock_guard lock{mutex_};
        return error_;
    }

    void setLogger(logfault_fwd::logfault_callback_t callback, logfault_fwd::Level level) override {
        logfault_fwd::setCallback(std::move(callback), "whisper-wrapper");
        logfault_fwd::setLevel(level);
    }

    shared_ptr<ModelCtx> load(const string &modelId,
                              const filesystem::path &modelPath,
                              const EngineLoadParams &params) override {
        whisper_context_params cparams = whisper_context_default_params();

        LOG_DEBUG << "Loading Whisper model " << modelId << " from " << modelPath;

        cparams.use_gpu = params.use_gpu;
        cparams.flash_attn = params.use_gpu && params.flash_attn; // flash attention require gpu
        cparams.gpu_device = params.gpu_device;

        // DTW token timestamps are not used
        cparams.dtw_token_timestamps = false;
        cparams.dtw_aheads_preset = WHISPER_AHEADS_NONE;

        if (!filesystem::is_regular_file(modelPath)) {
            setError(format("Model file {} does not exist", modelPath.string()));
            LOG_ERROR << lastError();
            return {};
        }

        if (auto *ctx = whisper_init_from_file_with_params_no_state(modelPath.string().c_str(), cparams)) {
            const auto device = params.use_gpu ? format("gpu:{}", params.gpu_device) : string{"cpu"};
            auto model_ctx = make_shared<WhisperCtxImpl>(*this, modelId, ctx, device);
            ++num_loaded_models_;
            clearError();
            return model_ctx;
        }

        setError(format("Failed to load Whisper model from {}", modelPath.string()));
        LOG_ERROR << lastError();
        return {};
    }

    void onModelUnloaded() noexcept {
        --num_loaded_models_;
    }

    void setError(string msg) {
        lock_guard lock{mutex_};
        error_ = std::move(msg);
    }

    void clearError() {
        lock_guard lock{mutex_};
        error_.clear();
    }

private:
    mutable mutex mutex_;
    string error_;
    atomic_int num_loaded_models_{0};
};

WhisperCtxImpl::~WhisperCtxImpl() {
    if (ctx_) {
        LOG_DEBUG << "Unloading Whisper model " << model_id_;
        whisper_free(ctx_);
        ctx_ = nullptr;
        engine_.onModelUnloaded();
    }
}

string WhisperCtxImpl::info() const
{
    return format("{}, model={}, device={}", wengine().version(), modelId(), device_);
}

std::shared_ptr<SessionCtx> WhisperCtxImpl::createSession()
{
    assert(ctx_ != nullptr);

    LOG_DEBUG << "Creating new Whisper session for model " << model_id_;

    if (auto *state = whisper_init_state(ctx_)) {
        return make_shared<WhisperSessionCtxImpl>(shared_from_this(), state);
    }

    engine_.setError(format("Failed to create a Whisper state for model {}", model_id_));
    return {};
}

WhisperSessionCtxImpl::WhisperSessionCtxImpl(shared_ptr<WhisperCtxImpl> modelCtx, whisper_state *state)
    : model_ctx_{std::move(modelCtx)}, state_{state}
{
    assert(model_ctx_ != nullptr);
    assert(state_ != nullptr);
}

WhisperSessionCtxImpl::~WhisperSessionCtxImpl()
{
    if (state_) {
        whisper_free_state(state_);
    }
}

bool WhisperSessionCtxImpl::transcribe(std::span<const float> pcm, const TranscribeParams &params, Transcript& out) {
    auto p = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    p.n_threads = params.threads > 0 ? params.threads : defaultThreads();
    p.translate = false;
    p.print_progress = false;
    p.print_realtime = false;
    p.print_timestamps = false;
    p.print_special = false;

    // nullptr (the default "en") is not what we want. "auto" makes whisper detect it.
    p.language = params.language.empty() ? "auto" : params.language.c_str();

    LOG_DEBUG << "Running whisper_full on " << pcm.size() << " samples"
              << ", language=" << p.language
              << ", n_threads=" << p.n_threads;

    if (pcm.empty()) {
        model_ctx_->wengine().setError("No audio samples to transcribe");
        return false;
    }

    const auto rc = whisper_full_with_state(model_ctx_->ctx(), state_, p, pcm.data(), static_cast<int>(pcm.size()));
    if (rc != 0) {
        model_ctx_->wengine().setError(format("whisper_full failed with code {}", rc));
        return false;
    }

    out.full_text.clear();

    const int n = whisper_full_n_segments_from_state(state_);
    for (int i = 0; i < n; ++i) {
        if (const char* txt = whisper_full_get_segment_text_from_state(state_, i)) {
            out.full_text += txt;
        }
    }

    if (!params.language.empty()) {
        out.language = params.language;
    } else if (const auto id = whisper_full_lang_id_from_state(state_); id >= 0) {
        out.language = whisper_lang_str(id);
    } else {
        out.language.clear();
    }

    LOG_DEBUG << "whisper_full produced " << n << " segments, language=" << out.language;
    return true;
}

} // anon ns

std::shared_ptr<WhisperEngine> WhisperEngine::create(const WhisperCreateParams &params)
{
    return make_shared<WhisperImpl>(params);
}

WhisperEngine::WhisperEngine() = default;

WhisperEngine::~WhisperEngine() = default;

} // ns
