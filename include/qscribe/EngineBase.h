#pragma once

#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "log_wrapper.h"

/*! Only pure interfaces here. The implementations live in separate libraries.
 */

namespace qscribe {

class EngineBase;
class SessionCtx;

/*! Parameters for loading a model.
 *
 * Specific engines may extend this struct with their own parameters.
 */
struct EngineLoadParams {
    EngineLoadParams() = default;
    virtual ~EngineLoadParams() = default;

    bool use_gpu{};
    bool flash_attn{};
    int gpu_device{};
};

/*! Parameters for one transcription pass. */
struct TranscribeParams {
    std::string language;   // empty for auto-detect
    int threads{-1};        // -1 to let the engine decide
};

struct Transcript {
    std::string full_text;
    std::string language;   // detected or forced
};

/*! Context for one run over related audio data.
 *
 * Create one session per audio file. A session is not thread safe.
 */
class SessionCtx {
public:
    SessionCtx() = default;
    virtual ~SessionCtx() = default;

    SessionCtx(const SessionCtx&) = delete;
    SessionCtx& operator=(const SessionCtx&) = delete;

    /*! Runs inference over the full audio buffer.
     *
     * @param pcm Mono float samples at the engine's sample rate.
     * @param params Parameters for this pass.
     * @param out Receives the text and the language.
     * @return true on success. On failure, EngineBase::lastError() may explain why.
     */
    virtual bool transcribe(std::span<const float> pcm,
                            const TranscribeParams& params,
                            Transcript& out) = 0;
};

/*! Context for a loaded model.
 *
 * When the last shared pointer to it goes away, the model is unloaded.
 */
class ModelCtx {
public:
    ModelCtx() = default;
    virtual ~ModelCtx() = default;

    ModelCtx(const ModelCtx&) = delete;
    ModelCtx& operator=(const ModelCtx&) = delete;

    virtual std::string info() const = 0;

    virtual const std::string& modelId() const noexcept = 0;

    /*! Where inference runs, for example "cpu" or "gpu:0". */
    virtual std::string device() const = 0;

    /*! Creates a new session on this model.
     *
     * @return The session, or nullptr on failure.
     */
    virtual std::shared_ptr<SessionCtx> createSession() = 0;
};

/* Abstract interface for a speech-to-text engine.
 *
 * The whisper implementation is built as its own shared library to keep the
 * dependency on whisper.cpp isolated from the application.
 */
class EngineBase {
public:
    EngineBase() = default;
    virtual ~EngineBase() = default;

    EngineBase(const EngineBase&) = delete;
    EngineBase& operator=(const EngineBase&) = delete;

    /*! Returns the version string of the underlying engine/library.
     *
     * Example: "whisper.cpp 1.7.6"
     */
    virtual std::string version() const = 0;

    /*! One time initialization of the engine.
     *
     * Must be called before any other methods.
     */
    virtual bool init() = 0;

    /*! Returns the last error message, or an empty string. */
    virtual std::string lastError() const = 0;

    /*! Sample rate (Hz) the engine expects for its mono float input. */
    virtual int sampleRate() const noexcept = 0;

    /*! Loads the model from the given path.
     *
     * The returned context can be shared by more than one session.
     *
     * @param modelId Identifier of the model being loaded.
     * @param modelPath Filesystem path to the model file.
     * @param params Load parameters.
     *
     * @return The loaded model context, or nullptr on failure.
     */
    virtual std::shared_ptr<ModelCtx> load(const std::string& modelId,
                                           const std::filesystem::path& modelPath,
                                           const EngineLoadParams& params) = 0;

    virtual int numLoadedModels() const noexcept = 0;

    /*! Routes the engine's log output to the application's logger. */
    virtual void setLogger(logfault_fwd::logfault_callback_t callback, logfault_fwd::Level level) = 0;
};

} // ns
