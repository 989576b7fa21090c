#pragma once

#include "EngineBase.h"

#if defined(_WIN32)
#if defined(QSCRIBE_WHISPER_WRAP_BUILD)
#define QSCRIBE_WHISPER_WRAP_API __declspec(dllexport)
#else
#define QSCRIBE_WHISPER_WRAP_API __declspec(dllimport)
#endif
#else
#define QSCRIBE_WHISPER_WRAP_API __attribute__((visibility("default")))
#endif

namespace qscribe {

/*! Whisper engine interface
 *
 * Wraps whisper.cpp. Model files are ggml binaries as published in the
 * whisper.cpp model repository.
 */
class QSCRIBE_WHISPER_WRAP_API WhisperEngine : public EngineBase {
public:
    static constexpr int sample_rate = 16000;

    WhisperEngine();
    ~WhisperEngine() override;

    struct WhisperCreateParams {};

    /*! Creates a new Whisper engine instance.
     *
     * @param params Parameters for creating the engine.
     * @return The new engine.
     */
    static std::shared_ptr<WhisperEngine> create(const WhisperCreateParams& params);

    int sampleRate() const noexcept override {
        return sample_rate;
    }
};

} // ns
