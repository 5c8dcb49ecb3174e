#pragma once

#include <string>
#include <memory>
#include <string_view>
#include <filesystem>
#include <functional>

#include "log_wrapper.h"

/*! Only pure interfaces here. The implementations live in separate libraries.
 */

namespace qvt {

class EngineBase;
class WhisperSessionCtx;

/*! Parameters for loading a model.
 *
 * Specific engines extend this struct with their own parameters.
 */
struct EngineLoadParams {
    EngineLoadParams() = default;
    virtual ~EngineLoadParams() = default;
};

/*! Context for one session (one audio buffer, one prompt, ...).
 */
struct SessionCtx {
    SessionCtx() = default;
    virtual ~SessionCtx() = default;

    /*! Retrieves the full text result of the last operation on the session.
     */
    virtual std::string getFullTextResult() const = 0;
};

/*! Context for a loaded model.
 *
 * The model stays loaded for as long as someone holds a shared pointer to it.
 */
class ModelCtx {
public:
    ModelCtx() = default;
    virtual ~ModelCtx() = default;

    virtual std::string info() const noexcept = 0;

    virtual const EngineBase& engine() const noexcept = 0;

    virtual EngineBase & engine() noexcept  = 0;

    virtual const std::string& modelId() const noexcept = 0;

    /*! Creates a new Whisper session context for processing.
     *
     * Only applicable for Whisper models.
     */
    virtual std::shared_ptr<WhisperSessionCtx> createWhisperSession() {
        return {};
    };
};

/* Abstract interface for an inference engine.
 *
 * The implementations are built as separate shared libraries to keep the
 * third-party dependencies out of the application.
 */
class EngineBase {
public:
    EngineBase() = default;
    virtual ~EngineBase() = default;

    /*! Returns the version string of the underlying library.
     *
     * Example: "whisper.cpp version 1.7.5"
     */
    virtual std::string version() const = 0;

    /*! One time initialization of the engine.
     *
     * Must be called before any other methods.
     */
    virtual bool init() = 0;

    /*! Returns the last error message, if any.
     *
     * If the last operation was successful, returns an empty string.
     */
    virtual std::string lastError() const noexcept = 0;

    /*! Loads the model from the given path with the specified parameters.
     *
     * @param modelId Identifier of the model being loaded.
     * @param modelPath Filesystem path to the model file.
     * @param params Load parameters specific to the engine.
     *
     * @return Shared pointer to the loaded model context, or nullptr on failure.
     */
    virtual std::shared_ptr<ModelCtx> load(const std::string& modelId,
                                           const std::filesystem::path& modelPath,
                                           const EngineLoadParams& params) = 0;

    virtual int numLoadedModels() const noexcept = 0;

    /*! Route the library's log output to the application's logger.
     *
     * The library has no logging dependencies of its own. Must be implemented
     * inside the library so that its own forwarder instance is the one configured.
     */
    virtual void setLogger(logfault_fwd::logfault_callback_t cb, logfault_fwd::Level level) = 0;
};

} // ns
