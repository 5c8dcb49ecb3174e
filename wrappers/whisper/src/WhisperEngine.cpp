#define LOGFAULT_FWD_ENABLE_LOGGING 1

#include <algorithm>
#include <atomic>
#include <cassert>
#include <format>
#include <memory>
#include <thread>

#include "qvt/WhisperEngine.h"
#include "qvt/log_wrapper.h"

#include <whisper.h>

using namespace std;

namespace qvt {

namespace {

class WhisperImpl;
class WhisperCtxImpl;

void whisperLogger(ggml_log_level level, const char *msg, void *) {
    string_view message(msg ? msg : "");
    while (!message.empty() && message.back() == '\n') {
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

bool checkAbort(void *userData) {
    const auto *flag = static_cast<const atomic_bool *>(userData);
    return flag && flag->load();
}

int pickThreads(int requested) {
    if (requested > 0) {
        return requested;
    }

    const auto thds = static_cast<int>(std::thread::hardware_concurrency());
    if (thds > 32) {
        return thds - 4;
    }
    if (thds > 4) {
        return thds - 1;
    }
    return 4;
}

class WhisperSessionCtxImpl final : public WhisperSessionCtx {
public:
    WhisperSessionCtxImpl(shared_ptr<WhisperCtxImpl> modelCtx, whisper_state *state);
    ~WhisperSessionCtxImpl() override;

    string getFullTextResult() const override {
        return final_text_;
    }

    bool whisperFull(std::span<const float> data, const WhisperFullParams &params, Transcript& out) override;

private:
    shared_ptr<WhisperCtxImpl> model_ctx_;
    whisper_state *state_{nullptr};
    std::string final_text_;
};

class WhisperCtxImpl final : public WhisperCtx, public enable_shared_from_this<WhisperCtxImpl> {
public:
    WhisperCtxImpl(WhisperImpl& engine, string_view modelId, whisper_context *ctx)
        : engine_{engine}, model_id_{modelId}, ctx_{ctx}
    {
        assert(ctx_ != nullptr);
    }

    ~WhisperCtxImpl() override;

    string info() const noexcept override;
    EngineBase &engine() noexcept override;
    const EngineBase &engine() const noexcept override;

    WhisperImpl& wengine() noexcept {
        return engine_;
    }

    const WhisperImpl& wengine() const noexcept {
        return engine_;
    }

    const string &modelId() const noexcept override {
        return model_id_;
    }

    std::shared_ptr<WhisperSessionCtx> createWhisperSession() override {
        LOG_DEBUG << "Creating new Whisper session for model " << model_id_;

        if (auto state = whisper_init_state(ctx_)) {
            return make_shared<WhisperSessionCtxImpl>(shared_from_this(), state);
        }

        LOG_ERROR << "Failed to allocate a Whisper state for model " << model_id_;
        return {};
    }

    whisper_context *ctx() noexcept override {
        return ctx_;
    };

    const whisper_context *ctx() const noexcept override {
        return ctx_;
    };

private:
    WhisperImpl& engine_;
    const std::string model_id_;
    whisper_context *ctx_{nullptr};
};

class WhisperImpl final : public WhisperEngine {
public:
    explicit WhisperImpl(const WhisperCreateParams& /*params*/)
    {
        whisper_log_set(whisperLogger, nullptr);
    }

    ~WhisperImpl() override {
        LOG_DEBUG << "Destroying Whisper engine with " << num_loaded_models_ << " loaded models";
    }

    int numLoadedModels() const noexcept override {
        return num_loaded_models_.load();
    }

    string version() const noexcept override {
        string_view v;
        if (const auto p = whisper_version()) {
            v = p;
        }

        return format("whisper.cpp version {}", v);
    }

    bool init() override {
        LOG_INFO << "Whisper engine initialized: " << version();
        return clearError();
    }

    string lastError() const noexcept override {
        return error_;
    }

    void setLogger(logfault_fwd::logfault_callback_t cb, logfault_fwd::Level level) override {
        logfault_fwd::setCallback(std::move(cb), "WhisperEngine");
        logfault_fwd::setLevel(level);
    }

    shared_ptr<ModelCtx> load(const string &modelId, const filesystem::path &modelPath, const EngineLoadParams &params) override {
        WhisperEngineLoadParams wp;
        if (auto *wparams = dynamic_cast<const WhisperEngineLoadParams*>(&params)) {
            wp = *wparams;
        }

        return loadWhisper(modelId, modelPath, wp);
    }

    std::shared_ptr<WhisperCtx> loadWhisper(const std::string &modelId,
                                            const std::filesystem::path &modelPath,
                                            const WhisperEngineLoadParams &params) override {

        std::error_code ec;
        if (!filesystem::is_regular_file(modelPath, ec)) {
            setError(format("Whisper model file {} does not exist. Download ggml-{}.bin into the model directory.",
                            modelPath.string(), modelId));
            LOG_ERROR << error_;
            return {};
        }

        whisper_context_params cparams = whisper_context_default_params();
        cparams.use_gpu = params.use_gpu;
        cparams.flash_attn = params.use_gpu && params.flash_attn;
        cparams.gpu_device = params.gpu_device;
        cparams.dtw_token_timestamps = false;
        cparams.dtw_aheads_preset = WHISPER_AHEADS_NONE;

        LOG_DEBUG << "Loading Whisper model " << modelId << " from " << modelPath
                  << " use_gpu=" << cparams.use_gpu;

        if (auto *ctx = whisper_init_from_file_with_params_no_state(modelPath.c_str(), cparams)) {
            auto modelCtx = make_shared<WhisperCtxImpl>(*this, modelId, ctx);
            num_loaded_models_++;
            clearError();
            return modelCtx;
        }

        setError(format("Failed to load Whisper model from {}", modelPath.string()));
        LOG_ERROR << error_;
        return {};
    }

    void onModelUnloaded() {
        --num_loaded_models_;
    }

private:
    void setError(string msg) {
        error_ = std::move(msg);
    }

    bool clearError() {
        error_.clear();
        return true;
    }

    string error_;
    atomic_int num_loaded_models_{0};
};

WhisperCtxImpl::~WhisperCtxImpl() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
        engine_.onModelUnloaded();
    }
}

string WhisperCtxImpl::info() const noexcept
{
    return format("{}, model={}", wengine().version(), modelId());
}

EngineBase &WhisperCtxImpl::engine() noexcept {
    return engine_;
}

const EngineBase &WhisperCtxImpl::engine() const noexcept
{
    return engine_;
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
        state_ = nullptr;
    }
}

bool WhisperSessionCtxImpl::whisperFull(std::span<const float> data, const WhisperFullParams &params, Transcript& out) {
    auto p = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    p.print_progress = false;
    p.print_realtime = false;
    p.print_timestamps = false;
    p.print_special = false;
    p.n_threads = pickThreads(params.threads);

    if (params.no_context.has_value()) {
        p.no_context = params.no_context.value();
    }
    if (params.single_segment.has_value()) {
        p.single_segment = params.single_segment.value();
    }
    if (params.suppress_non_speech.has_value()) {
        p.suppress_nst = params.suppress_non_speech.value();
    }
    if (!params.language.empty()) {
        p.language = params.language.c_str();
    }
    if (params.abort_flag) {
        p.abort_callback = checkAbort;
        p.abort_callback_user_data = const_cast<atomic_bool *>(params.abort_flag);
    }

    LOG_TRACE << "Whisper full params: "
              << "language='" << (p.language ? p.language : "auto") << "', "
              << "n_threads=" << p.n_threads << ", "
              << "samples=" << data.size() << ", "
              << "no_context=" << p.no_context << ", "
              << "single_segment=" << p.single_segment;

    auto rc = whisper_full_with_state(model_ctx_->ctx(), state_, p, data.data(), static_cast<int>(data.size()));
    if (rc != 0) {
        LOG_WARN << "whisper_full_with_state failed with rc=" << rc;
        return false;
    }

    out = {};
    final_text_.clear();

    const auto eot = whisper_token_eot(model_ctx_->ctx());
    const int n = whisper_full_n_segments_from_state(state_);
    out.segments.reserve(std::max(0, n));

    double p_sum = 0;
    int p_count = 0;

    for (int i = 0; i < n; ++i) {
        Segment seg{};
        seg.t0_ms = whisper_full_get_segment_t0_from_state(state_, i) * 10; // whisper uses 10ms units
        seg.t1_ms = whisper_full_get_segment_t1_from_state(state_, i) * 10;

        if (const char* txt = whisper_full_get_segment_text_from_state(state_, i)) {
            seg.text.assign(txt);
            out.full_text += seg.text;
        }

        seg.no_speech_prob = whisper_full_get_segment_no_speech_prob_from_state(state_, i);

        double seg_sum = 0;
        const int tokens = whisper_full_n_tokens_from_state(state_, i);
        for (int t = 0; t < tokens; ++t) {
            const auto td = whisper_full_get_token_data_from_state(state_, i, t);
            if (td.id >= eot) {
                continue; // timestamps and other special tokens
            }
            seg_sum += td.p;
            ++seg.tokens;
        }

        if (seg.tokens > 0) {
            seg.mean_token_p = static_cast<float>(seg_sum / seg.tokens);
            p_sum += seg_sum;
            p_count += seg.tokens;
        }

        out.segments.push_back(std::move(seg));
    }

    out.confidence = p_count ? static_cast<float>(p_sum / p_count) : 0.0f;

    if (!params.language.empty()) {
        out.language = params.language;
    } else if (const auto id = whisper_full_lang_id_from_state(state_); id >= 0) {
        if (const auto *name = whisper_lang_str(id)) {
            out.language = name;
        }
    }

    final_text_ = out.full_text;
    LOG_DEBUG << "Whisper produced " << n << " segments, " << p_count
              << " tokens, confidence=" << out.confidence;
    return true;
}

} // anon ns

std::shared_ptr<WhisperEngine> WhisperEngine::create(const WhisperCreateParams &params)
{
    return make_shared<WhisperImpl>(params);
}

WhisperCtx::WhisperCtx() {}
WhisperCtx::~WhisperCtx() {}

WhisperSessionCtx::WhisperSessionCtx() {}
WhisperSessionCtx::~WhisperSessionCtx() {}

WhisperEngine::WhisperEngine() {}
WhisperEngine::~WhisperEngine() {}

} // ns
