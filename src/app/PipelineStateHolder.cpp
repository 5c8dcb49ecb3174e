#include "PipelineStateHolder.h"
#include "logging.h"

PipelineState PipelineStateHolder::state() const
{
    std::lock_guard lock{mutex_};
    return state_;
}

bool PipelineStateHolder::transition(PipelineState from, PipelineState to)
{
    {
        std::lock_guard lock{mutex_};
        if (state_ != from) {
            return false;
        }
        state_ = to;
    }

    LOG_DEBUG << "Pipeline state changed from " << from << " to " << to;
    return true;
}

PipelineState PipelineStateHolder::reset()
{
    PipelineState prev;
    {
        std::lock_guard lock{mutex_};
        prev = state_;
        state_ = PipelineState::Idle;
    }

    if (prev != PipelineState::Idle) {
        LOG_DEBUG << "Pipeline state reset from " << prev << " to " << PipelineState::Idle;
    }
    return prev;
}
