#pragma once

#include <mutex>

#include "PipelineTypes.h"

/*! The one pipeline state.
 *
 * Owned by whoever creates the coordinator and passed to it by reference, so
 * several independent coordinators can exist in one process (tests).
 * The mutex is held only for the compare-and-set itself.
 */
class PipelineStateHolder
{
public:
    PipelineStateHolder() = default;

    PipelineStateHolder(const PipelineStateHolder&) = delete;
    PipelineStateHolder& operator=(const PipelineStateHolder&) = delete;

    PipelineState state() const;

    /*! Atomically change the state from `from` to `to`.
     *
     * @return true if the state was `from` and is now `to`.
     */
    bool transition(PipelineState from, PipelineState to);

    // Unconditionally return to Idle. Returns the previous state.
    PipelineState reset();

private:
    mutable std::mutex mutex_;
    PipelineState state_{PipelineState::Idle};
};
