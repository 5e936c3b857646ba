#pragma once

#include <bodymeasure/loop/strategies.hpp>

namespace bodymeasure
{

struct loop_reconstruction
{
    LoopMethod method = LoopMethod::NONE;
    closed_loop loop;
    std::optional<size_t> alpha_k;

    // fallback usage warnings followed by the single rejection reason, if any strategy was rejected
    std::vector<std::string> warnings;

    // every strategy tried, in order; the code is empty for the one that produced the loop
    std::vector<loop_attempt_record> attempts;

    bool ok() const
    {
        return method != LoopMethod::NONE;
    }
};

/**
 * Try each applicable strategy of the chain in order until one produces a loop. Exceptions escaping a strategy
 * become <STAGE>_FAIL:EXCEPTION and the chain continues. Exactly one rejection code reaches the warnings: the one
 * of the attempt just before the successful strategy, or of the last attempt when every strategy is rejected.
 */
loop_reconstruction reconstructLoop(const loop_input &input,
                                    const std::vector<named_strategy> &chain = defaultStrategyChain());

} // namespace bodymeasure
