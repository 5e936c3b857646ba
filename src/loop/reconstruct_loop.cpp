#include <bodymeasure/loop/reconstruct_loop.hpp>

#include <bodymeasure/types/warning_codes.hpp>

#include <spdlog/spdlog.h>

#include <exception>

namespace bodymeasure
{

loop_reconstruction reconstructLoop(const loop_input &input, const std::vector<named_strategy> &chain)
{
    loop_reconstruction reconstruction;
    std::string last_rejection;

    for (const named_strategy &strategy : chain)
    {
        if (strategy.applies && !strategy.applies(input, reconstruction.attempts))
        {
            continue;
        }

        strategy_result result;
        try
        {
            result = strategy.run(input);
        }
        catch (const std::exception &e)
        {
            spdlog::error("loop strategy {} threw: {}", strategy.name, e.what());
            result = strategy_result::failure(codes::REASON_EXCEPTION);
        }

        if (!result.ok())
        {
            last_rejection = codes::stageFailure(strategy.stage, result.reason);
            reconstruction.attempts.push_back({strategy.name, last_rejection});
            spdlog::trace("{} rejected: {}", strategy.name, last_rejection);
            continue;
        }

        reconstruction.attempts.push_back({strategy.name, ""});
        reconstruction.method = result.method;
        reconstruction.loop = std::move(result.loop);
        reconstruction.alpha_k = result.alpha_k;
        reconstruction.warnings = std::move(result.warnings);
        break;
    }

    if (!last_rejection.empty())
    {
        reconstruction.warnings.push_back(last_rejection);
    }

    spdlog::trace("loop reconstruction: {} after {} attempts", toString(reconstruction.method),
                  reconstruction.attempts.size());
    return reconstruction;
}

} // namespace bodymeasure
