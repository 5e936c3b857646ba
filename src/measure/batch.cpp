#include <bodymeasure/measure/batch.hpp>

#include <bodymeasure/measure/measure.hpp>

#include <spdlog/spdlog.h>

#include <omp.h>

#include <functional>
#include <stdexcept>

using fvec = std::vector<std::function<void()>>;

namespace
{

void run_parallel(fvec &funcs, int parallelism)
{
#pragma omp parallel for schedule(dynamic, 1) num_threads(parallelism)
    for (int i = 0; i < (int)funcs.size(); i++)
    {
        funcs[i]();
    }
}

} // namespace

namespace bodymeasure
{

std::vector<batch_outcome> runBatch(const std::vector<batch_case> &cases, const std::vector<std::string> &keys,
                                    const measure_options &options, size_t parallelism)
{
    std::vector<batch_outcome> outcomes(cases.size() * keys.size());

    fvec funcs;
    funcs.reserve(outcomes.size());
    for (size_t c = 0; c < cases.size(); c++)
    {
        for (size_t k = 0; k < keys.size(); k++)
        {
            batch_outcome &outcome = outcomes[c * keys.size() + k];
            outcome.case_id = cases[c].case_id;
            outcome.key = keys[k];

            funcs.push_back([&outcome, &options, &bcase = cases[c]]() {
                measure_options case_options = options;
                case_options.case_id = bcase.case_id;
                try
                {
                    outcome.result = measureCircumference(bcase.cloud, outcome.key, case_options);
                }
                catch (const std::invalid_argument &e)
                {
                    spdlog::warn("case {} key {}: contract violation: {}", bcase.case_id, outcome.key, e.what());
                    outcome.contract_error = e.what();
                }
            });
        }
    }

    const int threads = parallelism == 0 ? omp_get_num_procs() : static_cast<int>(parallelism);
    spdlog::info("measuring {} cases x {} keys on {} threads", cases.size(), keys.size(), threads);
    run_parallel(funcs, threads);

    return outcomes;
}

} // namespace bodymeasure
