#include <bodymeasure/facts/facts_summary.hpp>
#include <bodymeasure/io/load_xyz.hpp>
#include <bodymeasure/io/serialize.hpp>
#include <bodymeasure/measure/batch.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include "CommandLine.hpp"

#include <omp.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace bodymeasure;

namespace
{
std::vector<std::string> splitKeys(const std::string &list)
{
    std::vector<std::string> keys;
    std::istringstream in(list);
    std::string key;
    while (std::getline(in, key, ','))
    {
        if (key.size() > 0)
            keys.push_back(key);
    }
    return keys;
}
} // namespace

int main(int argc, char *argv[])
{
    std::string input_path = "";
    std::string key_list = "";
    std::string output_file = "";
    std::string facts_file = "";
    std::string log_file = "";
    std::string case_id = "";
    uint32_t debug_level = 2;
    int parallelism = omp_get_max_threads();
    double tolerance = 0;
    double connectivity = 0;
    int32_t candidates = 20;
    bool printHelp = false;

    CommandLine args("Measure body circumferences from XYZ vertex files");
    args.addArgument({"-i", "--input"}, &input_path, "Input XYZ file, or directory of XYZ files (one case per file)");
    args.addArgument({"-k", "--keys"}, &key_list, "Comma separated measurement keys (default: all)");
    args.addArgument({"-o", "--output"}, &output_file, "Output JSONL file, one result per case and key");
    args.addArgument({"-f", "--facts"}, &facts_file, "Output facts summary JSON file");
    args.addArgument({"-d", "--debug"}, &debug_level, "none=0, critical=1, error=2, warn=3, info=4, debug=5");
    args.addArgument({"-l", "--log-file"}, &log_file, "Output logging file, overwrites existing files");
    args.addArgument({"-b", "--parallelism"}, &parallelism, "Number of cases measured in parallel");
    args.addArgument({"-n", "--candidates"}, &candidates, "Candidate heights per measurement region");
    args.addArgument({"--tolerance"}, &tolerance, "Absolute slice half thickness in meters (default: automatic)");
    args.addArgument({"--connectivity"}, &connectivity,
                     "Absolute component connectivity distance in meters (default: automatic)");
    args.addArgument({"--case-id"}, &case_id, "Case id for a single input file (default: file name)");
    args.addArgument({"-h", "--help"}, &printHelp, "You must specify at least an input file");

    try
    {
        args.parse(argc, argv);
    }
    catch (std::runtime_error const &e)
    {
        std::cout << e.what() << std::endl;
        return -1;
    }

    if (printHelp || input_path.empty())
    {
        args.printHelp();
        return printHelp ? 0 : -1;
    }

    auto level = spdlog::level::err;
    std::string log_level_str = "err";
    switch (debug_level)
    {
    case 0:
        level = spdlog::level::off;
        log_level_str = "off";
        break;
    case 1:
        level = spdlog::level::critical;
        log_level_str = "critical";
        break;
    case 2:
        level = spdlog::level::err;
        log_level_str = "err";
        break;
    case 3:
        level = spdlog::level::warn;
        log_level_str = "warn";
        break;
    case 4:
        level = spdlog::level::info;
        log_level_str = "info";
        break;
    case 5:
        level = spdlog::level::debug;
        log_level_str = "debug";
        break;
    }
    spdlog::set_level(level);
    if (log_file.size() > 0)
    {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
        spdlog::default_logger()->sinks().push_back(std::move(file_sink));
    }

    spdlog::info("Log level set to {}", log_level_str);

    measure_options options;
    options.slice_tolerance = tolerance;
    options.connectivity_distance = connectivity;
    options.num_candidates = candidates > 0 ? static_cast<size_t>(candidates) : 0;
    try
    {
        validateOptions(options);
    }
    catch (const std::invalid_argument &e)
    {
        spdlog::critical("Invalid options: {}", e.what());
        return -1;
    }

    std::vector<std::string> keys = splitKeys(key_list);
    if (keys.empty())
    {
        for (MeasurementKey key : allMeasurementKeys())
            keys.push_back(toString(key));
    }

    const std::vector<std::string> files = listXYZInputs(input_path);
    if (files.empty())
    {
        spdlog::error("no .xyz files in {}", input_path);
        return -1;
    }

    // a file that cannot be read becomes a contract violation for each of its keys
    std::vector<batch_case> cases;
    std::vector<batch_outcome> rejected;
    for (const std::string &file : files)
    {
        batch_case c;
        c.case_id = files.size() == 1 && case_id.size() > 0 ? case_id : std::filesystem::path(file).stem().string();
        std::string error;
        try
        {
            if (!loadXYZ(file, c.cloud))
                error = "could not open " + file;
        }
        catch (const std::invalid_argument &e)
        {
            error = e.what();
        }

        if (error.empty())
        {
            cases.push_back(std::move(c));
            continue;
        }
        spdlog::warn("case {}: {}", c.case_id, error);
        for (const std::string &key : keys)
        {
            batch_outcome outcome;
            outcome.case_id = c.case_id;
            outcome.key = key;
            outcome.contract_error = error;
            rejected.push_back(std::move(outcome));
        }
    }

    std::vector<batch_outcome> outcomes =
        runBatch(cases, keys, options, parallelism > 0 ? static_cast<size_t>(parallelism) : 0);
    outcomes.insert(outcomes.end(), rejected.begin(), rejected.end());

    if (output_file.size() > 0)
    {
        std::ofstream output;
        output.open(output_file, std::ios::binary);
        if (!toJsonLines(outcomes, output))
        {
            spdlog::error("failed writing {}", output_file);
            return -1;
        }
        output.close();
    }
    else if (!toJsonLines(outcomes, std::cout))
    {
        spdlog::error("failed writing results");
        return -1;
    }

    const facts_summary summary = summarizeFacts(outcomes);
    spdlog::info("{} results, {} processed, {} contract violations", summary.total, summary.processed,
                 summary.contract_violations);

    if (facts_file.size() > 0)
    {
        std::ofstream output;
        output.open(facts_file, std::ios::binary);
        if (!toJson(summary, output))
        {
            spdlog::error("failed writing {}", facts_file);
            return -1;
        }
        output.close();
    }

    return 0;
}
