#include <bodymeasure/io/load_xyz.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace bodymeasure
{

point_cloud fromXYZ(std::istream &in)
{
    std::vector<double> values;
    std::string line;
    size_t line_number = 0;
    while (std::getline(in, line))
    {
        line_number++;
        const size_t comment = line.find('#');
        if (comment != std::string::npos)
        {
            line.resize(comment);
        }
        std::replace(line.begin(), line.end(), ',', ' ');

        std::istringstream row(line);
        std::vector<double> row_values;
        std::string token;
        while (row >> token)
        {
            size_t parsed = 0;
            double value = 0;
            try
            {
                value = std::stod(token, &parsed);
            }
            catch (const std::logic_error &)
            {
                parsed = 0;
            }
            if (parsed != token.size())
            {
                throw std::invalid_argument("line " + std::to_string(line_number) + ": '" + token +
                                            "' is not a number");
            }
            row_values.push_back(value);
        }

        if (row_values.empty())
        {
            continue;
        }
        if (row_values.size() != 3)
        {
            throw std::invalid_argument("line " + std::to_string(line_number) + ": expected 3 columns, got " +
                                        std::to_string(row_values.size()));
        }
        values.insert(values.end(), row_values.begin(), row_values.end());
    }

    return fromFlatBuffer(values, 3);
}

bool loadXYZ(const std::string &path, point_cloud &cloud)
{
    std::ifstream in(path);
    if (!in)
    {
        spdlog::error("could not open {}", path);
        return false;
    }
    cloud = fromXYZ(in);
    spdlog::debug("loaded {} vertices from {}", cloud.size(), path);
    return true;
}

std::vector<std::string> listXYZInputs(const std::string &path)
{
    std::vector<std::string> files;
    if (!std::filesystem::is_directory(path))
    {
        files.push_back(path);
        return files;
    }

    for (const auto &entry : std::filesystem::directory_iterator(path))
    {
        if (entry.is_regular_file() && entry.path().extension() == ".xyz")
        {
            files.push_back(entry.path().string());
        }
    }
    std::sort(files.begin(), files.end());
    spdlog::debug("{} .xyz files in {}", files.size(), path);
    return files;
}

} // namespace bodymeasure
