#include "sedphot/TableLoaders.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace sedphot {
namespace {

// ----------------------------------------------------------------------------
//  Read an ASCII table of <λ, value> rows, skip comment lines
// ----------------------------------------------------------------------------
std::vector<std::array<double, 2>>
read_two_column_table(const std::string& path, char comment_char = '#')
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Cannot open '" + path + "'");

    std::vector<std::array<double, 2>> rows;
    std::string line;
    while (std::getline(in, line))
    {
        auto it = std::find_if_not(line.begin(), line.end(),
                                   [](unsigned char c) { return std::isspace(c); });
        if (it == line.end()) continue;           // blank line
        if (*it == comment_char) continue;        // comment

        std::istringstream ss(line);
        std::array<double, 2> row{};
        if (!(ss >> row[0] >> row[1])) continue;
        rows.push_back(row);
    }
    if (rows.empty())
        throw std::runtime_error("File '" + path + "' contains no valid data");

    return rows;
}

// ----------------------------------------------------------------------------
//  Sort rows by λ ascending and move into Eigen vectors
// ----------------------------------------------------------------------------
void to_eigen(const std::vector<std::array<double, 2>>& rows,
              Vector& x_out,
              Vector& y_out)
{
    const std::size_t n = rows.size();
    std::vector<std::size_t> idx(n);
    std::iota(idx.begin(), idx.end(), 0);
    std::stable_sort(idx.begin(), idx.end(),
                     [&](std::size_t i, std::size_t j)
                     { return rows[i][0] < rows[j][0]; });

    x_out.resize(static_cast<Index>(n));
    y_out.resize(static_cast<Index>(n));
    for (std::size_t k = 0; k < n; ++k)
    {
        x_out[static_cast<Index>(k)] = rows[idx[k]][0];
        y_out[static_cast<Index>(k)] = rows[idx[k]][1];
    }
}

} // unnamed namespace

Spectrum load_sed_ascii(const std::string& path)
{
    Spectrum sed;
    to_eigen(read_two_column_table(path), sed.wave, sed.lum);
    return sed;
}

FilterCurve load_filter_ascii(const std::string& path, const std::string& name)
{
    FilterCurve filter;
    filter.name = name.empty() ? std::filesystem::path(path).stem().string() : name;
    to_eigen(read_two_column_table(path), filter.wave, filter.trans);
    return filter;
}

} // namespace sedphot
