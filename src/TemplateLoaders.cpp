#include "skymodel/TemplateLoaders.hpp"
#include "skymodel/Quantity.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace skymodel {
namespace {

// ----------------------------------------------------------------------------
//  Sort rows by column 0 ascending and move the first two columns into a
//  2 x n matrix
// ----------------------------------------------------------------------------
Eigen::Matrix2Xd to_sorted_matrix(const std::vector<std::vector<double>>& rows)
{
    const std::size_t n = rows.size();
    std::vector<std::size_t> idx(n);
    std::iota(idx.begin(), idx.end(), 0);
    std::sort(idx.begin(), idx.end(),
              [&](std::size_t i, std::size_t j)
              { return rows[i][0] < rows[j][0]; });

    Eigen::Matrix2Xd out(2, static_cast<Index>(n));
    for (std::size_t k = 0; k < n; ++k)
    {
        const auto& r = rows[idx[k]];
        out(0, static_cast<Index>(k)) = r[0];
        out(1, static_cast<Index>(k)) = r[1];
    }
    return out;
}

} // unnamed namespace

// ----------------------------------------------------------------------------
//  Read an ASCII table of doubles, skip comment lines
// ----------------------------------------------------------------------------
std::vector<std::vector<double>>
read_ascii_table(const std::string& path, int min_cols, char comment_char)
{
    if (min_cols < 1)
        throw std::invalid_argument("read_ascii_table: min_cols must be positive");

    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Cannot open '" + path + "'");

    std::vector<std::vector<double>> rows;
    std::string line;
    while (std::getline(in, line))
    {
        // trim leading whitespace
        auto it = std::find_if_not(line.begin(), line.end(), ::isspace);
        if (it == line.end()) continue;           // blank line
        if (*it == comment_char) continue;        // comment

        std::istringstream ss(line);
        std::vector<double> row;
        double v;
        while (ss >> v) row.push_back(v);
        if (static_cast<int>(row.size()) < min_cols) continue;
        rows.push_back(std::move(row));
    }
    if (rows.empty())
        throw std::runtime_error("File '" + path + "' contains no valid data");

    return rows;
}

SpinningDustTemplate load_spdust2_template(const std::string& path)
{
    const auto rows = read_ascii_table(path, /*min_cols=*/2);
    if (rows.size() < 2)
        throw std::runtime_error("spdust2 template '" + path + "' needs at least two rows");

    Eigen::Matrix2Xd table = to_sorted_matrix(rows);

    // GHz -> Hz, Jy/sr -> K_RJ at every template frequency
    const Quantity freq(Array2D(table.row(0).array()), units::GHz);
    const Quantity amp(Array2D(table.row(1).array()), units::Jy / units::sr);
    const Array2D freq_hz = freq.to_value(units::Hz);

    SpinningDustTemplate t;
    t.table.resize(2, table.cols());
    t.table.row(0) = freq_hz.matrix();
    t.table.row(1) = amp.to_value(units::K_RJ, brightness_temperature(freq_hz)).matrix();

    std::cout << "Loaded spdust2 template: " << path
              << " (" << t.size() << " points)\n";
    return t;
}

PointSourceCatalog load_radio_catalog(const std::string& path)
{
    const auto rows = read_ascii_table(path, /*min_cols=*/2);

    PointSourceCatalog cat;
    cat.coords.resize(2, static_cast<Index>(rows.size()));
    for (std::size_t k = 0; k < rows.size(); ++k)
    {
        cat.coords(0, static_cast<Index>(k)) = rows[k][0];
        cat.coords(1, static_cast<Index>(k)) = rows[k][1];
    }

    std::cout << "Loaded radio catalog: " << path
              << " (" << cat.size() << " sources)\n";
    return cat;
}

} // namespace skymodel
