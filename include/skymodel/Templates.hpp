#pragma once
#include "Types.hpp"

namespace skymodel {

// spdust2 spinning dust SED: row 0 frequency [Hz], row 1 brightness [K_RJ],
// columns sorted by frequency.
struct SpinningDustTemplate {
    Eigen::Matrix2Xd table;

    Index size() const { return table.cols(); }
    double freq_min() const { return table.row(0).minCoeff(); }
    double freq_max() const { return table.row(0).maxCoeff(); }
};

// Angular position of every point source: row 0 longitude, row 1 latitude
// (degrees).  One column per source.
struct PointSourceCatalog {
    Eigen::Matrix2Xd coords;

    Index size() const { return coords.cols(); }
};

} // namespace skymodel
