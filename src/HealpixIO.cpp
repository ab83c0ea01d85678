#include "skymodel/HealpixIO.hpp"
#include "skymodel/Healpix.hpp"

#include <CCfits/CCfits>
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <valarray>
#include <vector>

namespace skymodel {
namespace {

/* -------- read one column, scalar or fixed-length vector rows ------- */
std::vector<double> read_column(CCfits::Column& col, long nrows)
{
    std::vector<double> buf;
    if (col.repeat() == 1) {
        col.read(buf, 1, nrows);
        return buf;
    }
    // HEALPix files usually pack 1024 pixels per row
    std::vector<std::valarray<double>> rows;
    col.readArrays(rows, 1, nrows);
    buf.reserve(static_cast<std::size_t>(nrows) * col.repeat());
    for (const auto& r : rows)
        buf.insert(buf.end(), std::begin(r), std::end(r));
    return buf;
}

std::string ordering_of(CCfits::ExtHDU& ext)
{
    std::string ordering = "RING";
    try {
        ext.readKey("ORDERING", ordering);
    } catch (CCfits::HDU::NoSuchKeyword&) {
        // no keyword: assume RING, as healpy does
    }
    return ordering;
}

} // unnamed namespace

Array2D read_healpix_map(const std::string& path, int nfields)
{
    if (nfields != 0 && nfields != 1 && nfields != 3)
        throw std::invalid_argument("read_healpix_map: nfields must be 0, 1 or 3");

    try {
        CCfits::FITS f(path, CCfits::Read);
        CCfits::ExtHDU& ext = f.extension(1);

        if (ordering_of(ext).rfind("NEST", 0) == 0)
            throw std::runtime_error("'" + path + "' is NESTED; only RING maps are supported");

        const int ncols = ext.numCols();
        const int nread = nfields == 0 ? std::min(ncols, 3) : nfields;
        if (nread > ncols)
            throw std::runtime_error("'" + path + "' has " + std::to_string(ncols)
                                     + " columns, " + std::to_string(nread) + " requested");

        Array2D map;
        for (int i = 0; i < nread; ++i) {
            const std::vector<double> col = read_column(ext.column(i + 1), ext.rows());
            if (i == 0) map.resize(nread, static_cast<Index>(col.size()));
            if (static_cast<Index>(col.size()) != map.cols())
                throw std::runtime_error("'" + path + "': columns differ in length");
            map.row(i) = Eigen::Map<const Eigen::RowVectorXd>(col.data(), map.cols()).array();
        }

        healpix::npix2nside(map.cols());      // rejects non-HEALPix tables
        std::cout << "Loaded map: " << path << " (" << map.rows() << " x "
                  << map.cols() << ")\n";
        return map;
    }
    catch (const CCfits::FitsException& e) {
        throw std::runtime_error("Cannot read '" + path + "': " + e.message());
    }
}

void write_healpix_map(const std::string& path, const Quantity& map)
{
    if (map.rows() != 1 && map.rows() != 3)
        throw std::invalid_argument("write_healpix_map: map must have 1 or 3 Stokes rows");
    const long nside = healpix::npix2nside(map.cols());

    static const char* kNames[] = {"I_STOKES", "Q_STOKES", "U_STOKES"};
    std::vector<std::string> names, forms, unit_names;
    for (Index i = 0; i < map.rows(); ++i) {
        names.emplace_back(kNames[i]);
        forms.emplace_back("D");
        unit_names.push_back(map.unit().name);
    }

    try {
        CCfits::FITS f("!" + path, CCfits::Write);       // '!' overwrites
        CCfits::Table* table = f.addTable("xtension", static_cast<int>(map.cols()),
                                          names, forms, unit_names);
        table->addKey("PIXTYPE",  std::string("HEALPIX"), "HEALPIX pixelisation");
        table->addKey("ORDERING", std::string("RING"),    "Pixel ordering scheme");
        table->addKey("NSIDE",    nside,                  "Resolution parameter of HEALPIX");
        table->addKey("INDXSCHM", std::string("IMPLICIT"), "Indexing: IMPLICIT or EXPLICIT");

        for (Index i = 0; i < map.rows(); ++i) {
            const Eigen::RowVectorXd row = map.value().row(i).matrix();
            table->column(names[i]).write(std::vector<double>(row.data(), row.data() + row.size()), 1);
        }
    }
    catch (const CCfits::FitsException& e) {
        throw std::runtime_error("Cannot write '" + path + "': " + e.message());
    }
}

} // namespace skymodel
