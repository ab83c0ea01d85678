#pragma once
#include "Templates.hpp"
#include <string>
#include <vector>

namespace skymodel {

// Whitespace separated numeric table; blank lines and lines starting with
// `comment_char` are skipped, rows with fewer than `min_cols` numbers too.
std::vector<std::vector<double>>
read_ascii_table(const std::string& path, int min_cols, char comment_char = '#');

/* spdust2 SED: column 0 frequency [GHz], column 1 emission [Jy/sr].
 * The emission is converted to brightness temperature at each template
 * frequency and both rows are stored in SI (Hz, K_RJ), sorted by frequency. */
SpinningDustTemplate load_spdust2_template(const std::string& path);

// Radio source catalog: column 0 longitude, column 1 latitude [deg]
PointSourceCatalog load_radio_catalog(const std::string& path);

} // namespace skymodel
