// TableLoaders.hpp
#pragma once
#include "sedphot/Spectrum.hpp"
#include <string>

namespace sedphot {

// ---------------------------------------------------------------------------
// Two-column ASCII tables:  wavelength [Å]   value
// Lines starting with '#' and blank lines are skipped, rows are sorted by
// wavelength.  Throws std::runtime_error if the file cannot be read or holds
// no rows.
// ---------------------------------------------------------------------------
Spectrum    load_sed_ascii   (const std::string& path);
FilterCurve load_filter_ascii(const std::string& path,
                              const std::string& name = "");   // "" → file stem

} // namespace sedphot
