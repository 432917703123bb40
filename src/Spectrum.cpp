#include "sedphot/Spectrum.hpp"
#include <stdexcept>
#include <string>

namespace sedphot {

void check_same_size(const Vector& a, const Vector& b,
                     const char* caller, const char* what)
{
    if (a.size() != b.size())
        throw std::invalid_argument(
            std::string(caller) + ": " + what + " size mismatch (" +
            std::to_string(a.size()) + " vs " + std::to_string(b.size()) + ")");
}

} // namespace sedphot
