#include "sedphot/JsonUtils.hpp"
#include <cstdlib>
#include <fstream>
#include <regex>
#include <stdexcept>

namespace sedphot {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open()) throw std::runtime_error("Cannot open: " + path);
    nlohmann::json j;
    f >> j;
    return j;
}

/* ${VAR} or ${VAR:-fallback}; unset variables without fallback become "" */
static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}:]+)(:-([^}]*))?\})");
    std::string out;
    auto begin = input.cbegin();
    std::smatch m;
    while (std::regex_search(begin, input.cend(), m, re)) {
        out.append(begin, m[0].first);
        const std::string var = m[1];
        const char* env = std::getenv(var.c_str());
        if (env)               out += env;
        else if (m[2].matched) out += m[3].str();
        begin = m[0].second;
    }
    out.append(begin, input.cend());
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

} // namespace sedphot
