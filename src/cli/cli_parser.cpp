#include "cli/cli_parser.hpp"

#include <stdexcept>

namespace infocode {

void CliParser::parse(int argc, char** argv) {
    kv_.clear();
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        if (a.rfind("--", 0) != 0 || a.size() == 2) {
            throw std::runtime_error("cli: unexpected argument '" + a + "'");
        }
        std::string key = a.substr(2);
        std::string val = "true";
        if (i + 1 < argc) {
            std::string next = argv[i + 1] ? argv[i + 1] : "";
            if (next.rfind("--", 0) != 0) {
                val = next;
                ++i;
            }
        }
        kv_[key] = val;
    }
}

bool CliParser::has(const std::string& key) const {
    return kv_.find(key) != kv_.end();
}

std::string CliParser::get(const std::string& key, const std::string& def) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;
    return it->second;
}

double CliParser::get_double(const std::string& key, double def) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(it->second, &used);
    } catch (const std::exception&) {
        throw std::runtime_error("cli: --" + key + " expects a number, got '" + it->second + "'");
    }
    if (used != it->second.size()) {
        throw std::runtime_error("cli: --" + key + " expects a number, got '" + it->second + "'");
    }
    return v;
}

bool CliParser::get_flag(const std::string& key) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return false;
    const std::string& v = it->second;
    if (v == "true" || v == "1" || v == "yes") return true;
    if (v == "false" || v == "0" || v == "no") return false;
    throw std::runtime_error("cli: --" + key + " expects true/false, got '" + v + "'");
}

} // namespace infocode
