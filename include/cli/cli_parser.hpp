#pragma once

#include <string>
#include <unordered_map>

namespace infocode {

// Very small CLI parser:
//   --key value
//   --flag (treated as "true")
// Anything not starting with "--" outside a value position is rejected.
class CliParser {
public:
    void parse(int argc, char** argv);
    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    // Throws std::runtime_error when the value is not a number.
    double get_double(const std::string& key, double def) const;
    // "true"/"1"/"yes" or a bare flag -> true; "false"/"0"/"no" -> false.
    bool get_flag(const std::string& key) const;
private:
    std::unordered_map<std::string, std::string> kv_;
};

} // namespace infocode
