#pragma once

#include <string>

namespace infocode {

// Read a whole file as bytes (UTF-8 text expected, not validated).
std::string load_text(const std::string& path);

// Write text as-is, replacing the file.
void save_text(const std::string& path, const std::string& text);

} // namespace infocode
