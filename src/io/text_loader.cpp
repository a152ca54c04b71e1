#include "io/text_loader.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace infocode {

std::string load_text(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw std::runtime_error("Cannot open file: " + path);
    std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad()) throw std::runtime_error("Cannot read file: " + path);
    return text;
}

void save_text(const std::string& path, const std::string& text) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs.good()) throw std::runtime_error("Cannot write file: " + path);
    ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!ofs.good()) throw std::runtime_error("Cannot write file: " + path);
}

} // namespace infocode
