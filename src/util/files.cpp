#include "util/files.hpp"

#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

std::string kv::util::readFileToString(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(static_cast<std::size_t>(size), '\0');
    if (!in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());
    in.close();

    return buffer;
}

void kv::util::writeFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + path.string());

    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) throw std::runtime_error("Failed to write file: " + path.string());
}

void kv::util::writeFileAtomic(const fs::path& path, const std::string& content) {
    fs::path tmpPath = path;
    tmpPath += ".tmp";

    try {
        writeFile(tmpPath, content);
        fs::rename(tmpPath, path);
    } catch (const std::exception&) {
        std::error_code ec;
        fs::remove(tmpPath, ec);
        throw;
    }
}
