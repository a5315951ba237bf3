#pragma once

#include <filesystem>
#include <string>

namespace kv::util {

std::string readFileToString(const std::filesystem::path& path);

void writeFile(const std::filesystem::path& path, const std::string& content);

// Writes to "<path>.tmp" first and renames it over the destination, so a
// crash mid-write never leaves a truncated file at `path`.
void writeFileAtomic(const std::filesystem::path& path, const std::string& content);

}
