#pragma once

#include <filesystem>
#include <string>

namespace sm::util {

std::string readFileToString(const std::filesystem::path& path);

// Writes to a sibling temp file, fsyncs it and renames it over the target.
void writeFileAtomic(const std::filesystem::path& path, const std::string& contents);

std::string generate_random_suffix(size_t length = 8);

}
