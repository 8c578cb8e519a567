#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cuisine::util {

std::vector<uint8_t> readFileToVector(const std::filesystem::path& path);

std::string readFileToString(const std::filesystem::path& path);

void writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& data);

void writeFile(const std::filesystem::path& path, std::string_view data);

// Writes next to the target under a random name, then renames over it.
void writeFileAtomic(const std::filesystem::path& path, std::string_view data);

std::string generate_random_suffix(size_t length = 8);

}
