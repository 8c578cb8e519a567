#include "util/files.hpp"

#include <fstream>
#include <random>
#include <stdexcept>
#include <system_error>

namespace cuisine::util {

std::vector<uint8_t> readFileToVector(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!in.read(reinterpret_cast<char*>(buffer.data()), size))
        throw std::runtime_error("Failed to read file: " + path.string());

    return buffer;
}

std::string readFileToString(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (!in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());

    return buffer;
}

static void writeBytes(const std::filesystem::path& path, const char* data, const size_t size) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + path.string());
    out.write(data, static_cast<std::streamsize>(size));
    out.close();
    if (!out) throw std::runtime_error("Failed to write file: " + path.string());
}

void writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    writeBytes(path, reinterpret_cast<const char*>(data.data()), data.size());
}

void writeFile(const std::filesystem::path& path, const std::string_view data) {
    writeBytes(path, data.data(), data.size());
}

void writeFileAtomic(const std::filesystem::path& path, const std::string_view data) {
    namespace fs = std::filesystem;

    auto tmp = path;
    tmp += ".tmp-" + generate_random_suffix();

    try {
        writeFile(tmp, data);
        fs::rename(tmp, path);
    } catch (...) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }
}

std::string generate_random_suffix(const size_t length) {
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}

}
