// Tracemark (MIT License) - See LICENSE file
#pragma once

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace test_files {

// Path inside a scratch directory under the system temp dir
inline std::string TempPath(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / "tracemark-tests";
    std::filesystem::create_directories(dir);
    return (dir / name).string();
}

inline std::string WriteTempFile(const std::string& name, const std::string& content) {
    std::string path = TempPath(name);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    return path;
}

inline std::string ReadWholeFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace test_files
