#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace ragcore {

std::string getenv_or(const char* key, const std::string& def);

std::string sha256_hex(const std::string& data);
std::string sha1_hex(const std::string& data);
std::string sha1_file(const std::filesystem::path& p);

std::vector<std::filesystem::path> list_files(const std::filesystem::path& root,
                                              const std::vector<std::string>& exts,
                                              const std::vector<std::string>& ignore_dirs);
std::string read_text_file(const std::filesystem::path& p);

} // namespace ragcore
