#include "io/json_file.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace segue::io {

JsonFile::JsonFile(std::string path) : path_(std::move(path)) {}

JsonFile::JsonFile(JsonFile&& other) noexcept : path_(std::move(other.path_)) {}

JsonFile& JsonFile::operator=(JsonFile&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    path_ = std::move(other.path_);
    return *this;
}

const std::string& JsonFile::path() const {
    return path_;
}

bool JsonFile::exists() const {
    std::error_code ec;
    return !path_.empty() && std::filesystem::exists(path_, ec);
}

void JsonFile::removeIfExists() const {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

bool JsonFile::writeJsonAtomically(const nlohmann::json& payload) const {
    if (path_.empty()) {
        return false;
    }

    std::string tmpPath = path_ + ".tmp";
    std::ofstream ofs(tmpPath);
    if (!ofs) {
        return false;
    }
    ofs << payload.dump(2) << '\n';
    ofs.close();
    if (!ofs) {
        return false;
    }
    return (std::rename(tmpPath.c_str(), path_.c_str()) == 0);
}

std::optional<nlohmann::json> JsonFile::read() const {
    if (path_.empty()) {
        return std::nullopt;
    }
    std::ifstream ifs(path_);
    if (!ifs) {
        return std::nullopt;
    }
    return nlohmann::json::parse(ifs);
}

}  // namespace segue::io
