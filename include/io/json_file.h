#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace segue::io {

// JSON document on disk, replaced atomically (write tmp, then rename).
class JsonFile {
   public:
    explicit JsonFile(std::string path);

    JsonFile(const JsonFile&) = delete;
    JsonFile& operator=(const JsonFile&) = delete;

    JsonFile(JsonFile&& other) noexcept;
    JsonFile& operator=(JsonFile&& other) noexcept;

    const std::string& path() const;

    bool exists() const;
    void removeIfExists() const;
    bool writeJsonAtomically(const nlohmann::json& payload) const;

    // nullopt when the file is missing. Throws nlohmann::json::parse_error on
    // malformed content.
    std::optional<nlohmann::json> read() const;

   private:
    std::string path_;
};

}  // namespace segue::io
