#pragma once

#include "relay/common/noncopyable.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace relay {
namespace common {

// INI-style settings: [section] headers, key = value lines, '#' or ';' comments.
// Keys before the first section land in "global".
class Config : noncopyable {
public:
    static Config& Instance();

    Config() = default;

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings (does not change loaded filename).
    bool LoadFromString(const std::string& iniText);

    std::optional<std::string> LoadedFilename() const;

    bool Has(const std::string& section, const std::string& key) const;

    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    double GetDouble(const std::string& section, const std::string& key, double defaultVal = 0.0) const;
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

    // Comma separated values, trimmed, empty items dropped.
    std::vector<std::string> GetList(const std::string& section, const std::string& key) const;

private:
    using Settings = std::map<std::string, std::map<std::string, std::string>>;

    static std::string Trim(const std::string& s);
    static bool Parse(std::istream& in, Settings* out);

    mutable std::mutex mutex_;
    Settings settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace relay
