#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace relay {
namespace protocol {

// Header fields in arrival order. Names keep their original case; lookups are
// case-insensitive. Repeated fields stay separate entries.
class HttpHeaders {
public:
    using Field = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Field>::const_iterator;

    void Add(const std::string& name, const std::string& value) {
        fields_.emplace_back(name, value);
    }
    // Replaces every existing field of that name with one entry.
    void Set(const std::string& name, const std::string& value);
    // First value, or empty.
    std::string Get(const std::string& name) const;
    std::vector<std::string> GetAll(const std::string& name) const;
    bool Contains(const std::string& name) const;
    // Removes every field of that name; returns how many were removed.
    size_t Remove(const std::string& name);
    // True if any comma-separated element of any field `name` equals token.
    bool HasToken(const std::string& name, const std::string& token) const;

    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }
    void clear() { fields_.clear(); }
    const_iterator begin() const { return fields_.begin(); }
    const_iterator end() const { return fields_.end(); }
    void swap(HttpHeaders& that) { fields_.swap(that.fields_); }

    static bool IEquals(const std::string& a, const std::string& b);
    // Splits a list-valued field on commas, trimming optional whitespace.
    static std::vector<std::string> SplitTokens(const std::string& value);
    static std::string JoinTokens(const std::vector<std::string>& tokens);
    // RFC 7230 token: one or more tchar.
    static bool IsToken(const char* begin, const char* end);
    // Field content: visible ASCII, obs-text, SP and HTAB. No CR, LF, NUL or other CTL.
    static bool IsFieldValue(const char* begin, const char* end);

private:
    std::vector<Field> fields_;
};

} // namespace protocol
} // namespace relay
