#include "relay/protocol/HttpHeaders.h"

#include <algorithm>
#include <cstring>

namespace relay {
namespace protocol {

namespace {

char LowerAscii(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool IsOws(char c) {
    return c == ' ' || c == '\t';
}

bool IsTokenChar(unsigned char c) {
    if (c >= '0' && c <= '9') return true;
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) return true;
    return c != '\0' && std::strchr("!#$%&'*+-.^_`|~", c) != nullptr;
}

} // namespace

bool HttpHeaders::IsToken(const char* begin, const char* end) {
    if (begin == end) return false;
    for (const char* p = begin; p != end; ++p) {
        if (!IsTokenChar(static_cast<unsigned char>(*p))) return false;
    }
    return true;
}

bool HttpHeaders::IsFieldValue(const char* begin, const char* end) {
    for (const char* p = begin; p != end; ++p) {
        const unsigned char c = static_cast<unsigned char>(*p);
        if ((c < 0x20 && c != '\t') || c == 0x7f) return false;
    }
    return true;
}

bool HttpHeaders::IEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (LowerAscii(a[i]) != LowerAscii(b[i])) return false;
    }
    return true;
}

std::vector<std::string> HttpHeaders::SplitTokens(const std::string& value) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();
        size_t b = start;
        size_t e = comma;
        while (b < e && IsOws(value[b])) ++b;
        while (e > b && IsOws(value[e - 1])) --e;
        if (e > b) out.emplace_back(value, b, e - b);
        start = comma + 1;
    }
    return out;
}

std::string HttpHeaders::JoinTokens(const std::vector<std::string>& tokens) {
    std::string out;
    for (const auto& t : tokens) {
        if (!out.empty()) out += ", ";
        out += t;
    }
    return out;
}

void HttpHeaders::Set(const std::string& name, const std::string& value) {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&name](const Field& f) { return IEquals(f.first, name); });
    if (it == fields_.end()) {
        Add(name, value);
        return;
    }
    it->second = value;
    const auto keep = it - fields_.begin();
    fields_.erase(std::remove_if(fields_.begin() + keep + 1, fields_.end(),
                                 [&name](const Field& f) { return IEquals(f.first, name); }),
                  fields_.end());
}

std::string HttpHeaders::Get(const std::string& name) const {
    for (const auto& f : fields_) {
        if (IEquals(f.first, name)) return f.second;
    }
    return std::string();
}

std::vector<std::string> HttpHeaders::GetAll(const std::string& name) const {
    std::vector<std::string> values;
    for (const auto& f : fields_) {
        if (IEquals(f.first, name)) values.push_back(f.second);
    }
    return values;
}

bool HttpHeaders::Contains(const std::string& name) const {
    return std::any_of(fields_.begin(), fields_.end(),
                       [&name](const Field& f) { return IEquals(f.first, name); });
}

size_t HttpHeaders::Remove(const std::string& name) {
    const size_t before = fields_.size();
    fields_.erase(std::remove_if(fields_.begin(), fields_.end(),
                                 [&name](const Field& f) { return IEquals(f.first, name); }),
                  fields_.end());
    return before - fields_.size();
}

bool HttpHeaders::HasToken(const std::string& name, const std::string& token) const {
    for (const auto& f : fields_) {
        if (!IEquals(f.first, name)) continue;
        for (const auto& t : SplitTokens(f.second)) {
            if (IEquals(t, token)) return true;
        }
    }
    return false;
}

} // namespace protocol
} // namespace relay
