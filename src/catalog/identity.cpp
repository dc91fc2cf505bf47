#include <weft/identity.hpp>
#include <algorithm>
#include <cctype>
#include <functional>

namespace weft {

Result<TypeName> TypeName::parse(const std::string& raw) {
    if (raw.empty()) {
        return WeftError{WeftError::Parse, "empty resource type name"};
    }

    std::string body = raw;
    if (body.compare(0, 2, "::") == 0) body.erase(0, 2);

    // Validate each :: separated segment
    size_t start = 0;
    while (true) {
        size_t end = body.find("::", start);
        std::string seg = body.substr(start, end == std::string::npos
                                                 ? std::string::npos
                                                 : end - start);
        if (seg.empty()) {
            return WeftError{WeftError::Parse,
                "invalid resource type name '" + raw + "'",
                "type name segments must not be empty"};
        }
        if (!std::isalpha(static_cast<unsigned char>(seg[0])) && seg[0] != '_') {
            return WeftError{WeftError::Parse,
                "invalid resource type name '" + raw + "'",
                "each segment must start with a letter or '_'"};
        }
        for (char c : seg) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
                return WeftError{WeftError::Parse,
                    "invalid character '" + std::string(1, c) +
                    "' in resource type name '" + raw + "'",
                    "allowed: [a-zA-Z0-9_] separated by '::'"};
            }
        }
        if (end == std::string::npos) break;
        start = end + 2;
    }

    TypeName name;
    name.raw_ = raw;
    name.normalized_ = body;
    std::transform(name.normalized_.begin(), name.normalized_.end(),
                   name.normalized_.begin(),
                   [](char c) -> char {
                       return static_cast<char>(
                           std::tolower(static_cast<unsigned char>(c)));
                   });

    return Result<TypeName>::ok(std::move(name));
}

const std::string& TypeName::raw() const { return raw_; }
const std::string& TypeName::normalized() const { return normalized_; }

std::string TypeName::display() const {
    std::string out = normalized_;
    bool at_segment_start = true;
    for (auto& c : out) {
        if (c == ':') {
            at_segment_start = true;
            continue;
        }
        if (at_segment_start) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            at_segment_start = false;
        }
    }
    return out;
}

bool TypeName::operator==(const TypeName& o) const {
    return normalized_ == o.normalized_;
}

bool TypeName::operator!=(const TypeName& o) const {
    return !(*this == o);
}

std::string ResourceIdentity::str() const {
    return type.display() + "[" + title.quoted() + "]";
}

size_t ResourceIdentityHash::operator()(const ResourceIdentity& id) const {
    size_t h = std::hash<std::string>{}(id.type.normalized());
    return h ^ (id.title.hash() + 0x9e3779b9 + (h << 6) + (h >> 2));
}

} // namespace weft
