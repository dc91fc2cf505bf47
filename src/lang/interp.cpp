#include <weft/lang/interp.hpp>
#include <functional>

namespace weft {

InterpString InterpString::literal(std::string text) {
    return InterpString({Segment{Segment::Literal, std::move(text)}});
}

bool InterpString::has_references() const {
    for (const auto& s : segments_) {
        if (s.kind == Segment::Reference) return true;
    }
    return false;
}

std::string InterpString::literal_text() const {
    std::string out;
    for (const auto& s : segments_) {
        if (s.kind == Segment::Literal) out += s.text;
    }
    return out;
}

std::string InterpString::str() const {
    std::string out;
    for (const auto& s : segments_) {
        if (s.kind == Segment::Literal) {
            out += s.text;
        } else {
            out += "${" + s.text + "}";
        }
    }
    return out;
}

std::string InterpString::quoted() const {
    std::string out;
    if (!has_references()) {
        out += '\'';
        for (char c : literal_text()) {
            if (c == '\'' || c == '\\') out += '\\';
            out += c;
        }
        out += '\'';
        return out;
    }

    out += '"';
    for (const auto& s : segments_) {
        if (s.kind == Segment::Reference) {
            out += "${" + s.text + "}";
            continue;
        }
        for (char c : s.text) {
            switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '$':  out += "\\$"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:   out += c; break;
            }
        }
    }
    out += '"';
    return out;
}

size_t InterpString::hash() const {
    size_t h = segments_.size();
    std::hash<std::string> hs;
    for (const auto& s : segments_) {
        size_t sh = hs(s.text) * 31 + static_cast<size_t>(s.kind);
        h ^= sh + 0x9e3779b9 + (h << 6) + (h >> 2);
    }
    return h;
}

InterpString split_interpolation(const std::string& text,
                                 const std::vector<InterpSpan>& spans) {
    if (spans.empty()) {
        return InterpString::literal(text);
    }

    std::vector<Segment> segments;
    size_t cursor = 0;
    for (const auto& span : spans) {
        if (span.offset > cursor) {
            segments.push_back({Segment::Literal, text.substr(cursor, span.offset - cursor)});
        }
        segments.push_back({Segment::Reference, span.variable});
        cursor = span.offset + span.length;
    }
    if (cursor < text.size()) {
        segments.push_back({Segment::Literal, text.substr(cursor)});
    }
    return InterpString(std::move(segments));
}

InterpString split_interpolation(const Token& token) {
    return split_interpolation(token.text, token.spans);
}

} // namespace weft
