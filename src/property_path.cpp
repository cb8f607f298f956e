#include "deepeq/property_path.hpp"

namespace deepeq {

auto PropertyPath::parse(std::string_view dotted) -> std::expected<PropertyPath, core::error> {
    using core::error; using core::error_code;
    PropertyPath out;
    if (dotted.empty()) {
        return std::unexpected(error{error_code::invalid_argument, "empty member path", "deepeq.path"});
    }
    std::size_t start = 0;
    while (start <= dotted.size()) {
        auto dot = dotted.find('.', start);
        auto part = dotted.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
        auto bracket = part.find('[');
        if (bracket != std::string_view::npos) {
            if (part.back() != ']') {
                return std::unexpected(error{error_code::invalid_argument,
                    "malformed index in member path '" + std::string(dotted) + "'", "deepeq.path"});
            }
            part = part.substr(0, bracket);
        }
        if (part.empty()) {
            return std::unexpected(error{error_code::invalid_argument,
                "empty segment in member path '" + std::string(dotted) + "'", "deepeq.path"});
        }
        out.segments_.push_back(Segment{std::string(part), std::nullopt});
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }
    return out;
}

auto PropertyPath::member(std::string_view name) const -> PropertyPath {
    PropertyPath out(*this);
    out.segments_.push_back(Segment{std::string(name), std::nullopt});
    return out;
}

auto PropertyPath::index(std::size_t i) const -> PropertyPath {
    PropertyPath out(*this);
    out.segments_.push_back(Segment{std::string(), i});
    return out;
}

auto PropertyPath::str() const -> std::string {
    std::string out;
    for (const auto& s : segments_) {
        if (s.index) {
            out.append("[").append(std::to_string(*s.index)).append("]");
        } else {
            if (!out.empty()) out.push_back('.');
            out.append(s.name);
        }
    }
    return out;
}

auto PropertyPath::member_path() const -> std::string {
    std::string out;
    for (const auto& s : segments_) {
        if (s.index) continue;
        if (!out.empty()) out.push_back('.');
        out.append(s.name);
    }
    return out;
}

auto PropertyPath::describe() const -> std::string {
    return empty() ? std::string("subject") : "member " + str();
}

} // namespace deepeq
