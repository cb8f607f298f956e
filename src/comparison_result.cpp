#include "deepeq/comparison_result.hpp"

#include <cctype>
#include <charconv>

namespace deepeq {

auto to_string(FailureKind kind) -> std::string_view {
    switch (kind) {
        case FailureKind::value_mismatch: return "value_mismatch";
        case FailureKind::null_mismatch: return "null_mismatch";
        case FailureKind::type_mismatch: return "type_mismatch";
        case FailureKind::missing_member: return "missing_member";
        case FailureKind::size_mismatch: return "size_mismatch";
        case FailureKind::cyclic_reference: return "cyclic_reference";
        case FailureKind::depth_exceeded: return "depth_exceeded";
    }
    return "unknown";
}

auto format_reason(std::string_view templ, const std::vector<std::string>& args) -> std::string {
    std::string out;
    out.reserve(templ.size() + 32);
    std::size_t i = 0;
    while (i < templ.size()) {
        if (templ[i] == '{') {
            auto close = templ.find('}', i + 1);
            if (close != std::string_view::npos && close > i + 1) {
                const char* beg = templ.data() + i + 1;
                const char* end = templ.data() + close;
                std::size_t n = 0;
                auto [ptr, ec] = std::from_chars(beg, end, n, 10);
                if (ec == std::errc() && ptr == end && n < args.size()) {
                    out.append(args[n]);
                    i = close + 1;
                    continue;
                }
            }
        }
        out.push_back(templ[i]);
        ++i;
    }
    return out;
}

auto BecauseClause::render() const -> std::string {
    std::string text = format_reason(reason, args);
    std::size_t lead = 0;
    while (lead < text.size() && std::isspace(static_cast<unsigned char>(text[lead]))) ++lead;
    text.erase(0, lead);
    if (text.empty()) return {};
    if (text.rfind("because", 0) == 0) return " " + text;
    return " because " + text;
}

auto ComparisonResult::summary() const -> std::string {
    std::string out;
    for (const auto& f : failures_) {
        if (!out.empty()) out.push_back('\n');
        out.append(f.message());
    }
    return out;
}

} // namespace deepeq
