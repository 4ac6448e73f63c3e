#include "members/filter_policy.hpp"

namespace memscope::members {

namespace {

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.remove_suffix(1);
    return s;
}

} // namespace

auto FilterPolicy::parse(std::string_view spec) -> Result<FilterPolicy, std::string> {
    FilterPolicy policy;
    bool saw_term = false;
    bool saw_type = false;

    size_t pos = 0;
    while (pos <= spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos)
            comma = spec.size();

        auto token = trim(spec.substr(pos, comma - pos));
        pos = comma + 1;

        if (token.empty())
            continue;

        if (token == "term") {
            saw_term = true;
        } else if (token == "type") {
            saw_type = true;
        } else if (token == "applied") {
            policy.is_applied = true;
        } else if (token == "private") {
            policy.include_private = true;
        } else if (token == "synthetic") {
            policy.include_synthetic = true;
        } else if (token == "constructors") {
            policy.include_constructors = true;
        } else if (token == "accessible") {
            policy.check_accessibility = true;
        } else {
            return "unknown filter option '" + std::string(token) + "'";
        }
    }

    if (saw_term && saw_type)
        return std::string("filter cannot select both 'term' and 'type' members");
    policy.kind = saw_type ? MemberKind::Type : MemberKind::Term;
    return policy;
}

auto to_string(const FilterPolicy& policy) -> std::string {
    std::string out = policy.wants_type() ? "type" : "term";
    if (policy.is_applied)
        out += ",applied";
    if (policy.include_private)
        out += ",private";
    if (policy.include_synthetic)
        out += ",synthetic";
    if (policy.include_constructors)
        out += ",constructors";
    if (policy.check_accessibility)
        out += ",accessible";
    return out;
}

} // namespace memscope::members
