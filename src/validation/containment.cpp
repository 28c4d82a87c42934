#include "fsgate/containment.hpp"

#include <algorithm>

namespace fsgate {

namespace {

std::string strip_trailing_separators(const std::string& root) {
    std::string out = root;
    while (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

} // namespace

bool is_contained(const std::string& candidate, const std::string& root) {
    if (candidate.empty() || root.empty()) {
        return false;
    }

    std::string r = strip_trailing_separators(root);
    if (r == "/") {
        return candidate[0] == '/';
    }
    if (candidate == r) {
        return true;
    }
    return candidate.size() > r.size() &&
           candidate.compare(0, r.size(), r) == 0 &&
           candidate[r.size()] == '/';
}

bool is_contained(const std::string& candidate, const std::vector<std::string>& roots) {
    return find_containing_root(candidate, roots).has_value();
}

std::optional<std::size_t> find_containing_root(const std::string& candidate,
                                                const std::vector<std::string>& roots) {
    for (std::size_t i = 0; i < roots.size(); ++i) {
        if (is_contained(candidate, roots[i])) {
            return i;
        }
    }
    return std::nullopt;
}

std::vector<std::string> dedupe_roots(const std::vector<std::string>& roots) {
    std::vector<std::string> out;
    out.reserve(roots.size());
    for (const auto& root : roots) {
        std::string r = strip_trailing_separators(root);
        if (r.empty()) continue;
        if (std::find(out.begin(), out.end(), r) == out.end()) {
            out.push_back(r);
        }
    }
    return out;
}

} // namespace fsgate
