#include "fsgate/path_utils.hpp"
#include "fsgate/platform.hpp"

#include <cctype>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace fsgate {

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

bool is_blank(const std::string& s) {
    for (unsigned char c : s) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

bool is_separator(char c) {
#ifdef _WIN32
    return c == '/' || c == '\\';
#else
    return c == '/';
#endif
}

bool is_absolute(const std::string& s) {
    if (!s.empty() && is_separator(s[0])) return true;
#ifdef _WIN32
    if (s.size() >= 3 && std::isalpha(static_cast<unsigned char>(s[0])) && s[1] == ':' &&
        is_separator(s[2])) {
        return true;
    }
#endif
    return false;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        parts.push_back(current);
    }
    return parts;
}

std::string join_components(const std::string& root, const std::vector<std::string>& comps) {
    std::filesystem::path p(root);
    for (const auto& c : comps) {
        p /= c;
    }
    return to_portable_path(p.lexically_normal().string());
}

std::string lookup(const std::unordered_map<std::string, std::string>& env,
                   const std::string& name) {
    auto it = env.find(name);
    return it != env.end() ? it->second : std::string();
}

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

const char* path_error_to_string(PathError error) {
    switch (error) {
        case PathError::None: return "none";
        case PathError::Empty: return "Path must be a non-empty string";
        case PathError::ContainsNul: return "Path contains a null byte";
        case PathError::AbsoluteNotAllowed: return "Absolute path not allowed";
        case PathError::EscapesRoot: return "Path escapes root";
    }
    return "unknown";
}

std::string expand_home(const std::string& input) {
    if (input.empty() || input[0] != '~') {
        return input;
    }
    if (input.size() == 1) {
        return home_directory();
    }
    if (input[1] == '/' || input[1] == '\\') {
        return home_directory() + input.substr(1);
    }
    return input;
}

std::string expand_env_vars(const std::string& input,
                            const std::unordered_map<std::string, std::string>& env) {
    std::string output;
    output.reserve(input.size());

    // Single pass: substituted values are never rescanned.
    size_t i = 0;
    while (i < input.size()) {
        char c = input[i];
        if (c == '$' && i + 1 < input.size()) {
            if (input[i + 1] == '{') {
                size_t close = input.find('}', i + 2);
                if (close != std::string::npos && close > i + 2) {
                    output += lookup(env, input.substr(i + 2, close - i - 2));
                    i = close + 1;
                    continue;
                }
            } else if (is_ident_start(input[i + 1])) {
                size_t end = i + 1;
                while (end < input.size() && is_ident_char(input[end])) {
                    ++end;
                }
                output += lookup(env, input.substr(i + 1, end - i - 1));
                i = end;
                continue;
            }
        } else if (c == '%') {
            size_t close = input.find('%', i + 1);
            if (close != std::string::npos && close > i + 1) {
                std::string name = input.substr(i + 1, close - i - 1);
                if (name.find_first_of("/\\") == std::string::npos) {
                    output += lookup(env, name);
                    i = close + 1;
                    continue;
                }
            }
        }
        output += c;
        ++i;
    }

    return output;
}

std::string collapse_absolute(const std::string& absolute_path) {
    std::string path = absolute_path;
#ifdef _WIN32
    path = to_portable_path(path);
#endif

    std::string root = "/";
#ifdef _WIN32
    if (path.size() >= 2 && std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':') {
        root = path.substr(0, 2) + "/";
        path = path.substr(2);
    }
#endif

    std::vector<std::string> normalized;
    for (const auto& part : split(path, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (!normalized.empty()) {
                normalized.pop_back();
            }
            continue;
        }
        normalized.push_back(part);
    }

    std::string out = root;
    for (size_t i = 0; i < normalized.size(); ++i) {
        if (i > 0) out += '/';
        out += normalized[i];
    }
    return out;
}

PathResult normalize_path(const std::string& input, const std::string& base) {
    return normalize_path(input, base, get_all_env());
}

PathResult normalize_path(const std::string& input,
                          const std::string& base,
                          const std::unordered_map<std::string, std::string>& env) {
    if (input.empty() || is_blank(input)) {
        return {false, {}, PathError::Empty};
    }
    if (contains_nul(input)) {
        return {false, {}, PathError::ContainsNul};
    }

    std::string expanded = expand_env_vars(expand_home(input), env);
    if (expanded.empty()) {
        // Everything expanded away; this names the base directory.
        expanded = ".";
    }

    std::string absolute;
    if (is_absolute(expanded)) {
        absolute = expanded;
    } else {
        std::string anchor = base.empty() ? current_directory() : base;
        if (!is_absolute(anchor)) {
            anchor = current_directory() + "/" + anchor;
        }
        absolute = anchor + "/" + expanded;
    }

    return {true, collapse_absolute(absolute), PathError::None};
}

PathResult normalize_under_root(const std::string& root, const std::string& relative_path) {
    if (contains_nul(root) || contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }

    std::string rel = to_portable_path(relative_path);
    if (!rel.empty() && rel[0] == '/') {
        return {false, {}, PathError::AbsoluteNotAllowed};
    }

    std::vector<std::string> normalized;
    for (const auto& part : split(rel, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (normalized.empty()) {
                return {false, {}, PathError::EscapesRoot};
            }
            normalized.pop_back();
        } else {
            normalized.push_back(part);
        }
    }

    std::string out = join_components(root, normalized);

    // Lexical containment, no filesystem access.
    std::filesystem::path lex_root = std::filesystem::path(root).lexically_normal();
    std::filesystem::path lex_out = std::filesystem::path(out).lexically_normal();
    auto root_it = lex_root.begin();
    auto out_it = lex_out.begin();
    for (; root_it != lex_root.end() && out_it != lex_out.end(); ++root_it, ++out_it) {
        if (root_it->empty()) continue;  // trailing separator on root
        if (*root_it != *out_it) {
            return {false, {}, PathError::EscapesRoot};
        }
    }
    for (; root_it != lex_root.end(); ++root_it) {
        if (!root_it->empty()) {
            return {false, {}, PathError::EscapesRoot};
        }
    }

    if (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return {true, out, PathError::None};
}

} // namespace fsgate
