#pragma once
// URL tokenization for positional filter matching.
// Order: host labels (userinfo and port dropped), path segments, query fragments, fragment.
// Scheme and the raw host/path/query strings are never tokens.

#include <string>
#include <vector>
#include <cctype>

namespace filters {

struct UrlParts {
    std::string scheme;
    std::string netloc;
    std::string path;
    std::string query;
    std::string fragment;
    bool has_fragment = false;
};

namespace detail {
inline bool is_scheme_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

inline void split_nonempty(const std::string& s, char sep, std::vector<std::string>& out) {
    std::size_t start = 0;
    while (start <= s.size()) {
        std::size_t pos = s.find(sep, start);
        if (pos == std::string::npos) pos = s.size();
        if (pos > start) out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}
} // namespace detail

// scheme:[//netloc]path[?query][#fragment]
// A URL without "//" has no netloc; everything before ?/# is path.
inline UrlParts split_url(const std::string& url) {
    UrlParts p;
    std::string rest = url;

    // scheme: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
    std::size_t colon = rest.find(':');
    if (colon != std::string::npos && colon > 0 &&
        std::isalpha(static_cast<unsigned char>(rest[0]))) {
        bool ok = true;
        for (std::size_t i = 1; i < colon; ++i) {
            if (!detail::is_scheme_char(rest[i])) { ok = false; break; }
        }
        if (ok) {
            p.scheme = rest.substr(0, colon);
            rest = rest.substr(colon + 1);
        }
    }

    std::size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        p.fragment = rest.substr(hash + 1);
        p.has_fragment = true;
        rest.resize(hash);
    }

    std::size_t q = rest.find('?');
    if (q != std::string::npos) {
        p.query = rest.substr(q + 1);
        rest.resize(q);
    }

    if (rest.compare(0, 2, "//") == 0) {
        std::size_t slash = rest.find('/', 2);
        if (slash == std::string::npos) {
            p.netloc = rest.substr(2);
        } else {
            p.netloc = rest.substr(2, slash - 2);
            p.path = rest.substr(slash);
        }
    } else {
        p.path = rest;
    }
    return p;
}

// Host part of a netloc: "user:pw@[::1]:8080" -> "[::1]", "a.com:443" -> "a.com".
inline std::string host_of(const std::string& netloc) {
    std::string host = netloc;
    std::size_t at = host.rfind('@');
    if (at != std::string::npos) host.erase(0, at + 1);
    if (!host.empty() && host.front() == '[') {
        std::size_t close = host.find(']');
        if (close != std::string::npos) host.resize(close + 1);
        return host;
    }
    std::size_t colon = host.find(':');
    if (colon != std::string::npos) host.resize(colon);
    return host;
}

inline std::vector<std::string> tokenize(const std::string& url) {
    const UrlParts p = split_url(url);
    std::vector<std::string> tokens;
    detail::split_nonempty(host_of(p.netloc), '.', tokens);
    detail::split_nonempty(p.path, '/', tokens);
    detail::split_nonempty(p.query, '&', tokens);
    if (p.has_fragment && !p.fragment.empty()) tokens.push_back(p.fragment);
    return tokens;
}

} // namespace filters
