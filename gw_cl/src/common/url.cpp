/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#include "gw/url.hpp"
#include "gw/internal/utils.hpp"
#include "gw/internal/request.hpp"
#include <algorithm>
#include <vector>

namespace gw {

namespace {

// Split "a/b/../c/./d" into segments and drop dot segments.
std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> out;
    std::size_t p = 0;
    while (p <= path.size()) {
        std::size_t slash = path.find('/', p);
        if (slash == std::string::npos) slash = path.size();
        const std::string seg = path.substr(p, slash - p);
        if (seg == "..") {
            if (out.size() > 1) out.pop_back();
        } else if (seg != ".") {
            out.push_back(seg);
        }
        p = slash + 1;
    }
    std::string r;
    for (std::size_t i = 0; i < out.size(); ++i) {
        if (i) r += '/';
        r += out[i];
    }
    // a trailing "." or ".." names a directory
    if (path.size() >= 2 && (path.compare(path.size() - 2, 2, "/.") == 0 ||
                             (path.size() >= 3 && path.compare(path.size() - 3, 3, "/..") == 0))) {
        r += '/';
    }
    if (r.empty() || r[0] != '/') r.insert(r.begin(), '/');
    return r;
}

} // namespace

bool parse_gemini_url(const std::string& url_in, GeminiUrl& out) {
    std::string url = url_in;
    internal::trim_inplace(url);
    if (!internal::starts_with(internal::lower_copy(url.substr(0, 9)), internal::kGeminiScheme)) {
        return false;
    }
    std::string rest = url.substr(9);

    const std::size_t hash = rest.find('#');
    if (hash != std::string::npos) rest.erase(hash);

    const std::size_t auth_end = rest.find_first_of("/?");
    const std::string authority = rest.substr(0, auth_end);
    std::string resource = auth_end == std::string::npos ? std::string() : rest.substr(auth_end);

    GeminiUrl u;
    std::string port_s;
    if (!authority.empty() && authority[0] == '[') {
        const std::size_t close = authority.find(']');
        if (close == std::string::npos) return false;
        u.host = authority.substr(0, close + 1);
        const std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':') return false;
            port_s = tail.substr(1);
        }
    } else {
        const std::size_t colon = authority.rfind(':');
        u.host = authority.substr(0, colon);
        if (colon != std::string::npos) port_s = authority.substr(colon + 1);
    }
    if (u.host.empty() || u.host == "[]") return false;

    if (!port_s.empty()) {
        if (port_s.size() > 5) return false;
        unsigned long v = 0;
        for (char c : port_s) {
            if (c < '0' || c > '9') return false;
            v = v * 10 + (unsigned long)(c - '0');
        }
        if (v == 0 || v > 65535) return false;
        u.port = (std::uint16_t)v;
    }

    if (resource.empty()) resource = "/";
    else if (resource[0] == '?') resource.insert(resource.begin(), '/');
    u.resource = resource;

    out = u;
    return true;
}

bool parse_host_arg(const std::string& arg_in, GeminiUrl& out) {
    std::string arg = arg_in;
    internal::trim_inplace(arg);
    if (arg.empty()) return false;

    if (internal::lower_copy(arg.substr(0, 9)) == internal::kGeminiScheme) {
        return parse_gemini_url(arg, out);
    }
    if (arg.find("://") != std::string::npos) return false;

    // "::1", "fe80::1": more than one colon and no brackets
    if (arg[0] != '[' && std::count(arg.begin(), arg.end(), ':') > 1) {
        if (arg.find_first_of("/?#") != std::string::npos) return false;
        GeminiUrl u;
        u.host = "[" + arg + "]";
        out = u;
        return true;
    }
    return parse_gemini_url(internal::kGeminiScheme + arg, out);
}

bool resolve_redirect(const GeminiUrl& base, const std::string& target_in, GeminiUrl& out) {
    std::string target = target_in;
    internal::trim_inplace(target);
    if (target.empty()) return false;

    if (internal::starts_with(internal::lower_copy(target), internal::kGeminiScheme)) {
        return parse_gemini_url(target, out);
    }
    if (internal::starts_with(target, "//")) {
        return parse_gemini_url("gemini:" + target, out);
    }
    const std::size_t colon = target.find(':');
    const std::size_t first_delim = target.find_first_of("/?#");
    if (colon != std::string::npos && (first_delim == std::string::npos || colon < first_delim)) {
        // some other scheme
        return false;
    }

    const std::size_t hash = target.find('#');
    if (hash != std::string::npos) target.erase(hash);

    std::string base_path = base.resource.substr(0, base.resource.find('?'));
    if (base_path.empty()) base_path = "/";

    GeminiUrl u = base;
    if (target.empty()) {
        u.resource = base_path;
    } else if (target[0] == '?') {
        u.resource = base_path + target;
    } else {
        std::string path, query;
        const std::size_t q = target.find('?');
        path = target.substr(0, q);
        if (q != std::string::npos) query = target.substr(q);
        if (path.empty() || path[0] != '/') {
            path = base_path.substr(0, base_path.rfind('/') + 1) + path;
        }
        u.resource = remove_dot_segments(path) + query;
    }
    out = u;
    return true;
}

std::string percent_encode(const std::string& s) {
    static const char unreserved[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-._~";
    auto is_unreserved = [&](unsigned char c){
        for(const char* p=unreserved; *p; ++p) if((unsigned char)*p==c) return true;
        return false;
    };
    std::string out; out.reserve(s.size()*3);
    for(unsigned char c: s){
        if(is_unreserved(c)) out.push_back((char)c);
        else {
            static const char* H="0123456789ABCDEF";
            out.push_back('%'); out.push_back(H[c>>4]); out.push_back(H[c&0xF]);
        }
    }
    return out;
}

} // namespace gw
