/*
 * Part of the Gemwire (GW) project.
 *
 * SPDX-FileCopyrightText: 2025 Gemwire contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Gemwire (GW). See LICENSE for details.
 */

#include "gw/internal/utils.hpp"
#include <cctype>
#include <cstring>

namespace gw::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

bool starts_with(const std::string& s, const char* prefix){
    const std::size_t n = std::strlen(prefix);
    return s.size() >= n && s.compare(0, n, prefix) == 0;
}

bool has_line_break(const std::string& s){
    return s.find_first_of("\r\n") != std::string::npos;
}

void split_media_type(const std::string& meta, std::string& type, std::string& charset){
    charset.clear();
    std::size_t semi = meta.find(';');
    type = meta.substr(0, semi);
    trim_inplace(type);
    type = lower_copy(type);

    while (semi != std::string::npos) {
        const std::size_t next = meta.find(';', semi + 1);
        std::string param = meta.substr(semi + 1, next == std::string::npos ? std::string::npos : next - semi - 1);
        semi = next;

        const std::size_t eq = param.find('=');
        if (eq == std::string::npos) continue;
        std::string k = param.substr(0, eq), v = param.substr(eq + 1);
        trim_inplace(k);
        trim_inplace(v);
        if (lower_copy(k) != "charset") continue;
        if (v.size() >= 2 && v.front() == '"' && v.back() == '"') v = v.substr(1, v.size() - 2);
        charset = lower_copy(v);
    }
}

bool is_valid_utf8(const std::string& s){
    const unsigned char* p = (const unsigned char*)s.data();
    const std::size_t n = s.size();
    std::size_t i = 0;
    while (i < n) {
        const unsigned char c = p[i];
        if (c < 0x80) { ++i; continue; }

        std::size_t len = 0;
        unsigned int cp = 0;
        if      (c >= 0xC2 && c <= 0xDF) { len = 2; cp = c & 0x1F; }
        else if (c >= 0xE0 && c <= 0xEF) { len = 3; cp = c & 0x0F; }
        else if (c >= 0xF0 && c <= 0xF4) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (std::size_t k = 1; k < len; ++k) {
            const unsigned char cc = p[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong, surrogate or out of range
        if (len == 3 && cp < 0x800) return false;
        if (len == 4 && (cp < 0x10000 || cp > 0x10FFFF)) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        i += len;
    }
    return true;
}

bool is_7bit_ascii(const std::string& s){
    for (unsigned char c : s) if (c >= 0x80) return false;
    return true;
}

std::string escape_bytes(const std::string& s){
    static const char* H = "0123456789abcdef";
    std::string o; o.reserve(s.size());
    for (unsigned char c : s) {
        if (c == '\r') { o += "\\r"; continue; }
        if (c == '\n') { o += "\\n"; continue; }
        if (c >= 0x20 && c < 0x7F) { o.push_back((char)c); continue; }
        o += "\\x"; o.push_back(H[c >> 4]); o.push_back(H[c & 0xF]);
    }
    return o;
}

} // namespace gw::internal
