#pragma once

#include <eosio/eosio.hpp>
#include <eosio/crypto.hpp>
#include <eosio/print.hpp>

#include <array>
#include <string>
#include <string_view>
#include <vector>

using namespace std;

static constexpr eosio::name active_perm{"active"_n};

#ifndef ASSERT
    #define ASSERT(exp) eosio::check(exp, #exp)
#endif

#define CHECK(exp, msg) { if (!(exp)) eosio::check(false, msg); }

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, string("[[") + to_string((int)code) + string("]] ") + msg); }

#ifdef BTCRED_DEBUG
    #define TRACE_L(...) { eosio::print(__VA_ARGS__, "\n"); }
#else
    #define TRACE_L(...)
#endif

namespace btcred {

inline vector<string_view> split(string_view str, string_view delims = " ") {
    vector<string_view> res;
    std::size_t current, previous = 0;
    current = str.find_first_of(delims);
    while (current != std::string::npos) {
        res.push_back(str.substr(previous, current - previous));
        previous = current + 1;
        current = str.find_first_of(delims, previous);
    }
    res.push_back(str.substr(previous, current - previous));
    return res;
}

inline uint8_t from_hex_char(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    CHECK(false, string("invalid hex char: ") + c);
    return 0;
}

//up to 64 hex chars, most significant byte first, optional 0x prefix.
//shorter values are left-padded with zeros, so hex(int) style ids resolve to the same key
inline eosio::checksum256 hex_to_checksum256(string_view hex) {
    if (hex.size() > 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
        hex.remove_prefix(2);
    CHECK(!hex.empty() && hex.size() <= 64, "hash must be 1 to 64 hex chars: " + string(hex));

    string padded(64 - hex.size(), '0');
    padded.append(hex.data(), hex.size());

    std::array<uint8_t, 32> bytes;
    for (size_t i = 0; i < bytes.size(); i++) {
        bytes[i] = (from_hex_char(padded[2 * i]) << 4) | from_hex_char(padded[2 * i + 1]);
    }
    return eosio::checksum256(bytes);
}

inline string checksum256_to_hex(const eosio::checksum256& hash) {
    static const char* digits = "0123456789abcdef";
    auto bytes = hash.extract_as_byte_array();
    string res;
    res.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        res += digits[(b >> 4) & 0x0f];
        res += digits[b & 0x0f];
    }
    return res;
}

} //namespace btcred
