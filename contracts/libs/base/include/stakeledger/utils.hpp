#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <eosio/eosio.hpp>

namespace stakeledger {

using std::string_view;
using std::vector;

#define CHECK(exp, msg) { if (!(exp)) eosio::check(false, msg); }

inline string_view trim(string_view sv) {
    sv.remove_prefix(std::min(sv.find_first_not_of(" "), sv.size())); // left trim
    sv.remove_suffix(std::min(sv.size()-sv.find_last_not_of(" ")-1, sv.size())); // right trim
    return sv;
}

inline vector<string_view> split(string_view str, string_view delims = " ")
{
    vector<string_view> res;
    std::size_t current, previous = 0;
    current = str.find_first_of(delims);
    while (current != std::string::npos) {
        res.push_back(trim(str.substr(previous, current - previous)));
        previous = current + 1;
        current = str.find_first_of(delims, previous);
    }
    res.push_back(trim(str.substr(previous, current - previous)));
    return res;
}

/**
 * @brief a * b / c, 中间结果用 int128 计算, 由调用方负责截断到目标范围
 */
inline int128_t multiply_divide(int128_t a, int128_t b, int128_t c) {
    CHECK(c != 0, "divide by zero");
    return a * b / c;
}

} // namespace stakeledger
