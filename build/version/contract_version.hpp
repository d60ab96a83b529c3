#pragma once

#include <eosio/eosio.hpp>

#include <string>

#ifndef CONTRACT_VERSION
#define CONTRACT_VERSION "0.1.0"
#endif

// 放在合约类的 public 区域内, 生成 version action, 返回值即版本号
#define CONTRACT_VERSION_ACTION(class_name)                                             \
    [[eosio::action]] std::string version() {                                          \
        return CONTRACT_VERSION;                                                        \
    }                                                                                   \
    using version_action = eosio::action_wrapper<"version"_n, &class_name::version>;
