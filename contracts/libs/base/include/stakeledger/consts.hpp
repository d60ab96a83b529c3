#pragma once
#include <eosio/asset.hpp>
#include <eosio/name.hpp>

#include <string_view>

namespace stakeledger {

static constexpr eosio::name active_perm            {"active"_n};

static constexpr uint16_t REWARD_RATE_PERCENT       = 10;       // 每满一个最短质押周期的奖励比例(%)
static constexpr uint16_t PERCENT_BOOST             = 100;

#ifndef DAY_SECONDS_FOR_TEST
static constexpr uint64_t DAY_SECONDS               = 24 * 3600;
#else
#warning "DAY_SECONDS_FOR_TEST should be used only for test!!!"
static constexpr uint64_t DAY_SECONDS               = DAY_SECONDS_FOR_TEST;
#endif//DAY_SECONDS_FOR_TEST

static constexpr uint64_t MAX_STAKING_PERIOD        = 10 * 365 * DAY_SECONDS;
static constexpr uint32_t MAX_MEMO_SIZE             = 256;

namespace memo_type {
    static constexpr std::string_view REWARD        = "reward";    // 奖励池充值
    static constexpr std::string_view STAKE         = "stake";
    static constexpr std::string_view UNSTAKE       = "unstake";
    static constexpr std::string_view WITHDRAW      = "withdraw reward";
}

}
