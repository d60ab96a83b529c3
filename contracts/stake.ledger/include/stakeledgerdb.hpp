#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/time.hpp>

#include <stakeledger/consts.hpp>

namespace stakeledger {

using namespace eosio;
using namespace std;

#define TBL struct [[eosio::table, eosio::contract("stake.ledger")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("stake.ledger")]]

NTBL("global") global_t {
    name                admin;                                      // 管理员（owner）
    name                token_contract;                             // 质押币发行合约
    symbol              stake_symbol;                               // 质押币符号
    uint32_t            min_staking_period      = 0;                // 最短质押周期（秒），init 后不可修改
    uint16_t            reward_rate_percent     = REWARD_RATE_PERCENT;
    asset               total_staked;                               // 当前质押总额 = sum(stake_t.amount)
    asset               reward_pool;                                // 已充值、未发放的奖励
    asset               total_rewards_paid;                         // 累计已发放奖励
    bool                initialized             = false;

    EOSLIB_SERIALIZE( global_t, (admin)(token_contract)(stake_symbol)
                                (min_staking_period)(reward_rate_percent)
                                (total_staked)(reward_pool)(total_rewards_paid)(initialized) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

//Scope: _self
//Note: record is kept with zero amount after unstake
TBL stake_t {
    name                owner;                                      // PK: 质押用户
    asset               amount;                                     // 当前质押数量，0 表示未质押
    time_point_sec      since;                                      // 最近一次质押时间
    asset               cum_staked;                                 // 累计质押数量（历史统计）
    asset               cum_rewards;                                // 累计领取奖励
    time_point_sec      created_at;

    stake_t() {}
    stake_t(const name& o): owner(o) {}

    uint64_t primary_key() const { return owner.value; }

    typedef eosio::multi_index<"stakes"_n, stake_t> tbl_t;

    EOSLIB_SERIALIZE( stake_t, (owner)(amount)(since)(cum_staked)(cum_rewards)(created_at) )
};

} // namespace stakeledger
