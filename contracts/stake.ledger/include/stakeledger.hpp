#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/permission.hpp>
#include <eosio/action.hpp>

#include <ledger.token/ledger.token.hpp>
#include <stakeledger/utils.hpp>
#include <contract_version.hpp>

#include "stakeledgerdb.hpp"

namespace stakeledger {

using namespace eosio;
using std::string;

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, string("[[") + std::to_string((int)code) + string("]] ") + msg); }

enum class err: uint8_t {
   NONE                     = 0,
   INVALID_AMOUNT           = 1,
   INSUFFICIENT_BALANCE     = 2,
   STAKING_PERIOD_NOT_MET   = 3,
   UNAUTHORIZED             = 4,
   REWARD_POOL_INSUFFICIENT = 5,
   NOT_INITIALIZED          = 6,
   ALREADY_INITIALIZED      = 7,
   PARAM_ERROR              = 8,
   ACCOUNT_INVALID          = 9,
   SYMBOL_MISMATCH          = 10,
   CONTRACT_MISMATCH        = 11,
   MEMO_FORMAT_ERROR        = 12,
   ALLOWANCE_INSUFFICIENT   = 13
};

/**
 * 合约：stake.ledger
 * 功能：单币质押 + 按时长计息
 * 说明：
 *   - 用户先在 token 合约 approve 本合约，再调用 stake，本合约通过 transferfrom 托管本金
 *   - 满最短质押周期后 unstake，一次性返还本金 + 奖励
 *   - 奖励由任意账户转账（memo: "reward"）注入奖励池
 */
class [[eosio::contract("stake.ledger")]] stakeledger : public contract {
public:
    using contract::contract;

    stakeledger(name receiver, name code, datastream<const char*> ds)
    : contract(receiver, code, ds),
      _global(get_self(), get_self().value)
    {
        _gstate = _global.exists() ? _global.get() : global_t{};
    }

    ~stakeledger() {
        _global.set(_gstate, get_self());
    }

    /**
     * 初始化（仅一次）
     * @param admin 管理员账户
     * @param token_contract 质押币发行合约
     * @param stake_symbol 质押币符号
     * @param min_staking_period 最短质押周期（秒）
     */
    ACTION init(const name& admin, const name& token_contract, const symbol& stake_symbol, const uint32_t& min_staking_period);

    /**
     * 更换管理员（仅管理员）
     */
    ACTION setadmin(const name& new_admin);

    /**
     * 质押：需先 approve 本合约足够额度，余额不足报 InsufficientBalance，额度不足报 InsufficientAllowance
     * @param owner 质押用户
     * @param quantity 质押数量
     */
    ACTION stake(const name& owner, const asset& quantity);

    /**
     * 赎回全部本金 + 奖励，需满足最短质押周期
     * 奖励池不足时只发放池内余额，unstakedlog 记录实际发放的奖励
     */
    ACTION unstake(const name& owner);

    /**
     * 查询当前可得奖励（无质押返回 0）
     */
    [[eosio::action]]
    asset calcreward(const name& owner);

    /**
     * 管理员提取未发放的奖励池余额（不涉及质押本金）
     */
    ACTION withdrawrwd(const name& to, const asset& quantity);

    // ========== 事件日志 (仅本合约 inline 调用) ==========
    ACTION stakedlog(const name& owner, const asset& quantity, const time_point_sec& since);
    ACTION unstakedlog(const name& owner, const asset& principal, const asset& reward);

    /**
     * 奖励充值（监听质押币转账）
     * memo 格式： "reward" 或 "reward:<note>"
     */
    [[eosio::on_notify("*::transfer")]]
    void on_transfer(const name& from, const name& to, const asset& quantity, const string& memo);

    CONTRACT_VERSION_ACTION(stakeledger)

    /**
     * 奖励 = principal * rate_percent * (elapsed - min_period) / (100 * min_period)
     * 未超过 min_period 的部分不计息, 结果封顶使 principal + reward 不超过 asset::max_amount
     */
    static asset calc_reward(const asset& principal, const uint32_t& elapsed, const uint32_t& min_period, const uint16_t& rate_percent);

    static asset get_reward(const name& stake_contract, const name& owner);

    using stakedlog_action      = eosio::action_wrapper<"stakedlog"_n, &stakeledger::stakedlog>;
    using unstakedlog_action    = eosio::action_wrapper<"unstakedlog"_n, &stakeledger::unstakedlog>;

private:
    void _on_reward_in(const name& from, const asset& quantity);

    static uint32_t _elapsed_since(const time_point_sec& since);

private:
    global_singleton       _global;
    global_t               _gstate;
};

} // namespace stakeledger
