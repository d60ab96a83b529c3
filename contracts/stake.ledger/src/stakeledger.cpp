#include "stakeledger.hpp"

namespace stakeledger {

asset stakeledger::calc_reward(const asset& principal, const uint32_t& elapsed, const uint32_t& min_period, const uint16_t& rate_percent) {
    if (principal.amount <= 0 || min_period == 0 || elapsed <= min_period) return asset(0, principal.symbol);

    const int128_t accrued = elapsed - min_period;
    int128_t reward_amt = multiply_divide((int128_t)principal.amount * rate_percent, accrued, (int128_t)PERCENT_BOOST * min_period);
    // principal + reward 必须仍是合法 asset
    const int128_t max_reward = asset::max_amount - principal.amount;
    if (reward_amt > max_reward) reward_amt = max_reward;
    return asset((int64_t)reward_amt, principal.symbol);
}

uint32_t stakeledger::_elapsed_since(const time_point_sec& since) {
    const auto now = time_point_sec(current_time_point());
    return now > since ? now.sec_since_epoch() - since.sec_since_epoch() : 0;
}

asset stakeledger::get_reward(const name& stake_contract, const name& owner) {
    global_singleton global(stake_contract, stake_contract.value);
    CHECKC(global.exists() && global.get().initialized, err::NOT_INITIALIZED, "NotInitialized: stake contract not initialized");
    const auto gstate = global.get();

    stake_t::tbl_t stakes(stake_contract, stake_contract.value);
    auto itr = stakes.find(owner.value);
    if (itr == stakes.end() || itr->amount.amount <= 0) return asset(0, gstate.stake_symbol);

    return calc_reward(itr->amount, _elapsed_since(itr->since), gstate.min_staking_period, gstate.reward_rate_percent);
}

void stakeledger::init(const name& admin, const name& token_contract, const symbol& stake_symbol, const uint32_t& min_staking_period) {
    require_auth(get_self());
    CHECKC(!_gstate.initialized, err::ALREADY_INITIALIZED, "AlreadyInitialized: contract already initialized");
    CHECKC(is_account(admin), err::ACCOUNT_INVALID, "ParamError: invalid admin account");
    CHECKC(is_account(token_contract), err::ACCOUNT_INVALID, "ParamError: invalid token contract");
    CHECKC(stake_symbol.is_valid(), err::PARAM_ERROR, "ParamError: invalid stake symbol");
    CHECKC(min_staking_period > 0 && min_staking_period <= MAX_STAKING_PERIOD, err::PARAM_ERROR,
           "ParamError: min staking period out of range");

    token::stats statstable(token_contract, stake_symbol.code().raw());
    auto st = statstable.find(stake_symbol.code().raw());
    CHECKC(st != statstable.end() && st->supply.symbol == stake_symbol, err::SYMBOL_MISMATCH,
           "ParamError: stake symbol not found in token contract");

    _gstate.admin               = admin;
    _gstate.token_contract      = token_contract;
    _gstate.stake_symbol        = stake_symbol;
    _gstate.min_staking_period  = min_staking_period;
    _gstate.reward_rate_percent = REWARD_RATE_PERCENT;
    _gstate.total_staked        = asset(0, stake_symbol);
    _gstate.reward_pool         = asset(0, stake_symbol);
    _gstate.total_rewards_paid  = asset(0, stake_symbol);
    _gstate.initialized         = true;
}

void stakeledger::setadmin(const name& new_admin) {
    CHECKC(_gstate.initialized, err::NOT_INITIALIZED, "NotInitialized: contract not initialized");
    CHECKC(has_auth(_gstate.admin), err::UNAUTHORIZED, "Unauthorized: admin only");
    CHECKC(is_account(new_admin), err::ACCOUNT_INVALID, "ParamError: invalid admin account");

    _gstate.admin = new_admin;
}

void stakeledger::stake(const name& owner, const asset& quantity) {
    require_auth(owner);
    CHECKC(_gstate.initialized, err::NOT_INITIALIZED, "NotInitialized: contract not initialized");
    CHECKC(quantity.is_valid() && quantity.symbol == _gstate.stake_symbol, err::INVALID_AMOUNT,
           "InvalidAmount: expect " + _gstate.stake_symbol.code().to_string() + " quantity");
    CHECKC(quantity.amount > 0, err::INVALID_AMOUNT, "InvalidAmount: must stake positive quantity");

    const asset balance = token::get_balance(_gstate.token_contract, owner, quantity.symbol);
    CHECKC(balance >= quantity, err::INSUFFICIENT_BALANCE,
           "InsufficientBalance: available " + balance.to_string() + " < " + quantity.to_string());

    const asset allowance = token::get_allowance(_gstate.token_contract, owner, get_self(), quantity.symbol);
    CHECKC(allowance >= quantity, err::ALLOWANCE_INSUFFICIENT,
           "InsufficientAllowance: approved " + allowance.to_string() + " < " + quantity.to_string());

    const auto now = time_point_sec(current_time_point());

    stake_t::tbl_t stakes(get_self(), get_self().value);
    auto itr = stakes.find(owner.value);
    if (itr == stakes.end()) {
        stakes.emplace(get_self(), [&](auto& s) {
            s.owner         = owner;
            s.amount        = quantity;
            s.since         = now;
            s.cum_staked    = quantity;
            s.cum_rewards   = asset(0, quantity.symbol);
            s.created_at    = now;
        });
    } else {
        // 追加质押：计息起点重置为本次质押时间
        stakes.modify(itr, same_payer, [&](auto& s) {
            s.amount       += quantity;
            s.since         = now;
            s.cum_staked   += quantity;
        });
    }

    _gstate.total_staked += quantity;

    TRANSFER_FROM(_gstate.token_contract, owner, get_self(), quantity, string(memo_type::STAKE));

    stakedlog_action{ get_self(), { {get_self(), active_perm} } }.send(owner, quantity, now);
}

void stakeledger::unstake(const name& owner) {
    require_auth(owner);
    CHECKC(_gstate.initialized, err::NOT_INITIALIZED, "NotInitialized: contract not initialized");

    stake_t::tbl_t stakes(get_self(), get_self().value);
    auto itr = stakes.find(owner.value);
    CHECKC(itr != stakes.end() && itr->amount.amount > 0, err::UNAUTHORIZED,
           "Unauthorized: no active stake for " + owner.to_string());

    const uint32_t elapsed = _elapsed_since(itr->since);
    CHECKC(elapsed >= _gstate.min_staking_period, err::STAKING_PERIOD_NOT_MET,
           "StakingPeriodNotMet: " + std::to_string(elapsed) + "s elapsed, "
           + std::to_string(_gstate.min_staking_period) + "s required");

    const asset principal = itr->amount;
    const asset accrued   = calc_reward(principal, elapsed, _gstate.min_staking_period, _gstate.reward_rate_percent);
    // 奖励池不足时按池内余额发放, 本金总能取回
    const asset reward    = accrued <= _gstate.reward_pool ? accrued : _gstate.reward_pool;

    stakes.modify(itr, same_payer, [&](auto& s) {
        s.amount        = asset(0, principal.symbol);
        s.cum_rewards  += reward;
    });

    _gstate.total_staked        -= principal;
    _gstate.reward_pool         -= reward;
    _gstate.total_rewards_paid  += reward;

    TRANSFER(_gstate.token_contract, owner, principal + reward, string(memo_type::UNSTAKE));

    unstakedlog_action{ get_self(), { {get_self(), active_perm} } }.send(owner, principal, reward);
}

asset stakeledger::calcreward(const name& owner) {
    CHECKC(_gstate.initialized, err::NOT_INITIALIZED, "NotInitialized: contract not initialized");
    return get_reward(get_self(), owner);
}

void stakeledger::withdrawrwd(const name& to, const asset& quantity) {
    CHECKC(_gstate.initialized, err::NOT_INITIALIZED, "NotInitialized: contract not initialized");
    CHECKC(has_auth(_gstate.admin), err::UNAUTHORIZED, "Unauthorized: admin only");
    CHECKC(is_account(to), err::ACCOUNT_INVALID, "ParamError: invalid receiver account");
    CHECKC(quantity.is_valid() && quantity.symbol == _gstate.stake_symbol, err::INVALID_AMOUNT,
           "InvalidAmount: expect " + _gstate.stake_symbol.code().to_string() + " quantity");
    CHECKC(quantity.amount > 0, err::INVALID_AMOUNT, "InvalidAmount: must withdraw positive quantity");
    CHECKC(quantity <= _gstate.reward_pool, err::REWARD_POOL_INSUFFICIENT,
           "InsufficientRewardPool: pool " + _gstate.reward_pool.to_string() + " < " + quantity.to_string());

    _gstate.reward_pool -= quantity;

    TRANSFER(_gstate.token_contract, to, quantity, string(memo_type::WITHDRAW));
}

void stakeledger::stakedlog(const name& owner, const asset& quantity, const time_point_sec& since) {
    require_auth(get_self());
}

void stakeledger::unstakedlog(const name& owner, const asset& principal, const asset& reward) {
    require_auth(get_self());
}

// --- 奖励充值 ---
void stakeledger::on_transfer(const name& from, const name& to, const asset& quantity, const string& memo) {
    if (from == get_self() || to != get_self()) return;

    CHECKC(_gstate.initialized, err::NOT_INITIALIZED, "NotInitialized: contract not initialized");
    CHECKC(get_first_receiver() == _gstate.token_contract, err::CONTRACT_MISMATCH, "ParamError: token contract mismatch");
    CHECKC(quantity.symbol == _gstate.stake_symbol, err::SYMBOL_MISMATCH, "ParamError: symbol mismatch");
    CHECKC(quantity.amount > 0, err::INVALID_AMOUNT, "InvalidAmount: must transfer positive amount");

    auto parts = split(memo, ":");
    CHECKC(parts[0] == memo_type::REWARD, err::MEMO_FORMAT_ERROR, "ParamError: invalid memo format, expect reward[:<note>]");

    _on_reward_in(from, quantity);
}

void stakeledger::_on_reward_in(const name& from, const asset& quantity) {
    _gstate.reward_pool += quantity;
}

} // namespace stakeledger
