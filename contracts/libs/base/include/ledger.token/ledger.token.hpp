#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>

#include <string>

#include <stakeledger/consts.hpp>
#include <contract_version.hpp>

namespace stakeledger {

using std::string;
using namespace eosio;

#define TRANSFER(bank, to, quantity, memo) \
    { token::transfer_action act{ bank, { {_self, active_perm} } };\
      act.send( _self, to, quantity , memo );}

// _self 作为 spender, 消耗 from 对 _self 的授权额度
#define TRANSFER_FROM(bank, from, to, quantity, memo) \
    { token::transferfrom_action act{ bank, { {_self, active_perm} } };\
      act.send( _self, from, to, quantity, memo );}

/**
 * The `ledger.token` contract is a fungible token ledger with ERC20 style allowances.
 *
 * Besides the usual create / issue / transfer flow it lets an owner `approve` a spender
 * for a bounded quantity, which the spender can later move with `transferfrom`. The
 * `stake.ledger` contract pulls stakes into custody through that path.
 *
 * Balances live in the `accounts` table (scope: owner), supply in `stat` (scope: symbol code)
 * and allowances in `allowances` (scope: owner, one row per spender).
 */
class [[eosio::contract("ledger.token")]] token : public contract {
   public:
      using contract::contract;

      /**
       * Creates a new token with `maximum_supply` and `issuer`. Needs the contract's authority.
       */
      ACTION create( const name& issuer, const asset& maximum_supply );

      /**
       * Issues `quantity` into the issuer's balance. `to` must be the issuer.
       */
      ACTION issue( const name& to, const asset& quantity, const string& memo );

      /**
       * Burns `quantity` from the issuer's balance and lowers the supply.
       */
      ACTION retire( const asset& quantity, const string& memo );

      ACTION transfer( const name& from, const name& to, const asset& quantity, const string& memo );

      /**
       * Sets the allowance of `spender` over `owner`'s tokens to `quantity`.
       * A zero quantity revokes it.
       */
      ACTION approve( const name& owner, const name& spender, const asset& quantity );

      /**
       * Moves `quantity` from `from` to `to` on behalf of `spender`, consuming the allowance.
       */
      ACTION transferfrom( const name& spender, const name& from, const name& to, const asset& quantity, const string& memo );

      ACTION open( const name& owner, const symbol& symbol, const name& ram_payer );

      ACTION close( const name& owner, const symbol& symbol );

      CONTRACT_VERSION_ACTION(token)

      // balanceOf
      static asset get_balance( const name& token_contract_account, const name& owner, const symbol& sym )
      {
         accounts accountstable( token_contract_account, owner.value );
         auto itr = accountstable.find( sym.code().raw() );
         return itr == accountstable.end() ? asset(0, sym) : itr->balance;
      }

      static asset get_allowance( const name& token_contract_account, const name& owner, const name& spender, const symbol& sym )
      {
         allowances allowtable( token_contract_account, owner.value );
         auto itr = allowtable.find( spender.value );
         if( itr == allowtable.end() || itr->quantity.symbol != sym ) return asset(0, sym);
         return itr->quantity;
      }

      using create_action        = eosio::action_wrapper<"create"_n, &token::create>;
      using issue_action         = eosio::action_wrapper<"issue"_n, &token::issue>;
      using retire_action        = eosio::action_wrapper<"retire"_n, &token::retire>;
      using transfer_action      = eosio::action_wrapper<"transfer"_n, &token::transfer>;
      using approve_action       = eosio::action_wrapper<"approve"_n, &token::approve>;
      using transferfrom_action  = eosio::action_wrapper<"transferfrom"_n, &token::transferfrom>;
      using open_action          = eosio::action_wrapper<"open"_n, &token::open>;
      using close_action         = eosio::action_wrapper<"close"_n, &token::close>;

      struct [[eosio::table]] account {
         asset    balance;

         uint64_t primary_key()const { return balance.symbol.code().raw(); }
      };

      struct [[eosio::table]] currency_stats {
         asset    supply;
         asset    max_supply;
         name     issuer;

         uint64_t primary_key()const { return supply.symbol.code().raw(); }
      };

      struct [[eosio::table]] allowance {
         name     spender;
         asset    quantity;

         uint64_t primary_key()const { return spender.value; }
      };

      typedef eosio::multi_index< "accounts"_n, account > accounts;
      typedef eosio::multi_index< "stat"_n, currency_stats > stats;
      typedef eosio::multi_index< "allowances"_n, allowance > allowances;

   private:
      void sub_balance( const name& owner, const asset& value );
      void add_balance( const name& owner, const asset& value, const name& ram_payer );
      void sub_allowance( const name& owner, const name& spender, const asset& value );
};

} // namespace stakeledger
