#pragma once

#include <boost/test/unit_test.hpp>

#include <eosio/testing/tester.hpp>
#include <eosio/chain/abi_serializer.hpp>

#include <fc/variant_object.hpp>
#include <fc/io/raw.hpp>

#include <contracts.hpp>

using namespace eosio::testing;
using namespace eosio;
using namespace eosio::chain;
using namespace fc;
using namespace std;

using mvo = fc::mutable_variant_object;

static constexpr account_name TOKEN   = "ledger.token"_n;
static constexpr account_name STAKE   = "stake.ledger"_n;
static constexpr account_name ADMIN   = "admin"_n;

// 7 days, matches the default deployment
static constexpr uint32_t MIN_STAKING_PERIOD = 7 * 24 * 3600;

static const std::string TST_SYM_STR = "4,TST";
static const symbol      TST_SYMBOL  = symbol::from_string(TST_SYM_STR);

static asset tst(const std::string& amount) {
   return asset::from_string(amount + " TST");
}

// action_result strings carry the full "assertion failure with message: [[code]] Kind: ..." text
static void require_substr(const std::string& s, const std::string& needle) {
   BOOST_REQUIRE_MESSAGE( s.find(needle) != std::string::npos, "\"" + s + "\" does not contain \"" + needle + "\"" );
}

class stakeledger_tester : public tester {
public:
   stakeledger_tester() {
      produce_blocks( 2 );

      create_accounts( { "alice"_n, "bob"_n, "carol"_n, ADMIN, TOKEN, STAKE } );
      produce_blocks( 2 );

      set_code( TOKEN, contracts::token_wasm() );
      set_abi( TOKEN, contracts::token_abi().data() );
      set_code( STAKE, contracts::stake_wasm() );
      set_abi( STAKE, contracts::stake_abi().data() );

      // stake.ledger sends inline transfer / transferfrom / log actions as itself
      set_authority( STAKE, config::active_name,
                     authority( 1,
                                { key_weight{ get_public_key( STAKE, "active" ), 1 } },
                                { permission_level_weight{ { STAKE, config::eosio_code_name }, 1 } } ),
                     config::owner_name );

      produce_blocks();

      load_abi( TOKEN, token_abi_ser );
      load_abi( STAKE, stake_abi_ser );
   }

   // -----------------------------
   // ledger.token
   // -----------------------------

   action_result push_token_action( const account_name& signer, const action_name& name, const variant_object& data ) {
      return push_contract_action( TOKEN, token_abi_ser, signer, name, data );
   }

   action_result create( account_name issuer, asset maximum_supply ) {
      return push_token_action( TOKEN, "create"_n, mvo()
           ( "issuer", issuer )
           ( "maximum_supply", maximum_supply )
      );
   }

   action_result issue( account_name issuer, asset quantity, string memo ) {
      return push_token_action( issuer, "issue"_n, mvo()
           ( "to", issuer )
           ( "quantity", quantity )
           ( "memo", memo )
      );
   }

   action_result retire( account_name issuer, asset quantity, string memo ) {
      return push_token_action( issuer, "retire"_n, mvo()
           ( "quantity", quantity )
           ( "memo", memo )
      );
   }

   action_result transfer( account_name from, account_name to, asset quantity, string memo ) {
      return push_token_action( from, "transfer"_n, mvo()
           ( "from", from )
           ( "to", to )
           ( "quantity", quantity )
           ( "memo", memo )
      );
   }

   action_result approve( account_name owner, account_name spender, asset quantity ) {
      return push_token_action( owner, "approve"_n, mvo()
           ( "owner", owner )
           ( "spender", spender )
           ( "quantity", quantity )
      );
   }

   action_result transferfrom( account_name spender, account_name from, account_name to, asset quantity, string memo ) {
      return push_token_action( spender, "transferfrom"_n, mvo()
           ( "spender", spender )
           ( "from", from )
           ( "to", to )
           ( "quantity", quantity )
           ( "memo", memo )
      );
   }

   action_result open( account_name owner, const string& symbolname, account_name ram_payer ) {
      return push_token_action( ram_payer, "open"_n, mvo()
           ( "owner", owner )
           ( "symbol", symbolname )
           ( "ram_payer", ram_payer )
      );
   }

   action_result close( account_name owner, const string& symbolname ) {
      return push_token_action( owner, "close"_n, mvo()
           ( "owner", owner )
           ( "symbol", symbolname )
      );
   }

   fc::variant get_stats( const string& symbolname ) {
      auto symbol_code = symbol::from_string(symbolname).to_symbol_code().value;
      vector<char> data = get_row_by_account( TOKEN, name(symbol_code), "stat"_n, account_name(symbol_code) );
      return data.empty() ? fc::variant() : token_abi_ser.binary_to_variant( "currency_stats", data, abi_serializer::create_yield_function(abi_serializer_max_time) );
   }

   fc::variant get_account( account_name acc, const string& symbolname ) {
      auto symbol_code = symbol::from_string(symbolname).to_symbol_code().value;
      vector<char> data = get_row_by_account( TOKEN, acc, "accounts"_n, account_name(symbol_code) );
      return data.empty() ? fc::variant() : token_abi_ser.binary_to_variant( "account", data, abi_serializer::create_yield_function(abi_serializer_max_time) );
   }

   fc::variant get_allowance( account_name owner, account_name spender ) {
      vector<char> data = get_row_by_account( TOKEN, owner, "allowances"_n, spender );
      return data.empty() ? fc::variant() : token_abi_ser.binary_to_variant( "allowance", data, abi_serializer::create_yield_function(abi_serializer_max_time) );
   }

   asset get_balance( account_name acc, const string& symbolname = TST_SYM_STR ) {
      auto row = get_account( acc, symbolname );
      if( row.is_null() ) return asset( 0, symbol::from_string(symbolname) );
      return row["balance"].as<asset>();
   }

   // -----------------------------
   // stake.ledger
   // -----------------------------

   action_result push_stake_action( const account_name& signer, const action_name& name, const variant_object& data ) {
      return push_contract_action( STAKE, stake_abi_ser, signer, name, data );
   }

   action_result init( account_name admin, account_name token_contract, const string& sym, uint32_t min_staking_period ) {
      return push_stake_action( STAKE, "init"_n, mvo()
           ( "admin", admin )
           ( "token_contract", token_contract )
           ( "stake_symbol", sym )
           ( "min_staking_period", min_staking_period )
      );
   }

   action_result setadmin( account_name signer, account_name new_admin ) {
      return push_stake_action( signer, "setadmin"_n, mvo()
           ( "new_admin", new_admin )
      );
   }

   action_result stake( account_name owner, asset quantity ) {
      return push_stake_action( owner, "stake"_n, mvo()
           ( "owner", owner )
           ( "quantity", quantity )
      );
   }

   action_result unstake( account_name owner ) {
      return push_stake_action( owner, "unstake"_n, mvo()
           ( "owner", owner )
      );
   }

   action_result withdrawrwd( account_name signer, account_name to, asset quantity ) {
      return push_stake_action( signer, "withdrawrwd"_n, mvo()
           ( "to", to )
           ( "quantity", quantity )
      );
   }

   // approve + stake in one go
   action_result approve_and_stake( account_name owner, asset quantity ) {
      auto r = approve( owner, STAKE, quantity );
      if( r != success() ) return r;
      return stake( owner, quantity );
   }

   // runs in the pending block without producing it; vary the signer to query twice in one block
   asset calcreward( account_name owner, account_name signer = account_name() ) {
      if( signer == account_name() ) signer = owner;
      auto trace = base_tester::push_action( STAKE, "calcreward"_n, signer, mvo()( "owner", owner ) );
      return fc::raw::unpack<asset>( find_action_trace( trace, STAKE, "calcreward"_n ).return_value );
   }

   string version( account_name code ) {
      auto trace = base_tester::push_action( code, "version"_n, "alice"_n, mvo() );
      return fc::raw::unpack<string>( find_action_trace( trace, code, "version"_n ).return_value );
   }

   transaction_trace_ptr stake_trace( account_name owner, asset quantity ) {
      return base_tester::push_action( STAKE, "stake"_n, owner, mvo()( "owner", owner )( "quantity", quantity ) );
   }

   transaction_trace_ptr unstake_trace( account_name owner ) {
      return base_tester::push_action( STAKE, "unstake"_n, owner, mvo()( "owner", owner ) );
   }

   fc::variant get_stake( account_name owner ) {
      vector<char> data = get_row_by_account( STAKE, STAKE, "stakes"_n, owner );
      return data.empty() ? fc::variant() : stake_abi_ser.binary_to_variant( "stake_t", data, abi_serializer::create_yield_function(abi_serializer_max_time) );
   }

   fc::variant get_global() {
      vector<char> data = get_row_by_account( STAKE, STAKE, "global"_n, "global"_n );
      return data.empty() ? fc::variant() : stake_abi_ser.binary_to_variant( "global_t", data, abi_serializer::create_yield_function(abi_serializer_max_time) );
   }

   fc::variant get_log_data( const transaction_trace_ptr& trace, const action_name& log_name ) {
      const auto& at = find_action_trace( trace, STAKE, log_name );
      return stake_abi_ser.binary_to_variant( stake_abi_ser.get_action_type(log_name), at.act.data, abi_serializer::create_yield_function(abi_serializer_max_time) );
   }

   /// Must follow an action_result push: the next transaction then executes exactly `secs` seconds
   /// after the block that included the previous one.
   void skip_seconds( uint32_t secs ) {
      produce_block( fc::seconds(secs) - fc::milliseconds(config::block_interval_ms) );
   }

   abi_serializer token_abi_ser;
   abi_serializer stake_abi_ser;

private:
   void load_abi( const account_name& code, abi_serializer& ser ) {
      const auto& accnt = control->db().get<account_object,by_name>( code );
      abi_def abi;
      BOOST_REQUIRE_EQUAL( abi_serializer::to_abi(accnt.abi, abi), true );
      ser.set_abi( abi, abi_serializer::create_yield_function(abi_serializer_max_time) );
   }

   action_result push_contract_action( const account_name& code, abi_serializer& ser,
                                       const account_name& signer, const action_name& name, const variant_object& data ) {
      string action_type_name = ser.get_action_type(name);

      action act;
      act.account = code;
      act.name    = name;
      act.data    = ser.variant_to_binary( action_type_name, data, abi_serializer::create_yield_function(abi_serializer_max_time) );

      return base_tester::push_action( std::move(act), signer.to_uint64_t() );
   }

   const action_trace& find_action_trace( const transaction_trace_ptr& trace, const account_name& receiver, const action_name& act_name ) {
      BOOST_REQUIRE( trace );
      if( trace->except ) {
         BOOST_FAIL( trace->except->to_detail_string() );
      }
      for( const auto& at : trace->action_traces ) {
         if( at.receiver == receiver && at.act.name == act_name ) return at;
      }
      BOOST_FAIL( "action trace not found: " + receiver.to_string() + "::" + act_name.to_string() );
      return trace->action_traces.front();
   }
};

/// stake.ledger initialised against 4,TST with 1000.0000 TST for alice and bob
class stake_ledger_fixture : public stakeledger_tester {
public:
   stake_ledger_fixture() {
      BOOST_REQUIRE_EQUAL( success(), create( ADMIN, tst("1000000.0000") ) );
      BOOST_REQUIRE_EQUAL( success(), issue( ADMIN, tst("1000000.0000"), "issue" ) );
      BOOST_REQUIRE_EQUAL( success(), transfer( ADMIN, "alice"_n, tst("1000.0000"), "fund" ) );
      BOOST_REQUIRE_EQUAL( success(), transfer( ADMIN, "bob"_n, tst("1000.0000"), "fund" ) );

      BOOST_REQUIRE_EQUAL( success(), init( ADMIN, TOKEN, TST_SYM_STR, MIN_STAKING_PERIOD ) );
   }

   action_result fund_reward( asset quantity, const string& memo = "reward" ) {
      return transfer( ADMIN, STAKE, quantity, memo );
   }
};
