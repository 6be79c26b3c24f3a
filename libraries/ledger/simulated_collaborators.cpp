#include <nftex/ledger/config.hpp>
#include <nftex/ledger/exceptions.hpp>
#include <nftex/ledger/simulated_collaborators.hpp>

#include <fc/log/logger.hpp>

namespace nftex { namespace ledger {

   simulated_item_contract::simulated_item_contract( bool royalty_support )
   : _royalty_support( royalty_support )
   {
   }

   void simulated_item_contract::set_royalty( const address& receiver, share_type rate, share_type scale )
   {
      FC_ASSERT( rate >= 0 && scale > 0 );
      _royalty_receiver = receiver;
      _royalty_rate = rate;
      _royalty_scale = scale;
      _fixed_royalty.reset();
   }

   void simulated_item_contract::set_fixed_royalty( const address& receiver, share_type amount )
   {
      _royalty_receiver = receiver;
      _fixed_royalty = amount;
   }

   void simulated_item_contract::mint_unique( const address& owner, item_id_type item_id )
   {
      FC_ASSERT( !owner.is_null() );
      FC_ASSERT( _owners.count( item_id ) == 0, "item ${i} already exists", ("i",item_id) );
      _owners[ item_id ] = owner;
   }

   void simulated_item_contract::mint( const address& owner, item_id_type item_id, share_type quantity )
   {
      FC_ASSERT( !owner.is_null() && quantity > 0 );
      _balances[ std::make_pair( owner, item_id ) ] += quantity;
   }

   bool simulated_item_contract::supports_interface( uint32_t interface_id )const
   {
      return interface_id == NFTEX_ROYALTY_INFO_INTERFACE_ID && _royalty_support;
   }

   royalty_info simulated_item_contract::get_royalty_info( item_id_type item_id, share_type sale_amount )const
   {
      royalty_info info;
      info.receiver = _royalty_receiver;
      if( _fixed_royalty.valid() )
         info.amount = *_fixed_royalty;
      else if( !_royalty_receiver.is_null() )
         info.amount = scale_amount( sale_amount, _royalty_rate, _royalty_scale );
      return info;
   }

   address simulated_item_contract::owner_of( item_id_type item_id )const
   {
      const auto itr = _owners.find( item_id );
      if( itr == _owners.end() ) return address();
      return itr->second;
   }

   share_type simulated_item_contract::balance_of( const address& owner, item_id_type item_id )const
   {
      const auto itr = _balances.find( std::make_pair( owner, item_id ) );
      if( itr == _balances.end() ) return 0;
      return itr->second;
   }

   void simulated_item_contract::transfer_unique_item( const address& from, const address& to, item_id_type item_id )
   {
      FC_ASSERT( _transfers_enabled, "item transfers are paused" );
      FC_ASSERT( owner_of( item_id ) == from, "${f} does not own item ${i}", ("f",from)("i",item_id) );
      FC_ASSERT( !to.is_null() );
      _owners[ item_id ] = to;
      if( !_on_transfer ) return;

      // a throwing receive hook reverts the transfer
      try
      {
         _on_transfer( from, to, item_id, 1 );
      }
      catch( ... )
      {
         _owners[ item_id ] = from;
         throw;
      }
   }

   void simulated_item_contract::transfer_quantity( const address& from, const address& to,
                                                    item_id_type item_id, share_type quantity )
   {
      FC_ASSERT( _transfers_enabled, "item transfers are paused" );
      FC_ASSERT( quantity > 0 && balance_of( from, item_id ) >= quantity,
                 "${f} holds fewer than ${q} of item ${i}", ("f",from)("q",quantity)("i",item_id) );
      FC_ASSERT( !to.is_null() );
      _balances[ std::make_pair( from, item_id ) ] -= quantity;
      _balances[ std::make_pair( to, item_id ) ] += quantity;
      if( !_on_transfer ) return;

      try
      {
         _on_transfer( from, to, item_id, quantity );
      }
      catch( ... )
      {
         _balances[ std::make_pair( to, item_id ) ] -= quantity;
         _balances[ std::make_pair( from, item_id ) ] += quantity;
         throw;
      }
   }

   void simulated_item_directory::add_item_contract( const address& contract_address, const item_contract_ptr& contract )
   {
      FC_ASSERT( contract );
      _contracts[ contract_address ] = contract;
   }

   item_contract_ptr simulated_item_directory::find_item_contract( const address& contract )const
   {
      const auto itr = _contracts.find( contract );
      if( itr == _contracts.end() ) return item_contract_ptr();
      return itr->second;
   }

   void simulated_payment_rail::deposit( const address& owner, const asset& amount )
   {
      FC_ASSERT( amount.amount >= 0 );
      asset balance = get_wallet_balance( owner, amount.currency );
      balance += amount;
      _wallets[ std::make_pair( owner, amount.currency ) ] = balance.amount;
   }

   void simulated_payment_rail::approve( const address& owner, const address& token, share_type amount )
   {
      FC_ASSERT( amount >= 0 );
      _allowances[ std::make_pair( owner, token ) ] = amount;
   }

   asset simulated_payment_rail::get_wallet_balance( const address& owner, const address& currency )const
   {
      const auto itr = _wallets.find( std::make_pair( owner, currency ) );
      if( itr == _wallets.end() ) return asset( 0, currency );
      return asset( itr->second, currency );
   }

   asset simulated_payment_rail::get_treasury_balance( const address& currency )const
   {
      const auto itr = _treasury.find( currency );
      if( itr == _treasury.end() ) return asset( 0, currency );
      return asset( itr->second, currency );
   }

   share_type simulated_payment_rail::get_allowance( const address& owner, const address& token )const
   {
      const auto itr = _allowances.find( std::make_pair( owner, token ) );
      if( itr == _allowances.end() ) return 0;
      return itr->second;
   }

   void simulated_payment_rail::set_rejects_payments( const address& recipient, bool rejects )
   {
      if( rejects ) _rejecting.insert( recipient );
      else _rejecting.erase( recipient );
   }

   void simulated_payment_rail::withdraw_from_wallet( const address& owner, const asset& amount )
   {
      asset balance = get_wallet_balance( owner, amount.currency );
      if( balance < amount )
         FC_THROW( "${o} holds ${b}, cannot pay ${a}", ("o",owner)("b",balance)("a",amount) );
      balance -= amount;
      _wallets[ std::make_pair( owner, amount.currency ) ] = balance.amount;

      asset treasury = get_treasury_balance( amount.currency );
      treasury += amount;
      _treasury[ amount.currency ] = treasury.amount;
   }

   void simulated_payment_rail::pay_out( const address& to, const asset& amount )
   {
      if( _rejecting.count( to ) > 0 )
         FC_THROW( "${t} rejected a payment of ${a}", ("t",to)("a",amount) );

      asset treasury = get_treasury_balance( amount.currency );
      if( treasury < amount )
         FC_THROW( "treasury holds ${t}, cannot pay ${a}", ("t",treasury)("a",amount) );
      treasury -= amount;
      _treasury[ amount.currency ] = treasury.amount;

      const asset previous_balance = get_wallet_balance( to, amount.currency );
      _wallets[ std::make_pair( to, amount.currency ) ] = ( previous_balance + amount ).amount;
      if( !_on_payout ) return;

      // a throwing receive hook reverts the payout
      try
      {
         _on_payout( to, amount );
      }
      catch( ... )
      {
         _wallets[ std::make_pair( to, amount.currency ) ] = previous_balance.amount;
         _treasury[ amount.currency ] = ( get_treasury_balance( amount.currency ) + amount ).amount;
         throw;
      }
   }

   void simulated_payment_rail::receive_native( const address& from, share_type amount )
   {
      withdraw_from_wallet( from, asset( amount, NFTEX_NATIVE_CURRENCY ) );
   }

   void simulated_payment_rail::pull_token( const address& token, const address& from, share_type amount )
   {
      FC_ASSERT( !token.is_null() );
      const share_type allowance = get_allowance( from, token );
      if( allowance < amount )
         FC_THROW( "${f} allowed ${a} of ${t}, cannot pull ${n}", ("f",from)("a",allowance)("t",token)("n",amount) );
      withdraw_from_wallet( from, asset( amount, token ) );
      _allowances[ std::make_pair( from, token ) ] = allowance - amount;
   }

   void simulated_payment_rail::send_native( const address& to, share_type amount )
   {
      pay_out( to, asset( amount, NFTEX_NATIVE_CURRENCY ) );
   }

   void simulated_payment_rail::send_token( const address& token, const address& to, share_type amount )
   {
      FC_ASSERT( !token.is_null() );
      pay_out( to, asset( amount, token ) );
   }

} } // nftex::ledger
