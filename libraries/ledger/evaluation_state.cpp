#include <nftex/ledger/claim_vault.hpp>
#include <nftex/ledger/config.hpp>
#include <nftex/ledger/evaluation_state.hpp>
#include <nftex/ledger/exceptions.hpp>
#include <nftex/ledger/operation_factory.hpp>
#include <nftex/ledger/pending_ledger_state.hpp>

#include <fc/log/logger.hpp>

namespace nftex { namespace ledger {

   evaluation_state::evaluation_state( pending_ledger_state_ptr pending_state, const market_services& services,
                                       const call_context& ctx )
   : context( ctx ), _pending_state( pending_state ), _services( services )
   {
      FC_ASSERT( _services.authority && _services.registry && _services.fees && _services.item_contracts );
   }

   void evaluation_state::evaluate( const operation& op )
   { try {
      if( context.attached_value < 0 )
         FC_CAPTURE_AND_THROW( invalid_amount, (context.attached_value) );

      operation_factory::instance().evaluate( *this, op );

      if( native_value_consumed != context.attached_value )
         FC_CAPTURE_AND_THROW( payment_mismatch, (context.attached_value)(native_value_consumed) );
   } FC_CAPTURE_AND_RETHROW( (op)(context) ) }

   bool evaluation_state::is_sale_ledger_deprecated()const
   {
      return !_services.registry->is_approved_listing_contract( _services.sale_ledger );
   }

   bool evaluation_state::is_auction_ledger_deprecated()const
   {
      return !_services.registry->is_approved_listing_contract( _services.auction_ledger );
   }

   bool evaluation_state::is_administrator( const address& addr )const
   {
      return _services.authority->is_administrator( addr );
   }

   item_contract_ptr evaluation_state::get_item_contract( const address& contract )const
   {
      const item_contract_ptr result = _services.item_contracts->find_item_contract( contract );
      if( !result )
         FC_CAPTURE_AND_THROW( unknown_item_contract, (contract) );
      return result;
   }

   void evaluation_state::check_listing_eligibility( const address& ledger, const item_reference& item,
                                                     const address& currency )const
   { try {
      const eligibility_registry& registry = *_services.registry;

      if( !registry.is_approved_listing_contract( ledger ) )
         FC_CAPTURE_AND_THROW( ledger_deprecated, (ledger) );

      if( !registry.is_approved_listing_contract( item.contract ) )
         FC_CAPTURE_AND_THROW( unapproved_listing_contract, (item.contract) );

      if( !registry.is_approved_currency( currency ) )
         FC_CAPTURE_AND_THROW( unapproved_currency, (currency) );

      if( !get_item_contract( item.contract )->supports_interface( NFTEX_ROYALTY_INFO_INTERFACE_ID ) )
         FC_CAPTURE_AND_THROW( missing_royalty_support, (item.contract) );
   } FC_CAPTURE_AND_RETHROW( (ledger)(item)(currency) ) }

   void evaluation_state::collect_payment( const address& payer, const asset& amount )
   { try {
      if( amount.amount < 0 )
         FC_CAPTURE_AND_THROW( invalid_amount, (amount) );
      if( amount.amount == 0 ) return;

      if( amount.is_native() )
      {
         asset consumed( native_value_consumed );
         consumed += amount;
         native_value_consumed = consumed.amount;
      }

      external_transfer transfer;
      transfer.type = external_transfer::receive_payment;
      transfer.from = payer;
      transfer.amount = amount;
      transfers.push_back( transfer );
   } FC_CAPTURE_AND_RETHROW( (payer)(amount) ) }

   void evaluation_state::queue_payout( const address& payee, const asset& amount )
   { try {
      FC_ASSERT( amount.amount > 0 );

      external_transfer transfer;
      transfer.type = external_transfer::send_payment;
      transfer.to = payee;
      transfer.amount = amount;
      transfers.push_back( transfer );
   } FC_CAPTURE_AND_RETHROW( (payee)(amount) ) }

   void evaluation_state::queue_item_transfer( const item_reference& item, const address& from, const address& to,
                                               share_type quantity )
   { try {
      FC_ASSERT( quantity > 0 );

      external_transfer transfer;
      transfer.type = external_transfer::move_items;
      transfer.from = from;
      transfer.to = to;
      transfer.item = item;
      transfer.quantity = quantity;
      transfers.push_back( transfer );
   } FC_CAPTURE_AND_RETHROW( (item)(from)(to)(quantity) ) }

   void evaluation_state::pay_proceeds( const item_reference& item, const address& seller, const asset& gross )
   { try {
      FC_ASSERT( gross.amount >= 0 );

      const fee_info fee = _services.fees->get_fee_info( gross.amount );
      const asset fee_amount( fee.amount, gross.currency );
      asset remaining = gross;
      remaining -= fee_amount;

      // royalties are looked up at settlement, not at listing
      const royalty_info royalty = get_item_contract( item.contract )->get_royalty_info( item.item_id, gross.amount );
      asset royalty_amount( 0, gross.currency );
      if( !royalty.receiver.is_null() && royalty.receiver != seller && royalty.amount > 0 )
      {
         royalty_amount.amount = royalty.amount;
         if( royalty_amount > remaining )
         {
            wlog( "royalty of ${r} exceeds the ${n} left after fees, paying ${n}",
                  ("r",royalty.amount)("n",remaining.amount) );
            royalty_amount = remaining;
         }
      }
      remaining -= royalty_amount;

      claim_vault vault( *pending_state() );
      vault.credit( fee.recipient, fee_amount );
      vault.credit( royalty.receiver, royalty_amount );
      vault.credit( seller, remaining );

      ilog( "proceeds of ${g}: fee ${f} to ${fr}, royalty ${r} to ${rr}, ${s} to seller ${sl}",
            ("g",gross)("f",fee_amount.amount)("fr",fee.recipient)
            ("r",royalty_amount.amount)("rr",royalty.receiver)("s",remaining.amount)("sl",seller) );
   } FC_CAPTURE_AND_RETHROW( (item)(seller)(gross) ) }

} } // nftex::ledger
