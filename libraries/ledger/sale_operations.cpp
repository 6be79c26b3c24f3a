#include <nftex/ledger/claim_vault.hpp>
#include <nftex/ledger/config.hpp>
#include <nftex/ledger/evaluation_state.hpp>
#include <nftex/ledger/exceptions.hpp>
#include <nftex/ledger/item_custody.hpp>
#include <nftex/ledger/pending_ledger_state.hpp>
#include <nftex/ledger/sale_operations.hpp>

#include <fc/log/logger.hpp>

namespace nftex { namespace ledger {

namespace
{
   sale_record get_sale( const evaluation_state& eval_state, const sale_id_type sale_id )
   {
      const osale_record sale = eval_state.pending_state()->get_sale_record( sale_id );
      if( !sale.valid() )
         FC_CAPTURE_AND_THROW( unknown_sale, (sale_id) );
      return *sale;
   }

   sale_status get_status( const evaluation_state& eval_state, const sale_record& sale )
   {
      return sale.status( eval_state.pending_state()->now(), eval_state.is_sale_ledger_deprecated() );
   }
}

void create_sale_operation::evaluate( evaluation_state& eval_state )const
{ try {
   const address& seller = eval_state.caller();
   const address& sale_ledger = eval_state.services().sale_ledger;

   eval_state.check_listing_eligibility( sale_ledger, this->item, this->price.currency );

   const item_custody& custody = get_item_custody( this->item.kind );
   custody.validate_quantity( this->quantity );

   if( this->end_time <= this->start_time )
      FC_CAPTURE_AND_THROW( invalid_time_window, (start_time)(end_time) );

   if( this->price.amount < 0 || this->price.amount > NFTEX_LEDGER_MAX_SHARES )
      FC_CAPTURE_AND_THROW( invalid_amount, (price) );

   // the full lot must be payable without overflow
   const asset lot_price = multiply( this->price, this->quantity );

   const item_contract_ptr contract = eval_state.get_item_contract( this->item.contract );
   const share_type held = custody.held_by( *contract, seller, this->item.item_id );
   if( held < this->quantity )
      FC_CAPTURE_AND_THROW( insufficient_item_balance, (seller)(held)(quantity) );

   pending_ledger_state* pending = eval_state.pending_state();

   sale_record sale;
   sale.id = pending->new_sale_id();
   sale.item = this->item;
   sale.seller = seller;
   sale.price = this->price;
   sale.amount = this->quantity;
   sale.start_time = this->start_time;
   sale.end_time = this->end_time;
   pending->store_sale_record( sale );

   eval_state.queue_item_transfer( this->item, seller, sale_ledger, this->quantity );
   eval_state.created_id = sale.id;

   ilog( "sale ${id} created by ${s}: ${q} x ${p}, ${t} in total", ("id",sale.id)("s",seller)("q",quantity)("p",price)("t",lot_price) );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

void buy_sale_operation::evaluate( evaluation_state& eval_state )const
{ try {
   const address& buyer = eval_state.caller();
   pending_ledger_state* pending = eval_state.pending_state();

   sale_record sale = get_sale( eval_state, this->sale_id );
   if( get_status( eval_state, sale ) != sale_status::active )
      FC_CAPTURE_AND_THROW( sale_not_active, (sale_id) );

   if( this->quantity <= 0 )
      FC_CAPTURE_AND_THROW( invalid_quantity, (quantity) );

   if( this->quantity > sale.remaining() )
      FC_CAPTURE_AND_THROW( insufficient_stock, (quantity)(sale.remaining()) );

   if( this->amount_from_vault < 0 )
      FC_CAPTURE_AND_THROW( invalid_amount, (amount_from_vault) );

   const asset gross = multiply( sale.price, this->quantity );
   const asset from_vault( this->amount_from_vault, sale.price.currency );
   if( from_vault > gross )
      FC_CAPTURE_AND_THROW( payment_mismatch, (gross)(from_vault) );

   claim_vault vault( *pending );
   vault.debit( buyer, from_vault );
   eval_state.collect_payment( buyer, gross - from_vault );

   eval_state.pay_proceeds( sale.item, sale.seller, gross );

   sale.purchased += this->quantity;
   pending->store_sale_record( sale );

   const sale_purchase_index index( sale.id, buyer );
   sale_purchase_record purchase;
   purchase.index = index;
   const osale_purchase_record prev_purchase = pending->get_sale_purchase_record( index );
   if( prev_purchase.valid() ) purchase = *prev_purchase;
   purchase.quantity += this->quantity;
   pending->store_sale_purchase_record( purchase );

   const address recipient = this->recipient.is_null() ? buyer : this->recipient;
   eval_state.queue_item_transfer( sale.item, eval_state.services().sale_ledger, recipient, this->quantity );

   ilog( "${b} bought ${q} from sale ${id} for ${g}", ("b",buyer)("q",quantity)("id",sale_id)("g",gross) );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

void claim_sale_items_operation::evaluate( evaluation_state& eval_state )const
{ try {
   sale_record sale = get_sale( eval_state, this->sale_id );

   const sale_status status = get_status( eval_state, sale );
   if( status != sale_status::ended && status != sale_status::cancelled )
      FC_CAPTURE_AND_THROW( sale_not_finished, (sale_id)(status) );

   if( eval_state.caller() != sale.seller )
      FC_CAPTURE_AND_THROW( not_seller, (sale_id)(eval_state.caller()) );

   const share_type remaining = sale.remaining();
   if( remaining <= 0 )
      FC_CAPTURE_AND_THROW( nothing_to_claim, (sale_id) );

   sale.purchased = sale.amount;
   eval_state.pending_state()->store_sale_record( sale );

   eval_state.queue_item_transfer( sale.item, eval_state.services().sale_ledger, sale.seller, remaining );

   ilog( "seller ${s} reclaimed ${q} from sale ${id}", ("s",sale.seller)("q",remaining)("id",sale_id) );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

void cancel_sale_operation::evaluate( evaluation_state& eval_state )const
{ try {
   sale_record sale = get_sale( eval_state, this->sale_id );

   const address& caller = eval_state.caller();
   if( caller != sale.seller && !eval_state.is_administrator( caller ) )
      FC_CAPTURE_AND_THROW( not_seller, (sale_id)(caller) );

   const sale_status status = get_status( eval_state, sale );
   if( status != sale_status::active && status != sale_status::pending )
      FC_CAPTURE_AND_THROW( sale_not_active, (sale_id)(status) );

   sale.cancelled = true;
   eval_state.pending_state()->store_sale_record( sale );

   ilog( "sale ${id} cancelled by ${c}", ("id",sale_id)("c",caller) );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

} } // nftex::ledger
