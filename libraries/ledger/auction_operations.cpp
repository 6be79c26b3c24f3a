#include <nftex/ledger/auction_operations.hpp>
#include <nftex/ledger/claim_vault.hpp>
#include <nftex/ledger/config.hpp>
#include <nftex/ledger/evaluation_state.hpp>
#include <nftex/ledger/exceptions.hpp>
#include <nftex/ledger/item_custody.hpp>
#include <nftex/ledger/pending_ledger_state.hpp>

#include <fc/log/logger.hpp>

namespace nftex { namespace ledger {

namespace
{
   auction_record get_auction( const evaluation_state& eval_state, const auction_id_type auction_id )
   {
      const oauction_record auction = eval_state.pending_state()->get_auction_record( auction_id );
      if( !auction.valid() )
         FC_CAPTURE_AND_THROW( unknown_auction, (auction_id) );
      return *auction;
   }

   auction_status get_status( const evaluation_state& eval_state, const auction_record& auction )
   {
      return auction.status( eval_state.pending_state()->now(), eval_state.is_auction_ledger_deprecated() );
   }

   bid_record get_bid( const evaluation_state& eval_state, const auction_id_type auction_id, const address& bidder )
   {
      bid_record bid;
      bid.index = bid_index( auction_id, bidder );
      const obid_record prev_bid = eval_state.pending_state()->get_bid_record( bid.index );
      if( prev_bid.valid() ) bid = *prev_bid;
      return bid;
   }

   /** moves the highest standing bid out of escrow and back into the bidder's claim balance */
   void refund_highest_bid( evaluation_state& eval_state, auction_record& auction )
   {
      if( !auction.has_bids() ) return;

      pending_ledger_state* pending = eval_state.pending_state();
      bid_record bid = get_bid( eval_state, auction.id, auction.highest_bidder );
      const asset refund( bid.amount, auction.reserve_price.currency );

      claim_vault vault( *pending );
      vault.release_escrow( refund );
      vault.credit( bid.index.bidder, refund );

      bid.amount = 0;
      bid.last_update = pending->now();
      pending->store_bid_record( bid );

      auction.highest_bidder = address();
   }
}

void create_auction_operation::evaluate( evaluation_state& eval_state )const
{ try {
   const address& seller = eval_state.caller();
   const address& auction_ledger = eval_state.services().auction_ledger;

   eval_state.check_listing_eligibility( auction_ledger, this->item, this->reserve_price.currency );

   if( this->end_time <= this->start_time )
      FC_CAPTURE_AND_THROW( invalid_time_window, (start_time)(end_time) );

   if( this->reserve_price.amount < 0 || this->reserve_price.amount > NFTEX_LEDGER_MAX_SHARES )
      FC_CAPTURE_AND_THROW( invalid_amount, (reserve_price) );

   const item_custody& custody = get_item_custody( this->item.kind );
   const item_contract_ptr contract = eval_state.get_item_contract( this->item.contract );
   const share_type held = custody.held_by( *contract, seller, this->item.item_id );
   if( held < NFTEX_AUCTION_ITEM_QUANTITY )
      FC_CAPTURE_AND_THROW( insufficient_item_balance, (seller)(held) );

   pending_ledger_state* pending = eval_state.pending_state();

   auction_record auction;
   auction.id = pending->new_auction_id();
   auction.item = this->item;
   auction.seller = seller;
   auction.reserve_price = this->reserve_price;
   auction.start_time = this->start_time;
   auction.end_time = this->end_time;
   pending->store_auction_record( auction );

   eval_state.queue_item_transfer( this->item, seller, auction_ledger, NFTEX_AUCTION_ITEM_QUANTITY );
   eval_state.created_id = auction.id;

   ilog( "auction ${id} created by ${s} with reserve ${r}", ("id",auction.id)("s",seller)("r",reserve_price) );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

void auction_bid_operation::evaluate( evaluation_state& eval_state )const
{ try {
   const address& bidder = eval_state.caller();
   pending_ledger_state* pending = eval_state.pending_state();

   auction_record auction = get_auction( eval_state, this->auction_id );
   if( get_status( eval_state, auction ) != auction_status::active )
      FC_CAPTURE_AND_THROW( auction_not_active, (auction_id) );

   if( bidder == auction.seller )
      FC_CAPTURE_AND_THROW( seller_cannot_bid, (auction_id)(bidder) );

   if( this->amount_from_vault < 0 || this->external_funds < 0 )
      FC_CAPTURE_AND_THROW( invalid_amount, (amount_from_vault)(external_funds) );

   const address& currency = auction.reserve_price.currency;
   const asset from_vault( this->amount_from_vault, currency );
   const asset external( this->external_funds, currency );

   bid_record bid = get_bid( eval_state, auction.id, bidder );
   asset new_total( bid.amount, currency );
   new_total += from_vault;
   new_total += external;

   asset previous_highest( 0, currency );
   if( auction.has_bids() )
      previous_highest.amount = get_bid( eval_state, auction.id, auction.highest_bidder ).amount;

   if( new_total <= previous_highest )
      FC_CAPTURE_AND_THROW( bid_too_low, (new_total)(previous_highest) );

   if( new_total < auction.reserve_price )
      FC_CAPTURE_AND_THROW( bid_too_low, (new_total)(auction.reserve_price) );

   claim_vault vault( *pending );
   vault.debit( bidder, from_vault );
   eval_state.collect_payment( bidder, external );

   if( auction.has_bids() && auction.highest_bidder != bidder )
      refund_highest_bid( eval_state, auction );

   // escrow now holds only the caller's own standing bid, zero unless they were the incumbent
   vault.deposit_escrow( new_total - asset( bid.amount, currency ) );

   bid.amount = new_total.amount;
   bid.last_update = pending->now();
   pending->store_bid_record( bid );

   auction.highest_bidder = bidder;
   pending->store_auction_record( auction );

   ilog( "${b} bid ${t} on auction ${id}", ("b",bidder)("t",new_total)("id",auction_id) );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

void resolve_auction_operation::evaluate( evaluation_state& eval_state )const
{ try {
   const address& caller = eval_state.caller();
   pending_ledger_state* pending = eval_state.pending_state();

   auction_record auction = get_auction( eval_state, this->auction_id );
   if( auction.claimed )
      FC_CAPTURE_AND_THROW( auction_already_settled, (auction_id) );

   const auction_status status = get_status( eval_state, auction );
   if( status != auction_status::ended && status != auction_status::cancelled )
      FC_CAPTURE_AND_THROW( auction_not_finished, (auction_id)(status) );

   if( caller != auction.seller && caller != auction.highest_bidder && !eval_state.is_administrator( caller ) )
      FC_CAPTURE_AND_THROW( unauthorized, (auction_id)(caller) );

   const address& auction_ledger = eval_state.services().auction_ledger;
   const address& currency = auction.reserve_price.currency;

   bid_record winning_bid;
   if( auction.has_bids() )
      winning_bid = get_bid( eval_state, auction.id, auction.highest_bidder );

   const bool sold = status == auction_status::ended
                     && auction.has_bids()
                     && winning_bid.amount > 0
                     && winning_bid.amount >= auction.reserve_price.amount;

   if( sold )
   {
      const asset gross( winning_bid.amount, currency );

      claim_vault vault( *pending );
      vault.release_escrow( gross );

      winning_bid.amount = 0;
      winning_bid.last_update = pending->now();
      pending->store_bid_record( winning_bid );

      eval_state.pay_proceeds( auction.item, auction.seller, gross );
      eval_state.queue_item_transfer( auction.item, auction_ledger, auction.highest_bidder, NFTEX_AUCTION_ITEM_QUANTITY );

      ilog( "auction ${id} won by ${w} for ${g}", ("id",auction_id)("w",auction.highest_bidder)("g",gross) );
   }
   else
   {
      // a bid left standing by a deprecated ledger still has to be returned
      refund_highest_bid( eval_state, auction );
      eval_state.queue_item_transfer( auction.item, auction_ledger, auction.seller, NFTEX_AUCTION_ITEM_QUANTITY );

      ilog( "auction ${id} closed without a sale, returning the item to ${s}", ("id",auction_id)("s",auction.seller) );
   }

   auction.claimed = true;
   pending->store_auction_record( auction );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

void cancel_auction_operation::evaluate( evaluation_state& eval_state )const
{ try {
   auction_record auction = get_auction( eval_state, this->auction_id );

   const address& caller = eval_state.caller();
   if( caller != auction.seller && !eval_state.is_administrator( caller ) )
      FC_CAPTURE_AND_THROW( not_seller, (auction_id)(caller) );

   const auction_status status = get_status( eval_state, auction );
   if( status != auction_status::active && status != auction_status::pending )
      FC_CAPTURE_AND_THROW( auction_not_active, (auction_id)(status) );

   refund_highest_bid( eval_state, auction );

   auction.cancelled = true;
   eval_state.pending_state()->store_auction_record( auction );

   ilog( "auction ${id} cancelled by ${c}", ("id",auction_id)("c",caller) );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

} } // nftex::ledger
