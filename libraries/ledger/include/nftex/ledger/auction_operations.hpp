#pragma once

#include <nftex/ledger/asset.hpp>
#include <nftex/ledger/operations.hpp>
#include <nftex/ledger/types.hpp>

namespace nftex { namespace ledger {

   /** Puts one unit of an item up for auction with a reserve price. */
   struct create_auction_operation
   {
      static const operation_type_enum type;

      item_reference      item;
      time_point_sec      start_time;
      time_point_sec      end_time;
      asset               reserve_price;

      void evaluate( evaluation_state& eval_state )const;
   };

   /**
    *  Raises the caller's standing bid by amount_from_vault + external_funds.
    *  The resulting total must exceed the current highest bid and meet the
    *  reserve price.
    */
   struct auction_bid_operation
   {
      static const operation_type_enum type;

      auction_id_type     auction_id = 0;
      share_type          amount_from_vault = 0;
      share_type          external_funds = 0;

      void evaluate( evaluation_state& eval_state )const;
   };

   /**
    *  Settles an ended or cancelled auction.  A winning bid is paid out to the
    *  fee recipient, royalty receiver and seller and the item goes to the
    *  winner; otherwise the item returns to the seller.
    */
   struct resolve_auction_operation
   {
      static const operation_type_enum type;

      auction_id_type     auction_id = 0;

      void evaluate( evaluation_state& eval_state )const;
   };

   struct cancel_auction_operation
   {
      static const operation_type_enum type;

      auction_id_type     auction_id = 0;

      void evaluate( evaluation_state& eval_state )const;
   };

} } // nftex::ledger

FC_REFLECT( nftex::ledger::create_auction_operation, (item)(start_time)(end_time)(reserve_price) )
FC_REFLECT( nftex::ledger::auction_bid_operation, (auction_id)(amount_from_vault)(external_funds) )
FC_REFLECT( nftex::ledger::resolve_auction_operation, (auction_id) )
FC_REFLECT( nftex::ledger::cancel_auction_operation, (auction_id) )
