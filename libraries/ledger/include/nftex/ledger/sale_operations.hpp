#pragma once

#include <nftex/ledger/asset.hpp>
#include <nftex/ledger/operations.hpp>
#include <nftex/ledger/types.hpp>

namespace nftex { namespace ledger {

   /**
    *  Lists quantity units of an item at a fixed unit price.  The seller is the
    *  caller; the units move into the sale ledger's custody when the operation
    *  settles.
    */
   struct create_sale_operation
   {
      static const operation_type_enum type;

      item_reference      item;
      share_type          quantity = 0;
      time_point_sec      start_time;
      time_point_sec      end_time;
      asset               price;

      void evaluate( evaluation_state& eval_state )const;
   };

   /**
    *  Buys quantity units from an active sale.  amount_from_vault is spent from
    *  the buyer's claimable balance, the rest of the gross price is paid
    *  externally: attached to the call for the native currency, pulled from the
    *  buyer for a token.
    */
   struct buy_sale_operation
   {
      static const operation_type_enum type;

      sale_id_type        sale_id = 0;
      address             recipient;          ///< receives the items, the buyer if null
      share_type          quantity = 0;
      share_type          amount_from_vault = 0;

      void evaluate( evaluation_state& eval_state )const;
   };

   /** Returns the units left in a finished or cancelled sale to its seller. */
   struct claim_sale_items_operation
   {
      static const operation_type_enum type;

      sale_id_type        sale_id = 0;

      void evaluate( evaluation_state& eval_state )const;
   };

   struct cancel_sale_operation
   {
      static const operation_type_enum type;

      sale_id_type        sale_id = 0;

      void evaluate( evaluation_state& eval_state )const;
   };

} } // nftex::ledger

FC_REFLECT( nftex::ledger::create_sale_operation, (item)(quantity)(start_time)(end_time)(price) )
FC_REFLECT( nftex::ledger::buy_sale_operation, (sale_id)(recipient)(quantity)(amount_from_vault) )
FC_REFLECT( nftex::ledger::claim_sale_items_operation, (sale_id) )
FC_REFLECT( nftex::ledger::cancel_sale_operation, (sale_id) )
