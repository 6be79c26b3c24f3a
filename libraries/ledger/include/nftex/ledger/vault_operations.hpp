#pragma once

#include <nftex/ledger/operations.hpp>
#include <nftex/ledger/types.hpp>

namespace nftex { namespace ledger {

   /** Withdraws the caller's entire claimable balance in one currency. */
   struct claim_balance_operation
   {
      static const operation_type_enum type;

      address             currency;

      void evaluate( evaluation_state& eval_state )const;
   };

} } // nftex::ledger

FC_REFLECT( nftex::ledger::claim_balance_operation, (currency) )
