#pragma once

#include <nftex/ledger/asset.hpp>
#include <nftex/ledger/ledger_interface.hpp>

namespace nftex { namespace ledger {

   /**
    *  Per-owner, per-currency balances owed by the marketplace.  Every payout the
    *  ledger makes is first credited here; owners withdraw with a claim or spend
    *  the balance on later purchases and bids.
    */
   class claim_vault
   {
      public:
         explicit claim_vault( ledger_interface& db );

         asset   get_balance( const address& owner, const address& currency )const;

         /** zero amounts are ignored */
         void    credit( const address& owner, const asset& amount );
         /** throws insufficient_vault_balance if the owner holds less than amount */
         void    debit( const address& owner, const asset& amount );

         asset   get_escrow( const address& currency )const;
         void    deposit_escrow( const asset& amount );
         void    release_escrow( const asset& amount );

      private:
         ledger_interface& _db;
   };

} } // nftex::ledger
