#pragma once

#include <nftex/ledger/config.hpp>
#include <nftex/ledger/types.hpp>

namespace nftex { namespace ledger {

   /** Initial marketplace policy, loaded from the "market" section of a config file. */
   struct market_config
   {
      market_config()
      :sale_ledger( address::from_label( "nftex.sale_ledger" ) ),
       auction_ledger( address::from_label( "nftex.auction_ledger" ) ),
       fee_rate( NFTEX_DEFAULT_FEE_RATE ),
       fee_scale( NFTEX_DEFAULT_FEE_SCALE ),
       approve_all_currencies( false ){}

      address            sale_ledger;
      address            auction_ledger;

      /** the first administrator applies the rest of this config */
      vector<address>    administrators;

      address            fee_recipient;
      share_type         fee_rate;
      share_type         fee_scale;

      vector<address>    approved_item_contracts;
      vector<address>    approved_currencies;
      bool               approve_all_currencies;
   };

   /**
    *  The administrative state as it stands after every policy change: stored
    *  as the market_policy property so that a reopened ledger keeps it instead
    *  of starting again from market_config.
    */
   struct market_policy
   {
      market_policy():fee_rate(0),fee_scale(1),all_currencies_approved(false){}

      set<address>       administrators;
      address            fee_recipient;
      share_type         fee_rate;
      share_type         fee_scale;
      set<address>       listing_contracts;
      set<address>       currencies;
      bool               all_currencies_approved;
   };

} } // nftex::ledger

FC_REFLECT( nftex::ledger::market_config,
            (sale_ledger)
            (auction_ledger)
            (administrators)
            (fee_recipient)
            (fee_rate)
            (fee_scale)
            (approved_item_contracts)
            (approved_currencies)
            (approve_all_currencies)
            )
FC_REFLECT( nftex::ledger::market_policy,
            (administrators)
            (fee_recipient)
            (fee_rate)
            (fee_scale)
            (listing_contracts)
            (currencies)
            (all_currencies_approved)
            )
