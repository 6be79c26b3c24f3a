#pragma once

#include <nftex/ledger/admin_authority.hpp>
#include <nftex/ledger/types.hpp>

#include <fc/signals.hpp>

namespace nftex { namespace ledger {

   /**
    *  Allow-lists consulted before anything can be listed.
    *
    *  Listing contracts are the item contracts that may be sold, plus the sale
    *  and auction ledgers themselves: removing a ledger's address deprecates it,
    *  which cancels all of its listings.  Currencies may be approved one by one,
    *  or all at once; the blanket approval cannot be revoked.
    */
   class eligibility_registry
   {
      public:
         eligibility_registry( admin_authority_ptr authority );

         bool        is_approved_listing_contract( const address& contract )const;
         bool        is_approved_currency( const address& currency )const;
         bool        are_all_currencies_approved()const { return _all_currencies_approved; }

         void        set_listing_contract_approval( const address& caller, const address& contract, bool approved );
         void        set_currency_approval( const address& caller, const address& currency, bool approved );
         void        approve_all_currencies( const address& caller );

         const set<address>& get_approved_listing_contracts()const { return _listing_contracts; }
         const set<address>& get_approved_currencies()const { return _currencies; }

         /** restores stored approvals without an authority check or notifications */
         void        load( const set<address>& listing_contracts, const set<address>& currencies,
                           bool all_currencies_approved );

         /** emitted only when an approval actually changes */
         fc::signal<void( const address&, bool )> listing_contract_approval_changed;
         fc::signal<void( const address&, bool )> currency_approval_changed;
         fc::signal<void()>                       all_currencies_approved;

      private:
         admin_authority_ptr _authority;
         set<address>        _listing_contracts;
         set<address>        _currencies;
         bool                _all_currencies_approved = false;
   };
   typedef std::shared_ptr<eligibility_registry> eligibility_registry_ptr;

} } // nftex::ledger
