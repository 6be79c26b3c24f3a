#include <nftex/ledger/eligibility_registry.hpp>
#include <nftex/ledger/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace nftex { namespace ledger {

   eligibility_registry::eligibility_registry( admin_authority_ptr authority )
   : _authority( authority )
   {
      FC_ASSERT( _authority );
   }

   bool eligibility_registry::is_approved_listing_contract( const address& contract )const
   {
      return _listing_contracts.count( contract ) > 0;
   }

   bool eligibility_registry::is_approved_currency( const address& currency )const
   {
      return _all_currencies_approved || _currencies.count( currency ) > 0;
   }

   void eligibility_registry::set_listing_contract_approval( const address& caller, const address& contract, bool approved )
   { try {
      _authority->require_administrator( caller );
      if( contract.is_null() )
         FC_CAPTURE_AND_THROW( invalid_parameters, (contract) );

      const bool changed = approved ? _listing_contracts.insert( contract ).second
                                    : _listing_contracts.erase( contract ) > 0;
      if( !changed ) return;

      ilog( "listing contract ${c} ${s}", ("c",contract)("s",approved ? "approved" : "revoked") );
      listing_contract_approval_changed( contract, approved );
   } FC_CAPTURE_AND_RETHROW( (caller)(contract)(approved) ) }

   void eligibility_registry::set_currency_approval( const address& caller, const address& currency, bool approved )
   { try {
      _authority->require_administrator( caller );

      const bool changed = approved ? _currencies.insert( currency ).second
                                    : _currencies.erase( currency ) > 0;
      if( !changed ) return;

      ilog( "currency ${c} ${s}", ("c",currency)("s",approved ? "approved" : "revoked") );
      currency_approval_changed( currency, approved );
   } FC_CAPTURE_AND_RETHROW( (caller)(currency)(approved) ) }

   void eligibility_registry::approve_all_currencies( const address& caller )
   { try {
      _authority->require_administrator( caller );
      if( _all_currencies_approved ) return;

      _all_currencies_approved = true;
      ilog( "all currencies approved" );
      all_currencies_approved();
   } FC_CAPTURE_AND_RETHROW( (caller) ) }

   void eligibility_registry::load( const set<address>& listing_contracts, const set<address>& currencies,
                                    bool all_currencies_approved )
   {
      _listing_contracts = listing_contracts;
      _listing_contracts.erase( address() );
      _currencies = currencies;
      _all_currencies_approved = all_currencies_approved;
   }

} } // nftex::ledger
