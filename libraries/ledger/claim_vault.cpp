#include <nftex/ledger/claim_vault.hpp>
#include <nftex/ledger/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace nftex { namespace ledger {

   claim_vault::claim_vault( ledger_interface& db )
   : _db( db )
   {
   }

   asset claim_vault::get_balance( const address& owner, const address& currency )const
   { try {
      const oclaim_balance_record record = _db.get_claim_balance_record( claim_balance_index{ owner, currency } );
      if( !record.valid() ) return asset( 0, currency );
      return record->get_balance();
   } FC_CAPTURE_AND_RETHROW( (owner)(currency) ) }

   void claim_vault::credit( const address& owner, const asset& amount )
   { try {
      FC_ASSERT( amount.amount >= 0 );
      if( amount.amount == 0 ) return;
      if( owner.is_null() )
         FC_THROW_EXCEPTION( internal_fault, "cannot credit the null address" );

      claim_balance_record record;
      record.index = claim_balance_index{ owner, amount.currency };
      const oclaim_balance_record prev_record = _db.get_claim_balance_record( record.index );
      if( prev_record.valid() ) record = *prev_record;

      asset balance = record.get_balance();
      balance += amount;
      record.balance = balance.amount;
      record.last_update = _db.now();
      _db.store_claim_balance_record( record );

      dlog( "credited ${a} to ${o}", ("a",amount)("o",owner) );
   } FC_CAPTURE_AND_RETHROW( (owner)(amount) ) }

   void claim_vault::debit( const address& owner, const asset& amount )
   { try {
      FC_ASSERT( amount.amount >= 0 );
      if( amount.amount == 0 ) return;

      const claim_balance_index index{ owner, amount.currency };
      oclaim_balance_record record = _db.get_claim_balance_record( index );
      if( !record.valid() || record->balance < amount.amount )
         FC_CAPTURE_AND_THROW( insufficient_vault_balance, (owner)(amount)(get_balance( owner, amount.currency )) );

      asset balance = record->get_balance();
      balance -= amount;
      record->balance = balance.amount;
      record->last_update = _db.now();
      _db.store_claim_balance_record( *record );

      dlog( "debited ${a} from ${o}", ("a",amount)("o",owner) );
   } FC_CAPTURE_AND_RETHROW( (owner)(amount) ) }

   asset claim_vault::get_escrow( const address& currency )const
   { try {
      const oescrow_record record = _db.get_escrow_record( currency );
      if( !record.valid() ) return asset( 0, currency );
      return record->get_balance();
   } FC_CAPTURE_AND_RETHROW( (currency) ) }

   void claim_vault::deposit_escrow( const asset& amount )
   { try {
      FC_ASSERT( amount.amount >= 0 );
      if( amount.amount == 0 ) return;

      asset balance = get_escrow( amount.currency );
      balance += amount;

      escrow_record record;
      record.currency = amount.currency;
      record.balance = balance.amount;
      _db.store_escrow_record( record );
   } FC_CAPTURE_AND_RETHROW( (amount) ) }

   void claim_vault::release_escrow( const asset& amount )
   { try {
      FC_ASSERT( amount.amount >= 0 );
      if( amount.amount == 0 ) return;

      asset balance = get_escrow( amount.currency );
      if( balance < amount )
         FC_THROW_EXCEPTION( internal_fault, "escrow of ${b} cannot release ${a}", ("b",balance)("a",amount) );
      balance -= amount;

      escrow_record record;
      record.currency = amount.currency;
      record.balance = balance.amount;
      _db.store_escrow_record( record );
   } FC_CAPTURE_AND_RETHROW( (amount) ) }

} } // nftex::ledger
