#include <nftex/ledger/balance_record.hpp>
#include <nftex/ledger/config.hpp>
#include <nftex/ledger/ledger_interface.hpp>

namespace nftex { namespace ledger {

void claim_balance_record::sanity_check( const ledger_interface& db )const
{ try {
   FC_ASSERT( !index.owner.is_null() );
   FC_ASSERT( balance >= 0 && balance <= NFTEX_LEDGER_MAX_SHARES );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

oclaim_balance_record claim_balance_record::lookup( const ledger_interface& db, const claim_balance_index& index )
{ try {
   return db.claim_balance_lookup_by_index( index );
} FC_CAPTURE_AND_RETHROW( (index) ) }

void claim_balance_record::store( ledger_interface& db, const claim_balance_index& index, const claim_balance_record& record )
{ try {
   db.claim_balance_insert_into_index_map( index, record );
} FC_CAPTURE_AND_RETHROW( (index)(record) ) }

void claim_balance_record::remove( ledger_interface& db, const claim_balance_index& index )
{ try {
   db.claim_balance_erase_from_index_map( index );
} FC_CAPTURE_AND_RETHROW( (index) ) }

void escrow_record::sanity_check( const ledger_interface& db )const
{ try {
   FC_ASSERT( balance >= 0 && balance <= NFTEX_LEDGER_MAX_SHARES );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

oescrow_record escrow_record::lookup( const ledger_interface& db, const address& currency )
{ try {
   return db.escrow_lookup_by_currency( currency );
} FC_CAPTURE_AND_RETHROW( (currency) ) }

void escrow_record::store( ledger_interface& db, const address& currency, const escrow_record& record )
{ try {
   db.escrow_insert_into_currency_map( currency, record );
} FC_CAPTURE_AND_RETHROW( (currency)(record) ) }

void escrow_record::remove( ledger_interface& db, const address& currency )
{ try {
   db.escrow_erase_from_currency_map( currency );
} FC_CAPTURE_AND_RETHROW( (currency) ) }

} } // nftex::ledger
