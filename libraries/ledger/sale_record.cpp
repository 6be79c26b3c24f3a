#include <nftex/ledger/exceptions.hpp>
#include <nftex/ledger/ledger_interface.hpp>
#include <nftex/ledger/sale_record.hpp>

namespace nftex { namespace ledger {

sale_status sale_record::status( const time_point_sec now, const bool ledger_deprecated )const
{
   if( cancelled || ledger_deprecated )
      return sale_status::cancelled;

   if( now < start_time )
      return sale_status::pending;

   if( now < end_time && purchased < amount )
      return sale_status::active;

   return sale_status::ended;
}

void sale_record::sanity_check( const ledger_interface& db )const
{ try {
   FC_ASSERT( id > 0 );
   FC_ASSERT( !seller.is_null() );
   FC_ASSERT( amount > 0 );
   FC_ASSERT( purchased >= 0 && purchased <= amount );
   FC_ASSERT( price.amount >= 0 );
   FC_ASSERT( start_time < end_time );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

osale_record sale_record::lookup( const ledger_interface& db, const sale_id_type id )
{ try {
   return db.sale_lookup_by_id( id );
} FC_CAPTURE_AND_RETHROW( (id) ) }

void sale_record::store( ledger_interface& db, const sale_id_type id, const sale_record& record )
{ try {
   db.sale_insert_into_id_map( id, record );
} FC_CAPTURE_AND_RETHROW( (id)(record) ) }

void sale_record::remove( ledger_interface& db, const sale_id_type id )
{ try {
   db.sale_erase_from_id_map( id );
} FC_CAPTURE_AND_RETHROW( (id) ) }

void sale_purchase_record::sanity_check( const ledger_interface& db )const
{ try {
   FC_ASSERT( index.sale_id > 0 );
   FC_ASSERT( !index.buyer.is_null() );
   FC_ASSERT( quantity > 0 );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

osale_purchase_record sale_purchase_record::lookup( const ledger_interface& db, const sale_purchase_index& index )
{ try {
   return db.sale_purchase_lookup_by_index( index );
} FC_CAPTURE_AND_RETHROW( (index) ) }

void sale_purchase_record::store( ledger_interface& db, const sale_purchase_index& index, const sale_purchase_record& record )
{ try {
   db.sale_purchase_insert_into_index_map( index, record );
} FC_CAPTURE_AND_RETHROW( (index)(record) ) }

void sale_purchase_record::remove( ledger_interface& db, const sale_purchase_index& index )
{ try {
   db.sale_purchase_erase_from_index_map( index );
} FC_CAPTURE_AND_RETHROW( (index) ) }

} } // nftex::ledger
