#include <nftex/ledger/auction_records.hpp>
#include <nftex/ledger/ledger_interface.hpp>

namespace nftex { namespace ledger {

auction_status auction_record::status( const time_point_sec now, const bool ledger_deprecated )const
{
   if( cancelled || ledger_deprecated )
      return auction_status::cancelled;

   if( claimed )
      return auction_status::ended_and_claimed;

   if( now < start_time )
      return auction_status::pending;

   if( now < end_time )
      return auction_status::active;

   return auction_status::ended;
}

void auction_record::sanity_check( const ledger_interface& db )const
{ try {
   FC_ASSERT( id > 0 );
   FC_ASSERT( !seller.is_null() );
   FC_ASSERT( reserve_price.amount >= 0 );
   FC_ASSERT( start_time < end_time );
   FC_ASSERT( highest_bidder != seller );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

oauction_record auction_record::lookup( const ledger_interface& db, const auction_id_type id )
{ try {
   return db.auction_lookup_by_id( id );
} FC_CAPTURE_AND_RETHROW( (id) ) }

void auction_record::store( ledger_interface& db, const auction_id_type id, const auction_record& record )
{ try {
   db.auction_insert_into_id_map( id, record );
} FC_CAPTURE_AND_RETHROW( (id)(record) ) }

void auction_record::remove( ledger_interface& db, const auction_id_type id )
{ try {
   db.auction_erase_from_id_map( id );
} FC_CAPTURE_AND_RETHROW( (id) ) }

void bid_record::sanity_check( const ledger_interface& db )const
{ try {
   FC_ASSERT( index.auction_id > 0 );
   FC_ASSERT( !index.bidder.is_null() );
   FC_ASSERT( amount >= 0 );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

obid_record bid_record::lookup( const ledger_interface& db, const bid_index& index )
{ try {
   return db.bid_lookup_by_index( index );
} FC_CAPTURE_AND_RETHROW( (index) ) }

void bid_record::store( ledger_interface& db, const bid_index& index, const bid_record& record )
{ try {
   db.bid_insert_into_index_map( index, record );
} FC_CAPTURE_AND_RETHROW( (index)(record) ) }

void bid_record::remove( ledger_interface& db, const bid_index& index )
{ try {
   db.bid_erase_from_index_map( index );
} FC_CAPTURE_AND_RETHROW( (index) ) }

} } // nftex::ledger
