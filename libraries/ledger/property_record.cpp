#include <nftex/ledger/ledger_interface.hpp>
#include <nftex/ledger/property_record.hpp>

namespace nftex { namespace ledger {

void property_record::sanity_check( const ledger_interface& db )const
{ try {
   FC_ASSERT( !value.is_null() );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

oproperty_record property_record::lookup( const ledger_interface& db, const property_id_type id )
{ try {
   return db.property_lookup_by_id( id );
} FC_CAPTURE_AND_RETHROW( (id) ) }

void property_record::store( ledger_interface& db, const property_id_type id, const property_record& record )
{ try {
   db.property_insert_into_id_map( id, record );
} FC_CAPTURE_AND_RETHROW( (id)(record) ) }

void property_record::remove( ledger_interface& db, const property_id_type id )
{ try {
   db.property_erase_from_id_map( id );
} FC_CAPTURE_AND_RETHROW( (id) ) }

} } // nftex::ledger
