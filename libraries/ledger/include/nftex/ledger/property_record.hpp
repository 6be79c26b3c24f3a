#pragma once

#include <nftex/ledger/types.hpp>

namespace nftex { namespace ledger {

enum class property_id_type : uint8_t
{
   database_version            = 0,
   last_sale_id                = 1,
   last_auction_id             = 2,
   market_policy               = 3
};

struct property_record;
typedef fc::optional<property_record> oproperty_record;

class ledger_interface;
struct property_record
{
   property_id_type    id;
   variant             value;

   void sanity_check( const ledger_interface& )const;
   static oproperty_record lookup( const ledger_interface&, const property_id_type );
   static void store( ledger_interface&, const property_id_type, const property_record& );
   static void remove( ledger_interface&, const property_id_type );
};

class property_db_interface
{
   friend struct property_record;

   virtual oproperty_record property_lookup_by_id( const property_id_type )const = 0;
   virtual void property_insert_into_id_map( const property_id_type, const property_record& ) = 0;
   virtual void property_erase_from_id_map( const property_id_type ) = 0;
};

} } // nftex::ledger

FC_REFLECT_TYPENAME( nftex::ledger::property_id_type )
FC_REFLECT_ENUM( nftex::ledger::property_id_type,
      (database_version)
      (last_sale_id)
      (last_auction_id)
      (market_policy)
      );
FC_REFLECT( nftex::ledger::property_record,
      (id)
      (value)
      );
