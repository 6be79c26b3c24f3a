#include <nftex/ledger/ledger_interface.hpp>

namespace nftex { namespace ledger {

   sale_id_type ledger_interface::last_sale_id()const
   { try {
       const oproperty_record record = get_property_record( property_id_type::last_sale_id );
       FC_ASSERT( record.valid() );
       return record->value.as<sale_id_type>();
   } FC_CAPTURE_AND_RETHROW() }

   sale_id_type ledger_interface::new_sale_id()
   { try {
       const sale_id_type next_id = last_sale_id() + 1;
       store_property_record( property_id_type::last_sale_id, variant( next_id ) );
       return next_id;
   } FC_CAPTURE_AND_RETHROW() }

   auction_id_type ledger_interface::last_auction_id()const
   { try {
       const oproperty_record record = get_property_record( property_id_type::last_auction_id );
       FC_ASSERT( record.valid() );
       return record->value.as<auction_id_type>();
   } FC_CAPTURE_AND_RETHROW() }

   auction_id_type ledger_interface::new_auction_id()
   { try {
       const auction_id_type next_id = last_auction_id() + 1;
       store_property_record( property_id_type::last_auction_id, variant( next_id ) );
       return next_id;
   } FC_CAPTURE_AND_RETHROW() }

   oproperty_record ledger_interface::get_property_record( const property_id_type id )const
   {
       return lookup<property_record>( id );
   }

   void ledger_interface::store_property_record( const property_id_type id, const variant& value )
   {
       property_record record;
       record.id = id;
       record.value = value;
       store( id, record );
   }

   osale_record ledger_interface::get_sale_record( const sale_id_type id )const
   {
       return lookup<sale_record>( id );
   }

   void ledger_interface::store_sale_record( const sale_record& record )
   {
       store( record.id, record );
   }

   osale_purchase_record ledger_interface::get_sale_purchase_record( const sale_purchase_index& index )const
   {
       return lookup<sale_purchase_record>( index );
   }

   void ledger_interface::store_sale_purchase_record( const sale_purchase_record& record )
   {
       store( record.index, record );
   }

   oauction_record ledger_interface::get_auction_record( const auction_id_type id )const
   {
       return lookup<auction_record>( id );
   }

   void ledger_interface::store_auction_record( const auction_record& record )
   {
       store( record.id, record );
   }

   obid_record ledger_interface::get_bid_record( const bid_index& index )const
   {
       return lookup<bid_record>( index );
   }

   void ledger_interface::store_bid_record( const bid_record& record )
   {
       store( record.index, record );
   }

   oclaim_balance_record ledger_interface::get_claim_balance_record( const claim_balance_index& index )const
   {
       return lookup<claim_balance_record>( index );
   }

   void ledger_interface::store_claim_balance_record( const claim_balance_record& record )
   {
       store( record.index, record );
   }

   oescrow_record ledger_interface::get_escrow_record( const address& currency )const
   {
       return lookup<escrow_record>( currency );
   }

   void ledger_interface::store_escrow_record( const escrow_record& record )
   {
       store( record.currency, record );
   }

} } // nftex::ledger
