#pragma once

#include <nftex/ledger/auction_records.hpp>
#include <nftex/ledger/balance_record.hpp>
#include <nftex/ledger/property_record.hpp>
#include <nftex/ledger/sale_record.hpp>
#include <nftex/ledger/types.hpp>

namespace nftex { namespace ledger {

   /**
    *  Record storage shared by the committed ledger and the pending overlays that
    *  operations are evaluated against.
    */
   class ledger_interface
   : public property_db_interface,
     public sale_db_interface,
     public auction_db_interface,
     public vault_db_interface
   {
      public:
         virtual ~ledger_interface(){};

         virtual fc::time_point_sec         now()const = 0;

         sale_id_type                       last_sale_id()const;
         sale_id_type                       new_sale_id();

         auction_id_type                    last_auction_id()const;
         auction_id_type                    new_auction_id();

         oproperty_record                   get_property_record( const property_id_type id )const;
         void                               store_property_record( const property_id_type id, const variant& value );

         osale_record                       get_sale_record( const sale_id_type id )const;
         void                               store_sale_record( const sale_record& record );

         osale_purchase_record              get_sale_purchase_record( const sale_purchase_index& index )const;
         void                               store_sale_purchase_record( const sale_purchase_record& record );

         oauction_record                    get_auction_record( const auction_id_type id )const;
         void                               store_auction_record( const auction_record& record );

         obid_record                        get_bid_record( const bid_index& index )const;
         void                               store_bid_record( const bid_record& record );

         oclaim_balance_record              get_claim_balance_record( const claim_balance_index& index )const;
         void                               store_claim_balance_record( const claim_balance_record& record );

         oescrow_record                     get_escrow_record( const address& currency )const;
         void                               store_escrow_record( const escrow_record& record );

         template<typename T, typename U>
         optional<T> lookup( const U& key )const
         { try {
             return T::lookup( *this, key );
         } FC_CAPTURE_AND_RETHROW( (key) ) }

         template<typename T, typename U>
         void store( const U& key, const T& record )
         { try {
             record.sanity_check( *this );
             T::store( *this, key, record );
         } FC_CAPTURE_AND_RETHROW( (key)(record) ) }

         template<typename T, typename U>
         void remove( const U& key )
         { try {
             T::remove( *this, key );
         } FC_CAPTURE_AND_RETHROW( (key) ) }
   };
   typedef std::shared_ptr<ledger_interface> ledger_interface_ptr;

} } // nftex::ledger
