#pragma once

#include <nftex/ledger/asset.hpp>
#include <nftex/ledger/types.hpp>

namespace nftex { namespace ledger {

   enum class sale_status : uint8_t
   {
      pending   = 0,
      active    = 1,
      ended     = 2,
      cancelled = 3
   };

   struct sale_record;
   typedef fc::optional<sale_record> osale_record;

   class ledger_interface;

   /**
    *  A fixed-price listing of a quantity of one item.  The sale ledger custodies
    *  the listed units from creation until they are bought or reclaimed by the seller.
    */
   struct sale_record
   {
      sale_id_type            id = 0;
      item_reference          item;
      address                 seller;
      asset                   price;          ///< unit price and settlement currency
      share_type              amount = 0;     ///< units listed
      share_type              purchased = 0;  ///< units bought or reclaimed, never exceeds amount
      time_point_sec          start_time;
      time_point_sec          end_time;
      bool                    cancelled = false;

      share_type              remaining()const { return amount - purchased; }

      /**
       *  Derived status, evaluated in order: cancelled (explicitly or because the
       *  sale ledger is deprecated), pending before start, active while the window
       *  is open and stock remains, otherwise ended.
       */
      sale_status             status( const time_point_sec now, const bool ledger_deprecated )const;

      void sanity_check( const ledger_interface& )const;
      static osale_record lookup( const ledger_interface&, const sale_id_type );
      static void store( ledger_interface&, const sale_id_type, const sale_record& );
      static void remove( ledger_interface&, const sale_id_type );
   };

   struct sale_purchase_index
   {
      sale_purchase_index(){}
      sale_purchase_index( const sale_id_type id, const address& addr )
      :sale_id(id),buyer(addr){}

      sale_id_type  sale_id = 0;
      address       buyer;

      friend bool operator < ( const sale_purchase_index& a, const sale_purchase_index& b )
      {
         return std::tie( a.sale_id, a.buyer ) < std::tie( b.sale_id, b.buyer );
      }

      friend bool operator == ( const sale_purchase_index& a, const sale_purchase_index& b )
      {
         return std::tie( a.sale_id, a.buyer ) == std::tie( b.sale_id, b.buyer );
      }
   };

   struct sale_purchase_record;
   typedef fc::optional<sale_purchase_record> osale_purchase_record;

   /** Total units a single buyer has bought from one sale. */
   struct sale_purchase_record
   {
      sale_purchase_index     index;
      share_type              quantity = 0;

      void sanity_check( const ledger_interface& )const;
      static osale_purchase_record lookup( const ledger_interface&, const sale_purchase_index& );
      static void store( ledger_interface&, const sale_purchase_index&, const sale_purchase_record& );
      static void remove( ledger_interface&, const sale_purchase_index& );
   };

   class sale_db_interface
   {
      friend struct sale_record;
      friend struct sale_purchase_record;

      virtual osale_record sale_lookup_by_id( const sale_id_type )const = 0;
      virtual void sale_insert_into_id_map( const sale_id_type, const sale_record& ) = 0;
      virtual void sale_erase_from_id_map( const sale_id_type ) = 0;

      virtual osale_purchase_record sale_purchase_lookup_by_index( const sale_purchase_index& )const = 0;
      virtual void sale_purchase_insert_into_index_map( const sale_purchase_index&, const sale_purchase_record& ) = 0;
      virtual void sale_purchase_erase_from_index_map( const sale_purchase_index& ) = 0;
   };

} } // nftex::ledger

FC_REFLECT_TYPENAME( nftex::ledger::sale_status )
FC_REFLECT_ENUM( nftex::ledger::sale_status,
      (pending)
      (active)
      (ended)
      (cancelled)
      );
FC_REFLECT( nftex::ledger::sale_record,
      (id)
      (item)
      (seller)
      (price)
      (amount)
      (purchased)
      (start_time)
      (end_time)
      (cancelled)
      );
FC_REFLECT( nftex::ledger::sale_purchase_index,
      (sale_id)
      (buyer)
      );
FC_REFLECT( nftex::ledger::sale_purchase_record,
      (index)
      (quantity)
      );
