// English auctions of a single unit, settled through the claim vault and the escrow pool

#pragma once

#include <nftex/ledger/asset.hpp>
#include <nftex/ledger/types.hpp>

namespace nftex { namespace ledger {

   enum class auction_status : uint8_t
   {
      pending           = 0,
      active            = 1,
      ended             = 2,
      cancelled         = 3,
      ended_and_claimed = 4
   };

   struct auction_record;
   typedef fc::optional<auction_record> oauction_record;

   class ledger_interface;

   struct auction_record
   {
      auction_id_type          id = 0;
      item_reference           item;
      address                  seller;
      asset                    reserve_price;   ///< minimum winning bid and settlement currency
      time_point_sec           start_time;
      time_point_sec           end_time;
      address                  highest_bidder;  ///< null until the first bid
      bool                     cancelled = false;
      bool                     claimed = false; ///< set once the auction has been resolved

      bool                     has_bids()const { return !highest_bidder.is_null(); }

      /** cancelled takes precedence over every other state, then claimed, pending, active, ended */
      auction_status           status( const time_point_sec now, const bool ledger_deprecated )const;

      void sanity_check( const ledger_interface& )const;
      static oauction_record lookup( const ledger_interface&, const auction_id_type );
      static void store( ledger_interface&, const auction_id_type, const auction_record& );
      static void remove( ledger_interface&, const auction_id_type );
   };

   struct bid_index
   {
      bid_index(){}
      bid_index( const auction_id_type id, const address& addr )
      :auction_id(id),bidder(addr){}

      auction_id_type  auction_id = 0;
      address          bidder;

      friend bool operator < ( const bid_index& a, const bid_index& b )
      {
         return std::tie( a.auction_id, a.bidder ) < std::tie( b.auction_id, b.bidder );
      }

      friend bool operator == ( const bid_index& a, const bid_index& b )
      {
         return std::tie( a.auction_id, a.bidder ) == std::tie( b.auction_id, b.bidder );
      }
   };

   struct bid_record;
   typedef fc::optional<bid_record> obid_record;

   /** A bidder's standing bid.  Outbid and refunded bids are kept with a zero amount. */
   struct bid_record
   {
      bid_index                index;
      share_type               amount = 0;
      time_point_sec           last_update;

      void sanity_check( const ledger_interface& )const;
      static obid_record lookup( const ledger_interface&, const bid_index& );
      static void store( ledger_interface&, const bid_index&, const bid_record& );
      static void remove( ledger_interface&, const bid_index& );
   };

   class auction_db_interface
   {
      friend struct auction_record;
      friend struct bid_record;

      virtual oauction_record auction_lookup_by_id( const auction_id_type )const = 0;
      virtual void auction_insert_into_id_map( const auction_id_type, const auction_record& ) = 0;
      virtual void auction_erase_from_id_map( const auction_id_type ) = 0;

      virtual obid_record bid_lookup_by_index( const bid_index& )const = 0;
      virtual void bid_insert_into_index_map( const bid_index&, const bid_record& ) = 0;
      virtual void bid_erase_from_index_map( const bid_index& ) = 0;
   };

} } // nftex::ledger

FC_REFLECT_TYPENAME( nftex::ledger::auction_status )
FC_REFLECT_ENUM( nftex::ledger::auction_status,
      (pending)
      (active)
      (ended)
      (cancelled)
      (ended_and_claimed)
      );
FC_REFLECT( nftex::ledger::auction_record,
      (id)
      (item)
      (seller)
      (reserve_price)
      (start_time)
      (end_time)
      (highest_bidder)
      (cancelled)
      (claimed)
      );
FC_REFLECT( nftex::ledger::bid_index,
      (auction_id)
      (bidder)
      );
FC_REFLECT( nftex::ledger::bid_record,
      (index)
      (amount)
      (last_update)
      );
