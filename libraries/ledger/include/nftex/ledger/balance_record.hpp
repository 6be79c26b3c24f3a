#pragma once

#include <nftex/ledger/asset.hpp>
#include <nftex/ledger/types.hpp>

namespace nftex { namespace ledger {

   struct claim_balance_index
   {
      claim_balance_index(){}
      claim_balance_index( const address& o, const address& c )
      :owner(o),currency(c){}

      address   owner;
      address   currency;

      friend bool operator < ( const claim_balance_index& a, const claim_balance_index& b )
      {
         return std::tie( a.owner, a.currency ) < std::tie( b.owner, b.currency );
      }

      friend bool operator == ( const claim_balance_index& a, const claim_balance_index& b )
      {
         return std::tie( a.owner, a.currency ) == std::tie( b.owner, b.currency );
      }
   };

   struct claim_balance_record;
   typedef fc::optional<claim_balance_record> oclaim_balance_record;

   class ledger_interface;

   /**
    *  Funds owed to an owner in one currency: sale proceeds, fees, royalties and
    *  refunded bids.  Owners withdraw with a claim operation or spend the balance
    *  on later purchases and bids.
    */
   struct claim_balance_record
   {
      claim_balance_index     index;
      share_type              balance = 0;
      time_point_sec          last_update;

      asset                   get_balance()const { return asset( balance, index.currency ); }

      void sanity_check( const ledger_interface& )const;
      static oclaim_balance_record lookup( const ledger_interface&, const claim_balance_index& );
      static void store( ledger_interface&, const claim_balance_index&, const claim_balance_record& );
      static void remove( ledger_interface&, const claim_balance_index& );
   };

   struct escrow_record;
   typedef fc::optional<escrow_record> oescrow_record;

   /** Sum of all standing highest bids held by the auction ledger in one currency. */
   struct escrow_record
   {
      address                 currency;
      share_type              balance = 0;

      asset                   get_balance()const { return asset( balance, currency ); }

      void sanity_check( const ledger_interface& )const;
      static oescrow_record lookup( const ledger_interface&, const address& );
      static void store( ledger_interface&, const address&, const escrow_record& );
      static void remove( ledger_interface&, const address& );
   };

   class vault_db_interface
   {
      friend struct claim_balance_record;
      friend struct escrow_record;

      virtual oclaim_balance_record claim_balance_lookup_by_index( const claim_balance_index& )const = 0;
      virtual void claim_balance_insert_into_index_map( const claim_balance_index&, const claim_balance_record& ) = 0;
      virtual void claim_balance_erase_from_index_map( const claim_balance_index& ) = 0;

      virtual oescrow_record escrow_lookup_by_currency( const address& )const = 0;
      virtual void escrow_insert_into_currency_map( const address&, const escrow_record& ) = 0;
      virtual void escrow_erase_from_currency_map( const address& ) = 0;
   };

} } // nftex::ledger

FC_REFLECT( nftex::ledger::claim_balance_index,
      (owner)
      (currency)
      );
FC_REFLECT( nftex::ledger::claim_balance_record,
      (index)
      (balance)
      (last_update)
      );
FC_REFLECT( nftex::ledger::escrow_record,
      (currency)
      (balance)
      );
