#pragma once

#include <nftex/ledger/ledger_interface.hpp>
#include <nftex/ledger/pending_ledger_state.hpp>

#include <fc/filesystem.hpp>

namespace nftex { namespace ledger {

   namespace detail { class ledger_database_impl; }

   /**
    *  The committed ledger state.  Records live in memory; open() restores them
    *  from a JSON snapshot in the data directory and close() writes them back.
    */
   class ledger_database : public ledger_interface, public std::enable_shared_from_this<ledger_database>
   {
      public:
         ledger_database();
         virtual ~ledger_database()override;

         void                           open( const fc::path& data_dir );
         void                           close();
         void                           flush()const;
         bool                           is_open()const;

         virtual fc::time_point_sec     now()const override;

         vector<sale_record>            get_sales()const;
         vector<auction_record>         get_auctions()const;
         vector<bid_record>             get_bids( const auction_id_type auction_id )const;
         vector<claim_balance_record>   get_claim_balances()const;
         vector<escrow_record>          get_escrow_records()const;

         /** every committed record, in the same layout as a pending_ledger_state */
         variant                        to_variant()const;
         void                           from_variant( const variant& v );

      private:
         unique_ptr<detail::ledger_database_impl> my;

         virtual oproperty_record property_lookup_by_id( const property_id_type )const override;
         virtual void property_insert_into_id_map( const property_id_type, const property_record& )override;
         virtual void property_erase_from_id_map( const property_id_type )override;

         virtual osale_record sale_lookup_by_id( const sale_id_type )const override;
         virtual void sale_insert_into_id_map( const sale_id_type, const sale_record& )override;
         virtual void sale_erase_from_id_map( const sale_id_type )override;

         virtual osale_purchase_record sale_purchase_lookup_by_index( const sale_purchase_index& )const override;
         virtual void sale_purchase_insert_into_index_map( const sale_purchase_index&, const sale_purchase_record& )override;
         virtual void sale_purchase_erase_from_index_map( const sale_purchase_index& )override;

         virtual oauction_record auction_lookup_by_id( const auction_id_type )const override;
         virtual void auction_insert_into_id_map( const auction_id_type, const auction_record& )override;
         virtual void auction_erase_from_id_map( const auction_id_type )override;

         virtual obid_record bid_lookup_by_index( const bid_index& )const override;
         virtual void bid_insert_into_index_map( const bid_index&, const bid_record& )override;
         virtual void bid_erase_from_index_map( const bid_index& )override;

         virtual oclaim_balance_record claim_balance_lookup_by_index( const claim_balance_index& )const override;
         virtual void claim_balance_insert_into_index_map( const claim_balance_index&, const claim_balance_record& )override;
         virtual void claim_balance_erase_from_index_map( const claim_balance_index& )override;

         virtual oescrow_record escrow_lookup_by_currency( const address& )const override;
         virtual void escrow_insert_into_currency_map( const address&, const escrow_record& )override;
         virtual void escrow_erase_from_currency_map( const address& )override;
   };
   typedef std::shared_ptr<ledger_database> ledger_database_ptr;

} } // nftex::ledger
