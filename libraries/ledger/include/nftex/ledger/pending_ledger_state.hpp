#pragma once
#include <nftex/ledger/ledger_interface.hpp>
#include <fc/reflect/reflect.hpp>

namespace nftex { namespace ledger {

   /**
    *  An overlay of record changes on top of another ledger state.  Reads fall
    *  through to the previous state for keys not touched here; nothing reaches
    *  the previous state until apply_changes() is called.
    */
   class pending_ledger_state : public ledger_interface, public std::enable_shared_from_this<pending_ledger_state>
   {
      public:
                                        pending_ledger_state( ledger_interface_ptr prev_state = ledger_interface_ptr() );

         void                           set_prev_state( ledger_interface_ptr prev_state );

         virtual fc::time_point_sec     now()const override;

         /** captures the previous values of every record touched here, so applying the undo state reverts apply_changes() */
         void                           build_undo_state( const ledger_interface_ptr& undo_state )const;
         void                           apply_changes()const;

         template<typename T, typename U>
         void populate_undo_state( const ledger_interface_ptr& undo_state, const ledger_interface_ptr& prev_state,
                                   const T& store_map, const U& remove_set )const
         {
             using V = typename T::mapped_type;
             for( const auto& key : remove_set )
             {
                 const auto prev_record = prev_state->lookup<V>( key );
                 if( prev_record.valid() ) undo_state->store( key, *prev_record );
             }
             for( const auto& item : store_map )
             {
                 const auto& key = item.first;
                 const auto prev_record = prev_state->lookup<V>( key );
                 if( prev_record.valid() ) undo_state->store( key, *prev_record );
                 else undo_state->remove<V>( key );
             }
         }

         template<typename T, typename U>
         void apply_records( const ledger_interface_ptr& prev_state, const T& store_map, const U& remove_set )const
         {
             using V = typename T::mapped_type;
             for( const auto& key : remove_set ) prev_state->remove<V>( key );
             for( const auto& item : store_map ) prev_state->store( item.first, item.second );
         }

         void                           from_variant( const variant& v );
         variant                        to_variant()const;

         map<property_id_type, property_record>                             _property_id_to_record;
         set<property_id_type>                                              _property_id_remove;

         map<sale_id_type, sale_record>                                     _sale_id_to_record;
         set<sale_id_type>                                                  _sale_id_remove;

         map<sale_purchase_index, sale_purchase_record>                     _sale_purchase_index_to_record;
         set<sale_purchase_index>                                           _sale_purchase_index_remove;

         map<auction_id_type, auction_record>                               _auction_id_to_record;
         set<auction_id_type>                                               _auction_id_remove;

         map<bid_index, bid_record>                                         _bid_index_to_record;
         set<bid_index>                                                     _bid_index_remove;

         map<claim_balance_index, claim_balance_record>                     _claim_balance_index_to_record;
         set<claim_balance_index>                                           _claim_balance_index_remove;

         map<address, escrow_record>                                        _escrow_currency_to_record;
         set<address>                                                       _escrow_currency_remove;

      private:
         // Not serialized
         std::weak_ptr<ledger_interface>                                    _prev_state;

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
   typedef std::shared_ptr<pending_ledger_state> pending_ledger_state_ptr;

} } // nftex::ledger

FC_REFLECT( nftex::ledger::pending_ledger_state,
            (_property_id_to_record)
            (_property_id_remove)
            (_sale_id_to_record)
            (_sale_id_remove)
            (_sale_purchase_index_to_record)
            (_sale_purchase_index_remove)
            (_auction_id_to_record)
            (_auction_id_remove)
            (_bid_index_to_record)
            (_bid_index_remove)
            (_claim_balance_index_to_record)
            (_claim_balance_index_remove)
            (_escrow_currency_to_record)
            (_escrow_currency_remove)
            )
