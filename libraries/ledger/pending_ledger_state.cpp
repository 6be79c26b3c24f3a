#include <nftex/ledger/exceptions.hpp>
#include <nftex/ledger/pending_ledger_state.hpp>
#include <nftex/ledger/time.hpp>

namespace nftex { namespace ledger {

   pending_ledger_state::pending_ledger_state( ledger_interface_ptr prev_state )
   : _prev_state( prev_state )
   {
   }

   void pending_ledger_state::set_prev_state( ledger_interface_ptr prev_state )
   {
      _prev_state = prev_state;
   }

   fc::time_point_sec pending_ledger_state::now()const
   {
      const ledger_interface_ptr prev_state = _prev_state.lock();
      if( !prev_state ) return ledger::now();
      return prev_state->now();
   }

   void pending_ledger_state::apply_changes()const
   {
      ledger_interface_ptr prev_state = _prev_state.lock();
      if( !prev_state ) return;

      apply_records( prev_state, _property_id_to_record, _property_id_remove );
      apply_records( prev_state, _sale_id_to_record, _sale_id_remove );
      apply_records( prev_state, _sale_purchase_index_to_record, _sale_purchase_index_remove );
      apply_records( prev_state, _auction_id_to_record, _auction_id_remove );
      apply_records( prev_state, _bid_index_to_record, _bid_index_remove );
      apply_records( prev_state, _claim_balance_index_to_record, _claim_balance_index_remove );
      apply_records( prev_state, _escrow_currency_to_record, _escrow_currency_remove );
   }

   void pending_ledger_state::build_undo_state( const ledger_interface_ptr& undo_state )const
   { try {
      ledger_interface_ptr prev_state = _prev_state.lock();
      FC_ASSERT( prev_state );

      populate_undo_state( undo_state, prev_state, _property_id_to_record, _property_id_remove );
      populate_undo_state( undo_state, prev_state, _sale_id_to_record, _sale_id_remove );
      populate_undo_state( undo_state, prev_state, _sale_purchase_index_to_record, _sale_purchase_index_remove );
      populate_undo_state( undo_state, prev_state, _auction_id_to_record, _auction_id_remove );
      populate_undo_state( undo_state, prev_state, _bid_index_to_record, _bid_index_remove );
      populate_undo_state( undo_state, prev_state, _claim_balance_index_to_record, _claim_balance_index_remove );
      populate_undo_state( undo_state, prev_state, _escrow_currency_to_record, _escrow_currency_remove );
   } FC_CAPTURE_AND_RETHROW() }

   void pending_ledger_state::from_variant( const fc::variant& v )
   {
      fc::from_variant( v, *this );
   }

   fc::variant pending_ledger_state::to_variant()const
   {
      fc::variant v;
      fc::to_variant( *this, v );
      return v;
   }

   oproperty_record pending_ledger_state::property_lookup_by_id( const property_id_type key )const
   {
       const auto iter = _property_id_to_record.find( key );
       if( iter != _property_id_to_record.end() ) return iter->second;
       if( _property_id_remove.count( key ) > 0 ) return oproperty_record();
       const ledger_interface_ptr prev_state = _prev_state.lock();
       if( !prev_state ) return oproperty_record();
       return prev_state->lookup<property_record>( key );
   }

   void pending_ledger_state::property_insert_into_id_map( const property_id_type key, const property_record& record )
   {
       _property_id_remove.erase( key );
       _property_id_to_record[ key ] = record;
   }

   void pending_ledger_state::property_erase_from_id_map( const property_id_type key )
   {
       _property_id_to_record.erase( key );
       _property_id_remove.insert( key );
   }

   osale_record pending_ledger_state::sale_lookup_by_id( const sale_id_type key )const
   {
       const auto iter = _sale_id_to_record.find( key );
       if( iter != _sale_id_to_record.end() ) return iter->second;
       if( _sale_id_remove.count( key ) > 0 ) return osale_record();
       const ledger_interface_ptr prev_state = _prev_state.lock();
       if( !prev_state ) return osale_record();
       return prev_state->lookup<sale_record>( key );
   }

   void pending_ledger_state::sale_insert_into_id_map( const sale_id_type key, const sale_record& record )
   {
       _sale_id_remove.erase( key );
       _sale_id_to_record[ key ] = record;
   }

   void pending_ledger_state::sale_erase_from_id_map( const sale_id_type key )
   {
       _sale_id_to_record.erase( key );
       _sale_id_remove.insert( key );
   }

   osale_purchase_record pending_ledger_state::sale_purchase_lookup_by_index( const sale_purchase_index& key )const
   {
       const auto iter = _sale_purchase_index_to_record.find( key );
       if( iter != _sale_purchase_index_to_record.end() ) return iter->second;
       if( _sale_purchase_index_remove.count( key ) > 0 ) return osale_purchase_record();
       const ledger_interface_ptr prev_state = _prev_state.lock();
       if( !prev_state ) return osale_purchase_record();
       return prev_state->lookup<sale_purchase_record>( key );
   }

   void pending_ledger_state::sale_purchase_insert_into_index_map( const sale_purchase_index& key, const sale_purchase_record& record )
   {
       _sale_purchase_index_remove.erase( key );
       _sale_purchase_index_to_record[ key ] = record;
   }

   void pending_ledger_state::sale_purchase_erase_from_index_map( const sale_purchase_index& key )
   {
       _sale_purchase_index_to_record.erase( key );
       _sale_purchase_index_remove.insert( key );
   }

   oauction_record pending_ledger_state::auction_lookup_by_id( const auction_id_type key )const
   {
       const auto iter = _auction_id_to_record.find( key );
       if( iter != _auction_id_to_record.end() ) return iter->second;
       if( _auction_id_remove.count( key ) > 0 ) return oauction_record();
       const ledger_interface_ptr prev_state = _prev_state.lock();
       if( !prev_state ) return oauction_record();
       return prev_state->lookup<auction_record>( key );
   }

   void pending_ledger_state::auction_insert_into_id_map( const auction_id_type key, const auction_record& record )
   {
       _auction_id_remove.erase( key );
       _auction_id_to_record[ key ] = record;
   }

   void pending_ledger_state::auction_erase_from_id_map( const auction_id_type key )
   {
       _auction_id_to_record.erase( key );
       _auction_id_remove.insert( key );
   }

   obid_record pending_ledger_state::bid_lookup_by_index( const bid_index& key )const
   {
       const auto iter = _bid_index_to_record.find( key );
       if( iter != _bid_index_to_record.end() ) return iter->second;
       if( _bid_index_remove.count( key ) > 0 ) return obid_record();
       const ledger_interface_ptr prev_state = _prev_state.lock();
       if( !prev_state ) return obid_record();
       return prev_state->lookup<bid_record>( key );
   }

   void pending_ledger_state::bid_insert_into_index_map( const bid_index& key, const bid_record& record )
   {
       _bid_index_remove.erase( key );
       _bid_index_to_record[ key ] = record;
   }

   void pending_ledger_state::bid_erase_from_index_map( const bid_index& key )
   {
       _bid_index_to_record.erase( key );
       _bid_index_remove.insert( key );
   }

   oclaim_balance_record pending_ledger_state::claim_balance_lookup_by_index( const claim_balance_index& key )const
   {
       const auto iter = _claim_balance_index_to_record.find( key );
       if( iter != _claim_balance_index_to_record.end() ) return iter->second;
       if( _claim_balance_index_remove.count( key ) > 0 ) return oclaim_balance_record();
       const ledger_interface_ptr prev_state = _prev_state.lock();
       if( !prev_state ) return oclaim_balance_record();
       return prev_state->lookup<claim_balance_record>( key );
   }

   void pending_ledger_state::claim_balance_insert_into_index_map( const claim_balance_index& key, const claim_balance_record& record )
   {
       _claim_balance_index_remove.erase( key );
       _claim_balance_index_to_record[ key ] = record;
   }

   void pending_ledger_state::claim_balance_erase_from_index_map( const claim_balance_index& key )
   {
       _claim_balance_index_to_record.erase( key );
       _claim_balance_index_remove.insert( key );
   }

   oescrow_record pending_ledger_state::escrow_lookup_by_currency( const address& key )const
   {
       const auto iter = _escrow_currency_to_record.find( key );
       if( iter != _escrow_currency_to_record.end() ) return iter->second;
       if( _escrow_currency_remove.count( key ) > 0 ) return oescrow_record();
       const ledger_interface_ptr prev_state = _prev_state.lock();
       if( !prev_state ) return oescrow_record();
       return prev_state->lookup<escrow_record>( key );
   }

   void pending_ledger_state::escrow_insert_into_currency_map( const address& key, const escrow_record& record )
   {
       _escrow_currency_remove.erase( key );
       _escrow_currency_to_record[ key ] = record;
   }

   void pending_ledger_state::escrow_erase_from_currency_map( const address& key )
   {
       _escrow_currency_to_record.erase( key );
       _escrow_currency_remove.insert( key );
   }

} } // nftex::ledger
