#include <nftex/ledger/config.hpp>
#include <nftex/ledger/exceptions.hpp>
#include <nftex/ledger/ledger_database.hpp>
#include <nftex/ledger/time.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

namespace nftex { namespace ledger {

   namespace detail
   {
      struct ledger_snapshot
      {
         uint32_t                                                   database_version = NFTEX_LEDGER_DATABASE_VERSION;

         map<property_id_type, property_record>                     _property_id_to_record;
         map<sale_id_type, sale_record>                             _sale_id_to_record;
         map<sale_purchase_index, sale_purchase_record>             _sale_purchase_index_to_record;
         map<auction_id_type, auction_record>                       _auction_id_to_record;
         map<bid_index, bid_record>                                 _bid_index_to_record;
         map<claim_balance_index, claim_balance_record>             _claim_balance_index_to_record;
         map<address, escrow_record>                                _escrow_currency_to_record;
      };

      class ledger_database_impl
      {
         public:
            void initialize_properties()
            {
               property_record record;
               record.id = property_id_type::database_version;
               record.value = variant( NFTEX_LEDGER_DATABASE_VERSION );
               _state._property_id_to_record[ record.id ] = record;

               record.id = property_id_type::last_sale_id;
               record.value = variant( sale_id_type( 0 ) );
               _state._property_id_to_record[ record.id ] = record;

               record.id = property_id_type::last_auction_id;
               record.value = variant( auction_id_type( 0 ) );
               _state._property_id_to_record[ record.id ] = record;
            }

            fc::path snapshot_file()const
            {
               return _data_dir / "ledger_state.json";
            }

            ledger_snapshot                 _state;
            fc::optional<fc::path>          _data_dir_opt;
            fc::path                        _data_dir;
      };

   } // detail

} } // nftex::ledger

FC_REFLECT( nftex::ledger::detail::ledger_snapshot,
            (database_version)
            (_property_id_to_record)
            (_sale_id_to_record)
            (_sale_purchase_index_to_record)
            (_auction_id_to_record)
            (_bid_index_to_record)
            (_claim_balance_index_to_record)
            (_escrow_currency_to_record)
            )

namespace nftex { namespace ledger {

   ledger_database::ledger_database()
   : my( new detail::ledger_database_impl() )
   {
      my->initialize_properties();
   }

   ledger_database::~ledger_database()
   {
      try
      {
         close();
      }
      catch( const fc::exception& e )
      {
         wlog( "unexpected exception closing ledger database: ${e}", ("e",e.to_detail_string()) );
      }
   }

   void ledger_database::open( const fc::path& data_dir )
   { try {
      FC_ASSERT( !is_open(), "ledger database is already open" );

      if( !fc::exists( data_dir ) )
         fc::create_directories( data_dir );

      my->_data_dir = data_dir;
      my->_data_dir_opt = data_dir;

      const fc::path snapshot = my->snapshot_file();
      if( fc::exists( snapshot ) )
      {
         ilog( "loading ledger state from ${f}", ("f",snapshot) );
         from_variant( fc::json::from_file( snapshot ) );
      }
      else
      {
         ilog( "initializing empty ledger in ${d}", ("d",data_dir) );
      }
   } FC_CAPTURE_AND_RETHROW( (data_dir) ) }

   void ledger_database::close()
   { try {
      if( !is_open() ) return;
      flush();
      my->_data_dir_opt.reset();
   } FC_CAPTURE_AND_RETHROW() }

   void ledger_database::flush()const
   { try {
      if( !is_open() ) return;
      fc::json::save_to_file( to_variant(), my->snapshot_file(), true );
   } FC_CAPTURE_AND_RETHROW() }

   bool ledger_database::is_open()const
   {
      return my->_data_dir_opt.valid();
   }

   fc::time_point_sec ledger_database::now()const
   {
      return ledger::now();
   }

   vector<sale_record> ledger_database::get_sales()const
   {
      vector<sale_record> records;
      records.reserve( my->_state._sale_id_to_record.size() );
      for( const auto& item : my->_state._sale_id_to_record )
         records.push_back( item.second );
      return records;
   }

   vector<auction_record> ledger_database::get_auctions()const
   {
      vector<auction_record> records;
      records.reserve( my->_state._auction_id_to_record.size() );
      for( const auto& item : my->_state._auction_id_to_record )
         records.push_back( item.second );
      return records;
   }

   vector<bid_record> ledger_database::get_bids( const auction_id_type auction_id )const
   {
      vector<bid_record> records;
      bid_index start;
      start.auction_id = auction_id;
      for( auto iter = my->_state._bid_index_to_record.lower_bound( start );
           iter != my->_state._bid_index_to_record.end() && iter->first.auction_id == auction_id; ++iter )
      {
         records.push_back( iter->second );
      }
      return records;
   }

   vector<claim_balance_record> ledger_database::get_claim_balances()const
   {
      vector<claim_balance_record> records;
      records.reserve( my->_state._claim_balance_index_to_record.size() );
      for( const auto& item : my->_state._claim_balance_index_to_record )
         records.push_back( item.second );
      return records;
   }

   vector<escrow_record> ledger_database::get_escrow_records()const
   {
      vector<escrow_record> records;
      records.reserve( my->_state._escrow_currency_to_record.size() );
      for( const auto& item : my->_state._escrow_currency_to_record )
         records.push_back( item.second );
      return records;
   }

   variant ledger_database::to_variant()const
   {
      fc::variant v;
      fc::to_variant( my->_state, v );
      return v;
   }

   void ledger_database::from_variant( const variant& v )
   { try {
      detail::ledger_snapshot state;
      fc::from_variant( v, state );
      if( state.database_version != NFTEX_LEDGER_DATABASE_VERSION )
         FC_THROW_EXCEPTION( unsupported_ledger_operation, "ledger snapshot has version ${v}, expected ${e}",
                             ("v",state.database_version)("e",NFTEX_LEDGER_DATABASE_VERSION) );
      my->_state = std::move( state );
   } FC_CAPTURE_AND_RETHROW() }

   oproperty_record ledger_database::property_lookup_by_id( const property_id_type key )const
   {
       const auto iter = my->_state._property_id_to_record.find( key );
       if( iter != my->_state._property_id_to_record.end() ) return iter->second;
       return oproperty_record();
   }

   void ledger_database::property_insert_into_id_map( const property_id_type key, const property_record& record )
   {
       my->_state._property_id_to_record[ key ] = record;
   }

   void ledger_database::property_erase_from_id_map( const property_id_type key )
   {
       my->_state._property_id_to_record.erase( key );
   }

   osale_record ledger_database::sale_lookup_by_id( const sale_id_type key )const
   {
       const auto iter = my->_state._sale_id_to_record.find( key );
       if( iter != my->_state._sale_id_to_record.end() ) return iter->second;
       return osale_record();
   }

   void ledger_database::sale_insert_into_id_map( const sale_id_type key, const sale_record& record )
   {
       my->_state._sale_id_to_record[ key ] = record;
   }

   void ledger_database::sale_erase_from_id_map( const sale_id_type key )
   {
       my->_state._sale_id_to_record.erase( key );
   }

   osale_purchase_record ledger_database::sale_purchase_lookup_by_index( const sale_purchase_index& key )const
   {
       const auto iter = my->_state._sale_purchase_index_to_record.find( key );
       if( iter != my->_state._sale_purchase_index_to_record.end() ) return iter->second;
       return osale_purchase_record();
   }

   void ledger_database::sale_purchase_insert_into_index_map( const sale_purchase_index& key, const sale_purchase_record& record )
   {
       my->_state._sale_purchase_index_to_record[ key ] = record;
   }

   void ledger_database::sale_purchase_erase_from_index_map( const sale_purchase_index& key )
   {
       my->_state._sale_purchase_index_to_record.erase( key );
   }

   oauction_record ledger_database::auction_lookup_by_id( const auction_id_type key )const
   {
       const auto iter = my->_state._auction_id_to_record.find( key );
       if( iter != my->_state._auction_id_to_record.end() ) return iter->second;
       return oauction_record();
   }

   void ledger_database::auction_insert_into_id_map( const auction_id_type key, const auction_record& record )
   {
       my->_state._auction_id_to_record[ key ] = record;
   }

   void ledger_database::auction_erase_from_id_map( const auction_id_type key )
   {
       my->_state._auction_id_to_record.erase( key );
   }

   obid_record ledger_database::bid_lookup_by_index( const bid_index& key )const
   {
       const auto iter = my->_state._bid_index_to_record.find( key );
       if( iter != my->_state._bid_index_to_record.end() ) return iter->second;
       return obid_record();
   }

   void ledger_database::bid_insert_into_index_map( const bid_index& key, const bid_record& record )
   {
       my->_state._bid_index_to_record[ key ] = record;
   }

   void ledger_database::bid_erase_from_index_map( const bid_index& key )
   {
       my->_state._bid_index_to_record.erase( key );
   }

   oclaim_balance_record ledger_database::claim_balance_lookup_by_index( const claim_balance_index& key )const
   {
       const auto iter = my->_state._claim_balance_index_to_record.find( key );
       if( iter != my->_state._claim_balance_index_to_record.end() ) return iter->second;
       return oclaim_balance_record();
   }

   void ledger_database::claim_balance_insert_into_index_map( const claim_balance_index& key, const claim_balance_record& record )
   {
       my->_state._claim_balance_index_to_record[ key ] = record;
   }

   void ledger_database::claim_balance_erase_from_index_map( const claim_balance_index& key )
   {
       my->_state._claim_balance_index_to_record.erase( key );
   }

   oescrow_record ledger_database::escrow_lookup_by_currency( const address& key )const
   {
       const auto iter = my->_state._escrow_currency_to_record.find( key );
       if( iter != my->_state._escrow_currency_to_record.end() ) return iter->second;
       return oescrow_record();
   }

   void ledger_database::escrow_insert_into_currency_map( const address& key, const escrow_record& record )
   {
       my->_state._escrow_currency_to_record[ key ] = record;
   }

   void ledger_database::escrow_erase_from_currency_map( const address& key )
   {
       my->_state._escrow_currency_to_record.erase( key );
   }

} } // nftex::ledger
