#define BOOST_TEST_MODULE ConservationTests
#include <boost/test/unit_test.hpp>

#include "ledger_fixture.hpp"

#include <nftex/ledger/pending_ledger_state.hpp>

BOOST_FIXTURE_TEST_SUITE( conservation_tests, ledger_fixture )

BOOST_AUTO_TEST_CASE( treasury_matches_vault_through_market_activity )
{
   try {
      const sale_id_type sale_id = market->create_sale( seller, fungible_item( 7 ), 20, in( 0 ), in( 7200 ), asset( 37 ) );
      const auction_id_type first = auction_unique_item( 1, 250 );
      const auction_id_type second = market->create_auction( seller, unique_item( 2 ), in( 0 ), in( 7200 ), asset( 90, token ) );

      market->buy( call_context( buyer, 37 * 3 ), sale_id, address(), 3 );
      BOOST_CHECK( is_solvent() );

      market->bid( call_context( bidder, 250 ), first, 0, 250 );
      market->bid( call_context( rival, 300 ), first, 0, 300 );
      market->bid( call_context( bidder, 100 ), first, 250, 100 );
      BOOST_CHECK( is_solvent() );

      market->bid( bidder, second, 0, 90 );
      market->bid( rival, second, 0, 95 );
      BOOST_CHECK( is_solvent( token ) );

      // the outbid rival spends the refund on the sale
      market->buy( call_context( rival, 37 * 2 ), sale_id, address(), 10, 37 * 8 );
      BOOST_CHECK_EQUAL( claimable( rival ), 300 - 37 * 8 );
      BOOST_CHECK( is_solvent() );

      advance_time( 3600 );
      market->resolve_auction( bidder, first );
      BOOST_CHECK( items->owner_of( 1 ) == bidder );
      BOOST_CHECK( is_solvent() );

      market->cancel_auction( seller, second );
      market->resolve_auction( seller, second );
      BOOST_CHECK( items->owner_of( 2 ) == seller );
      BOOST_CHECK_EQUAL( claimable( rival, token ), 95 );
      BOOST_CHECK( is_solvent( token ) );

      advance_time( 3600 );
      market->claim_sale_items( seller, sale_id );
      BOOST_CHECK_EQUAL( items->balance_of( seller, 7 ), 100 - 13 );

      for( const address& owner : { seller, artist, fee_collector, bidder, rival } )
      {
         for( const address& currency : { NFTEX_NATIVE_CURRENCY, token } )
         {
            if( claimable( owner, currency ) > 0 )
               market->claim( owner, currency );
         }
      }

      BOOST_CHECK_EQUAL( payments->get_treasury_balance( NFTEX_NATIVE_CURRENCY ).amount, 0 );
      BOOST_CHECK_EQUAL( payments->get_treasury_balance( token ).amount, 0 );
      BOOST_CHECK_EQUAL( owed(), 0 );
      BOOST_CHECK_EQUAL( owed( token ), 0 );

      // every unit spent by a buyer or bidder reached a seller, the fee recipient or the artist
      const share_type spent = ( NFTEX_TEST_WALLET_FUNDS - wallet( buyer ) )
                             + ( NFTEX_TEST_WALLET_FUNDS - wallet( bidder ) )
                             + ( NFTEX_TEST_WALLET_FUNDS - wallet( rival ) );
      const share_type earned = wallet( seller ) + wallet( fee_collector ) + ( wallet( artist ) - NFTEX_TEST_WALLET_FUNDS );
      BOOST_CHECK_EQUAL( spent, earned );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string() ) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( undo_state_restores_committed_records )
{
   const sale_id_type sale_id = list_unique_item( 1, 500 );

   ledger_database_ptr db = std::make_shared<ledger_database>();
   sale_record sale = *market->database().get_sale_record( sale_id );
   db->store_sale_record( sale );
   db->store_property_record( property_id_type::last_sale_id, variant( sale_id ) );

   pending_ledger_state_ptr pending = std::make_shared<pending_ledger_state>( db );
   sale.purchased = 1;
   pending->store_sale_record( sale );

   sale_record other = sale;
   other.id = pending->new_sale_id();
   other.purchased = 0;
   pending->store_sale_record( other );

   pending_ledger_state_ptr undo = std::make_shared<pending_ledger_state>( db );
   pending->build_undo_state( undo );
   pending->apply_changes();

   BOOST_CHECK_EQUAL( db->get_sale_record( sale_id )->purchased, 1 );
   BOOST_CHECK( db->get_sale_record( other.id ).valid() );
   BOOST_CHECK_EQUAL( db->last_sale_id(), sale_id + 1 );

   undo->apply_changes();
   BOOST_CHECK_EQUAL( db->get_sale_record( sale_id )->purchased, 0 );
   BOOST_CHECK( !db->get_sale_record( other.id ).valid() );
   BOOST_CHECK_EQUAL( db->last_sale_id(), sale_id );
}

BOOST_AUTO_TEST_SUITE_END()
