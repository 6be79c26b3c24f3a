#define BOOST_TEST_MODULE AuctionTests
#include <boost/test/unit_test.hpp>

#include "ledger_fixture.hpp"

BOOST_FIXTURE_TEST_SUITE( auction_tests, ledger_fixture )

BOOST_AUTO_TEST_CASE( outbid_bidder_is_refunded_to_vault )
{
   try {
      const auction_id_type auction_id = auction_unique_item( 1, 500 );
      BOOST_CHECK_EQUAL( auction_id, 1u );
      BOOST_CHECK( items->owner_of( 1 ) == auction_ledger() );
      BOOST_CHECK( market->get_auction_status( auction_id ) == auction_status::active );

      BOOST_CHECK_THROW( market->bid( call_context( bidder, 400 ), auction_id, 0, 400 ), bid_too_low );

      market->bid( call_context( bidder, 500 ), auction_id, 0, 500 );
      BOOST_CHECK( market->get_highest_bidder( auction_id ) == bidder );
      BOOST_CHECK_EQUAL( market->get_escrow_balance( NFTEX_NATIVE_CURRENCY ).amount, 500 );

      BOOST_CHECK_THROW( market->bid( call_context( rival, 500 ), auction_id, 0, 500 ), bid_too_low );

      market->bid( call_context( rival, 600 ), auction_id, 0, 600 );
      BOOST_CHECK( market->get_highest_bidder( auction_id ) == rival );
      BOOST_CHECK_EQUAL( claimable( bidder ), 500 );
      BOOST_CHECK_EQUAL( market->get_bid( auction_id, bidder ).amount, 0 );
      BOOST_CHECK_EQUAL( market->get_escrow_balance( NFTEX_NATIVE_CURRENCY ).amount, 600 );
      BOOST_CHECK( is_solvent() );

      // the refund plus new funds outbids the rival
      market->bid( call_context( bidder, 200 ), auction_id, 500, 200 );
      BOOST_CHECK( market->get_highest_bidder( auction_id ) == bidder );
      BOOST_CHECK_EQUAL( market->get_bid( auction_id, bidder ).amount, 700 );
      BOOST_CHECK_EQUAL( claimable( bidder ), 0 );
      BOOST_CHECK_EQUAL( claimable( rival ), 600 );
      BOOST_CHECK_EQUAL( market->get_escrow_balance( NFTEX_NATIVE_CURRENCY ).amount, 700 );
      BOOST_CHECK( is_solvent() );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string() ) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( highest_bidder_can_raise )
{
   const auction_id_type auction_id = auction_unique_item( 1, 100 );
   market->bid( call_context( bidder, 100 ), auction_id, 0, 100 );
   market->bid( call_context( bidder, 50 ), auction_id, 0, 50 );

   BOOST_CHECK_EQUAL( market->get_bid( auction_id, bidder ).amount, 150 );
   BOOST_CHECK_EQUAL( market->get_escrow_balance( NFTEX_NATIVE_CURRENCY ).amount, 150 );
   BOOST_CHECK_EQUAL( wallet( bidder ), NFTEX_TEST_WALLET_FUNDS - 150 );

   // adding nothing does not beat the standing bid
   BOOST_CHECK_THROW( market->bid( bidder, auction_id, 0, 0 ), bid_too_low );
}

BOOST_AUTO_TEST_CASE( bid_validation )
{
   const auction_id_type auction_id = market->create_auction( seller, unique_item( 1 ), in( 600 ), in( 3600 ), asset( 100 ) );

   BOOST_CHECK( market->get_auction_status( auction_id ) == auction_status::pending );
   BOOST_CHECK_THROW( market->bid( call_context( bidder, 100 ), auction_id, 0, 100 ), auction_not_active );
   BOOST_CHECK_THROW( market->bid( call_context( bidder, 100 ), 42, 0, 100 ), unknown_auction );

   advance_time( 600 );
   BOOST_CHECK_THROW( market->bid( call_context( seller, 100 ), auction_id, 0, 100 ), seller_cannot_bid );
   BOOST_CHECK_THROW( market->bid( call_context( bidder, 0 ), auction_id, 0, -100 ), invalid_amount );
   BOOST_CHECK_THROW( market->bid( call_context( bidder, 90 ), auction_id, 0, 100 ), payment_mismatch );
   BOOST_CHECK_THROW( market->bid( bidder, auction_id, 100, 0 ), insufficient_vault_balance );

   BOOST_CHECK( market->get_highest_bidder( auction_id ).is_null() );
   BOOST_CHECK_EQUAL( wallet( bidder ), NFTEX_TEST_WALLET_FUNDS );

   advance_time( 3000 );
   BOOST_CHECK( market->get_auction_status( auction_id ) == auction_status::ended );
   BOOST_CHECK_THROW( market->bid( call_context( bidder, 100 ), auction_id, 0, 100 ), auction_not_active );
}

BOOST_AUTO_TEST_CASE( create_auction_validation )
{
   BOOST_CHECK_THROW( market->create_auction( seller, unique_item( 1 ), in( 10 ), in( 0 ), asset( 1 ) ), invalid_time_window );
   BOOST_CHECK_THROW( market->create_auction( seller, unique_item( 1 ), in( 0 ), in( 10 ), asset( -1 ) ), invalid_amount );
   BOOST_CHECK_THROW( market->create_auction( buyer, unique_item( 1 ), in( 0 ), in( 10 ), asset( 1 ) ), insufficient_item_balance );
   BOOST_CHECK_THROW( market->create_auction( seller, unique_item( 1 ), in( 0 ), in( 10 ), asset( 1, stranger ) ),
                      unapproved_currency );

   market->registry().set_listing_contract_approval( admin, auction_ledger(), false );
   BOOST_CHECK_THROW( auction_unique_item( 1, 1 ), ledger_deprecated );

   BOOST_CHECK_EQUAL( market->database().last_auction_id(), 0u );
}

BOOST_AUTO_TEST_CASE( fungible_auction_custodies_one_unit )
{
   const auction_id_type auction_id = market->create_auction( seller, fungible_item( 7 ), in( 0 ), in( 60 ), asset( 10 ) );
   BOOST_CHECK_EQUAL( items->balance_of( auction_ledger(), 7 ), 1 );
   BOOST_CHECK_EQUAL( items->balance_of( seller, 7 ), 99 );

   market->bid( call_context( bidder, 10 ), auction_id, 0, 10 );
   advance_time( 60 );
   market->resolve_auction( bidder, auction_id );
   BOOST_CHECK_EQUAL( items->balance_of( bidder, 7 ), 1 );
}

BOOST_AUTO_TEST_CASE( resolve_pays_seller_and_delivers_item )
{
   const auction_id_type auction_id = auction_unique_item( 1, 1000 );
   market->bid( call_context( bidder, 1000 ), auction_id, 0, 1000 );
   market->bid( call_context( rival, 2000 ), auction_id, 0, 2000 );

   BOOST_CHECK_THROW( market->resolve_auction( seller, auction_id ), auction_not_finished );

   advance_time( 3600 );
   BOOST_CHECK_THROW( market->resolve_auction( stranger, auction_id ), unauthorized );
   // an outbid bidder is no longer a party to the settlement
   BOOST_CHECK_THROW( market->resolve_auction( bidder, auction_id ), unauthorized );

   market->resolve_auction( rival, auction_id );

   BOOST_CHECK( items->owner_of( 1 ) == rival );
   BOOST_CHECK( market->get_auction_status( auction_id ) == auction_status::ended_and_claimed );
   BOOST_CHECK_EQUAL( market->get_escrow_balance( NFTEX_NATIVE_CURRENCY ).amount, 0 );
   BOOST_CHECK_EQUAL( market->get_bid( auction_id, rival ).amount, 0 );
   BOOST_CHECK_EQUAL( claimable( fee_collector ), 60 );
   BOOST_CHECK_EQUAL( claimable( artist ), 100 );
   BOOST_CHECK_EQUAL( claimable( seller ), 1840 );
   BOOST_CHECK_EQUAL( claimable( bidder ), 1000 );
   BOOST_CHECK( is_solvent() );

   BOOST_CHECK_THROW( market->resolve_auction( seller, auction_id ), auction_already_settled );
}

BOOST_AUTO_TEST_CASE( seller_or_administrator_can_resolve )
{
   const auction_id_type first = auction_unique_item( 1, 10 );
   const auction_id_type second = auction_unique_item( 2, 10 );
   market->bid( call_context( bidder, 10 ), first, 0, 10 );
   market->bid( call_context( bidder, 10 ), second, 0, 10 );
   advance_time( 3600 );

   market->resolve_auction( seller, first );
   market->resolve_auction( admin, second );

   BOOST_CHECK( items->owner_of( 1 ) == bidder );
   BOOST_CHECK( items->owner_of( 2 ) == bidder );
}

BOOST_AUTO_TEST_CASE( auction_without_bids_returns_item )
{
   const auction_id_type auction_id = auction_unique_item( 1, 10 );
   advance_time( 3600 );

   market->resolve_auction( seller, auction_id );
   BOOST_CHECK( items->owner_of( 1 ) == seller );
   BOOST_CHECK_EQUAL( claimable( seller ), 0 );
   BOOST_CHECK( market->get_auction_status( auction_id ) == auction_status::ended_and_claimed );
}

BOOST_AUTO_TEST_CASE( zero_reserve_requires_a_positive_bid )
{
   const auction_id_type auction_id = auction_unique_item( 1, 0 );
   BOOST_CHECK_THROW( market->bid( bidder, auction_id, 0, 0 ), bid_too_low );

   market->bid( call_context( bidder, 1 ), auction_id, 0, 1 );
   advance_time( 3600 );
   market->resolve_auction( bidder, auction_id );
   BOOST_CHECK( items->owner_of( 1 ) == bidder );
   BOOST_CHECK_EQUAL( claimable( seller ), 1 );
}

BOOST_AUTO_TEST_CASE( cancel_auction_refunds_highest_bid )
{
   const auction_id_type auction_id = auction_unique_item( 1, 100 );
   market->bid( call_context( bidder, 150 ), auction_id, 0, 150 );

   BOOST_CHECK_THROW( market->cancel_auction( bidder, auction_id ), not_seller );
   market->cancel_auction( seller, auction_id );

   BOOST_CHECK( market->get_auction_status( auction_id ) == auction_status::cancelled );
   BOOST_CHECK_EQUAL( claimable( bidder ), 150 );
   BOOST_CHECK_EQUAL( market->get_escrow_balance( NFTEX_NATIVE_CURRENCY ).amount, 0 );
   BOOST_CHECK( market->get_highest_bidder( auction_id ).is_null() );
   BOOST_CHECK_THROW( market->bid( call_context( rival, 200 ), auction_id, 0, 200 ), auction_not_active );
   BOOST_CHECK_THROW( market->cancel_auction( seller, auction_id ), auction_not_active );

   market->resolve_auction( seller, auction_id );
   BOOST_CHECK( items->owner_of( 1 ) == seller );
   BOOST_CHECK( is_solvent() );
}

BOOST_AUTO_TEST_CASE( administrator_can_cancel_auction )
{
   const auction_id_type auction_id = auction_unique_item( 1, 100 );
   market->cancel_auction( admin, auction_id );
   BOOST_CHECK( market->get_auction_status( auction_id ) == auction_status::cancelled );
}

BOOST_AUTO_TEST_CASE( deprecated_auction_ledger_refunds_on_resolve )
{
   const auction_id_type auction_id = auction_unique_item( 1, 100 );
   market->bid( call_context( bidder, 300 ), auction_id, 0, 300 );

   market->registry().set_listing_contract_approval( admin, auction_ledger(), false );
   BOOST_CHECK( market->get_auction_status( auction_id ) == auction_status::cancelled );
   BOOST_CHECK_THROW( market->bid( call_context( rival, 400 ), auction_id, 0, 400 ), auction_not_active );

   market->resolve_auction( bidder, auction_id );
   BOOST_CHECK( items->owner_of( 1 ) == seller );
   BOOST_CHECK_EQUAL( claimable( bidder ), 300 );
   BOOST_CHECK_EQUAL( claimable( seller ), 0 );
   BOOST_CHECK( is_solvent() );
}

BOOST_AUTO_TEST_CASE( token_auction )
{
   const auction_id_type auction_id = market->create_auction( seller, unique_item( 2 ), in( 0 ), in( 60 ), asset( 100, token ) );

   BOOST_CHECK_THROW( market->bid( call_context( bidder, 100 ), auction_id, 0, 100 ), payment_mismatch );
   market->bid( bidder, auction_id, 0, 100 );
   market->bid( rival, auction_id, 0, 120 );

   BOOST_CHECK_EQUAL( claimable( bidder, token ), 100 );
   BOOST_CHECK_EQUAL( market->get_escrow_balance( token ).amount, 120 );
   BOOST_CHECK_EQUAL( market->get_escrow_balance( NFTEX_NATIVE_CURRENCY ).amount, 0 );
   BOOST_CHECK( is_solvent( token ) );
}

BOOST_AUTO_TEST_SUITE_END()
