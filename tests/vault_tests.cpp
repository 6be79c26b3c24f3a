#define BOOST_TEST_MODULE VaultTests
#include <boost/test/unit_test.hpp>

#include "ledger_fixture.hpp"

BOOST_FIXTURE_TEST_SUITE( vault_tests, ledger_fixture )

BOOST_AUTO_TEST_CASE( claim_pays_out_whole_balance )
{
   try {
      list_unique_item( 1, 1000 );
      market->buy( call_context( buyer, 1000 ), 1, address(), 1 );

      const asset withdrawn = market->claim( seller, NFTEX_NATIVE_CURRENCY );
      BOOST_CHECK_EQUAL( withdrawn.amount, 920 );
      BOOST_CHECK( withdrawn.is_native() );
      BOOST_CHECK_EQUAL( wallet( seller ), 920 );
      BOOST_CHECK_EQUAL( claimable( seller ), 0 );

      BOOST_CHECK_THROW( market->claim( seller, NFTEX_NATIVE_CURRENCY ), nothing_to_claim );
      BOOST_CHECK_THROW( market->claim( seller, token ), nothing_to_claim );

      market->claim( fee_collector, NFTEX_NATIVE_CURRENCY );
      market->claim( artist, NFTEX_NATIVE_CURRENCY );
      BOOST_CHECK_EQUAL( payments->get_treasury_balance( NFTEX_NATIVE_CURRENCY ).amount, 0 );
      BOOST_CHECK( is_solvent() );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string() ) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( claim_rejects_attached_value )
{
   list_unique_item( 1, 1000 );
   market->buy( call_context( buyer, 1000 ), 1, address(), 1 );

   BOOST_CHECK_THROW( market->claim( call_context( seller, 1 ), NFTEX_NATIVE_CURRENCY ), payment_mismatch );
   BOOST_CHECK_EQUAL( claimable( seller ), 920 );
}

BOOST_AUTO_TEST_CASE( claim_is_per_currency )
{
   market->create_sale( seller, unique_item( 1 ), 1, in( 0 ), in( 60 ), asset( 100, token ) );
   market->buy( buyer, 1, address(), 1 );
   list_unique_item( 2, 100 );
   market->buy( call_context( buyer, 100 ), 2, address(), 1 );

   BOOST_CHECK_EQUAL( market->claim( seller, token ).amount, 92 );
   BOOST_CHECK_EQUAL( wallet( seller, token ), 92 );
   BOOST_CHECK_EQUAL( claimable( seller ), 92 );
   BOOST_CHECK( is_solvent( token ) );
   BOOST_CHECK( is_solvent() );
}

BOOST_AUTO_TEST_CASE( rejected_payout_keeps_balance )
{
   list_unique_item( 1, 1000 );
   market->buy( call_context( buyer, 1000 ), 1, address(), 1 );

   payments->set_rejects_payments( seller, true );
   BOOST_CHECK_THROW( market->claim( seller, NFTEX_NATIVE_CURRENCY ), transfer_failure );
   BOOST_CHECK_EQUAL( claimable( seller ), 920 );
   BOOST_CHECK_EQUAL( wallet( seller ), 0 );
   BOOST_CHECK( is_solvent() );

   payments->set_rejects_payments( seller, false );
   BOOST_CHECK_EQUAL( market->claim( seller, NFTEX_NATIVE_CURRENCY ).amount, 920 );
}

BOOST_AUTO_TEST_CASE( failed_item_transfer_reverts_purchase )
{
   const sale_id_type sale_id = list_unique_item( 1, 1000 );

   items->set_transfers_enabled( false );
   BOOST_CHECK_THROW( market->buy( call_context( buyer, 1000 ), sale_id, address(), 1 ), transfer_failure );

   BOOST_CHECK_EQUAL( market->get_sale( sale_id ).purchased, 0 );
   BOOST_CHECK_EQUAL( market->get_purchased_quantity( sale_id, buyer ), 0 );
   BOOST_CHECK_EQUAL( claimable( seller ), 0 );
   BOOST_CHECK_EQUAL( claimable( fee_collector ), 0 );
   BOOST_CHECK_EQUAL( wallet( buyer ), NFTEX_TEST_WALLET_FUNDS );
   BOOST_CHECK( items->owner_of( 1 ) == sale_ledger() );
   BOOST_CHECK( is_solvent() );

   items->set_transfers_enabled( true );
   market->buy( call_context( buyer, 1000 ), sale_id, address(), 1 );
   BOOST_CHECK( items->owner_of( 1 ) == buyer );
}

BOOST_AUTO_TEST_CASE( failed_listing_transfer_discards_sale )
{
   items->set_transfers_enabled( false );
   BOOST_CHECK_THROW( list_unique_item( 1, 10 ), transfer_failure );
   BOOST_CHECK_THROW( market->get_sale( 1 ), unknown_sale );
   BOOST_CHECK_EQUAL( market->database().last_sale_id(), 0u );
   BOOST_CHECK( market->database().get_sales().empty() );
}

BOOST_AUTO_TEST_CASE( failed_token_pull_reverts_bid )
{
   const auction_id_type auction_id = market->create_auction( seller, unique_item( 1 ), in( 0 ), in( 60 ), asset( 100, token ) );

   payments->approve( bidder, token, 50 );
   BOOST_CHECK_THROW( market->bid( bidder, auction_id, 0, 100 ), transfer_failure );
   BOOST_CHECK( market->get_highest_bidder( auction_id ).is_null() );
   BOOST_CHECK_EQUAL( market->get_escrow_balance( token ).amount, 0 );
   BOOST_CHECK_EQUAL( wallet( bidder, token ), NFTEX_TEST_WALLET_FUNDS );
}

BOOST_AUTO_TEST_CASE( payout_callback_cannot_reenter )
{
   list_unique_item( 1, 1000 );
   market->buy( call_context( buyer, 1000 ), 1, address(), 1 );

   // the seller's wallet tries to claim again from inside the payout
   uint32_t attempts = 0;
   bool reentry_rejected = false;
   payments->set_payout_hook( [&]( const address& to, const asset& amount )
   {
      if( to != seller || attempts++ > 0 ) return;
      try
      {
         market->claim( seller, NFTEX_NATIVE_CURRENCY );
      }
      catch( const reentrant_call& )
      {
         reentry_rejected = true;
      }
   } );

   BOOST_CHECK_EQUAL( market->claim( seller, NFTEX_NATIVE_CURRENCY ).amount, 920 );
   BOOST_CHECK( reentry_rejected );
   BOOST_CHECK_EQUAL( wallet( seller ), 920 );
   BOOST_CHECK_EQUAL( claimable( seller ), 0 );
   BOOST_CHECK( is_solvent() );
}

BOOST_AUTO_TEST_CASE( reentrant_call_fails_whole_operation )
{
   const sale_id_type sale_id = market->create_sale( seller, fungible_item( 7 ), 10, in( 0 ), in( 60 ), asset( 10 ) );

   // a recipient that buys again on receipt and lets the failure escape
   items->set_transfer_hook( [&]( const address& from, const address& to, item_id_type item_id, share_type quantity )
   {
      if( to == buyer )
         market->buy( call_context( buyer, 10 ), sale_id, address(), 1 );
   } );

   BOOST_CHECK_THROW( market->buy( call_context( buyer, 10 ), sale_id, address(), 1 ), transfer_failure );
   items->set_transfer_hook( simulated_item_contract::transfer_hook() );

   BOOST_CHECK_EQUAL( market->get_sale( sale_id ).purchased, 0 );
   BOOST_CHECK_EQUAL( items->balance_of( buyer, 7 ), 0 );
   BOOST_CHECK_EQUAL( wallet( buyer ), NFTEX_TEST_WALLET_FUNDS );
   BOOST_CHECK( is_solvent() );

   market->buy( call_context( buyer, 10 ), sale_id, address(), 1 );
   BOOST_CHECK_EQUAL( items->balance_of( buyer, 7 ), 1 );
}

BOOST_AUTO_TEST_CASE( failing_payout_callback_keeps_balance )
{
   list_unique_item( 1, 1000 );
   market->buy( call_context( buyer, 1000 ), 1, address(), 1 );

   // the seller's wallet claims again from inside the payout and lets the failure escape
   payments->set_payout_hook( [&]( const address& to, const asset& amount )
   {
      if( to == seller )
         market->claim( seller, NFTEX_NATIVE_CURRENCY );
   } );

   BOOST_CHECK_THROW( market->claim( seller, NFTEX_NATIVE_CURRENCY ), transfer_failure );
   payments->set_payout_hook( simulated_payment_rail::payout_hook() );

   BOOST_CHECK_EQUAL( wallet( seller ), 0 );
   BOOST_CHECK_EQUAL( claimable( seller ), 920 );
   BOOST_CHECK( is_solvent() );

   BOOST_CHECK_EQUAL( market->claim( seller, NFTEX_NATIVE_CURRENCY ).amount, 920 );
   BOOST_CHECK_EQUAL( wallet( seller ), 920 );
   BOOST_CHECK( is_solvent() );
}

BOOST_AUTO_TEST_CASE( unreturnable_payment_is_credited_to_payer )
{
   const sale_id_type sale_id = list_unique_item( 1, 1000 );

   items->set_transfers_enabled( false );
   payments->set_rejects_payments( buyer, true );
   BOOST_CHECK_THROW( market->buy( call_context( buyer, 1000 ), sale_id, address(), 1 ), transfer_failure );

   BOOST_CHECK_EQUAL( market->get_sale( sale_id ).purchased, 0 );
   BOOST_CHECK_EQUAL( claimable( seller ), 0 );
   BOOST_CHECK_EQUAL( claimable( buyer ), 1000 );
   BOOST_CHECK_EQUAL( wallet( buyer ), NFTEX_TEST_WALLET_FUNDS - 1000 );
   BOOST_CHECK( items->owner_of( 1 ) == sale_ledger() );
   BOOST_CHECK( is_solvent() );

   payments->set_rejects_payments( buyer, false );
   BOOST_CHECK_EQUAL( market->claim( buyer, NFTEX_NATIVE_CURRENCY ).amount, 1000 );
   BOOST_CHECK_EQUAL( wallet( buyer ), NFTEX_TEST_WALLET_FUNDS );
   BOOST_CHECK( is_solvent() );
}

BOOST_AUTO_TEST_SUITE_END()
