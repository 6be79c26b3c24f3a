#define BOOST_TEST_MODULE SaleTests
#include <boost/test/unit_test.hpp>

#include "ledger_fixture.hpp"

#include <fc/io/json.hpp>
#include <fc/reflect/variant.hpp>

BOOST_FIXTURE_TEST_SUITE( sale_tests, ledger_fixture )

BOOST_AUTO_TEST_CASE( buy_unique_item_splits_proceeds )
{
   try {
      const sale_id_type sale_id = list_unique_item( 1, 1000 );
      BOOST_CHECK_EQUAL( sale_id, 1u );
      BOOST_CHECK( items->owner_of( 1 ) == sale_ledger() );
      BOOST_CHECK( market->get_sale_status( sale_id ) == sale_status::active );

      BOOST_CHECK( market->buy( call_context( buyer, 1000 ), sale_id, address(), 1 ) );

      BOOST_CHECK( items->owner_of( 1 ) == buyer );
      BOOST_CHECK_EQUAL( wallet( buyer ), NFTEX_TEST_WALLET_FUNDS - 1000 );
      BOOST_CHECK_EQUAL( claimable( fee_collector ), 30 );
      BOOST_CHECK_EQUAL( claimable( artist ), 50 );
      BOOST_CHECK_EQUAL( claimable( seller ), 920 );
      BOOST_CHECK_EQUAL( market->get_purchased_quantity( sale_id, buyer ), 1 );
      BOOST_CHECK( market->get_sale_status( sale_id ) == sale_status::ended );
      BOOST_CHECK( is_solvent() );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string() ) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( attached_value_must_match_price )
{
   const sale_id_type sale_id = list_unique_item( 1, 1000 );

   BOOST_CHECK_THROW( market->buy( call_context( buyer, 999 ), sale_id, address(), 1 ), payment_mismatch );
   BOOST_CHECK_THROW( market->buy( call_context( buyer, 1001 ), sale_id, address(), 1 ), payment_mismatch );
   BOOST_CHECK_THROW( market->buy( call_context( buyer, -1 ), sale_id, address(), 1 ), invalid_amount );

   BOOST_CHECK_EQUAL( market->get_sale( sale_id ).purchased, 0 );
   BOOST_CHECK_EQUAL( wallet( buyer ), NFTEX_TEST_WALLET_FUNDS );
   BOOST_CHECK( items->owner_of( 1 ) == sale_ledger() );
}

BOOST_AUTO_TEST_CASE( fungible_sale_partial_purchase_and_reclaim )
{
   const sale_id_type sale_id = market->create_sale( seller, fungible_item( 7 ), 10, in( 0 ), in( 3600 ), asset( 100 ) );
   BOOST_CHECK_EQUAL( items->balance_of( seller, 7 ), 90 );
   BOOST_CHECK_EQUAL( items->balance_of( sale_ledger(), 7 ), 10 );

   market->buy( call_context( buyer, 300 ), sale_id, stranger, 3 );
   BOOST_CHECK_EQUAL( items->balance_of( stranger, 7 ), 3 );
   BOOST_CHECK_EQUAL( items->balance_of( buyer, 7 ), 0 );
   BOOST_CHECK_EQUAL( market->get_purchased_quantity( sale_id, buyer ), 3 );

   BOOST_CHECK_THROW( market->buy( call_context( buyer, 800 ), sale_id, address(), 8 ), insufficient_stock );
   BOOST_CHECK_THROW( market->buy( call_context( buyer, 0 ), sale_id, address(), 0 ), invalid_quantity );
   BOOST_CHECK_THROW( market->claim_sale_items( seller, sale_id ), sale_not_finished );

   advance_time( 3600 );
   BOOST_CHECK( market->get_sale_status( sale_id ) == sale_status::ended );
   BOOST_CHECK_THROW( market->buy( call_context( buyer, 100 ), sale_id, address(), 1 ), sale_not_active );
   BOOST_CHECK_THROW( market->claim_sale_items( buyer, sale_id ), not_seller );

   market->claim_sale_items( seller, sale_id );
   BOOST_CHECK_EQUAL( items->balance_of( seller, 7 ), 97 );
   BOOST_CHECK_EQUAL( items->balance_of( sale_ledger(), 7 ), 0 );
   BOOST_CHECK_EQUAL( market->get_sale( sale_id ).remaining(), 0 );
   BOOST_CHECK_THROW( market->claim_sale_items( seller, sale_id ), nothing_to_claim );

   // 3 x 100: 9 fee, 15 royalty
   BOOST_CHECK_EQUAL( claimable( fee_collector ), 9 );
   BOOST_CHECK_EQUAL( claimable( artist ), 15 );
   BOOST_CHECK_EQUAL( claimable( seller ), 276 );
   BOOST_CHECK( is_solvent() );
}

BOOST_AUTO_TEST_CASE( buy_with_claimable_balance )
{
   list_unique_item( 1, 1000 );
   market->buy( call_context( buyer, 1000 ), 1, address(), 1 );
   BOOST_CHECK_EQUAL( claimable( artist ), 50 );

   const sale_id_type sale_id = market->create_sale( seller, fungible_item( 7 ), 5, in( 0 ), in( 3600 ), asset( 100 ) );

   BOOST_CHECK_THROW( market->buy( call_context( artist, 0 ), sale_id, address(), 1, 101 ), payment_mismatch );
   BOOST_CHECK_THROW( market->buy( call_context( stranger, 0 ), sale_id, address(), 1, 100 ), insufficient_vault_balance );
   BOOST_CHECK_THROW( market->buy( call_context( artist, 50 ), sale_id, address(), 1, -1 ), invalid_amount );

   market->buy( call_context( artist, 50 ), sale_id, address(), 1, 50 );

   // the artist spent the 50 it was owed and earned 5 royalty on the new sale
   BOOST_CHECK_EQUAL( claimable( artist ), 5 );
   BOOST_CHECK_EQUAL( wallet( artist ), NFTEX_TEST_WALLET_FUNDS - 50 );
   BOOST_CHECK_EQUAL( items->balance_of( artist, 7 ), 1 );
   BOOST_CHECK( is_solvent() );
}

BOOST_AUTO_TEST_CASE( token_sale_pulls_allowance )
{
   const sale_id_type sale_id = market->create_sale( seller, unique_item( 2 ), 1, in( 0 ), in( 3600 ), asset( 2000, token ) );

   BOOST_CHECK_THROW( market->buy( call_context( buyer, 2000 ), sale_id, address(), 1 ), payment_mismatch );

   market->buy( buyer, sale_id, address(), 1 );
   BOOST_CHECK( items->owner_of( 2 ) == buyer );
   BOOST_CHECK_EQUAL( wallet( buyer, token ), NFTEX_TEST_WALLET_FUNDS - 2000 );
   BOOST_CHECK_EQUAL( payments->get_allowance( buyer, token ), NFTEX_TEST_WALLET_FUNDS - 2000 );
   BOOST_CHECK_EQUAL( claimable( seller, token ), 2000 - 60 - 100 );
   BOOST_CHECK_EQUAL( claimable( seller ), 0 );
   BOOST_CHECK( is_solvent( token ) );
}

BOOST_AUTO_TEST_CASE( listing_requires_eligibility )
{
   const address unlisted = address::from_label( "unlisted" );
   directory->add_item_contract( unlisted, std::make_shared<simulated_item_contract>() );

   item_reference foreign = unique_item( 1 );
   foreign.contract = unlisted;
   BOOST_CHECK_THROW( market->create_sale( seller, foreign, 1, in( 0 ), in( 60 ), asset( 1 ) ), unapproved_listing_contract );

   BOOST_CHECK_THROW( market->create_sale( seller, unique_item( 1 ), 1, in( 0 ), in( 60 ), asset( 1, stranger ) ),
                      unapproved_currency );

   items->set_royalty_support( false );
   BOOST_CHECK_THROW( market->create_sale( seller, unique_item( 1 ), 1, in( 0 ), in( 60 ), asset( 1 ) ),
                      missing_royalty_support );
   items->set_royalty_support( true );

   item_reference missing = unique_item( 1 );
   missing.contract = stranger;
   market->registry().set_listing_contract_approval( admin, stranger, true );
   BOOST_CHECK_THROW( market->create_sale( seller, missing, 1, in( 0 ), in( 60 ), asset( 1 ) ), unknown_item_contract );
}

BOOST_AUTO_TEST_CASE( listing_parameters_are_validated )
{
   BOOST_CHECK_THROW( market->create_sale( seller, unique_item( 1 ), 1, in( 60 ), in( 60 ), asset( 1 ) ), invalid_time_window );
   BOOST_CHECK_THROW( market->create_sale( seller, unique_item( 1 ), 2, in( 0 ), in( 60 ), asset( 1 ) ), invalid_quantity );
   BOOST_CHECK_THROW( market->create_sale( seller, fungible_item( 7 ), 0, in( 0 ), in( 60 ), asset( 1 ) ), invalid_quantity );
   BOOST_CHECK_THROW( market->create_sale( seller, fungible_item( 7 ), 101, in( 0 ), in( 60 ), asset( 1 ) ),
                      insufficient_item_balance );
   BOOST_CHECK_THROW( market->create_sale( buyer, unique_item( 1 ), 1, in( 0 ), in( 60 ), asset( 1 ) ),
                      insufficient_item_balance );
   BOOST_CHECK_THROW( market->create_sale( seller, unique_item( 1 ), 1, in( 0 ), in( 60 ), asset( -1 ) ), invalid_amount );
   BOOST_CHECK_THROW( market->create_sale( seller, fungible_item( 7 ), 100, in( 0 ), in( 60 ),
                                           asset( NFTEX_LEDGER_MAX_SHARES ) ),
                      addition_overflow );

   BOOST_CHECK_EQUAL( market->database().last_sale_id(), 0u );
   BOOST_CHECK( items->owner_of( 1 ) == seller );
}

BOOST_AUTO_TEST_CASE( zero_price_sale_transfers_without_payment )
{
   const sale_id_type sale_id = list_unique_item( 1, 0 );
   market->buy( buyer, sale_id, address(), 1 );

   BOOST_CHECK( items->owner_of( 1 ) == buyer );
   BOOST_CHECK_EQUAL( claimable( seller ), 0 );
   BOOST_CHECK_EQUAL( claimable( fee_collector ), 0 );
}

BOOST_AUTO_TEST_CASE( pending_sale_cannot_be_bought )
{
   const sale_id_type sale_id = market->create_sale( seller, unique_item( 1 ), 1, in( 600 ), in( 3600 ), asset( 10 ) );
   BOOST_CHECK( market->get_sale_status( sale_id ) == sale_status::pending );
   BOOST_CHECK_THROW( market->buy( call_context( buyer, 10 ), sale_id, address(), 1 ), sale_not_active );

   advance_time( 600 );
   BOOST_CHECK( market->get_sale_status( sale_id ) == sale_status::active );
   market->buy( call_context( buyer, 10 ), sale_id, address(), 1 );
}

BOOST_AUTO_TEST_CASE( cancel_sale )
{
   const sale_id_type sale_id = market->create_sale( seller, fungible_item( 7 ), 4, in( 0 ), in( 3600 ), asset( 10 ) );
   market->buy( call_context( buyer, 10 ), sale_id, address(), 1 );

   BOOST_CHECK_THROW( market->cancel_sale( buyer, sale_id ), not_seller );
   BOOST_CHECK_THROW( market->cancel_sale( seller, 99 ), unknown_sale );

   market->cancel_sale( seller, sale_id );
   BOOST_CHECK( market->get_sale_status( sale_id ) == sale_status::cancelled );
   BOOST_CHECK_THROW( market->cancel_sale( seller, sale_id ), sale_not_active );
   BOOST_CHECK_THROW( market->buy( call_context( buyer, 10 ), sale_id, address(), 1 ), sale_not_active );

   market->claim_sale_items( seller, sale_id );
   BOOST_CHECK_EQUAL( items->balance_of( seller, 7 ), 99 );
   BOOST_CHECK_EQUAL( items->balance_of( buyer, 7 ), 1 );
}

BOOST_AUTO_TEST_CASE( administrator_can_cancel_any_sale )
{
   const sale_id_type sale_id = list_unique_item( 1, 10 );
   market->cancel_sale( admin, sale_id );
   BOOST_CHECK( market->get_sale_status( sale_id ) == sale_status::cancelled );

   // only the seller takes the items back
   BOOST_CHECK_THROW( market->claim_sale_items( admin, sale_id ), not_seller );
   market->claim_sale_items( seller, sale_id );
   BOOST_CHECK( items->owner_of( 1 ) == seller );
}

BOOST_AUTO_TEST_CASE( deprecated_sale_ledger_cancels_listings )
{
   const sale_id_type sale_id = list_unique_item( 1, 10 );

   market->registry().set_listing_contract_approval( admin, sale_ledger(), false );
   BOOST_CHECK( market->is_sale_ledger_deprecated() );
   BOOST_CHECK( !market->is_auction_ledger_deprecated() );
   BOOST_CHECK( market->get_sale_status( sale_id ) == sale_status::cancelled );

   BOOST_CHECK_THROW( list_unique_item( 2, 10 ), ledger_deprecated );
   BOOST_CHECK_THROW( market->buy( call_context( buyer, 10 ), sale_id, address(), 1 ), sale_not_active );

   market->claim_sale_items( seller, sale_id );
   BOOST_CHECK( items->owner_of( 1 ) == seller );
}

BOOST_AUTO_TEST_CASE( sales_survive_reopen )
{
   const sale_id_type sale_id = market->create_sale( seller, fungible_item( 7 ), 10, in( 0 ), in( 3600 ), asset( 100 ) );
   market->buy( call_context( buyer, 200 ), sale_id, address(), 2 );
   const auction_id_type auction_id = auction_unique_item( 2, 50 );

   market->registry().approve_all_currencies( admin );
   market->registry().set_listing_contract_approval( admin, auction_ledger(), false );
   market->fees().set_fee_rate( admin, 10, 100 );
   market->authority().add_administrator( admin, stranger );
   market->close();

   marketplace reopened( config, directory, payments );
   reopened.open( data_dir.path() );

   const sale_record sale = reopened.get_sale( sale_id );
   BOOST_CHECK( sale.seller == seller );
   BOOST_CHECK_EQUAL( sale.purchased, 2 );
   BOOST_CHECK_EQUAL( reopened.get_purchased_quantity( sale_id, buyer ), 2 );
   BOOST_CHECK_EQUAL( reopened.get_claimable_balance( seller, NFTEX_NATIVE_CURRENCY ).amount, 200 - 6 - 10 );

   // policy changed after start-up is not reset to the config
   BOOST_CHECK( reopened.registry().are_all_currencies_approved() );
   BOOST_CHECK( reopened.registry().is_approved_currency( stranger ) );
   BOOST_CHECK( reopened.is_auction_ledger_deprecated() );
   BOOST_CHECK( reopened.get_auction_status( auction_id ) == auction_status::cancelled );
   BOOST_CHECK_EQUAL( reopened.fees().get_fee_rate(), 10 );
   BOOST_CHECK_EQUAL( reopened.fees().get_fee_scale(), 100 );
   BOOST_CHECK( reopened.authority().is_administrator( stranger ) );
   BOOST_CHECK_THROW( reopened.create_auction( seller, unique_item( 1 ), in( 0 ), in( 60 ), asset( 1 ) ),
                      ledger_deprecated );

   const sale_id_type next_id = reopened.create_sale( seller, unique_item( 1 ), 1, in( 0 ), in( 60 ), asset( 1 ) );
   BOOST_CHECK_EQUAL( next_id, sale_id + 1 );
}

BOOST_AUTO_TEST_CASE( committed_operations_reach_the_snapshot )
{
   const sale_id_type sale_id = market->create_sale( seller, fungible_item( 7 ), 10, in( 0 ), in( 3600 ), asset( 100 ) );
   market->buy( call_context( buyer, 300 ), sale_id, address(), 3 );
   market->fees().set_fee_recipient( admin, stranger );

   // read the file while the marketplace is still open
   ledger_database snapshot;
   snapshot.from_variant( fc::json::from_file( data_dir.path() / "ledger_state.json" ) );

   BOOST_REQUIRE( snapshot.get_sale_record( sale_id ).valid() );
   BOOST_CHECK_EQUAL( snapshot.get_sale_record( sale_id )->purchased, 3 );
   const oproperty_record policy = snapshot.get_property_record( property_id_type::market_policy );
   BOOST_REQUIRE( policy.valid() );
   BOOST_CHECK( policy->value.as<market_policy>().fee_recipient == stranger );
}

BOOST_AUTO_TEST_SUITE_END()
