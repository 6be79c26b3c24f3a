#pragma once

#include <nftex/ledger/config.hpp>
#include <nftex/ledger/exceptions.hpp>
#include <nftex/ledger/marketplace.hpp>
#include <nftex/ledger/simulated_collaborators.hpp>
#include <nftex/ledger/time.hpp>

#include <fc/exception/exception.hpp>
#include <fc/filesystem.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>

using namespace nftex::ledger;

#define NFTEX_TEST_WALLET_FUNDS int64_t(1000000)

/**
 *  A marketplace with a 3% fee, one approved item contract paying 5% royalties
 *  to an artist, funded buyer and bidder wallets, and the clock stopped at
 *  2020-01-01.
 */
struct ledger_fixture
{
   ledger_fixture()
   :admin( address::from_label( "admin" ) ),
    fee_collector( address::from_label( "fee_collector" ) ),
    seller( address::from_label( "seller" ) ),
    buyer( address::from_label( "buyer" ) ),
    bidder( address::from_label( "bidder" ) ),
    rival( address::from_label( "rival" ) ),
    artist( address::from_label( "artist" ) ),
    stranger( address::from_label( "stranger" ) ),
    token( address::from_label( "token" ) ),
    gallery( address::from_label( "gallery" ) )
   { try {
      start_simulated_time( fc::time_point::from_iso_string( "20200101T000000" ) );
      disable_logging();

      items = std::make_shared<simulated_item_contract>();
      items->set_royalty( artist, 500, 10000 );
      items->mint_unique( seller, 1 );
      items->mint_unique( seller, 2 );
      items->mint( seller, 7, 100 );

      directory = std::make_shared<simulated_item_directory>();
      directory->add_item_contract( gallery, items );

      payments = std::make_shared<simulated_payment_rail>();
      for( const address& owner : { buyer, bidder, rival, artist } )
      {
         payments->deposit( owner, asset( NFTEX_TEST_WALLET_FUNDS ) );
         payments->deposit( owner, asset( NFTEX_TEST_WALLET_FUNDS, token ) );
         payments->approve( owner, token, NFTEX_TEST_WALLET_FUNDS );
      }

      config.administrators.push_back( admin );
      config.fee_recipient = fee_collector;
      config.approved_item_contracts.push_back( gallery );
      config.approved_currencies.push_back( NFTEX_NATIVE_CURRENCY );
      config.approved_currencies.push_back( token );

      market = std::make_shared<marketplace>( config, directory, payments );
      market->open( data_dir.path() );
   } FC_LOG_AND_RETHROW() }

   ~ledger_fixture()
   {
      market.reset();
      stop_simulated_time();
   }

   void disable_logging()
   {
      fc::logging_config cfg;
      fc::configure_logging( cfg );
   }

   item_reference unique_item( item_id_type id )const
   {
      item_reference item;
      item.contract = gallery;
      item.item_id = id;
      item.kind = nftex::ledger::unique_item;
      return item;
   }

   item_reference fungible_item( item_id_type id )const
   {
      item_reference item;
      item.contract = gallery;
      item.item_id = id;
      item.kind = fungible_quantity;
      return item;
   }

   time_point_sec in( int32_t seconds )const
   {
      return now() + seconds;
   }

   const address& sale_ledger()const { return config.sale_ledger; }
   const address& auction_ledger()const { return config.auction_ledger; }

   share_type claimable( const address& owner, const address& currency = NFTEX_NATIVE_CURRENCY )const
   {
      return market->get_claimable_balance( owner, currency ).amount;
   }

   share_type wallet( const address& owner, const address& currency = NFTEX_NATIVE_CURRENCY )const
   {
      return payments->get_wallet_balance( owner, currency ).amount;
   }

   /** every claim balance plus escrow in one currency */
   share_type owed( const address& currency = NFTEX_NATIVE_CURRENCY )const
   {
      share_type total = market->get_escrow_balance( currency ).amount;
      for( const claim_balance_record& record : market->database().get_claim_balances() )
      {
         if( record.index.currency == currency )
            total += record.balance;
      }
      return total;
   }

   /** what the marketplace holds must equal what it owes */
   bool is_solvent( const address& currency = NFTEX_NATIVE_CURRENCY )const
   {
      return payments->get_treasury_balance( currency ).amount == owed( currency );
   }

   sale_id_type list_unique_item( item_id_type id, share_type price, int32_t duration = 3600 )
   {
      return market->create_sale( seller, unique_item( id ), 1, in( 0 ), in( duration ), asset( price ) );
   }

   auction_id_type auction_unique_item( item_id_type id, share_type reserve, int32_t duration = 3600 )
   {
      return market->create_auction( seller, unique_item( id ), in( 0 ), in( duration ), asset( reserve ) );
   }

   fc::temp_directory                data_dir;

   address                           admin;
   address                           fee_collector;
   address                           seller;
   address                           buyer;
   address                           bidder;
   address                           rival;
   address                           artist;
   address                           stranger;
   address                           token;
   address                           gallery;

   market_config                     config;
   simulated_item_contract_ptr       items;
   simulated_item_directory_ptr      directory;
   simulated_payment_rail_ptr        payments;
   marketplace_ptr                   market;
};
