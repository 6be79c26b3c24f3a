#include <nftex/ledger/auction_operations.hpp>
#include <nftex/ledger/claim_vault.hpp>
#include <nftex/ledger/exceptions.hpp>
#include <nftex/ledger/item_custody.hpp>
#include <nftex/ledger/marketplace.hpp>
#include <nftex/ledger/pending_ledger_state.hpp>
#include <nftex/ledger/sale_operations.hpp>
#include <nftex/ledger/vault_operations.hpp>

#include <fc/log/logger.hpp>
#include <fc/reflect/variant.hpp>

namespace nftex { namespace ledger {

   namespace detail
   {
      class reentrancy_guard
      {
         public:
            reentrancy_guard( bool& flag, const operation& op )
            :_flag( flag )
            {
               if( _flag )
                  FC_THROW_EXCEPTION( reentrant_call, "operation ${op} started while another operation is in progress",
                                      ("op",op) );
               _flag = true;
            }
            ~reentrancy_guard() { _flag = false; }

         private:
            bool& _flag;
      };
   }

   marketplace::marketplace( const market_config& config,
                             item_contract_directory_ptr item_contracts,
                             payment_rail_ptr payments )
   : _db( std::make_shared<ledger_database>() ), _payments( payments )
   { try {
      FC_ASSERT( item_contracts && payments );
      if( config.administrators.empty() )
         FC_THROW_EXCEPTION( invalid_parameters, "at least one administrator is required" );
      if( config.sale_ledger.is_null() || config.auction_ledger.is_null() || config.sale_ledger == config.auction_ledger )
         FC_THROW_EXCEPTION( invalid_parameters, "the sale and auction ledgers need distinct addresses" );

      _services.authority = std::make_shared<admin_authority>(
                  set<address>( config.administrators.begin(), config.administrators.end() ) );
      _services.registry = std::make_shared<eligibility_registry>( _services.authority );
      _services.fees = std::make_shared<fee_schedule>( _services.authority, config.fee_recipient,
                                                       config.fee_rate, config.fee_scale );
      _services.item_contracts = item_contracts;
      _services.sale_ledger = config.sale_ledger;
      _services.auction_ledger = config.auction_ledger;

      const address& admin = config.administrators.front();
      eligibility_registry& policy = *_services.registry;
      policy.set_listing_contract_approval( admin, config.sale_ledger, true );
      policy.set_listing_contract_approval( admin, config.auction_ledger, true );
      for( const address& contract : config.approved_item_contracts )
         policy.set_listing_contract_approval( admin, contract, true );
      for( const address& currency : config.approved_currencies )
         policy.set_currency_approval( admin, currency, true );
      if( config.approve_all_currencies )
         policy.approve_all_currencies( admin );

      _services.authority->administrators_changed.connect( [this]() { store_policy(); } );
      _services.fees->fee_changed.connect( [this]() { store_policy(); } );
      policy.listing_contract_approval_changed.connect( [this]( const address&, bool ) { store_policy(); } );
      policy.currency_approval_changed.connect( [this]( const address&, bool ) { store_policy(); } );
      policy.all_currencies_approved.connect( [this]() { store_policy(); } );
      store_policy();
   } FC_CAPTURE_AND_RETHROW( (config) ) }

   marketplace::~marketplace()
   {
      try
      {
         close();
      }
      catch( const fc::exception& e )
      {
         wlog( "unexpected exception closing marketplace: ${e}", ("e",e.to_detail_string()) );
      }
   }

   void marketplace::open( const fc::path& data_dir )
   { try {
      _db->open( data_dir );

      const oproperty_record stored = _db->get_property_record( property_id_type::market_policy );
      if( stored.valid() )
      {
         const market_policy policy = stored->value.as<market_policy>();
         _services.authority->load( policy.administrators );
         _services.fees->load( policy.fee_recipient, policy.fee_rate, policy.fee_scale );
         _services.registry->load( policy.listing_contracts, policy.currencies, policy.all_currencies_approved );
         ilog( "restored marketplace policy from ${d}", ("d",data_dir) );
      }
      else
      {
         store_policy();
      }
   } FC_CAPTURE_AND_RETHROW( (data_dir) ) }

   void marketplace::close()
   { try {
      _db->close();
   } FC_CAPTURE_AND_RETHROW() }

   market_policy marketplace::get_policy()const
   {
      market_policy policy;
      policy.administrators = _services.authority->get_administrators();
      policy.fee_recipient = _services.fees->get_fee_recipient();
      policy.fee_rate = _services.fees->get_fee_rate();
      policy.fee_scale = _services.fees->get_fee_scale();
      policy.listing_contracts = _services.registry->get_approved_listing_contracts();
      policy.currencies = _services.registry->get_approved_currencies();
      policy.all_currencies_approved = _services.registry->are_all_currencies_approved();
      return policy;
   }

   void marketplace::store_policy()
   { try {
      _db->store_property_record( property_id_type::market_policy, variant( get_policy() ) );
      _db->flush();
   } FC_CAPTURE_AND_RETHROW() }

   evaluation_state_ptr marketplace::apply_operation( const operation& op, const call_context& ctx )
   { try {
      detail::reentrancy_guard guard( _applying, op );

      const pending_ledger_state_ptr pending_state = std::make_shared<pending_ledger_state>( _db );
      const evaluation_state_ptr eval_state = std::make_shared<evaluation_state>( pending_state, _services, ctx );
      eval_state->evaluate( op );

      const pending_ledger_state_ptr undo_state = std::make_shared<pending_ledger_state>( _db );
      pending_state->build_undo_state( undo_state );
      pending_state->apply_changes();

      vector<external_transfer> executed;
      optional<string> failure;
      try
      {
         execute_transfers( eval_state->transfers, executed );
      }
      catch( const fc::exception& e )
      {
         elog( "reverting ${op}: ${e}", ("op",op)("e",e.to_detail_string()) );
         failure = e.to_string();
      }
      catch( const std::exception& e )
      {
         elog( "reverting ${op}: ${e}", ("op",op)("e",e.what()) );
         failure = string( e.what() );
      }

      if( failure.valid() )
      {
         undo_state->apply_changes();
         revert_transfers( executed );
         _db->flush();
         FC_THROW_EXCEPTION( transfer_failure, "external transfer failed: ${reason}", ("reason",*failure) );
      }

      _db->flush();
      return eval_state;
   } FC_CAPTURE_AND_RETHROW( (op)(ctx) ) }

   void marketplace::execute_transfer( const external_transfer& transfer )
   {
      switch( transfer.type )
      {
         case external_transfer::receive_payment:
         {
            if( transfer.amount.is_native() )
               _payments->receive_native( transfer.from, transfer.amount.amount );
            else
               _payments->pull_token( transfer.amount.currency, transfer.from, transfer.amount.amount );
            break;
         }
         case external_transfer::send_payment:
         {
            if( transfer.amount.is_native() )
               _payments->send_native( transfer.to, transfer.amount.amount );
            else
               _payments->send_token( transfer.amount.currency, transfer.to, transfer.amount.amount );
            break;
         }
         case external_transfer::move_items:
         {
            const item_contract_ptr contract = _services.item_contracts->find_item_contract( transfer.item.contract );
            if( !contract )
               FC_CAPTURE_AND_THROW( unknown_item_contract, (transfer.item.contract) );
            get_item_custody( transfer.item.kind ).transfer( *contract, transfer.from, transfer.to,
                                                             transfer.item.item_id, transfer.quantity );
            break;
         }
         default:
            FC_THROW_EXCEPTION( internal_fault, "unknown transfer type ${t}", ("t",transfer) );
      }
   }

   void marketplace::execute_transfers( const vector<external_transfer>& transfers, vector<external_transfer>& executed )
   {
      for( const external_transfer& transfer : transfers )
      {
         execute_transfer( transfer );
         executed.push_back( transfer );
      }
   }

   void marketplace::revert_transfers( const vector<external_transfer>& executed )
   {
      for( auto itr = executed.rbegin(); itr != executed.rend(); ++itr )
      {
         external_transfer reverse = *itr;
         switch( itr->type )
         {
            case external_transfer::receive_payment:
               reverse.type = external_transfer::send_payment;
               reverse.to = itr->from;
               reverse.from = address();
               break;
            case external_transfer::move_items:
               reverse.from = itr->to;
               reverse.to = itr->from;
               break;
            default:
               // a payout has left the marketplace and cannot be recalled
               elog( "cannot revert ${t}", ("t",*itr) );
               continue;
         }

         try
         {
            execute_transfer( reverse );
         }
         catch( const fc::exception& e )
         {
            elog( "failed to revert ${t}: ${e}", ("t",*itr)("e",e.to_detail_string()) );
            if( itr->type == external_transfer::receive_payment )
               refund_to_vault( *itr );
         }
         catch( const std::exception& e )
         {
            elog( "failed to revert ${t}: ${e}", ("t",*itr)("e",e.what()) );
            if( itr->type == external_transfer::receive_payment )
               refund_to_vault( *itr );
         }
      }
   }

   void marketplace::refund_to_vault( const external_transfer& payment )
   { try {
      claim_vault( *_db ).credit( payment.from, payment.amount );
      wlog( "credited ${a} to the claim balance of ${p} after its refund failed",
            ("a",payment.amount)("p",payment.from) );
   } FC_CAPTURE_AND_RETHROW( (payment) ) }

   sale_id_type marketplace::create_sale( const call_context& ctx, const item_reference& item, share_type quantity,
                                          const time_point_sec start_time, const time_point_sec end_time,
                                          const asset& price )
   {
      create_sale_operation op;
      op.item = item;
      op.quantity = quantity;
      op.start_time = start_time;
      op.end_time = end_time;
      op.price = price;
      return apply_operation( op, ctx )->created_id;
   }

   bool marketplace::buy( const call_context& ctx, const sale_id_type sale_id, const address& recipient,
                          share_type quantity, share_type amount_from_vault )
   {
      buy_sale_operation op;
      op.sale_id = sale_id;
      op.recipient = recipient;
      op.quantity = quantity;
      op.amount_from_vault = amount_from_vault;
      apply_operation( op, ctx );
      return true;
   }

   void marketplace::claim_sale_items( const call_context& ctx, const sale_id_type sale_id )
   {
      claim_sale_items_operation op;
      op.sale_id = sale_id;
      apply_operation( op, ctx );
   }

   void marketplace::cancel_sale( const call_context& ctx, const sale_id_type sale_id )
   {
      cancel_sale_operation op;
      op.sale_id = sale_id;
      apply_operation( op, ctx );
   }

   sale_record marketplace::get_sale( const sale_id_type sale_id )const
   {
      const osale_record sale = _db->get_sale_record( sale_id );
      if( !sale.valid() )
         FC_CAPTURE_AND_THROW( unknown_sale, (sale_id) );
      return *sale;
   }

   sale_status marketplace::get_sale_status( const sale_id_type sale_id )const
   {
      return get_sale( sale_id ).status( _db->now(), is_sale_ledger_deprecated() );
   }

   share_type marketplace::get_purchased_quantity( const sale_id_type sale_id, const address& buyer )const
   {
      const osale_purchase_record purchase = _db->get_sale_purchase_record( sale_purchase_index( sale_id, buyer ) );
      return purchase.valid() ? purchase->quantity : 0;
   }

   auction_id_type marketplace::create_auction( const call_context& ctx, const item_reference& item,
                                                const time_point_sec start_time, const time_point_sec end_time,
                                                const asset& reserve_price )
   {
      create_auction_operation op;
      op.item = item;
      op.start_time = start_time;
      op.end_time = end_time;
      op.reserve_price = reserve_price;
      return apply_operation( op, ctx )->created_id;
   }

   void marketplace::bid( const call_context& ctx, const auction_id_type auction_id,
                          share_type amount_from_vault, share_type external_funds )
   {
      auction_bid_operation op;
      op.auction_id = auction_id;
      op.amount_from_vault = amount_from_vault;
      op.external_funds = external_funds;
      apply_operation( op, ctx );
   }

   void marketplace::resolve_auction( const call_context& ctx, const auction_id_type auction_id )
   {
      resolve_auction_operation op;
      op.auction_id = auction_id;
      apply_operation( op, ctx );
   }

   void marketplace::cancel_auction( const call_context& ctx, const auction_id_type auction_id )
   {
      cancel_auction_operation op;
      op.auction_id = auction_id;
      apply_operation( op, ctx );
   }

   auction_record marketplace::get_auction( const auction_id_type auction_id )const
   {
      const oauction_record auction = _db->get_auction_record( auction_id );
      if( !auction.valid() )
         FC_CAPTURE_AND_THROW( unknown_auction, (auction_id) );
      return *auction;
   }

   auction_status marketplace::get_auction_status( const auction_id_type auction_id )const
   {
      return get_auction( auction_id ).status( _db->now(), is_auction_ledger_deprecated() );
   }

   bid_record marketplace::get_bid( const auction_id_type auction_id, const address& bidder )const
   {
      bid_record bid;
      bid.index = bid_index( auction_id, bidder );
      const obid_record record = _db->get_bid_record( bid.index );
      if( record.valid() ) bid = *record;
      return bid;
   }

   address marketplace::get_highest_bidder( const auction_id_type auction_id )const
   {
      return get_auction( auction_id ).highest_bidder;
   }

   asset marketplace::claim( const call_context& ctx, const address& currency )
   {
      claim_balance_operation op;
      op.currency = currency;
      return apply_operation( op, ctx )->withdrawn;
   }

   asset marketplace::get_claimable_balance( const address& owner, const address& currency )const
   {
      return claim_vault( *_db ).get_balance( owner, currency );
   }

   asset marketplace::get_escrow_balance( const address& currency )const
   {
      return claim_vault( *_db ).get_escrow( currency );
   }

   bool marketplace::is_sale_ledger_deprecated()const
   {
      return !_services.registry->is_approved_listing_contract( _services.sale_ledger );
   }

   bool marketplace::is_auction_ledger_deprecated()const
   {
      return !_services.registry->is_approved_listing_contract( _services.auction_ledger );
   }

} } // nftex::ledger
