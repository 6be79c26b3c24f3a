#pragma once

#include <nftex/ledger/asset.hpp>
#include <nftex/ledger/evaluation_state.hpp>
#include <nftex/ledger/ledger_database.hpp>
#include <nftex/ledger/market_config.hpp>

namespace nftex { namespace ledger {

   /**
    *  The sale ledger, the auction ledger and the claim vault behind a single
    *  entry point.
    *
    *  Every mutating call is evaluated against a pending state.  Its record
    *  changes are committed first and its external transfers run afterwards, in
    *  order; if any transfer fails the committed changes are reverted from an
    *  undo state, the transfers that already ran are compensated, and the call
    *  fails with transfer_failure.  A collected payment that cannot be sent
    *  back is credited to the payer's claim balance instead.  The committed
    *  state is flushed to the snapshot after every call.  A call made while another one is still
    *  running (for example from inside a payment rail callback) fails with
    *  reentrant_call.
    */
   class marketplace
   {
      public:
         marketplace( const market_config& config,
                      item_contract_directory_ptr item_contracts,
                      payment_rail_ptr payments );
         ~marketplace();

         void                        open( const fc::path& data_dir );
         void                        close();

         evaluation_state_ptr        apply_operation( const operation& op, const call_context& ctx );

         /**
          *  @name Sales
          */
         ///@{
         sale_id_type                create_sale( const call_context& ctx, const item_reference& item, share_type quantity,
                                                  const time_point_sec start_time, const time_point_sec end_time,
                                                  const asset& price );
         bool                        buy( const call_context& ctx, const sale_id_type sale_id, const address& recipient,
                                          share_type quantity, share_type amount_from_vault = 0 );
         void                        claim_sale_items( const call_context& ctx, const sale_id_type sale_id );
         void                        cancel_sale( const call_context& ctx, const sale_id_type sale_id );

         sale_record                 get_sale( const sale_id_type sale_id )const;
         sale_status                 get_sale_status( const sale_id_type sale_id )const;
         share_type                  get_purchased_quantity( const sale_id_type sale_id, const address& buyer )const;
         ///@}

         /**
          *  @name Auctions
          */
         ///@{
         auction_id_type             create_auction( const call_context& ctx, const item_reference& item,
                                                     const time_point_sec start_time, const time_point_sec end_time,
                                                     const asset& reserve_price );
         void                        bid( const call_context& ctx, const auction_id_type auction_id,
                                          share_type amount_from_vault, share_type external_funds );
         void                        resolve_auction( const call_context& ctx, const auction_id_type auction_id );
         void                        cancel_auction( const call_context& ctx, const auction_id_type auction_id );

         auction_record              get_auction( const auction_id_type auction_id )const;
         auction_status              get_auction_status( const auction_id_type auction_id )const;
         bid_record                  get_bid( const auction_id_type auction_id, const address& bidder )const;
         address                     get_highest_bidder( const auction_id_type auction_id )const;
         ///@}

         /**
          *  @name Claim vault
          */
         ///@{
         asset                       claim( const call_context& ctx, const address& currency );
         asset                       get_claimable_balance( const address& owner, const address& currency )const;
         asset                       get_escrow_balance( const address& currency )const;
         ///@}

         /** administrators, fees and approvals as currently in force */
         market_policy               get_policy()const;

         bool                        is_sale_ledger_deprecated()const;
         bool                        is_auction_ledger_deprecated()const;

         const market_services&      services()const { return _services; }
         admin_authority&            authority()const { return *_services.authority; }
         eligibility_registry&       registry()const { return *_services.registry; }
         fee_schedule&               fees()const { return *_services.fees; }
         const ledger_database&      database()const { return *_db; }

      private:
         void                        store_policy();
         void                        execute_transfer( const external_transfer& transfer );
         void                        execute_transfers( const vector<external_transfer>& transfers,
                                                        vector<external_transfer>& executed );
         /** compensates transfers that ran before a later one failed, newest first */
         void                        revert_transfers( const vector<external_transfer>& executed );
         /** keeps a collected payment withdrawable when sending it back failed */
         void                        refund_to_vault( const external_transfer& payment );

         ledger_database_ptr         _db;
         market_services             _services;
         payment_rail_ptr            _payments;
         bool                        _applying = false;
   };
   typedef std::shared_ptr<marketplace> marketplace_ptr;

} } // nftex::ledger
