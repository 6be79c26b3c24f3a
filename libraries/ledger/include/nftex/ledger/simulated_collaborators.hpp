#pragma once

#include <nftex/ledger/asset.hpp>
#include <nftex/ledger/external_interfaces.hpp>

namespace nftex { namespace ledger {

   /**
    *  In-memory item contract accounting for both unique items and fungible
    *  quantities.  Used by the scenario runner and the tests.
    */
   class simulated_item_contract : public item_contract
   {
      public:
         typedef std::function<void( const address& from, const address& to,
                                     item_id_type item_id, share_type quantity )> transfer_hook;

         simulated_item_contract( bool royalty_support = true );

         void                 set_royalty_support( bool supported ) { _royalty_support = supported; }
         /** royalty = floor( sale_amount * rate / scale ) paid to receiver */
         void                 set_royalty( const address& receiver, share_type rate, share_type scale );
         /** reports a fixed royalty amount regardless of the sale amount */
         void                 set_fixed_royalty( const address& receiver, share_type amount );

         void                 mint_unique( const address& owner, item_id_type item_id );
         void                 mint( const address& owner, item_id_type item_id, share_type quantity );

         void                 set_transfers_enabled( bool enabled ) { _transfers_enabled = enabled; }
         /** invoked after every transfer; if it throws the transfer is reverted */
         void                 set_transfer_hook( const transfer_hook& hook ) { _on_transfer = hook; }

         virtual bool         supports_interface( uint32_t interface_id )const override;
         virtual royalty_info get_royalty_info( item_id_type item_id, share_type sale_amount )const override;
         virtual address      owner_of( item_id_type item_id )const override;
         virtual share_type   balance_of( const address& owner, item_id_type item_id )const override;
         virtual void         transfer_unique_item( const address& from, const address& to, item_id_type item_id ) override;
         virtual void         transfer_quantity( const address& from, const address& to,
                                                 item_id_type item_id, share_type quantity ) override;

      private:
         bool                                              _royalty_support;
         bool                                              _transfers_enabled = true;
         address                                           _royalty_receiver;
         share_type                                        _royalty_rate = 0;
         share_type                                        _royalty_scale = 1;
         optional<share_type>                              _fixed_royalty;
         map<item_id_type, address>                        _owners;
         map<pair<address, item_id_type>, share_type>      _balances;
         transfer_hook                                     _on_transfer;
   };
   typedef std::shared_ptr<simulated_item_contract> simulated_item_contract_ptr;

   class simulated_item_directory : public item_contract_directory
   {
      public:
         void                       add_item_contract( const address& contract_address, const item_contract_ptr& contract );
         virtual item_contract_ptr  find_item_contract( const address& contract )const override;

      private:
         map<address, item_contract_ptr> _contracts;
   };
   typedef std::shared_ptr<simulated_item_directory> simulated_item_directory_ptr;

   /**
    *  Wallet balances per (owner, currency), token allowances, and the treasury
    *  the marketplace pays from.
    */
   class simulated_payment_rail : public payment_rail
   {
      public:
         typedef std::function<void( const address& to, const asset& amount )> payout_hook;

         void                 deposit( const address& owner, const asset& amount );
         void                 approve( const address& owner, const address& token, share_type amount );

         asset                get_wallet_balance( const address& owner, const address& currency )const;
         asset                get_treasury_balance( const address& currency )const;
         share_type           get_allowance( const address& owner, const address& token )const;

         /** payouts to a rejecting recipient throw */
         void                 set_rejects_payments( const address& recipient, bool rejects );
         /** invoked after every payout, as a recipient contract's receive callback would be; if it throws the payout is reverted */
         void                 set_payout_hook( const payout_hook& hook ) { _on_payout = hook; }

         virtual void         receive_native( const address& from, share_type amount ) override;
         virtual void         pull_token( const address& token, const address& from, share_type amount ) override;
         virtual void         send_native( const address& to, share_type amount ) override;
         virtual void         send_token( const address& token, const address& to, share_type amount ) override;

      private:
         void                 withdraw_from_wallet( const address& owner, const asset& amount );
         void                 pay_out( const address& to, const asset& amount );

         map<pair<address, address>, share_type>   _wallets;
         map<pair<address, address>, share_type>   _allowances;
         map<address, share_type>                  _treasury;
         set<address>                              _rejecting;
         payout_hook                               _on_payout;
   };
   typedef std::shared_ptr<simulated_payment_rail> simulated_payment_rail_ptr;

} } // nftex::ledger
