#pragma once

#include <nftex/ledger/types.hpp>

namespace nftex { namespace ledger {

   struct royalty_info
   {
      address      receiver;
      share_type   amount = 0;
   };

   /**
    *  An external contract that owns the listed items.  A contract may account
    *  for unique items, fungible quantities, or both; the ledger only calls the
    *  methods that match the item_kind of the listing.
    *
    *  Every method may throw.  A transfer that throws must have moved nothing,
    *  including when the failure comes from the recipient's receive callback.
    *  Failures raised while settling an operation are reported to the caller
    *  as transfer_failure.
    */
   class item_contract
   {
      public:
         virtual ~item_contract(){}

         virtual bool         supports_interface( uint32_t interface_id )const = 0;
         virtual royalty_info get_royalty_info( item_id_type item_id, share_type sale_amount )const = 0;

         /** current owner of a unique item, null if it does not exist */
         virtual address      owner_of( item_id_type item_id )const = 0;
         /** quantity of a fungible item held by owner */
         virtual share_type   balance_of( const address& owner, item_id_type item_id )const = 0;

         virtual void         transfer_unique_item( const address& from, const address& to, item_id_type item_id ) = 0;
         virtual void         transfer_quantity( const address& from, const address& to,
                                                 item_id_type item_id, share_type quantity ) = 0;
   };
   typedef std::shared_ptr<item_contract> item_contract_ptr;

   class item_contract_directory
   {
      public:
         virtual ~item_contract_directory(){}

         /** returns nullptr if no contract is deployed at the address */
         virtual item_contract_ptr find_item_contract( const address& contract )const = 0;
   };
   typedef std::shared_ptr<item_contract_directory> item_contract_directory_ptr;

   /**
    *  Moves settlement currency between accounts and the marketplace treasury.
    *  Native currency arrives attached to the call; token currencies are pulled
    *  from the payer under an allowance the payer granted beforehand.
    *
    *  As with item_contract, a method that throws must have moved nothing.
    */
   class payment_rail
   {
      public:
         virtual ~payment_rail(){}

         virtual void receive_native( const address& from, share_type amount ) = 0;
         virtual void pull_token( const address& token, const address& from, share_type amount ) = 0;
         virtual void send_native( const address& to, share_type amount ) = 0;
         virtual void send_token( const address& token, const address& to, share_type amount ) = 0;
   };
   typedef std::shared_ptr<payment_rail> payment_rail_ptr;

} } // nftex::ledger

FC_REFLECT( nftex::ledger::royalty_info, (receiver)(amount) )
