#pragma once

#include <nftex/ledger/admin_authority.hpp>
#include <nftex/ledger/asset.hpp>
#include <nftex/ledger/eligibility_registry.hpp>
#include <nftex/ledger/external_interfaces.hpp>
#include <nftex/ledger/fee_schedule.hpp>
#include <nftex/ledger/operations.hpp>
#include <nftex/ledger/types.hpp>

namespace nftex { namespace ledger {

class pending_ledger_state;
typedef std::shared_ptr<pending_ledger_state> pending_ledger_state_ptr;

/** Who is calling, and how much native currency the call carries. */
struct call_context
{
   call_context():attached_value(0){}
   call_context( const address& c, share_type value = 0 )
   :caller(c),attached_value(value){}

   address         caller;
   share_type      attached_value;
};

/** The policy services and collaborators operations are evaluated against. */
struct market_services
{
   admin_authority_ptr             authority;
   eligibility_registry_ptr        registry;
   fee_schedule_ptr                fees;
   item_contract_directory_ptr     item_contracts;

   address                         sale_ledger;
   address                         auction_ledger;
};

/**
 *  An interaction with an external contract that the ledger performs after its
 *  own records have been updated.
 */
struct external_transfer
{
   enum transfer_type
   {
      receive_payment = 0,   ///< payer -> treasury
      send_payment    = 1,   ///< treasury -> payee
      move_items      = 2    ///< item custody change
   };

   transfer_type       type = receive_payment;
   address             from;
   address             to;
   asset               amount;
   item_reference      item;
   share_type          quantity = 0;
};

/**
*  Tracks everything an operation does while it is evaluated against a pending
*  ledger state: the record changes live in the pending state, the external
*  transfers it requires are queued here in the order they must run.
*
*  Native currency attached to the call must be consumed exactly; whatever the
*  operation does not spend is rejected as a payment mismatch.
*/
struct evaluation_state
{
   evaluation_state( pending_ledger_state_ptr pending_state, const market_services& services, const call_context& ctx );

   pending_ledger_state* pending_state()const
   {
      const pending_ledger_state_ptr ptr = _pending_state.lock();
      FC_ASSERT( ptr );
      return ptr.get();
   }

   const market_services& services()const { return _services; }
   const address&         caller()const { return context.caller; }

   void evaluate( const operation& op );

   bool                is_sale_ledger_deprecated()const;
   bool                is_auction_ledger_deprecated()const;
   bool                is_administrator( const address& addr )const;

   /** throws unknown_item_contract */
   item_contract_ptr   get_item_contract( const address& contract )const;

   /** the ledger, the item contract and the currency must all be approved, and the item contract must report royalties */
   void                check_listing_eligibility( const address& ledger, const item_reference& item, const address& currency )const;

   void                collect_payment( const address& payer, const asset& amount );
   void                queue_payout( const address& payee, const asset& amount );
   void                queue_item_transfer( const item_reference& item, const address& from, const address& to, share_type quantity );

   /**
    *  Splits the gross proceeds of a sale between the fee recipient, the royalty
    *  receiver and the seller, crediting each claim balance.
    */
   void                pay_proceeds( const item_reference& item, const address& seller, const asset& gross );

   call_context                    context;
   vector<external_transfer>       transfers;
   share_type                      native_value_consumed = 0;

   /** id of the sale or auction created by the operation, 0 otherwise */
   uint64_t                        created_id = 0;
   /** amount paid out by a claim */
   asset                           withdrawn;

private:
   std::weak_ptr<pending_ledger_state>   _pending_state;
   market_services                       _services;
};
typedef shared_ptr<evaluation_state> evaluation_state_ptr;

} } // nftex::ledger

FC_REFLECT( nftex::ledger::call_context, (caller)(attached_value) )
FC_REFLECT_ENUM( nftex::ledger::external_transfer::transfer_type, (receive_payment)(send_payment)(move_items) )
FC_REFLECT( nftex::ledger::external_transfer, (type)(from)(to)(amount)(item)(quantity) )
FC_REFLECT( nftex::ledger::evaluation_state,
         (context)
         (transfers)
         (native_value_consumed)
         (created_id)
         (withdrawn)
         )
