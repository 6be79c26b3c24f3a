#include <nftex/ledger/config.hpp>
#include <nftex/ledger/exceptions.hpp>
#include <nftex/ledger/item_custody.hpp>

namespace nftex { namespace ledger {

   void unique_item_custody::validate_quantity( share_type quantity )const
   {
      if( quantity != 1 )
         FC_CAPTURE_AND_THROW( invalid_quantity, (quantity) );
   }

   share_type unique_item_custody::held_by( const item_contract& contract, const address& owner, item_id_type item_id )const
   { try {
      return contract.owner_of( item_id ) == owner ? 1 : 0;
   } FC_CAPTURE_AND_RETHROW( (owner)(item_id) ) }

   void unique_item_custody::transfer( item_contract& contract, const address& from, const address& to,
                                       item_id_type item_id, share_type quantity )const
   { try {
      validate_quantity( quantity );
      contract.transfer_unique_item( from, to, item_id );
   } FC_CAPTURE_AND_RETHROW( (from)(to)(item_id)(quantity) ) }

   void fungible_item_custody::validate_quantity( share_type quantity )const
   {
      if( quantity <= 0 || quantity > NFTEX_LEDGER_MAX_SHARES )
         FC_CAPTURE_AND_THROW( invalid_quantity, (quantity) );
   }

   share_type fungible_item_custody::held_by( const item_contract& contract, const address& owner, item_id_type item_id )const
   { try {
      return contract.balance_of( owner, item_id );
   } FC_CAPTURE_AND_RETHROW( (owner)(item_id) ) }

   void fungible_item_custody::transfer( item_contract& contract, const address& from, const address& to,
                                         item_id_type item_id, share_type quantity )const
   { try {
      validate_quantity( quantity );
      contract.transfer_quantity( from, to, item_id, quantity );
   } FC_CAPTURE_AND_RETHROW( (from)(to)(item_id)(quantity) ) }

   const item_custody& get_item_custody( item_kind kind )
   {
      static const unique_item_custody   unique_custody;
      static const fungible_item_custody fungible_custody;

      switch( kind )
      {
         case unique_item:
            return unique_custody;
         case fungible_quantity:
            return fungible_custody;
         default:
            FC_THROW_EXCEPTION( invalid_parameters, "unknown item kind ${k}", ("k",int(kind)) );
      }
   }

} } // nftex::ledger
