#pragma once

#include <nftex/ledger/external_interfaces.hpp>

namespace nftex { namespace ledger {

   /**
    *  Transfer semantics for one item_kind.  Sales and auctions hold items through
    *  these so neither ledger needs to know how an item contract counts ownership.
    */
   class item_custody
   {
      public:
         virtual ~item_custody(){}

         virtual item_kind    kind()const = 0;

         /** throws invalid_quantity if quantity cannot be listed for this kind */
         virtual void         validate_quantity( share_type quantity )const = 0;
         virtual share_type   held_by( const item_contract& contract, const address& owner, item_id_type item_id )const = 0;
         virtual void         transfer( item_contract& contract, const address& from, const address& to,
                                        item_id_type item_id, share_type quantity )const = 0;
   };

   class unique_item_custody : public item_custody
   {
      public:
         virtual item_kind    kind()const override { return unique_item; }
         virtual void         validate_quantity( share_type quantity )const override;
         virtual share_type   held_by( const item_contract& contract, const address& owner, item_id_type item_id )const override;
         virtual void         transfer( item_contract& contract, const address& from, const address& to,
                                        item_id_type item_id, share_type quantity )const override;
   };

   class fungible_item_custody : public item_custody
   {
      public:
         virtual item_kind    kind()const override { return fungible_quantity; }
         virtual void         validate_quantity( share_type quantity )const override;
         virtual share_type   held_by( const item_contract& contract, const address& owner, item_id_type item_id )const override;
         virtual void         transfer( item_contract& contract, const address& from, const address& to,
                                        item_id_type item_id, share_type quantity )const override;
   };

   const item_custody& get_item_custody( item_kind kind );

} } // nftex::ledger
