#pragma once

#include <nftex/ledger/admin_authority.hpp>
#include <nftex/ledger/config.hpp>
#include <nftex/ledger/types.hpp>

#include <fc/signals.hpp>

namespace nftex { namespace ledger {

   struct fee_info
   {
      address      recipient;
      share_type   amount = 0;
   };

   /**
    *  The platform fee taken from every settled sale or auction:
    *  floor( gross * rate / scale ), paid to the fee recipient's claim balance.
    */
   class fee_schedule
   {
      public:
         /** throws invalid_fee_rate unless 0 <= rate <= scale and scale > 0 */
         fee_schedule( admin_authority_ptr authority, const address& recipient,
                       share_type rate = NFTEX_DEFAULT_FEE_RATE, share_type scale = NFTEX_DEFAULT_FEE_SCALE );

         fee_info     get_fee_info( share_type gross_amount )const;

         void         set_fee_rate( const address& caller, share_type rate, share_type scale );
         void         set_fee_recipient( const address& caller, const address& recipient );

         share_type   get_fee_rate()const { return _rate; }
         share_type   get_fee_scale()const { return _scale; }
         address      get_fee_recipient()const { return _recipient; }

         /** restores stored settings, without an authority check */
         void         load( const address& recipient, share_type rate, share_type scale );

         fc::signal<void()> fee_changed;

      private:
         static void  validate( share_type rate, share_type scale );

         admin_authority_ptr _authority;
         address             _recipient;
         share_type          _rate;
         share_type          _scale;
   };
   typedef std::shared_ptr<fee_schedule> fee_schedule_ptr;

} } // nftex::ledger

FC_REFLECT( nftex::ledger::fee_info, (recipient)(amount) )
