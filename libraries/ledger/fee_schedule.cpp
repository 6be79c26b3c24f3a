#include <nftex/ledger/asset.hpp>
#include <nftex/ledger/exceptions.hpp>
#include <nftex/ledger/fee_schedule.hpp>

#include <fc/log/logger.hpp>

namespace nftex { namespace ledger {

   fee_schedule::fee_schedule( admin_authority_ptr authority, const address& recipient,
                               share_type rate, share_type scale )
   : _authority( authority ), _recipient( recipient ), _rate( rate ), _scale( scale )
   {
      FC_ASSERT( _authority );
      validate( rate, scale );
      if( recipient.is_null() )
         FC_CAPTURE_AND_THROW( invalid_parameters, (recipient) );
   }

   void fee_schedule::validate( share_type rate, share_type scale )
   {
      if( scale <= 0 || rate < 0 || rate > scale )
         FC_CAPTURE_AND_THROW( invalid_fee_rate, (rate)(scale) );
   }

   fee_info fee_schedule::get_fee_info( share_type gross_amount )const
   { try {
      FC_ASSERT( gross_amount >= 0 );
      fee_info info;
      info.recipient = _recipient;
      info.amount = scale_amount( gross_amount, _rate, _scale );
      return info;
   } FC_CAPTURE_AND_RETHROW( (gross_amount) ) }

   void fee_schedule::set_fee_rate( const address& caller, share_type rate, share_type scale )
   { try {
      _authority->require_administrator( caller );
      validate( rate, scale );
      _rate = rate;
      _scale = scale;
      ilog( "fee rate set to ${r}/${s}", ("r",rate)("s",scale) );
      fee_changed();
   } FC_CAPTURE_AND_RETHROW( (caller)(rate)(scale) ) }

   void fee_schedule::set_fee_recipient( const address& caller, const address& recipient )
   { try {
      _authority->require_administrator( caller );
      if( recipient.is_null() )
         FC_CAPTURE_AND_THROW( invalid_parameters, (recipient) );
      _recipient = recipient;
      ilog( "fee recipient set to ${r}", ("r",recipient) );
      fee_changed();
   } FC_CAPTURE_AND_RETHROW( (caller)(recipient) ) }

   void fee_schedule::load( const address& recipient, share_type rate, share_type scale )
   { try {
      validate( rate, scale );
      if( recipient.is_null() )
         FC_CAPTURE_AND_THROW( invalid_parameters, (recipient) );
      _recipient = recipient;
      _rate = rate;
      _scale = scale;
   } FC_CAPTURE_AND_RETHROW( (recipient)(rate)(scale) ) }

} } // nftex::ledger
