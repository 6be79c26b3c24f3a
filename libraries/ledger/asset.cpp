#include <nftex/ledger/asset.hpp>
#include <nftex/ledger/config.hpp>
#include <nftex/ledger/exceptions.hpp>

#include <fc/reflect/variant.hpp>
#include <fc/uint128.hpp>

namespace nftex { namespace ledger {

   asset::operator std::string()const
   {
      return fc::to_string(amount) + " " + (is_native() ? std::string( "native" ) : std::string( currency ));
   }

   asset& asset::operator += ( const asset& o )
   { try {
      if( currency != o.currency )
         FC_CAPTURE_AND_THROW( currency_mismatch, (*this)(o) );

      if( ( o.amount > 0 && amount > INT64_MAX - o.amount ) ||
          ( o.amount < 0 && amount < INT64_MIN - o.amount ) )
      {
         FC_THROW_EXCEPTION( addition_overflow, "asset addition overflow  ${a} + ${b}",
                             ("a", *this)("b",o) );
      }

      amount += o.amount;
      return *this;
   } FC_CAPTURE_AND_RETHROW( (*this)(o) ) }

   asset& asset::operator -= ( const asset& o )
   { try {
      if( currency != o.currency )
         FC_CAPTURE_AND_THROW( currency_mismatch, (*this)(o) );

      // balances are never allowed to go negative
      if( o.amount > amount || (o.amount < 0 && amount > INT64_MAX + o.amount) )
      {
         FC_THROW_EXCEPTION( subtraction_overflow, "asset subtraction underflow  ${a} - ${b}",
                             ("a", *this)("b",o) );
      }

      amount -= o.amount;
      return *this;
   } FC_CAPTURE_AND_RETHROW( (*this)(o) ) }

   asset multiply( const asset& unit_price, share_type quantity )
   { try {
      FC_ASSERT( unit_price.amount >= 0 && quantity >= 0 );
      const fc::uint128 product = fc::uint128( uint64_t( unit_price.amount ) ) * fc::uint128( uint64_t( quantity ) );
      if( product > fc::uint128( uint64_t( NFTEX_LEDGER_MAX_SHARES ) ) )
         FC_THROW_EXCEPTION( addition_overflow, "price ${p} times quantity ${q} is out of range",
                             ("p",unit_price)("q",quantity) );
      return asset( share_type( product.to_uint64() ), unit_price.currency );
   } FC_CAPTURE_AND_RETHROW( (unit_price)(quantity) ) }

   share_type scale_amount( share_type amount, share_type numerator, share_type denominator )
   { try {
      FC_ASSERT( amount >= 0 && numerator >= 0 && denominator > 0 );
      fc::uint128 result = fc::uint128( uint64_t( amount ) ) * fc::uint128( uint64_t( numerator ) );
      result /= fc::uint128( uint64_t( denominator ) );
      FC_ASSERT( result <= fc::uint128( uint64_t( INT64_MAX ) ) );
      return share_type( result.to_uint64() );
   } FC_CAPTURE_AND_RETHROW( (amount)(numerator)(denominator) ) }

} } // nftex::ledger
