#pragma once

#include <nftex/ledger/types.hpp>

#include <fc/exception/exception.hpp>

namespace nftex { namespace ledger {

   /**
    *  An asset is a 64-bit amount of a settlement currency, and the address
    *  of that currency (the null address for the native currency).
    *
    *  Arithmetic is checked: mixing currencies, overflowing or producing a
    *  negative amount throws rather than wrapping.
    */
   struct asset
   {
      asset():amount(0){}
      explicit asset( share_type a, const address& c = address() )
      :amount(a),currency(c){}

      asset& operator += ( const asset& o );
      asset& operator -= ( const asset& o );

      bool is_native()const { return currency.is_null(); }

      operator std::string()const;

      share_type     amount;
      address        currency;
   };

   inline bool operator == ( const asset& l, const asset& r )
   {
      return std::tie( l.amount, l.currency ) == std::tie( r.amount, r.currency );
   }
   inline bool operator != ( const asset& l, const asset& r )
   {
      return !( l == r );
   }
   inline bool operator < ( const asset& l, const asset& r )
   {
      FC_ASSERT( l.currency == r.currency );
      return l.amount < r.amount;
   }
   inline bool operator > ( const asset& l, const asset& r )
   {
      FC_ASSERT( l.currency == r.currency );
      return l.amount > r.amount;
   }
   inline bool operator <= ( const asset& l, const asset& r )
   {
      return l < r || l == r;
   }
   inline bool operator >= ( const asset& l, const asset& r )
   {
      return l > r || l == r;
   }
   inline asset operator + ( const asset& l, const asset& r )
   {
      return asset( l ) += r;
   }
   inline asset operator - ( const asset& l, const asset& r )
   {
      return asset( l ) -= r;
   }

   /** quantity * unit_price, throws addition_overflow if the product leaves the valid range */
   asset multiply( const asset& unit_price, share_type quantity );

   /** floor( amount * numerator / denominator ) computed in 128 bits */
   share_type scale_amount( share_type amount, share_type numerator, share_type denominator );

} } // nftex::ledger

#include <fc/reflect/reflect.hpp>
FC_REFLECT( nftex::ledger::asset, (amount)(currency) );
