#pragma once
#include <fc/array.hpp>
#include <fc/crypto/ripemd160.hpp>
#include <string>

namespace nftex { namespace ledger {

   /**
    *  @brief a 160 bit account, contract or currency identifier
    *
    *  An address can be converted to or from a base58 string with 32 bit checksum.
    *
    *  When converted to a string, checksum calculated as the first 4 bytes ripemd160( address ) is
    *  appended to the binary address before converting to base58.
    *
    *  The null address is reserved: it stands for the native currency when used
    *  as a currency and for "nobody" when used as an account.
    */
   class address
   {
      public:
       address(); ///< constructs empty / null address
       address( const std::string& base58str );   ///< converts to binary, validates checksum
       explicit address( const fc::ripemd160& hash );

       /** derives a deterministic address from a human readable label */
       static address from_label( const std::string& label );

       static bool is_valid( const std::string& base58str );
       bool        is_null()const { return addr == fc::ripemd160(); }
       operator    std::string()const; ///< converts to base58 + checksum

       fc::ripemd160      addr;
   };
   inline bool operator == ( const address& a, const address& b ) { return a.addr == b.addr; }
   inline bool operator != ( const address& a, const address& b ) { return a.addr != b.addr; }
   inline bool operator <  ( const address& a, const address& b ) { return a.addr <  b.addr; }

} } // namespace nftex::ledger


namespace fc
{
   void to_variant( const nftex::ledger::address& var,  fc::variant& vo );
   void from_variant( const fc::variant& var,  nftex::ledger::address& vo );
}

namespace std
{
   template<>
   struct hash<nftex::ledger::address>
   {
       public:
         size_t operator()(const nftex::ledger::address &a) const
         {
            return (uint64_t(a.addr._hash[0])<<32) | uint64_t( a.addr._hash[1] );
         }
   };
}

#include <fc/reflect/reflect.hpp>
FC_REFLECT( nftex::ledger::address, (addr) )
