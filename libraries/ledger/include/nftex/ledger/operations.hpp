#pragma once

#include <fc/io/enum_type.hpp>
#include <fc/io/raw.hpp>
#include <fc/reflect/reflect.hpp>

namespace nftex { namespace ledger {

struct evaluation_state;

enum operation_type_enum
{
   null_op_type                        = 0,

   create_sale_op_type                 = 1,
   buy_sale_op_type                    = 2,
   claim_sale_items_op_type            = 3,
   cancel_sale_op_type                 = 4,

   create_auction_op_type              = 5,
   auction_bid_op_type                 = 6,
   resolve_auction_op_type             = 7,
   cancel_auction_op_type              = 8,

   claim_balance_op_type               = 9
};

/**
*  A poly-morphic operator that modifies the ledger in some manner.
*/
struct operation
{
   operation():type(null_op_type){}

   operation( const operation& o )
      :type(o.type),data(o.data){}

   operation( operation&& o )
      :type(o.type),data(std::move(o.data)){}

   template<typename OperationType>
   operation( const OperationType& t )
   {
      type = OperationType::type;
      data = fc::raw::pack( t );
   }

   template<typename OperationType>
   OperationType as()const
   {
      FC_ASSERT( (operation_type_enum)type == OperationType::type, "", ("type",type)("OperationType",OperationType::type) );
      return fc::raw::unpack<OperationType>(data);
   }

   operation& operator=( const operation& o )
   {
      if( this == &o ) return *this;
      type = o.type;
      data = o.data;
      return *this;
   }

   operation& operator=( operation&& o )
   {
      if( this == &o ) return *this;
      type = o.type;
      data = std::move(o.data);
      return *this;
   }

   fc::enum_type<uint8_t,operation_type_enum> type;
   std::vector<char> data;
};

} } // nftex::ledger

FC_REFLECT_ENUM( nftex::ledger::operation_type_enum,
      (null_op_type)
      (create_sale_op_type)
      (buy_sale_op_type)
      (claim_sale_items_op_type)
      (cancel_sale_op_type)
      (create_auction_op_type)
      (auction_bid_op_type)
      (resolve_auction_op_type)
      (cancel_auction_op_type)
      (claim_balance_op_type)
   )

FC_REFLECT( nftex::ledger::operation, (type)(data) )

namespace fc
{
   void to_variant( const nftex::ledger::operation& var, variant& vo );
   void from_variant( const variant& var, nftex::ledger::operation& vo );
}
