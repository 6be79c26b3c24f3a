#include <nftex/ledger/auction_operations.hpp>
#include <nftex/ledger/operation_factory.hpp>
#include <nftex/ledger/operations.hpp>
#include <nftex/ledger/sale_operations.hpp>
#include <nftex/ledger/vault_operations.hpp>

#include <fc/io/raw_variant.hpp>
#include <fc/reflect/variant.hpp>

namespace nftex { namespace ledger {

   const operation_type_enum create_sale_operation::type               = create_sale_op_type;
   const operation_type_enum buy_sale_operation::type                  = buy_sale_op_type;
   const operation_type_enum claim_sale_items_operation::type          = claim_sale_items_op_type;
   const operation_type_enum cancel_sale_operation::type               = cancel_sale_op_type;

   const operation_type_enum create_auction_operation::type            = create_auction_op_type;
   const operation_type_enum auction_bid_operation::type               = auction_bid_op_type;
   const operation_type_enum resolve_auction_operation::type           = resolve_auction_op_type;
   const operation_type_enum cancel_auction_operation::type            = cancel_auction_op_type;

   const operation_type_enum claim_balance_operation::type             = claim_balance_op_type;

   static bool operations_registered = []() -> bool
   {
      operation_factory& factory = operation_factory::instance();

      factory.register_operation<create_sale_operation>();
      factory.register_operation<buy_sale_operation>();
      factory.register_operation<claim_sale_items_operation>();
      factory.register_operation<cancel_sale_operation>();

      factory.register_operation<create_auction_operation>();
      factory.register_operation<auction_bid_operation>();
      factory.register_operation<resolve_auction_operation>();
      factory.register_operation<cancel_auction_operation>();

      factory.register_operation<claim_balance_operation>();

      return true;
   }();

   operation_factory& operation_factory::instance()
   {
      static operation_factory factory;
      return factory;
   }

   const operation_factory::operation_handler& operation_factory::handler_for( operation_type_enum type )const
   {
      auto itr = _handlers.find( type );
      if( itr == _handlers.end() )
         FC_THROW_EXCEPTION( unsupported_ledger_operation, "no handler for operation type ${t}", ("t",type) );
      return *itr->second;
   }

   void operation_factory::evaluate( evaluation_state& eval_state, const operation& op )const
   {
      handler_for( op.type ).evaluate( eval_state, op );
   }

   void operation_factory::to_variant( const operation& in, fc::variant& output )const
   { try {
      fc::mutable_variant_object obj( "type", in.type );
      obj[ "data" ] = handler_for( in.type ).data_to_variant( in );
      output = std::move( obj );
   } FC_CAPTURE_AND_RETHROW( (in.type) ) }

   void operation_factory::from_variant( const fc::variant& in, operation& output )const
   { try {
      const fc::variant_object& obj = in.get_object();
      FC_ASSERT( obj.contains( "type" ) && obj.contains( "data" ), "an operation needs both type and data" );

      output.type = obj["type"].as<operation_type_enum>();
      output.data = handler_for( output.type ).data_from_variant( obj["data"] );
   } FC_CAPTURE_AND_RETHROW( (in) ) }

} } // nftex::ledger

namespace fc
{
   void to_variant( const nftex::ledger::operation& var, variant& vo )
   {
      nftex::ledger::operation_factory::instance().to_variant( var, vo );
   }

   void from_variant( const variant& var, nftex::ledger::operation& vo )
   {
      nftex::ledger::operation_factory::instance().from_variant( var, vo );
   }
}
