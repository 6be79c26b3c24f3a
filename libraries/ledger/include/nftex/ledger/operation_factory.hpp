#pragma once
#include <nftex/ledger/exceptions.hpp>
#include <nftex/ledger/operations.hpp>

#include <fc/reflect/variant.hpp>
#include <fc/variant_object.hpp>

#include <map>

namespace nftex { namespace ledger {

   /**
    * @class operation_factory
    *
    *  Every marketplace operation registers a handler here, keyed by its
    *  operation_type_enum. The handler knows how to unpack the operation,
    *  convert it to and from the {"type","data"} JSON form used by scenarios
    *  and snapshots, and run its evaluate() against an evaluation_state.
    */
   class operation_factory
   {
       public:
          static operation_factory& instance();

          struct operation_handler
          {
             virtual ~operation_handler(){}
             virtual fc::variant data_to_variant( const operation& op )const = 0;
             virtual std::vector<char> data_from_variant( const fc::variant& data )const = 0;
             virtual void evaluate( evaluation_state& eval_state, const operation& op )const = 0;
          };

          template<typename OperationType>
          struct typed_handler : public operation_handler
          {
             virtual fc::variant data_to_variant( const operation& op )const
             {
                return fc::variant( op.as<OperationType>() );
             }

             virtual std::vector<char> data_from_variant( const fc::variant& data )const
             { try {
                return fc::raw::pack( data.as<OperationType>() );
             } FC_CAPTURE_AND_RETHROW( (data) ) }

             virtual void evaluate( evaluation_state& eval_state, const operation& op )const
             {
                op.as<OperationType>().evaluate( eval_state );
             }
          };

          template<typename OperationType>
          void register_operation()
          {
             const bool inserted = _handlers.insert( std::make_pair( OperationType::type,
                                   std::make_shared< typed_handler<OperationType> >() ) ).second;
             FC_ASSERT( inserted, "operation type ${t} registered twice", ("t",OperationType::type) );
          }

          bool is_registered( operation_type_enum type )const
          {
             return _handlers.find( type ) != _handlers.end();
          }

          void evaluate( evaluation_state& eval_state, const operation& op )const;

          /// defined in operations.cpp
          void to_variant( const operation& in, fc::variant& output )const;
          /// defined in operations.cpp
          void from_variant( const fc::variant& in, operation& output )const;

       private:
          const operation_handler& handler_for( operation_type_enum type )const;

          std::map<operation_type_enum, std::shared_ptr<const operation_handler> > _handlers;
   };

} } // nftex::ledger
