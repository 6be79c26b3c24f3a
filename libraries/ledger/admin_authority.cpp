#include <nftex/ledger/admin_authority.hpp>
#include <nftex/ledger/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace nftex { namespace ledger {

   admin_authority::admin_authority( const set<address>& administrators )
   : _administrators( administrators )
   {
      _administrators.erase( address() );
   }

   bool admin_authority::is_administrator( const address& caller )const
   {
      return !caller.is_null() && _administrators.count( caller ) > 0;
   }

   void admin_authority::require_administrator( const address& caller )const
   {
      if( !is_administrator( caller ) )
         FC_CAPTURE_AND_THROW( not_administrator, (caller) );
   }

   void admin_authority::add_administrator( const address& caller, const address& administrator )
   { try {
      require_administrator( caller );
      if( administrator.is_null() )
         FC_CAPTURE_AND_THROW( invalid_parameters, (administrator) );
      if( _administrators.insert( administrator ).second )
      {
         ilog( "${c} added administrator ${a}", ("c",caller)("a",administrator) );
         administrators_changed();
      }
   } FC_CAPTURE_AND_RETHROW( (caller)(administrator) ) }

   void admin_authority::remove_administrator( const address& caller, const address& administrator )
   { try {
      require_administrator( caller );
      if( _administrators.count( administrator ) == 0 ) return;
      FC_ASSERT( _administrators.size() > 1, "cannot remove the last administrator" );
      _administrators.erase( administrator );
      ilog( "${c} removed administrator ${a}", ("c",caller)("a",administrator) );
      administrators_changed();
   } FC_CAPTURE_AND_RETHROW( (caller)(administrator) ) }

   void admin_authority::load( const set<address>& administrators )
   { try {
      set<address> loaded( administrators );
      loaded.erase( address() );
      FC_ASSERT( !loaded.empty(), "a stored policy needs at least one administrator" );
      _administrators = std::move( loaded );
   } FC_CAPTURE_AND_RETHROW( (administrators) ) }

} } // nftex::ledger
