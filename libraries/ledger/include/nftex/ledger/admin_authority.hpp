#pragma once

#include <nftex/ledger/types.hpp>

#include <fc/signals.hpp>

namespace nftex { namespace ledger {

   /** The set of addresses allowed to change marketplace policy. */
   class admin_authority
   {
      public:
         admin_authority( const set<address>& administrators = set<address>() );

         bool                is_administrator( const address& caller )const;
         /** throws not_administrator */
         void                require_administrator( const address& caller )const;

         void                add_administrator( const address& caller, const address& administrator );
         /** the last administrator cannot be removed */
         void                remove_administrator( const address& caller, const address& administrator );

         const set<address>& get_administrators()const { return _administrators; }

         /** replaces the set with a previously stored one, without an authority check */
         void                load( const set<address>& administrators );

         fc::signal<void()>  administrators_changed;

      private:
         set<address>        _administrators;
   };
   typedef std::shared_ptr<admin_authority> admin_authority_ptr;

} } // nftex::ledger
