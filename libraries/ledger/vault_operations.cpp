#include <nftex/ledger/claim_vault.hpp>
#include <nftex/ledger/evaluation_state.hpp>
#include <nftex/ledger/exceptions.hpp>
#include <nftex/ledger/pending_ledger_state.hpp>
#include <nftex/ledger/vault_operations.hpp>

#include <fc/log/logger.hpp>

namespace nftex { namespace ledger {

void claim_balance_operation::evaluate( evaluation_state& eval_state )const
{ try {
   const address& owner = eval_state.caller();

   claim_vault vault( *eval_state.pending_state() );
   const asset balance = vault.get_balance( owner, this->currency );
   if( balance.amount <= 0 )
      FC_CAPTURE_AND_THROW( nothing_to_claim, (owner)(currency) );

   vault.debit( owner, balance );
   eval_state.queue_payout( owner, balance );
   eval_state.withdrawn = balance;

   ilog( "${o} claimed ${b}", ("o",owner)("b",balance) );
} FC_CAPTURE_AND_RETHROW( (*this) ) }

} } // nftex::ledger
