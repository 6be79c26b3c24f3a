#include <nftex/ledger/time.hpp>

#include <fc/exception/exception.hpp>

namespace nftex { namespace ledger {

static int32_t simulated_time    = 0;
static int32_t adjusted_time_sec = 0;

fc::time_point_sec now()
{
   if( simulated_time )
       return fc::time_point() + fc::seconds( simulated_time + adjusted_time_sec );

   return fc::time_point::now() + fc::seconds( adjusted_time_sec );
}

void start_simulated_time( const fc::time_point sim_time )
{
   simulated_time = sim_time.sec_since_epoch();
   adjusted_time_sec = 0;
}

void advance_time( int32_t delta_seconds )
{
   FC_ASSERT( delta_seconds >= 0, "the ledger clock is monotonic" );
   adjusted_time_sec += delta_seconds;
}

void stop_simulated_time()
{
   simulated_time = 0;
   adjusted_time_sec = 0;
}

} } // nftex::ledger
