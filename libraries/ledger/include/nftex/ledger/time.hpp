#pragma once

#include <fc/time.hpp>

namespace nftex { namespace ledger {

   /** The ledger clock. Follows the wall clock unless a simulation is running. */
   fc::time_point_sec           now();

   void                         start_simulated_time( const fc::time_point sim_time );
   void                         advance_time( int32_t delta_seconds );
   void                         stop_simulated_time();

} } // nftex::ledger
