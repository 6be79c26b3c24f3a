#pragma once

#include <nftex/ledger/address.hpp>

#include <fc/optional.hpp>
#include <fc/time.hpp>
#include <fc/variant.hpp>
#include <fc/variant_object.hpp>

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace nftex { namespace ledger {

   typedef int64_t                     share_type;
   typedef uint64_t                    sale_id_type;
   typedef uint64_t                    auction_id_type;
   typedef uint64_t                    item_id_type;

   using std::string;
   using std::function;
   using fc::variant;
   using fc::variant_object;
   using fc::mutable_variant_object;
   using fc::optional;
   using std::map;
   using std::unordered_map;
   using std::set;
   using std::unordered_set;
   using std::vector;
   using std::pair;
   using std::unique_ptr;
   using std::shared_ptr;
   using fc::time_point_sec;
   using fc::time_point;
   using fc::microseconds;

   /** How an item contract accounts for ownership of a single item id. */
   enum item_kind
   {
      unique_item       = 0, ///< one owner per item id, transfers move exactly one unit
      fungible_quantity = 1  ///< per-owner balances of an item id, transfers move a quantity
   };

   /** A reference to one item type held by an external item contract. */
   struct item_reference
   {
      address          contract;
      item_id_type     item_id = 0;
      item_kind        kind = unique_item;
   };

   inline bool operator == ( const item_reference& a, const item_reference& b )
   {
      return std::tie( a.contract, a.item_id, a.kind ) == std::tie( b.contract, b.item_id, b.kind );
   }

} } // nftex::ledger

#include <fc/reflect/reflect.hpp>
FC_REFLECT_ENUM( nftex::ledger::item_kind, (unique_item)(fungible_quantity) )
FC_REFLECT( nftex::ledger::item_reference, (contract)(item_id)(kind) )
