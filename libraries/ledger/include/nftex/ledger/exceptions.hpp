#pragma once

#include <fc/exception/exception.hpp>

namespace nftex { namespace ledger {

FC_DECLARE_EXCEPTION(         ledger_exception,                                                      40000, "Ledger Exception" );
FC_DECLARE_DERIVED_EXCEPTION( addition_overflow,                nftex::ledger::ledger_exception,     40001, "addition overflow" );
FC_DECLARE_DERIVED_EXCEPTION( subtraction_overflow,             nftex::ledger::ledger_exception,     40002, "subtraction overflow" );
FC_DECLARE_DERIVED_EXCEPTION( currency_mismatch,                nftex::ledger::ledger_exception,     40003, "currency mismatch" );
FC_DECLARE_DERIVED_EXCEPTION( unsupported_ledger_operation,     nftex::ledger::ledger_exception,     40004, "unsupported ledger operation" );
FC_DECLARE_DERIVED_EXCEPTION( internal_fault,                   nftex::ledger::ledger_exception,     40005, "internal consistency fault" );

FC_DECLARE_EXCEPTION(         evaluation_error,                                                      41000, "Evaluation Error" );

FC_DECLARE_DERIVED_EXCEPTION( record_not_found,                 nftex::ledger::evaluation_error,     41100, "record not found" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_sale,                     nftex::ledger::record_not_found,     41101, "unknown sale" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_auction,                  nftex::ledger::record_not_found,     41102, "unknown auction" );

FC_DECLARE_DERIVED_EXCEPTION( invalid_state,                    nftex::ledger::evaluation_error,     41200, "invalid state" );
FC_DECLARE_DERIVED_EXCEPTION( sale_not_active,                  nftex::ledger::invalid_state,        41201, "sale not active" );
FC_DECLARE_DERIVED_EXCEPTION( sale_not_finished,                nftex::ledger::invalid_state,        41202, "sale not finished" );
FC_DECLARE_DERIVED_EXCEPTION( auction_not_active,               nftex::ledger::invalid_state,        41203, "auction not active" );
FC_DECLARE_DERIVED_EXCEPTION( auction_not_finished,             nftex::ledger::invalid_state,        41204, "auction not finished" );
FC_DECLARE_DERIVED_EXCEPTION( nothing_to_claim,                 nftex::ledger::invalid_state,        41205, "nothing to claim" );
FC_DECLARE_DERIVED_EXCEPTION( reentrant_call,                   nftex::ledger::invalid_state,        41206, "reentrant call" );
FC_DECLARE_DERIVED_EXCEPTION( auction_already_settled,          nftex::ledger::invalid_state,        41207, "auction already settled" );

FC_DECLARE_DERIVED_EXCEPTION( unauthorized,                     nftex::ledger::evaluation_error,     41300, "unauthorized" );
FC_DECLARE_DERIVED_EXCEPTION( not_seller,                       nftex::ledger::unauthorized,         41301, "caller is not the seller" );
FC_DECLARE_DERIVED_EXCEPTION( not_administrator,                nftex::ledger::unauthorized,         41302, "caller is not an administrator" );
FC_DECLARE_DERIVED_EXCEPTION( seller_cannot_bid,                nftex::ledger::unauthorized,         41303, "seller cannot bid on own auction" );

FC_DECLARE_DERIVED_EXCEPTION( insufficient_funds,               nftex::ledger::evaluation_error,     41400, "insufficient funds" );
FC_DECLARE_DERIVED_EXCEPTION( insufficient_vault_balance,       nftex::ledger::insufficient_funds,   41401, "insufficient vault balance" );
FC_DECLARE_DERIVED_EXCEPTION( payment_mismatch,                 nftex::ledger::insufficient_funds,   41402, "payment mismatch" );
FC_DECLARE_DERIVED_EXCEPTION( insufficient_stock,               nftex::ledger::insufficient_funds,   41403, "insufficient stock" );
FC_DECLARE_DERIVED_EXCEPTION( bid_too_low,                      nftex::ledger::insufficient_funds,   41404, "bid too low" );

FC_DECLARE_DERIVED_EXCEPTION( ineligible_asset,                 nftex::ledger::evaluation_error,     41500, "ineligible asset" );
FC_DECLARE_DERIVED_EXCEPTION( unapproved_listing_contract,      nftex::ledger::ineligible_asset,     41501, "listing contract not approved" );
FC_DECLARE_DERIVED_EXCEPTION( unapproved_currency,              nftex::ledger::ineligible_asset,     41502, "currency not approved" );
FC_DECLARE_DERIVED_EXCEPTION( missing_royalty_support,          nftex::ledger::ineligible_asset,     41503, "item contract lacks royalty info" );
FC_DECLARE_DERIVED_EXCEPTION( ledger_deprecated,                nftex::ledger::ineligible_asset,     41504, "ledger deprecated" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_item_contract,            nftex::ledger::ineligible_asset,     41505, "unknown item contract" );

FC_DECLARE_DERIVED_EXCEPTION( invalid_parameters,               nftex::ledger::evaluation_error,     41600, "invalid parameters" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_time_window,              nftex::ledger::invalid_parameters,   41601, "invalid time window" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_quantity,                 nftex::ledger::invalid_parameters,   41602, "invalid quantity" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_amount,                   nftex::ledger::invalid_parameters,   41603, "invalid amount" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_fee_rate,                 nftex::ledger::invalid_parameters,   41604, "invalid fee rate" );
FC_DECLARE_DERIVED_EXCEPTION( insufficient_item_balance,        nftex::ledger::invalid_parameters,   41605, "seller does not hold the items" );

FC_DECLARE_DERIVED_EXCEPTION( transfer_failure,                 nftex::ledger::evaluation_error,     41700, "external transfer failed" );

} } // nftex::ledger
