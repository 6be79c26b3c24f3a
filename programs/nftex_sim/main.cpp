#include <boost/program_options.hpp>

#include <nftex/ledger/config.hpp>
#include <nftex/ledger/exceptions.hpp>
#include <nftex/ledger/marketplace.hpp>
#include <nftex/ledger/simulated_collaborators.hpp>
#include <nftex/ledger/time.hpp>

#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/log/file_appender.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/reflect/variant.hpp>

#include <iostream>

using namespace nftex::ledger;
namespace program_options = boost::program_options;

struct sim_config
{
   market_config       market;
   fc::logging_config  logging;
};

struct scenario_holding
{
   address             owner;
   item_id_type        item_id = 0;
   share_type          quantity = 1;
   item_kind           kind = unique_item;
};

struct scenario_item_contract
{
   address                     contract;
   bool                        royalty_support = true;
   address                     royalty_receiver;
   share_type                  royalty_rate = 0;
   share_type                  royalty_scale = 10000;
   vector<scenario_holding>    holdings;
};

struct scenario_wallet
{
   address             owner;
   asset               balance;
   share_type          allowance = 0;   ///< token allowance granted to the marketplace
};

/**
 *  A policy change made by an administrator between operations, one of
 *  set_listing_contract_approval, set_currency_approval, approve_all_currencies,
 *  set_fee_rate, set_fee_recipient, add_administrator, remove_administrator.
 */
struct scenario_policy_change
{
   string              action;
   address             target;
   bool                approved = true;
   share_type          rate = 0;
   share_type          scale = 0;
};

struct scenario_step
{
   address                          caller;
   share_type                       value = 0;        ///< native currency attached to the call
   int32_t                          advance = 0;      ///< seconds to advance the clock before the step
   optional<operation>              op;
   optional<scenario_policy_change> policy;
   optional<string>                 expect_error;     ///< name of the exception the step must fail with
};

struct scenario
{
   string                           start_time;
   vector<scenario_item_contract>   item_contracts;
   vector<scenario_wallet>          wallets;
   vector<scenario_step>            steps;
};

FC_REFLECT( sim_config, (market)(logging) )
FC_REFLECT( scenario_holding, (owner)(item_id)(quantity)(kind) )
FC_REFLECT( scenario_item_contract, (contract)(royalty_support)(royalty_receiver)(royalty_rate)(royalty_scale)(holdings) )
FC_REFLECT( scenario_wallet, (owner)(balance)(allowance) )
FC_REFLECT( scenario_policy_change, (action)(target)(approved)(rate)(scale) )
FC_REFLECT( scenario_step, (caller)(value)(advance)(op)(policy)(expect_error) )
FC_REFLECT( scenario, (start_time)(item_contracts)(wallets)(steps) )

program_options::variables_map parse_option_variables( int argc, char** argv )
{
   program_options::options_description option_config("Usage");
   option_config.add_options()
         ("help", "Display this help message and exit")
         ("version", "Print version information and exit")

         ("data-dir", program_options::value<string>(), "Set the directory holding config.json and the ledger snapshot")
         ("config", program_options::value<string>(), "Load the marketplace config from this file instead of <data-dir>/config.json")
         ("scenario", program_options::value<string>(), "Run the JSON scenario in this file against an empty ledger (replaces <data-dir>/ledger)")
         ("simulated-time", program_options::value<string>(),
          "Start the clock at this ISO time (YYYYMMDDTHHMMSS) instead of the scenario's start_time")
         ("dump-state", "Print every committed ledger record when the run completes")
         ;

   program_options::variables_map option_variables;
   try
   {
      program_options::store(program_options::command_line_parser(argc, argv).
                             options(option_config).run(), option_variables);
      program_options::notify(option_variables);
   }
   catch (program_options::error& cmdline_error)
   {
      std::cerr << "Error: " << cmdline_error.what() << "\n";
      std::cerr << option_config << "\n";
      exit(1);
   }

   if (option_variables.count("help"))
   {
      std::cout << option_config << "\n";
      exit(0);
   }
   else if (option_variables.count("version"))
   {
      std::cout << fc::json::to_pretty_string( fc::mutable_variant_object( "nftex_ledger_version", NFTEX_LEDGER_VERSION )
                                                                         ( "ledger_database_version", NFTEX_LEDGER_DATABASE_VERSION ) )
                << "\n";
      exit(0);
   }

   return option_variables;
}

fc::path get_data_dir( const program_options::variables_map& option_variables )
{
   if( option_variables.count("data-dir") )
      return fc::path( option_variables["data-dir"].as<string>().c_str() );
   return fc::app_path() / ".nftex_sim";
}

fc::logging_config create_default_logging_config()
{
   fc::logging_config cfg;

   fc::file_appender::config ac;
   ac.filename             = fc::path( "logs" ) / "ledger.log";
   ac.flush                = true;
   ac.rotate               = false;

   fc::variants  c  {
      fc::mutable_variant_object( "level","debug")("color", "green"),
            fc::mutable_variant_object( "level","warn")("color", "brown"),
            fc::mutable_variant_object( "level","error")("color", "red") };

   cfg.appenders.push_back(
            fc::appender_config( "stderr", "console",
                                 fc::mutable_variant_object()
                                 ( "stream","std_error")
                                 ( "level_colors", c )
                                 ) );
   cfg.appenders.push_back( fc::appender_config( "ledger", "file", fc::variant( ac ) ) );

   fc::logger_config dlc;
   dlc.level = fc::log_level::info;
   dlc.name = "default";
   dlc.appenders.push_back( "ledger" );
   dlc.appenders.push_back( "stderr" );
   cfg.loggers.push_back( dlc );

   return cfg;
}

sim_config load_config( const fc::path& data_dir, const program_options::variables_map& option_variables )
{ try {
   fc::path config_file = data_dir / "config.json";
   if( option_variables.count("config") )
      config_file = fc::path( option_variables["config"].as<string>().c_str() );

   sim_config cfg;
   if( fc::exists( config_file ) )
   {
      std::cout << "Loading config from file: " << config_file.preferred_string() << "\n";
      cfg = fc::json::from_file( config_file ).as<sim_config>();
   }
   else
   {
      std::cerr << "Creating default config file at: " << config_file.preferred_string() << "\n";
      cfg.market.administrators.push_back( address::from_label( "nftex.admin" ) );
      cfg.market.fee_recipient = address::from_label( "nftex.treasury" );
      cfg.logging = create_default_logging_config();
      fc::json::save_to_file( cfg, config_file );
   }

   // the logging config may hold paths relative to the data directory
   for( fc::appender_config& appender : cfg.logging.appenders )
   {
      if( appender.type == "file" )
      {
         try
         {
            fc::file_appender::config file_appender_config = appender.args.as<fc::file_appender::config>();
            if( file_appender_config.filename.is_relative() )
            {
               file_appender_config.filename = fc::absolute( data_dir / file_appender_config.filename );
               appender.args = fc::variant( file_appender_config );
            }
         }
         catch( const fc::exception& e )
         {
            wlog( "Unexpected exception processing logging config: ${e}", ("e",e) );
         }
      }
   }

   return cfg;
} FC_CAPTURE_AND_RETHROW( (data_dir) ) }

/** replaces every string of the form "@label" with the address derived from label, and "@" with the null address */
fc::variant resolve_labels( const fc::variant& in )
{
   if( in.is_string() )
   {
      const string& str = in.get_string();
      if( str == "@" )
         return fc::variant( string( address() ) );
      if( !str.empty() && str[0] == '@' )
         return fc::variant( string( address::from_label( str.substr( 1 ) ) ) );
      return in;
   }
   if( in.is_array() )
   {
      fc::variants out;
      for( const fc::variant& item : in.get_array() )
         out.push_back( resolve_labels( item ) );
      return fc::variant( out );
   }
   if( in.is_object() )
   {
      fc::mutable_variant_object out;
      for( const auto& entry : in.get_object() )
         out[ entry.key() ] = resolve_labels( entry.value() );
      return fc::variant( out );
   }
   return in;
}

void apply_policy_change( marketplace& market, const address& caller, const scenario_policy_change& change )
{
   if( change.action == "set_listing_contract_approval" )
      market.registry().set_listing_contract_approval( caller, change.target, change.approved );
   else if( change.action == "set_currency_approval" )
      market.registry().set_currency_approval( caller, change.target, change.approved );
   else if( change.action == "approve_all_currencies" )
      market.registry().approve_all_currencies( caller );
   else if( change.action == "set_fee_rate" )
      market.fees().set_fee_rate( caller, change.rate, change.scale );
   else if( change.action == "set_fee_recipient" )
      market.fees().set_fee_recipient( caller, change.target );
   else if( change.action == "add_administrator" )
      market.authority().add_administrator( caller, change.target );
   else if( change.action == "remove_administrator" )
      market.authority().remove_administrator( caller, change.target );
   else
      FC_THROW_EXCEPTION( invalid_parameters, "unknown policy action ${a}", ("a",change.action) );
}

/** returns the number of steps whose outcome differed from the expected one */
uint32_t run_scenario( marketplace& market, const scenario& scene,
                       const simulated_item_directory_ptr& directory,
                       const simulated_payment_rail_ptr& payments )
{
   for( const scenario_item_contract& entry : scene.item_contracts )
   {
      const simulated_item_contract_ptr contract = std::make_shared<simulated_item_contract>( entry.royalty_support );
      if( !entry.royalty_receiver.is_null() )
         contract->set_royalty( entry.royalty_receiver, entry.royalty_rate, entry.royalty_scale );
      for( const scenario_holding& holding : entry.holdings )
      {
         if( holding.kind == unique_item )
            contract->mint_unique( holding.owner, holding.item_id );
         else
            contract->mint( holding.owner, holding.item_id, holding.quantity );
      }
      directory->add_item_contract( entry.contract, contract );
   }

   for( const scenario_wallet& wallet : scene.wallets )
   {
      payments->deposit( wallet.owner, wallet.balance );
      if( !wallet.balance.is_native() )
         payments->approve( wallet.owner, wallet.balance.currency, wallet.allowance );
   }

   uint32_t failures = 0;
   uint32_t step_num = 0;
   for( const scenario_step& step : scene.steps )
   {
      ++step_num;
      if( step.advance != 0 )
         advance_time( step.advance );

      optional<string> error_name;
      try
      {
         if( step.op.valid() )
         {
            const evaluation_state_ptr result = market.apply_operation( *step.op, call_context( step.caller, step.value ) );
            std::cout << "step " << step_num << ": " << fc::json::to_string( *result ) << "\n";
         }
         else if( step.policy.valid() )
         {
            apply_policy_change( market, step.caller, *step.policy );
            std::cout << "step " << step_num << ": " << step.policy->action << "\n";
         }
      }
      catch( const fc::exception& e )
      {
         error_name = e.name();
         std::cout << "step " << step_num << " failed: " << e.to_string() << "\n";
      }

      const string expected = step.expect_error.valid() ? *step.expect_error : string();
      const string actual = error_name.valid() ? *error_name : string();
      if( expected != actual )
      {
         ++failures;
         std::cerr << "step " << step_num << ": expected '" << expected << "', got '" << actual << "'\n";
      }
   }
   return failures;
}

int main( int argc, char** argv )
{
   int exit_code = 0;
   try
   {
      const program_options::variables_map option_variables = parse_option_variables( argc, argv );

      const fc::path data_dir = get_data_dir( option_variables );
      fc::create_directories( data_dir );

      const sim_config cfg = load_config( data_dir, option_variables );
      fc::configure_logging( cfg.logging );

      optional<scenario> scene;
      if( option_variables.count("scenario") )
      {
         const fc::path scenario_file( option_variables["scenario"].as<string>().c_str() );
         scene = resolve_labels( fc::json::from_file( scenario_file ) ).as<scenario>();
      }

      string start_time;
      if( option_variables.count("simulated-time") )
         start_time = option_variables["simulated-time"].as<string>();
      else if( scene.valid() && !scene->start_time.empty() )
         start_time = scene->start_time;
      if( !start_time.empty() )
         start_simulated_time( fc::time_point::from_iso_string( start_time ) );

      const simulated_item_directory_ptr directory = std::make_shared<simulated_item_directory>();
      const simulated_payment_rail_ptr payments = std::make_shared<simulated_payment_rail>();

      // item contracts and wallets live only as long as this process, so a scenario
      // starts from an empty ledger rather than records whose items it no longer holds
      const fc::path ledger_dir = data_dir / "ledger";
      if( scene.valid() && fc::exists( ledger_dir ) )
      {
         ilog( "discarding ledger state from a previous run in ${d}", ("d",ledger_dir) );
         fc::remove_all( ledger_dir );
      }

      marketplace market( cfg.market, directory, payments );
      market.open( ledger_dir );

      if( scene.valid() )
      {
         const uint32_t failures = run_scenario( market, *scene, directory, payments );
         std::cout << scene->steps.size() << " steps, " << failures << " unexpected outcomes\n";
         if( failures > 0 ) exit_code = 2;
      }

      if( option_variables.count("dump-state") )
         std::cout << fc::json::to_pretty_string( market.database().to_variant() ) << "\n";

      market.close();
   }
   catch ( const fc::exception& e )
   {
      std::cerr << "------------ error --------------\n"
                << e.to_detail_string() << "\n";
      wlog( "${e}", ("e", e.to_detail_string() ) );
      exit_code = 1;
   }

   stop_simulated_time();
   ilog( "Leaving main()" );
   fc::configure_logging( fc::logging_config::default_config() );
   return exit_code;
}
