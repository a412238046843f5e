/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#include <multitoken/app/scripted_receiver_registry.hpp>
#include <multitoken/app/script_player.hpp>
#include <multitoken/chain/database.hpp>
#include <multitoken/chain/exceptions.hpp>

#include <fc/io/json.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <fstream>
#include <iostream>

using namespace multitoken::app;
using namespace multitoken::chain;
namespace bpo = boost::program_options;

fc::log_level string_to_level( const std::string& level )
{
   fc::log_level result;
   if( level == "info" )
      result = fc::log_level::info;
   else if( level == "debug" )
      result = fc::log_level::debug;
   else if( level == "warn" )
      result = fc::log_level::warn;
   else if( level == "error" )
      result = fc::log_level::error;
   else if( level == "all" )
      result = fc::log_level::all;
   else
      FC_THROW( "Log level not allowed. Allowed levels are info, debug, warn, error and all." );

   return result;
}

void setup_logging( const std::string& console_level )
{
   fc::logging_config cfg;

   fc::console_appender::config console_appender_config;
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::debug,
         fc::console_appender::color::green ) );
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::warn,
         fc::console_appender::color::brown ) );
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::error,
         fc::console_appender::color::red ) );
   cfg.appenders.push_back( fc::appender_config( "default", "console", fc::variant( console_appender_config, 20 ) ) );
   cfg.loggers = { fc::logger_config( "default" ) };
   cfg.loggers.front().level = string_to_level( console_level );
   cfg.loggers.front().appenders = { "default" };
   fc::configure_logging( cfg );
}

void print_balances( const database& db )
{
   const auto& idx = db.get_index_type<token_balance_index>().indices().get<by_owner>();
   for( const auto& b : idx )
      std::cout << "balance " << std::string( b.owner ) << " " << b.token_id << " " << b.amount << "\n";
}

int main( int argc, char** argv )
{
   try {
      bpo::options_description opts( "Multi-token ledger node" );
      opts.add_options()
            ( "help,h", "Print this help message and exit." )
            ( "owner,o", bpo::value<std::string>(), "Address of the ledger owner, 0x followed by 40 hex digits" )
            ( "script,s", bpo::value<boost::filesystem::path>(), "JSON file with the transactions to replay" )
            ( "receivers,r", bpo::value<boost::filesystem::path>(),
              "JSON file describing the programmatic recipients and how they answer" )
            ( "log-level,l", bpo::value<std::string>()->default_value( "info" ),
              "Console log level: info, debug, warn, error or all" );

      bpo::options_description cli_only;
      cli_only.add_options()
            ( "config-file,c", bpo::value<boost::filesystem::path>(), "INI file with any of the options above" );

      bpo::options_description all_options;
      all_options.add( opts ).add( cli_only );

      bpo::variables_map options;
      try
      {
         bpo::store( bpo::parse_command_line( argc, argv, all_options ), options );
         if( options.count( "config-file" ) > 0 )
         {
            const auto config_file = options["config-file"].as<boost::filesystem::path>();
            std::ifstream in( config_file.string() );
            FC_ASSERT( in.good(), "Unable to open config file ${f}", ("f",config_file.string()) );
            bpo::store( bpo::parse_config_file( in, opts ), options );
         }
         bpo::notify( options );
      }
      catch( const boost::program_options::error& e )
      {
         std::cerr << "Error parsing command line: " << e.what() << "\n";
         return EXIT_FAILURE;
      }

      if( options.count( "help" ) > 0 )
      {
         std::cout << all_options << "\n";
         return EXIT_SUCCESS;
      }

      setup_logging( options.at( "log-level" ).as<std::string>() );

      FC_ASSERT( options.count( "owner" ) > 0, "--owner is required" );
      FC_ASSERT( options.count( "script" ) > 0, "--script is required" );

      database db;
      db.initialize( address( options.at( "owner" ).as<std::string>() ) );

      auto receivers = std::make_shared<scripted_receiver_registry>();
      if( options.count( "receivers" ) > 0 )
         receivers->load( options.at( "receivers" ).as<boost::filesystem::path>() );
      db.set_receipt_hook( receivers );

      db.applied_event.connect( []( const ledger_event& e ) {
         std::cout << "event " << fc::json::to_string( fc::variant( e, MULTITOKEN_MAX_NESTED_OBJECTS ) ) << "\n";
      });

      const auto steps = script_player::load( options.at( "script" ).as<boost::filesystem::path>() );
      ilog( "Replaying ${n} transactions", ("n",steps.size()) );

      script_player player( db );
      size_t mismatches = 0;
      for( size_t i = 0; i < steps.size(); ++i )
      {
         const auto result = player.play( steps[i] );
         std::cout << "step " << i << " "
                   << ( result.applied ? std::string( "applied" ) : "rejected " + result.failure ) << "\n";
         if( !result.matched_expectation )
            ++mismatches;
      }

      print_balances( db );

      if( mismatches > 0 )
      {
         elog( "${n} of ${t} steps did not end as expected", ("n",mismatches)("t",steps.size()) );
         return EXIT_FAILURE;
      }
      ilog( "Replay finished" );
      return EXIT_SUCCESS;
   } catch( const fc::exception& e ) {
      elog( "Exiting with error:\n${e}", ("e", e.to_detail_string()) );
      return EXIT_FAILURE;
   }
}
