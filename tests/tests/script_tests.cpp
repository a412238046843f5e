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
#include <boost/test/unit_test.hpp>

#include <multitoken/app/script_player.hpp>

#include <fc/io/json.hpp>

#include "../common/database_fixture.hpp"

using namespace multitoken::chain;
using namespace multitoken::app;

namespace {

vector<script_step> parse_script( const string& json )
{
   return fc::json::from_string( json ).as<vector<script_step>>( MULTITOKEN_MAX_NESTED_OBJECTS );
}

}

BOOST_FIXTURE_TEST_SUITE( script_tests, database_fixture )

BOOST_AUTO_TEST_CASE( replay_continues_after_rejected_steps )
{ try {
   ACTORS((alice)(bob));

   const string owner = string( ledger_owner );
   const string a = string( alice );
   const string b = string( bob );

   auto steps = parse_script( "["
      "{\"caller\":\"" + owner + "\",\"operations\":["
         "[3,{\"creator\":\"" + a + "\",\"initial_supply\":\"100\",\"uri\":\"\"}],"
         "[4,{\"to\":\"" + a + "\",\"token_id\":1,\"amount\":100}]]},"
      "{\"caller\":\"" + b + "\",\"operations\":["
         "[0,{\"from\":\"" + a + "\",\"to\":\"" + b + "\",\"token_id\":1,\"amount\":5}]],"
         "\"expect_failure\":\"Unauthorized\"},"
      "{\"caller\":\"" + a + "\",\"operations\":["
         "[0,{\"from\":\"" + a + "\",\"to\":\"" + b + "\",\"token_id\":1,\"amount\":500}]],"
         "\"expect_failure\":\"Unauthorized\"},"
      "{\"caller\":\"" + a + "\",\"operations\":["
         "[0,{\"from\":\"" + a + "\",\"to\":\"" + b + "\",\"token_id\":1,\"amount\":30}]]}"
   "]" );
   BOOST_REQUIRE_EQUAL( steps.size(), 4u );
   BOOST_CHECK( !steps[0].expect_failure.valid() );

   script_player player( db );
   auto results = player.play_all( steps );
   BOOST_REQUIRE_EQUAL( results.size(), 4u );

   BOOST_CHECK( results[0].applied );
   BOOST_CHECK( results[0].matched_expectation );
   BOOST_REQUIRE_EQUAL( results[0].operation_results.size(), 2u );
   BOOST_CHECK( results[0].operation_results[0].get<token_id_type>() == 1 );

   BOOST_CHECK( !results[1].applied );
   BOOST_CHECK_EQUAL( results[1].failure, "Unauthorized" );
   BOOST_CHECK( results[1].matched_expectation );

   // rejected for another reason than the expected one
   BOOST_CHECK( !results[2].applied );
   BOOST_CHECK_EQUAL( results[2].failure, "InsufficientBalance" );
   BOOST_CHECK( !results[2].matched_expectation );

   BOOST_CHECK( results[3].applied );
   BOOST_CHECK( results[3].matched_expectation );

   BOOST_CHECK( balance( 1, alice ) == 70 );
   BOOST_CHECK( balance( 1, bob ) == 30 );
   BOOST_CHECK( api.creator_of( 1 ) == alice );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( unexpected_success_is_a_mismatch )
{ try {
   ACTOR(alice);

   script_step step;
   step.caller = ledger_owner;
   mint_operation op;
   op.to = alice;
   op.token_id = 2;
   op.amount = 1;
   step.operations.push_back( op );
   step.expect_failure = string( "Unauthorized" );

   script_player player( db );
   auto result = player.play( step );
   BOOST_CHECK( result.applied );
   BOOST_CHECK( !result.matched_expectation );
   BOOST_CHECK( balance( 2, alice ) == 1 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( receivers_from_json )
{ try {
   ACTORS((alice)(vault));

   auto definitions = fc::json::from_string(
         "[{\"target\":\"" + string( vault ) + "\",\"behavior\":"
         "{\"mode\":\"revert_with_reason\",\"value\":0,\"reason\":\"vault closed\",\"code\":0}}]" )
      .as<vector<receiver_definition>>( MULTITOKEN_MAX_NESTED_OBJECTS );
   receivers->register_receivers( definitions );
   BOOST_CHECK( receivers->is_programmatic( vault ) );

   mint( alice, 1, 3 );
   MULTITOKEN_REQUIRE_FAILURE( transfer( alice, alice, vault, 1, 1 ), "vault closed" );
   BOOST_CHECK( balance( 1, alice ) == 3 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
