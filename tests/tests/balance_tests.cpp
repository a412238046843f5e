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

#include <multitoken/chain/database.hpp>
#include <multitoken/chain/exceptions.hpp>

#include "../common/database_fixture.hpp"

#include <limits>

using namespace multitoken::chain;

BOOST_FIXTURE_TEST_SUITE( balance_tests, database_fixture )

BOOST_AUTO_TEST_CASE( mint_then_burn )
{ try {
   ACTOR(holder);
   const token_id_type id = 1;

   mint( holder, id, 100 );
   BOOST_CHECK( balance( id, holder ) == 100 );

   burn( holder, holder, id, 40 );
   BOOST_CHECK( balance( id, holder ) == 60 );

   MULTITOKEN_REQUIRE_FAILURE( burn( holder, holder, id, 61 ), "BurnExceedsBalance" );
   BOOST_CHECK( balance( id, holder ) == 60 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( mint_and_burn_events )
{ try {
   ACTOR(holder);

   mint( holder, 3, 7 );
   burn( holder, holder, 3, 2 );

   auto transfers = events_of_type<transfer_single_event>();
   BOOST_REQUIRE_EQUAL( transfers.size(), 2u );

   BOOST_CHECK( transfers[0].operator_account == ledger_owner );
   BOOST_CHECK( transfers[0].from.is_null() );
   BOOST_CHECK( transfers[0].to == holder );
   BOOST_CHECK( transfers[0].token_id == 3 );
   BOOST_CHECK( transfers[0].amount == 7 );

   BOOST_CHECK( transfers[1].operator_account == holder );
   BOOST_CHECK( transfers[1].from == holder );
   BOOST_CHECK( transfers[1].to.is_null() );
   BOOST_CHECK( transfers[1].amount == 2 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( unknown_entries_read_zero )
{ try {
   ACTORS((alice)(bob));
   mint( alice, 1, 5 );

   BOOST_CHECK( balance( 1, bob ) == 0 );
   BOOST_CHECK( balance( 2, alice ) == 0 );
   BOOST_CHECK( db.get_holdings( bob ).empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( null_holder_query_fails )
{ try {
   ACTOR(alice);
   mint( alice, 1, 5 );

   MULTITOKEN_REQUIRE_FAILURE( db.balance_of( 1, address() ), "ZeroSource" );
   MULTITOKEN_REQUIRE_FAILURE( db.balance_of( 42, address() ), "ZeroSource" );
   MULTITOKEN_REQUIRE_FAILURE( db.balance_of_batch( { alice, address() }, { 1, 1 } ), "ZeroSource" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( balance_of_batch_pairs_by_position )
{ try {
   ACTORS((alice)(bob));
   mint( alice, 1, 10 );
   mint( bob, 2, 20 );

   auto balances = api.balance_of_batch( { alice, bob, alice, bob }, { 1, 2, 2, 1 } );
   BOOST_REQUIRE_EQUAL( balances.size(), 4u );
   BOOST_CHECK( balances[0] == 10 );
   BOOST_CHECK( balances[1] == 20 );
   BOOST_CHECK( balances[2] == 0 );
   BOOST_CHECK( balances[3] == 0 );

   BOOST_CHECK( api.balance_of_batch( {}, {} ).empty() );
   MULTITOKEN_REQUIRE_FAILURE( api.balance_of_batch( { alice, bob }, { 1 } ), "LengthMismatch" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( holdings_are_ordered_by_token )
{ try {
   ACTOR(alice);
   mint( alice, 9, 1 );
   mint( alice, 2, 1 );
   mint( alice, 5, 1 );

   auto holdings = db.get_holdings( alice );
   BOOST_REQUIRE_EQUAL( holdings.size(), 3u );
   BOOST_CHECK( holdings[0].token_id == 2 );
   BOOST_CHECK( holdings[1].token_id == 5 );
   BOOST_CHECK( holdings[2].token_id == 9 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( only_ledger_owner_mints )
{ try {
   ACTORS((alice)(bob));

   MULTITOKEN_REQUIRE_FAILURE( api.mint( alice, alice, 1, 100 ), "Unauthorized" );
   MULTITOKEN_REQUIRE_FAILURE( api.mint_batch( bob, alice, { 1 }, { 100 } ), "Unauthorized" );
   BOOST_CHECK( balance( 1, alice ) == 0 );
   BOOST_CHECK( events.empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( mint_to_null_address_fails )
{ try {
   MULTITOKEN_REQUIRE_FAILURE( mint( address(), 1, 100 ), "ZeroRecipient" );
   MULTITOKEN_REQUIRE_FAILURE( api.mint_batch( ledger_owner, address(), { 1 }, { 1 } ), "ZeroRecipient" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( burn_authorization )
{ try {
   ACTORS((alice)(bob)(carol));
   mint( alice, 1, 100 );

   MULTITOKEN_REQUIRE_FAILURE( burn( bob, alice, 1, 10 ), "Unauthorized" );
   BOOST_CHECK( balance( 1, alice ) == 100 );

   set_approval( alice, bob, true );
   burn( bob, alice, 1, 10 );
   BOOST_CHECK( balance( 1, alice ) == 90 );

   burn( ledger_owner, alice, 1, 20 );
   BOOST_CHECK( balance( 1, alice ) == 70 );

   MULTITOKEN_REQUIRE_FAILURE( burn( carol, alice, 1, 1 ), "Unauthorized" );
   MULTITOKEN_REQUIRE_FAILURE( burn( alice, address(), 1, 1 ), "ZeroSource" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( mint_batch_then_burn_batch_restores_zero )
{ try {
   ACTOR(alice);
   const vector<token_id_type> ids = { 1, 2, 3 };
   const vector<share_type> amounts = { 10, 0, 30 };

   api.mint_batch( ledger_owner, alice, ids, amounts );
   BOOST_CHECK( balance( 1, alice ) == 10 );
   BOOST_CHECK( balance( 3, alice ) == 30 );

   api.burn_batch( alice, alice, ids, amounts );
   for( const auto& id : ids )
      BOOST_CHECK( balance( id, alice ) == 0 );

   auto batches = events_of_type<transfer_batch_event>();
   BOOST_REQUIRE_EQUAL( batches.size(), 2u );
   BOOST_CHECK( batches[0].from.is_null() );
   BOOST_CHECK( batches[0].to == alice );
   BOOST_CHECK( batches[0].token_ids == ids );
   BOOST_CHECK( batches[1].from == alice );
   BOOST_CHECK( batches[1].to.is_null() );
   BOOST_CHECK( batches[1].amounts == amounts );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( burn_batch_is_all_or_nothing )
{ try {
   ACTOR(alice);
   mint( alice, 1, 10 );
   mint( alice, 2, 10 );

   // the same token twice draws on one balance
   MULTITOKEN_REQUIRE_FAILURE( api.burn_batch( alice, alice, { 1, 1 }, { 6, 5 } ), "BurnExceedsBalance" );
   MULTITOKEN_REQUIRE_FAILURE( api.burn_batch( alice, alice, { 2, 1 }, { 1, 11 } ), "BurnExceedsBalance" );
   BOOST_CHECK( balance( 1, alice ) == 10 );
   BOOST_CHECK( balance( 2, alice ) == 10 );

   MULTITOKEN_REQUIRE_FAILURE( api.burn_batch( alice, alice, { 1, 2 }, { 1 } ), "LengthMismatch" );

   api.burn_batch( alice, alice, { 1, 1 }, { 6, 4 } );
   BOOST_CHECK( balance( 1, alice ) == 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( mint_overflow_is_rejected )
{ try {
   ACTOR(alice);
   const share_type max_amount = std::numeric_limits<share_type>::max();

   mint( alice, 1, max_amount );
   MULTITOKEN_REQUIRE_THROW( mint( alice, 1, 1 ), fc::exception );
   BOOST_CHECK( balance( 1, alice ) == max_amount );

   // a batch crediting the same token twice overflows on the second pair
   mint( alice, 2, 1 );
   MULTITOKEN_REQUIRE_THROW( api.mint_batch( ledger_owner, alice, { 2, 2 }, { 1, max_amount } ), fc::exception );
   BOOST_CHECK( balance( 2, alice ) == 1 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
