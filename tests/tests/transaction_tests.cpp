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

#include <stdexcept>

using namespace multitoken::chain;

BOOST_FIXTURE_TEST_SUITE( transaction_tests, database_fixture )

BOOST_AUTO_TEST_CASE( empty_transaction_is_rejected )
{ try {
   MULTITOKEN_REQUIRE_FAILURE( push( vector<operation>(), ledger_owner ),
                               "A transaction must have at least one operation" );
   MULTITOKEN_REQUIRE_THROW( push( vector<operation>(), ledger_owner ), empty_transaction );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( uninitialized_ledger_rejects_transactions )
{ try {
   ACTOR(alice);

   database fresh;
   BOOST_CHECK( !fresh.is_initialized() );

   mint_operation op;
   op.to = alice;
   op.token_id = 1;
   op.amount = 1;
   MULTITOKEN_REQUIRE_FAILURE( fresh.push_operation( op, ledger_owner ), "LedgerNotInitialized" );
   MULTITOKEN_REQUIRE_FAILURE( fresh.get_ledger_owner(), "LedgerNotInitialized" );

   fresh.initialize( ledger_owner );
   BOOST_CHECK( fresh.is_initialized() );
   BOOST_CHECK( fresh.get_ledger_owner() == ledger_owner );
   BOOST_CHECK_THROW( fresh.initialize( ledger_owner ), fc::exception );

   fresh.push_operation( op, ledger_owner );
   BOOST_CHECK( fresh.balance_of( 1, alice ) == 1 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failing_operation_undoes_the_whole_transaction )
{ try {
   ACTOR(bob);

   const auto id = create_token_class( ledger_owner );
   events.clear();

   mint_operation mint_op;
   mint_op.to = ledger_owner;
   mint_op.token_id = id;
   mint_op.amount = 10;

   transfer_operation transfer_op;
   transfer_op.from = ledger_owner;
   transfer_op.to = bob;
   transfer_op.token_id = id;
   transfer_op.amount = 4;

   burn_operation burn_op;
   burn_op.owner = ledger_owner;
   burn_op.token_id = id;
   burn_op.amount = 7;

   token_class_create_operation create_op;
   create_op.creator = bob;

   MULTITOKEN_REQUIRE_FAILURE( push( { create_op, mint_op, transfer_op, burn_op }, ledger_owner ),
                               "BurnExceedsBalance" );

   BOOST_CHECK( balance( id, ledger_owner ) == 0 );
   BOOST_CHECK( balance( id, bob ) == 0 );
   BOOST_CHECK( db.get_holdings( ledger_owner ).empty() );
   BOOST_CHECK( db.get_holdings( bob ).empty() );
   BOOST_CHECK( db.get_next_token_id() == id + 1 );
   BOOST_CHECK( !api.exists( id + 1 ) );
   BOOST_CHECK( events.empty() );

   // the same operations minus the failing one commit together
   burn_op.amount = 6;
   push( { mint_op, transfer_op, burn_op }, ledger_owner );
   BOOST_CHECK( balance( id, ledger_owner ) == 0 );
   BOOST_CHECK( balance( id, bob ) == 4 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( events_follow_operation_order )
{ try {
   ACTORS((alice)(bob));

   mint_operation mint_op;
   mint_op.to = alice;
   mint_op.token_id = 3;
   mint_op.amount = 10;

   set_approval_for_all_operation approve_op;
   approve_op.owner = alice;
   approve_op.operator_account = bob;
   approve_op.approved = true;

   transfer_operation transfer_op;
   transfer_op.from = alice;
   transfer_op.to = bob;
   transfer_op.token_id = 3;
   transfer_op.amount = 2;

   push( mint_op, ledger_owner );
   push( { approve_op, transfer_op }, alice );

   BOOST_REQUIRE_EQUAL( events.size(), 3u );
   BOOST_CHECK( events[0].is_type<transfer_single_event>() );
   BOOST_CHECK( events[0].get<transfer_single_event>().from.is_null() );
   BOOST_CHECK( events[1].is_type<approval_for_all_event>() );
   BOOST_REQUIRE( events[2].is_type<transfer_single_event>() );
   const auto& moved = events[2].get<transfer_single_event>();
   BOOST_CHECK( moved.operator_account == alice );
   BOOST_CHECK( moved.from == alice );
   BOOST_CHECK( moved.to == bob );
   BOOST_CHECK( moved.amount == 2 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( events_are_published_after_commit )
{ try {
   ACTOR(alice);

   // while a listener runs the transaction is already visible
   share_type seen;
   db.applied_event.connect( [&]( const ledger_event& ) {
      seen = db.balance_of( 5, alice );
   });

   mint( alice, 5, 9 );
   BOOST_CHECK( seen == 9 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( operation_results_follow_operation_order )
{ try {
   ACTOR(alice);

   token_class_create_operation create_op;
   create_op.creator = alice;

   mint_operation mint_op;
   mint_op.to = alice;
   mint_op.token_id = 1;
   mint_op.amount = 1;

   auto processed = push( { create_op, mint_op, create_op }, ledger_owner );
   BOOST_REQUIRE_EQUAL( processed.operation_results.size(), 3u );
   BOOST_REQUIRE( processed.operation_results[0].is_type<token_id_type>() );
   BOOST_CHECK( processed.operation_results[0].get<token_id_type>() == 1 );
   BOOST_CHECK( processed.operation_results[1].is_type<void_result>() );
   BOOST_REQUIRE( processed.operation_results[2].is_type<token_id_type>() );
   BOOST_CHECK( processed.operation_results[2].get<token_id_type>() == 2 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failing_listener_does_not_undo )
{ try {
   ACTOR(alice);

   db.applied_event.connect( []( const ledger_event& ) {
      FC_THROW( "listener failure" );
   });

   mint( alice, 1, 5 );
   BOOST_CHECK( balance( 1, alice ) == 5 );
   BOOST_CHECK_EQUAL( events.size(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( listener_std_exception_does_not_fail_the_transaction )
{ try {
   ACTOR(alice);

   db.applied_event.connect( []( const ledger_event& ) {
      throw std::runtime_error( "listener failure" );
   });

   mint( alice, 1, 5 );
   BOOST_CHECK( balance( 1, alice ) == 5 );

   mint_operation op;
   op.to = alice;
   op.token_id = 2;
   op.amount = 3;
   auto processed = push( { op, op }, ledger_owner );
   BOOST_CHECK_EQUAL( processed.operation_results.size(), 2u );
   BOOST_CHECK( balance( 2, alice ) == 6 );

   // every event still reaches the listeners connected before the failing one
   BOOST_CHECK_EQUAL( events.size(), 3u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( listener_pushes_follow_up_transaction )
{ try {
   ACTOR(alice);

   bool followed_up = false;
   db.applied_event.connect( [&]( const ledger_event& ) {
      if( followed_up )
         return;
      followed_up = true;
      mint( alice, 2, 1 );
   });

   mint( alice, 1, 5 );
   BOOST_CHECK( balance( 1, alice ) == 5 );
   BOOST_CHECK( balance( 2, alice ) == 1 );
   BOOST_CHECK_EQUAL( events.size(), 2u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
