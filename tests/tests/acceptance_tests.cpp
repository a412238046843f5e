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
#include <multitoken/chain/receipt_hook.hpp>

#include "../common/database_fixture.hpp"

#include <stdexcept>

using namespace multitoken::chain;
using namespace multitoken::app;

namespace {

   /// a receipt hook whose every call fails with an exception
   class throwing_hook : public receipt_hook
   {
      public:
         explicit throwing_hook( bool std_exception ):_std_exception(std_exception){}

         bool is_programmatic( const address& )const override { return true; }

         receipt_outcome on_received( const address&, const receipt_call& ) override
         {
            if( _std_exception )
               throw std::runtime_error( "out of gas" );
            FC_THROW( "out of gas" );
         }

      private:
         bool _std_exception;
   };

   /// a receipt hook that tries to mint while the credit it is asked about is still pending
   class minting_hook : public receipt_hook
   {
      public:
         minting_hook( database& db, const address& minter ):_db(db),_minter(minter){}

         bool is_programmatic( const address& )const override { return true; }

         receipt_outcome on_received( const address& target, const receipt_call& call ) override
         {
            mint_operation op;
            op.to = target;
            op.token_id = 9;
            op.amount = 1;
            _db.push_operation( op, _minter );
            return hook_returned{ acceptance_selector( call ) };
         }

      private:
         database& _db;
         address   _minter;
   };

}

BOOST_FIXTURE_TEST_SUITE( acceptance_tests, database_fixture )

BOOST_AUTO_TEST_CASE( plain_recipients_are_not_called )
{ try {
   ACTORS((alice)(bob));
   mint( alice, 1, 10 );

   transfer( alice, alice, bob, 1, 4 );
   transfer_batch( alice, alice, bob, { 1 }, { 4 } );
   BOOST_CHECK( balance( 1, bob ) == 8 );
   BOOST_CHECK( receivers->received_calls().empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( accepting_receiver_gets_the_call )
{ try {
   ACTORS((alice)(vault));
   make_receiver( vault, accept_receipt );
   mint( alice, 1, 10 );

   api.safe_transfer_from( alice, alice, vault, 1, 4, bytes{ 'h', 'i' } );
   BOOST_CHECK( balance( 1, vault ) == 4 );

   BOOST_REQUIRE_EQUAL( receivers->received_calls().size(), 1u );
   const auto& call = receivers->received_calls().front();
   BOOST_CHECK( call.first == vault );
   BOOST_REQUIRE( call.second.is_type<single_receipt>() );
   const auto& single = call.second.get<single_receipt>();
   BOOST_CHECK( single.operator_account == alice );
   BOOST_CHECK( single.from == alice );
   BOOST_CHECK( single.token_id == 1 );
   BOOST_CHECK( single.amount == 4 );
   BOOST_CHECK( single.data == bytes({ 'h', 'i' }) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( batch_receiver_is_called_once )
{ try {
   ACTORS((alice)(vault));
   make_receiver( vault, accept_receipt );
   api.mint_batch( ledger_owner, alice, { 1, 2, 3 }, { 10, 10, 10 } );

   transfer_batch( alice, alice, vault, { 1, 2, 3 }, { 1, 2, 3 } );

   BOOST_REQUIRE_EQUAL( receivers->received_calls().size(), 1u );
   const auto& call = receivers->received_calls().front().second;
   BOOST_REQUIRE( call.is_type<batch_receipt>() );
   BOOST_CHECK( call.get<batch_receipt>().token_ids == vector<token_id_type>({ 1, 2, 3 }) );
   BOOST_CHECK( call.get<batch_receipt>().amounts == vector<share_type>({ 1, 2, 3 }) );
   BOOST_CHECK( balance( 3, vault ) == 3 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( wrong_selector_undoes_transfer )
{ try {
   ACTORS((alice)(vault));
   make_receiver( vault, return_value, 0xdeadbeef );
   mint( alice, 1, 10 );
   events.clear();

   MULTITOKEN_REQUIRE_FAILURE( transfer( alice, alice, vault, 1, 4 ), "RejectedBySelector" );
   BOOST_CHECK( balance( 1, alice ) == 10 );
   BOOST_CHECK( balance( 1, vault ) == 0 );
   BOOST_CHECK( events.empty() );
   // the hook was consulted after the balances moved
   BOOST_CHECK_EQUAL( receivers->received_calls().size(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( single_selector_does_not_accept_batches )
{ try {
   ACTORS((alice)(vault)(wallet));
   make_receiver( vault, return_value, MULTITOKEN_RECEIVED_SELECTOR );
   make_receiver( wallet, return_value, MULTITOKEN_BATCH_RECEIVED_SELECTOR );
   mint( alice, 1, 10 );

   transfer( alice, alice, vault, 1, 1 );
   MULTITOKEN_REQUIRE_FAILURE( transfer_batch( alice, alice, vault, { 1 }, { 1 } ), "RejectedBySelector" );

   transfer_batch( alice, alice, wallet, { 1 }, { 1 } );
   MULTITOKEN_REQUIRE_FAILURE( transfer( alice, alice, wallet, 1, 1 ), "RejectedBySelector" );

   BOOST_CHECK( balance( 1, vault ) == 1 );
   BOOST_CHECK( balance( 1, wallet ) == 1 );
   BOOST_CHECK( balance( 1, alice ) == 8 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( revert_reason_is_propagated )
{ try {
   ACTORS((alice)(vault));
   make_receiver( vault, revert_with_reason, 0, "vault is closed" );
   mint( alice, 1, 10 );

   MULTITOKEN_REQUIRE_FAILURE( transfer( alice, alice, vault, 1, 4 ), "vault is closed" );
   MULTITOKEN_REQUIRE_THROW( transfer( alice, alice, vault, 1, 4 ), receiver_reverted );
   BOOST_CHECK( balance( 1, alice ) == 10 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( revert_without_reason )
{ try {
   ACTORS((alice)(vault));
   make_receiver( vault, revert_silently );
   mint( alice, 1, 10 );

   MULTITOKEN_REQUIRE_FAILURE( transfer( alice, alice, vault, 1, 4 ), "NotAnERC1155Receiver" );
   MULTITOKEN_REQUIRE_FAILURE( transfer_batch( alice, alice, vault, { 1 }, { 4 } ), "NotAnERC1155Receiver" );
   BOOST_CHECK( balance( 1, alice ) == 10 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( panic_in_receiver )
{ try {
   ACTORS((alice)(vault));
   make_receiver( vault, panic );
   mint( alice, 1, 10 );

   MULTITOKEN_REQUIRE_FAILURE( transfer( alice, alice, vault, 1, 4 ), "CalleePanicked" );
   MULTITOKEN_REQUIRE_THROW( transfer( alice, alice, vault, 1, 4 ), callee_panicked );
   BOOST_CHECK( balance( 1, alice ) == 10 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( throwing_hook_counts_as_panic )
{ try {
   ACTORS((alice)(bob));
   mint( alice, 1, 10 );

   db.set_receipt_hook( std::make_shared<throwing_hook>( true ) );
   MULTITOKEN_REQUIRE_FAILURE( transfer( alice, alice, bob, 1, 4 ), "CalleePanicked" );

   db.set_receipt_hook( std::make_shared<throwing_hook>( false ) );
   MULTITOKEN_REQUIRE_FAILURE( transfer( alice, alice, bob, 1, 4 ), "CalleePanicked" );
   BOOST_CHECK( balance( 1, alice ) == 10 );

   db.set_receipt_hook( nullptr );
   transfer( alice, alice, bob, 1, 4 );
   BOOST_CHECK( balance( 1, bob ) == 4 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( hook_cannot_push_transactions )
{ try {
   ACTORS((alice)(bob));
   mint( alice, 1, 10 );
   const auto published = events.size();

   db.set_receipt_hook( std::make_shared<minting_hook>( db, ledger_owner ) );
   MULTITOKEN_REQUIRE_FAILURE( transfer( alice, alice, bob, 1, 4 ), "CalleePanicked" );
   BOOST_CHECK( balance( 1, alice ) == 10 );
   BOOST_CHECK( balance( 1, bob ) == 0 );
   BOOST_CHECK( balance( 9, bob ) == 0 );
   BOOST_CHECK_EQUAL( events.size(), published );

   db.set_receipt_hook( nullptr );
   transfer( alice, alice, bob, 1, 4 );
   BOOST_CHECK( balance( 1, bob ) == 4 );
   BOOST_CHECK_EQUAL( events.size(), published + 1 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( mint_skips_the_receipt_hook )
{ try {
   ACTOR(vault);
   make_receiver( vault, revert_silently );

   mint( vault, 1, 10 );
   api.mint_batch( ledger_owner, vault, { 2 }, { 5 } );
   BOOST_CHECK( balance( 1, vault ) == 10 );
   BOOST_CHECK( balance( 2, vault ) == 5 );
   BOOST_CHECK( receivers->received_calls().empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( classify_outcomes )
{ try {
   classify_receipt_outcome( hook_returned{ MULTITOKEN_RECEIVED_SELECTOR }, MULTITOKEN_RECEIVED_SELECTOR );
   classify_receipt_outcome( hook_returned{ MULTITOKEN_BATCH_RECEIVED_SELECTOR }, MULTITOKEN_BATCH_RECEIVED_SELECTOR );

   MULTITOKEN_REQUIRE_THROW( classify_receipt_outcome( hook_returned{ 0 }, MULTITOKEN_RECEIVED_SELECTOR ),
                             rejected_by_selector );
   MULTITOKEN_REQUIRE_THROW( classify_receipt_outcome( hook_reverted_with_reason{ "no" }, MULTITOKEN_RECEIVED_SELECTOR ),
                             receiver_reverted );
   MULTITOKEN_REQUIRE_THROW( classify_receipt_outcome( hook_reverted(), MULTITOKEN_RECEIVED_SELECTOR ),
                             not_a_receiver );
   MULTITOKEN_REQUIRE_THROW( classify_receipt_outcome( hook_panicked{ 0x11 }, MULTITOKEN_RECEIVED_SELECTOR ),
                             callee_panicked );

   BOOST_CHECK_EQUAL( acceptance_selector( single_receipt() ), MULTITOKEN_RECEIVED_SELECTOR );
   BOOST_CHECK_EQUAL( acceptance_selector( batch_receipt() ), MULTITOKEN_BATCH_RECEIVED_SELECTOR );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
