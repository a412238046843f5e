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

#include <multitoken/chain/balance_object.hpp>
#include <multitoken/chain/database.hpp>
#include <multitoken/chain/token_class_object.hpp>

#include "../common/database_fixture.hpp"

using namespace multitoken::chain;

BOOST_FIXTURE_TEST_SUITE( undo_tests, database_fixture )

BOOST_AUTO_TEST_CASE( undo_create )
{ try {
   ACTOR(creator);

   const auto& idx = db.get_index_type<token_class_index>().indices().get<by_token_id>();
   {
      auto ses = db._undo_db.start_undo_session();
      db.create<token_class_object>( [&]( token_class_object& obj ) {
         obj.token_id = 1;
         obj.creator = creator;
      });
      BOOST_CHECK_EQUAL( idx.size(), 1u );
   }
   BOOST_CHECK_EQUAL( idx.size(), 0u );

   // the object id handed out inside the session is handed out again
   const auto& first = db.create<token_class_object>( [&]( token_class_object& obj ) {
      obj.token_id = 1;
   });
   const object_id_type first_id = first.id;
   {
      auto ses = db._undo_db.start_undo_session();
      const auto& second = db.create<token_class_object>( [&]( token_class_object& obj ) {
         obj.token_id = 2;
      });
      BOOST_CHECK( second.id.instance() == first_id.instance() + 1 );
   }
   const auto& again = db.create<token_class_object>( [&]( token_class_object& obj ) {
      obj.token_id = 2;
   });
   BOOST_CHECK( again.id.instance() == first_id.instance() + 1 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( undo_modify )
{ try {
   ACTOR(alice);

   mint( alice, 1, 10 );
   {
      auto ses = db._undo_db.start_undo_session();
      db.add_balance( 1, alice, 5 );
      db.reduce_balance( 1, alice, 2 );
      BOOST_CHECK( balance( 1, alice ) == 13 );
   }
   BOOST_CHECK( balance( 1, alice ) == 10 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( commit_outer_session )
{ try {
   ACTOR(alice);

   {
      auto ses = db._undo_db.start_undo_session();
      db.add_balance( 4, alice, 3 );
      ses.commit();
   }
   BOOST_CHECK( balance( 4, alice ) == 3 );
   BOOST_CHECK_EQUAL( db._undo_db.size(), 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( merge_nested_session )
{ try {
   ACTOR(alice);

   mint( alice, 1, 10 );
   {
      auto outer = db._undo_db.start_undo_session();
      db.add_balance( 1, alice, 1 );
      {
         auto inner = db._undo_db.start_undo_session();
         db.add_balance( 1, alice, 5 );
         db.add_balance( 2, alice, 7 );
         inner.commit();
      }
      BOOST_CHECK_EQUAL( db._undo_db.size(), 1u );
      BOOST_CHECK( balance( 1, alice ) == 16 );
      BOOST_CHECK( balance( 2, alice ) == 7 );
   }
   BOOST_CHECK( balance( 1, alice ) == 10 );
   BOOST_CHECK( balance( 2, alice ) == 0 );
   BOOST_CHECK_EQUAL( db.get_holdings( alice ).size(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( undo_nested_session_only )
{ try {
   ACTOR(alice);

   {
      auto outer = db._undo_db.start_undo_session();
      db.add_balance( 1, alice, 1 );
      {
         auto inner = db._undo_db.start_undo_session();
         db.add_balance( 1, alice, 5 );
      }
      BOOST_CHECK( balance( 1, alice ) == 1 );
      outer.commit();
   }
   BOOST_CHECK( balance( 1, alice ) == 1 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( merge_removal_of_modified_object )
{ try {
   ACTOR(alice);

   mint( alice, 1, 10 );
   const auto& idx = db.get_index_type<token_balance_index>().indices().get<by_token_owner>();
   {
      auto outer = db._undo_db.start_undo_session();
      db.add_balance( 1, alice, 1 );
      {
         auto inner = db._undo_db.start_undo_session();
         db.remove( *idx.find( boost::make_tuple( token_id_type(1), alice ) ) );
         inner.commit();
      }
      BOOST_CHECK( idx.find( boost::make_tuple( token_id_type(1), alice ) ) == idx.end() );
   }
   // restored as it was before the outer session, not as the inner one saw it
   BOOST_CHECK( balance( 1, alice ) == 10 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_rollback_leaves_undo_usable )
{ try {
   ACTOR(alice);

   const auto& idx = db.get_index_type<token_class_index>().indices().get<by_token_id>();
   {
      auto ses = db._undo_db.start_undo_session();
      const auto& obj = db.create<token_class_object>( [&]( token_class_object& o ) {
         o.token_id = 1;
      });
      // removed behind the session's back, rolling back cannot find it
      db._undo_db.disable();
      db.remove( obj );
      db._undo_db.enable();
   }
   BOOST_CHECK_EQUAL( idx.size(), 0u );
   BOOST_CHECK_EQUAL( db._undo_db.size(), 0u );
   BOOST_CHECK( db._undo_db.enabled() );

   mint( alice, 1, 3 );
   {
      auto ses = db._undo_db.start_undo_session();
      db.add_balance( 1, alice, 4 );
   }
   BOOST_CHECK( balance( 1, alice ) == 3 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( object_variant_round_trip )
{ try {
   ACTOR(creator);

   const auto& obj = db.create<token_class_object>( [&]( token_class_object& o ) {
      o.token_id = 7;
      o.creator = creator;
      o.initial_supply = 100;
      o.uri = "ipfs://seven";
   });

   const fc::variant v = obj.to_variant();
   BOOST_CHECK_EQUAL( v["id"].as_string(), std::string( obj.id ) );

   const auto copy = v.as<token_class_object>( object::MAX_NESTING );
   BOOST_CHECK( copy.id == obj.id );
   BOOST_CHECK( copy.token_id == token_id_type(7) );
   BOOST_CHECK( copy.creator == creator );
   BOOST_CHECK( copy.initial_supply == 100 );
   BOOST_CHECK_EQUAL( copy.uri, "ipfs://seven" );

   const auto id = fc::variant( "2.0.42" ).as<object_id_type>( 1 );
   BOOST_CHECK_EQUAL( int( id.space() ), 2 );
   BOOST_CHECK_EQUAL( int( id.type() ), 0 );
   BOOST_CHECK_EQUAL( id.instance(), 42u );
   BOOST_CHECK_THROW( fc::variant( "2.0" ).as<object_id_type>( 1 ), fc::exception );
   BOOST_CHECK_THROW( fc::variant( "1.300.0" ).as<object_id_type>( 1 ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
