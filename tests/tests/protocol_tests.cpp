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

#include <multitoken/chain/exceptions.hpp>
#include <multitoken/protocol/events.hpp>
#include <multitoken/protocol/receipt.hpp>
#include <multitoken/protocol/transaction.hpp>

#include <fc/io/json.hpp>

#include <limits>

#include "../common/database_fixture.hpp"

using namespace multitoken::protocol;

namespace {

const string max_uint256 =
   "115792089237316195423570985008687907853269984665640564039457584007913129639935";

uint256_t parse_amount( const fc::variant& v )
{
   uint256_t result;
   fc::from_variant( v, result );
   return result;
}

}

BOOST_AUTO_TEST_SUITE( protocol_tests )

BOOST_AUTO_TEST_CASE( address_string_form )
{ try {
   const string hex = "0x00112233445566778899aabbccddeeff00112233";
   BOOST_CHECK( address::is_valid( hex ) );
   address a( hex );
   BOOST_CHECK( !a.is_null() );
   BOOST_CHECK_EQUAL( string( a ), hex );

   BOOST_CHECK( address( "0x00112233445566778899AABBCCDDEEFF00112233" ) == a );

   BOOST_CHECK( address().is_null() );
   BOOST_CHECK_EQUAL( string( address() ), "0x0000000000000000000000000000000000000000" );
   BOOST_CHECK( address( "0x0000000000000000000000000000000000000000" ).is_null() );

   BOOST_CHECK( !address::is_valid( "00112233445566778899aabbccddeeff00112233" ) );
   BOOST_CHECK( !address::is_valid( "0x00112233445566778899aabbccddeeff0011223" ) );
   BOOST_CHECK( !address::is_valid( "0x00112233445566778899aabbccddeeff0011223g" ) );
   BOOST_CHECK( !address::is_valid( "" ) );
   BOOST_CHECK_THROW( address( "0x1234" ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( address_from_seed )
{ try {
   const auto alice = address::from_seed( "alice" );
   BOOST_CHECK( !alice.is_null() );
   BOOST_CHECK( alice == address::from_seed( "alice" ) );
   BOOST_CHECK( alice != address::from_seed( "bob" ) );
   BOOST_CHECK( address::is_valid( string( alice ) ) );

   fc::variant v;
   fc::to_variant( alice, v );
   BOOST_CHECK_EQUAL( v.as_string(), string( alice ) );
   address parsed;
   fc::from_variant( v, parsed );
   BOOST_CHECK( parsed == alice );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( uint256_variants )
{ try {
   BOOST_CHECK( parse_amount( fc::variant( "12345" ) ) == 12345 );
   BOOST_CHECK( parse_amount( fc::variant( "0xff" ) ) == 255 );
   // leading zeros keep decimal strings decimal
   BOOST_CHECK( parse_amount( fc::variant( "010" ) ) == 10 );
   BOOST_CHECK( parse_amount( fc::variant( "0100" ) ) == 100 );
   BOOST_CHECK( parse_amount( fc::variant( "09" ) ) == 9 );
   BOOST_CHECK( parse_amount( fc::variant( "000" ) ) == 0 );
   BOOST_CHECK( parse_amount( fc::variant( "0x0010" ) ) == 16 );
   BOOST_CHECK( parse_amount( fc::variant( uint64_t(7) ) ) == 7 );
   BOOST_CHECK( parse_amount( fc::variant( int64_t(9) ) ) == 9 );
   BOOST_CHECK( parse_amount( fc::variant( max_uint256 ) ) == std::numeric_limits<uint256_t>::max() );

   BOOST_CHECK_THROW( parse_amount( fc::variant( int64_t(-1) ) ), fc::exception );
   BOOST_CHECK_THROW( parse_amount( fc::variant( "-1" ) ), fc::exception );
   BOOST_CHECK_THROW( parse_amount( fc::variant( "12abc" ) ), fc::exception );
   BOOST_CHECK_THROW( parse_amount( fc::variant( "" ) ), fc::exception );
   // one more than the largest value
   BOOST_CHECK_THROW( parse_amount( fc::variant(
         "115792089237316195423570985008687907853269984665640564039457584007913129639936" ) ),
         fc::out_of_range_exception );

   fc::variant v;
   fc::to_variant( std::numeric_limits<uint256_t>::max(), v );
   BOOST_CHECK_EQUAL( v.as_string(), max_uint256 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( checked_arithmetic )
{
   uint256_t top = std::numeric_limits<uint256_t>::max();
   BOOST_CHECK_THROW( top += 1, std::overflow_error );
   uint256_t zero = 0;
   BOOST_CHECK_THROW( zero -= 1, std::range_error );
}

BOOST_AUTO_TEST_CASE( validation_order )
{ try {
   const auto alice = address::from_seed( "alice" );
   const auto bob = address::from_seed( "bob" );

   transfer_batch_operation op;
   op.token_ids = { 1, 2 };
   op.amounts = { 1 };
   MULTITOKEN_REQUIRE_FAILURE( op.validate(), "ZeroRecipient" );
   op.to = bob;
   MULTITOKEN_REQUIRE_FAILURE( op.validate(), "ZeroSource" );
   op.from = alice;
   MULTITOKEN_REQUIRE_FAILURE( op.validate(), "LengthMismatch" );
   op.amounts.push_back( 2 );
   op.validate();

   transfer_operation single;
   single.from = alice;
   MULTITOKEN_REQUIRE_THROW( single.validate(), zero_recipient );
   single.to = bob;
   single.from = address();
   MULTITOKEN_REQUIRE_THROW( single.validate(), zero_source );

   set_approval_for_all_operation approval;
   approval.owner = alice;
   approval.operator_account = alice;
   MULTITOKEN_REQUIRE_FAILURE( approval.validate(), "SelfApproval" );
   approval.operator_account = bob;
   approval.validate();

   mint_batch_operation mint;
   mint.to = alice;
   mint.token_ids = { 1 };
   MULTITOKEN_REQUIRE_FAILURE( mint.validate(), "LengthMismatch" );

   burn_operation burn;
   MULTITOKEN_REQUIRE_FAILURE( burn.validate(), "ZeroSource" );

   token_class_create_operation create;
   MULTITOKEN_REQUIRE_FAILURE( create.validate(), "ZeroSource" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( selectors )
{
   BOOST_CHECK_EQUAL( acceptance_selector( single_receipt() ), 0xf23a6e61u );
   BOOST_CHECK_EQUAL( acceptance_selector( batch_receipt() ), 0xbc197c81u );
}

BOOST_AUTO_TEST_CASE( operation_from_json )
{ try {
   const auto alice = address::from_seed( "alice" );
   const string json = "[4,{\"to\":\"" + string( alice ) + "\",\"token_id\":\"0x10\",\"amount\":12}]";

   auto op = fc::json::from_string( json ).as<operation>( MULTITOKEN_MAX_NESTED_OBJECTS );
   BOOST_REQUIRE( op.is_type<mint_operation>() );
   const auto& mint = op.get<mint_operation>();
   BOOST_CHECK( mint.to == alice );
   BOOST_CHECK( mint.token_id == 16 );
   BOOST_CHECK( mint.amount == 12 );
   BOOST_CHECK( mint.data.empty() );
   operation_validate( op );

   auto echoed = fc::json::to_string( op );
   BOOST_CHECK_EQUAL( echoed, "[4,{\"to\":\"" + string( alice ) + "\",\"token_id\":\"16\",\"amount\":\"12\",\"data\":\"\"}]" );

   transaction trx;
   BOOST_CHECK_THROW( trx.validate(), empty_transaction );
   trx.operations.push_back( op );
   trx.validate();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
