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
#include <multitoken/chain/token_evaluator.hpp>
#include <multitoken/chain/transfer_evaluator.hpp>

#include <multitoken/chain/database.hpp>
#include <multitoken/chain/exceptions.hpp>
#include <multitoken/chain/token_class_object.hpp>

#include <limits>

namespace multitoken { namespace chain {

namespace {

   void verify_ledger_owner( const database& d, const address& caller )
   {
      MULTITOKEN_ASSERT( caller == d.get_ledger_owner(), unauthorized, "Unauthorized",
                         ("caller",caller)("ledger_owner",d.get_ledger_owner()) );
   }

   void verify_may_burn( const database& d, const address& owner, const address& caller )
   {
      MULTITOKEN_ASSERT( d.is_owner_or_approved( owner, caller ) || caller == d.get_ledger_owner(),
                         unauthorized, "Unauthorized", ("owner",owner)("caller",caller) );
   }

} // anonymous namespace

void_result token_class_create_evaluator::do_evaluate( const token_class_create_operation& op )
{ try {
   const database& d = db();
   verify_ledger_owner( d, caller() );

   FC_ASSERT( d.get_next_token_id() < std::numeric_limits<token_id_type>::max(),
              "Token id sequence exhausted" );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

token_id_type token_class_create_evaluator::do_apply( const token_class_create_operation& op )
{ try {
   database& d = db();

   const token_id_type new_id = d.get_next_token_id();
   d.modify( d.get_ledger_properties(), []( ledger_property_object& p ) {
      ++p.next_token_id;
   });

   d.create<token_class_object>( [&op,&new_id]( token_class_object& t ) {
      t.token_id       = new_id;
      t.creator        = op.creator;
      t.initial_supply = op.initial_supply;
      t.uri            = op.uri;
   });

   if( !op.uri.empty() )
   {
      uri_event e;
      e.uri = op.uri;
      e.token_id = new_id;
      d.push_event( e );
   }

   dlog( "Created token class ${id} for ${creator}", ("id",new_id)("creator",op.creator) );
   return new_id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result mint_evaluator::do_evaluate( const mint_operation& op )
{ try {
   verify_ledger_owner( db(), caller() );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result mint_evaluator::do_apply( const mint_operation& op )
{ try {
   database& d = db();

   d.add_balance( op.token_id, op.to, op.amount );

   transfer_single_event e;
   e.operator_account = caller();
   e.to = op.to;
   e.token_id = op.token_id;
   e.amount = op.amount;
   d.push_event( e );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result mint_batch_evaluator::do_evaluate( const mint_batch_operation& op )
{ try {
   verify_ledger_owner( db(), caller() );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result mint_batch_evaluator::do_apply( const mint_batch_operation& op )
{ try {
   database& d = db();

   for( size_t i = 0; i < op.token_ids.size(); ++i )
      d.add_balance( op.token_ids[i], op.to, op.amounts[i] );

   transfer_batch_event e;
   e.operator_account = caller();
   e.to = op.to;
   e.token_ids = op.token_ids;
   e.amounts = op.amounts;
   d.push_event( e );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result burn_evaluator::do_evaluate( const burn_operation& op )
{ try {
   const database& d = db();
   verify_may_burn( d, op.owner, caller() );

   const share_type available = d.balance_of( op.token_id, op.owner );
   MULTITOKEN_ASSERT( available >= op.amount, burn_exceeds_balance, "BurnExceedsBalance",
                      ("owner",op.owner)("token_id",op.token_id)("available",available)("amount",op.amount) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result burn_evaluator::do_apply( const burn_operation& op )
{ try {
   database& d = db();

   d.reduce_balance( op.token_id, op.owner, op.amount );

   transfer_single_event e;
   e.operator_account = caller();
   e.from = op.owner;
   e.token_id = op.token_id;
   e.amount = op.amount;
   d.push_event( e );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result burn_batch_evaluator::do_evaluate( const burn_batch_operation& op )
{ try {
   const database& d = db();
   verify_may_burn( d, op.owner, caller() );

   size_t failed_pair = 0;
   MULTITOKEN_ASSERT( can_cover_batch( d, op.owner, op.token_ids, op.amounts, false, failed_pair ),
                      burn_exceeds_balance, "BurnExceedsBalance",
                      ("owner",op.owner)("pair",failed_pair)("token_id",op.token_ids[failed_pair])
                      ("amount",op.amounts[failed_pair]) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result burn_batch_evaluator::do_apply( const burn_batch_operation& op )
{ try {
   database& d = db();

   for( size_t i = 0; i < op.token_ids.size(); ++i )
      d.reduce_balance( op.token_ids[i], op.owner, op.amounts[i] );

   transfer_batch_event e;
   e.operator_account = caller();
   e.from = op.owner;
   e.token_ids = op.token_ids;
   e.amounts = op.amounts;
   d.push_event( e );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // multitoken::chain
