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
#include <multitoken/chain/transfer_evaluator.hpp>

#include <multitoken/chain/database.hpp>
#include <multitoken/chain/exceptions.hpp>

namespace multitoken { namespace chain {

bool can_cover_batch( const database& d, const address& holder,
                      const vector<token_id_type>& token_ids, const vector<share_type>& amounts,
                      bool refunded, size_t& failed_pair )
{
   map<token_id_type, share_type> remaining;
   for( size_t i = 0; i < token_ids.size(); ++i )
   {
      auto itr = remaining.find( token_ids[i] );
      if( itr == remaining.end() )
         itr = remaining.emplace( token_ids[i], d.balance_of( token_ids[i], holder ) ).first;

      if( itr->second < amounts[i] )
      {
         failed_pair = i;
         return false;
      }
      if( !refunded )
         itr->second -= amounts[i];
   }
   return true;
}

void_result transfer_evaluator::do_evaluate( const transfer_operation& op )
{ try {
   const database& d = db();

   MULTITOKEN_ASSERT( d.is_owner_or_approved( op.from, caller() ), unauthorized, "Unauthorized",
                      ("from",op.from)("caller",caller()) );

   const share_type available = d.balance_of( op.token_id, op.from );
   MULTITOKEN_ASSERT( available >= op.amount, insufficient_balance, "InsufficientBalance",
                      ("from",op.from)("token_id",op.token_id)("available",available)("amount",op.amount) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result transfer_evaluator::do_apply( const transfer_operation& op )
{ try {
   database& d = db();

   d.reduce_balance( op.token_id, op.from, op.amount );
   d.add_balance( op.token_id, op.to, op.amount );

   transfer_single_event e;
   e.operator_account = caller();
   e.from = op.from;
   e.to = op.to;
   e.token_id = op.token_id;
   e.amount = op.amount;
   d.push_event( e );

   single_receipt call;
   call.operator_account = caller();
   call.from = op.from;
   call.token_id = op.token_id;
   call.amount = op.amount;
   call.data = op.data;
   check_acceptance( d.get_receipt_hook(), op.to, call );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result transfer_batch_evaluator::do_evaluate( const transfer_batch_operation& op )
{ try {
   const database& d = db();

   MULTITOKEN_ASSERT( d.is_owner_or_approved( op.from, caller() ), unauthorized, "Unauthorized",
                      ("from",op.from)("caller",caller()) );

   size_t failed_pair = 0;
   MULTITOKEN_ASSERT( can_cover_batch( d, op.from, op.token_ids, op.amounts, op.from == op.to, failed_pair ),
                      insufficient_balance, "InsufficientBalance",
                      ("from",op.from)("pair",failed_pair)("token_id",op.token_ids[failed_pair])
                      ("amount",op.amounts[failed_pair]) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result transfer_batch_evaluator::do_apply( const transfer_batch_operation& op )
{ try {
   database& d = db();

   for( size_t i = 0; i < op.token_ids.size(); ++i )
   {
      d.reduce_balance( op.token_ids[i], op.from, op.amounts[i] );
      d.add_balance( op.token_ids[i], op.to, op.amounts[i] );
   }

   transfer_batch_event e;
   e.operator_account = caller();
   e.from = op.from;
   e.to = op.to;
   e.token_ids = op.token_ids;
   e.amounts = op.amounts;
   d.push_event( e );

   batch_receipt call;
   call.operator_account = caller();
   call.from = op.from;
   call.token_ids = op.token_ids;
   call.amounts = op.amounts;
   call.data = op.data;
   check_acceptance( d.get_receipt_hook(), op.to, call );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // multitoken::chain
