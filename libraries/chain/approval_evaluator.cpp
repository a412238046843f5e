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
#include <multitoken/chain/approval_evaluator.hpp>
#include <multitoken/chain/approval_object.hpp>

#include <multitoken/chain/database.hpp>
#include <multitoken/chain/exceptions.hpp>

namespace multitoken { namespace chain {

void_result set_approval_for_all_evaluator::do_evaluate( const set_approval_for_all_operation& op )
{ try {
   const database& d = db();

   MULTITOKEN_ASSERT( caller() == op.owner, unauthorized, "Unauthorized",
                      ("owner",op.owner)("caller",caller()) );

   const auto& idx = d.get_index_type<operator_approval_index>().indices().get<by_owner_operator>();
   auto itr = idx.find( boost::make_tuple( op.owner, op.operator_account ) );
   if( itr != idx.end() )
      _approval = &*itr;

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result set_approval_for_all_evaluator::do_apply( const set_approval_for_all_operation& op )
{ try {
   database& d = db();

   if( _approval == nullptr )
   {
      d.create<operator_approval_object>( [&op]( operator_approval_object& a ) {
         a.owner = op.owner;
         a.operator_account = op.operator_account;
         a.approved = op.approved;
      });
   }
   else
   {
      d.modify( *_approval, [&op]( operator_approval_object& a ) {
         a.approved = op.approved;
      });
   }

   // announced even when the value does not change
   approval_for_all_event e;
   e.owner = op.owner;
   e.operator_account = op.operator_account;
   e.approved = op.approved;
   d.push_event( e );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // multitoken::chain
