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

#include <multitoken/chain/database.hpp>
#include <multitoken/chain/exceptions.hpp>

namespace multitoken { namespace chain {

namespace {

   struct applying_transaction_flag
   {
      explicit applying_transaction_flag( bool& flag ):_flag(flag) { _flag = true; }
      ~applying_transaction_flag() { _flag = false; }
      bool& _flag;
   };

} // anonymous namespace

processed_transaction database::push_transaction( const transaction& trx, const address& caller )
{ try {
   MULTITOKEN_ASSERT( is_initialized(), ledger_not_initialized, "LedgerNotInitialized" );
   FC_ASSERT( !_applying_transaction, "A transaction cannot be pushed while another one is being applied" );

   processed_transaction result;
   {
      applying_transaction_flag applying( _applying_transaction );
      _pending_events.clear();
      try
      {
         // _apply_transaction() fails as a whole: leaving this scope without
         // commit() undoes every change made by the operations applied so far.
         auto session = _undo_db.start_undo_session();
         result = _apply_transaction( trx, caller );
         session.commit();
      }
      catch( const fc::exception& e )
      {
         _pending_events.clear();
         wlog( "Transaction from ${c} rejected: ${r}", ("c",caller)("r",failure_reason(e)) );
         throw;
      }
   }

   // listeners may push follow-up transactions
   notify_applied_events();
   return result;
} FC_CAPTURE_AND_RETHROW( (trx)(caller) ) }

operation_result database::push_operation( const operation& op, const address& caller )
{
   transaction trx;
   trx.operations.push_back( op );
   auto processed = push_transaction( trx, caller );
   return processed.operation_results.front();
}

void database::push_event( const ledger_event& e )
{
   _pending_events.push_back( e );
}

processed_transaction database::_apply_transaction( const transaction& trx, const address& caller )
{ try {
   trx.validate();

   transaction_evaluation_state eval_state( this, caller );

   processed_transaction ptrx( trx );
   for( const auto& op : ptrx.operations )
      eval_state.operation_results.emplace_back( apply_operation( eval_state, op ) );
   ptrx.operation_results = std::move( eval_state.operation_results );
   return ptrx;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

operation_result database::apply_operation( transaction_evaluation_state& eval_state, const operation& op )
{ try {
   int i_which = op.which();
   uint64_t u_which = uint64_t( i_which );
   FC_ASSERT( i_which >= 0, "Negative operation tag ${o}", ("o", i_which) );
   FC_ASSERT( u_which < _operation_evaluators.size(), "No registered evaluator for operation ${o}", ("o", i_which) );
   unique_ptr<op_evaluator>& eval = _operation_evaluators[ u_which ];
   FC_ASSERT( eval, "No registered evaluator for operation ${o}", ("o", i_which) );
   return eval->evaluate( eval_state, op, true );
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // multitoken::chain
