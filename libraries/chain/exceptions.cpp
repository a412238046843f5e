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
#include <multitoken/chain/exceptions.hpp>

namespace multitoken { namespace chain {

   // Public exceptions

   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "ledger exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( database_query_exception,      chain_exception, 3010000, "database query exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( transaction_process_exception, chain_exception, 3030000, "transaction processing exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_evaluate_exception,  chain_exception, 3050000, "operation evaluation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( acceptance_exception,          chain_exception, 3060000, "recipient did not accept" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( nonexistent_token,      database_query_exception,      3010001,
                                   "token class does not exist" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( ledger_not_initialized, transaction_process_exception, 3030001,
                                   "ledger has not been initialized" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( unauthorized,           operation_evaluate_exception,  3050001,
                                   "caller is not authorized" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_balance,   operation_evaluate_exception,  3050002,
                                   "insufficient balance" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( burn_exceeds_balance,   operation_evaluate_exception,  3050003,
                                   "burn amount exceeds balance" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( rejected_by_selector,   acceptance_exception,          3060001,
                                   "receipt hook returned the wrong value" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( receiver_reverted,      acceptance_exception,          3060002,
                                   "receipt hook reverted" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( not_a_receiver,         acceptance_exception,          3060003,
                                   "recipient does not implement the receipt hook" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( callee_panicked,        acceptance_exception,          3060004,
                                   "receipt hook panicked" )

   // Internal exceptions

   FC_IMPLEMENT_DERIVED_EXCEPTION( internal_exception, chain_exception, 3990000, "internal exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( unclassified_outcome,   internal_exception,            3990001,
                                   "receipt hook outcome could not be classified" )

   std::string failure_reason( const fc::exception& e )
   {
      const auto& log = e.get_log();
      if( log.empty() )
         return e.what();
      return log.front().get_message();
   }

} } // multitoken::chain
