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
#pragma once

#include <fc/exception/exception.hpp>
#include <multitoken/protocol/exceptions.hpp>

#include <exception>
#include <string>

/**
 * Fires a signal for listeners outside the ledger. A listener failure is logged
 * and does not affect the already committed transaction.
 */
#define MULTITOKEN_TRY_NOTIFY( signal, ... )                                  \
   try                                                                        \
   {                                                                          \
      signal( __VA_ARGS__ );                                                  \
   }                                                                          \
   catch( const fc::exception& e )                                            \
   {                                                                          \
      elog( "Caught exception in event listener: ${e}", ("e", e.to_detail_string() ) ); \
   }                                                                          \
   catch( const std::exception& e )                                           \
   {                                                                          \
      elog( "Caught exception in event listener: ${e}", ("e", e.what()) );    \
   }                                                                          \
   catch( ... )                                                               \
   {                                                                          \
      wlog( "Caught unexpected exception in event listener" );                \
   }

namespace multitoken { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   FC_DECLARE_DERIVED_EXCEPTION( database_query_exception,      chain_exception, 3010000 )
   FC_DECLARE_DERIVED_EXCEPTION( transaction_process_exception, chain_exception, 3030000 )
   FC_DECLARE_DERIVED_EXCEPTION( operation_evaluate_exception,  chain_exception, 3050000 )
   FC_DECLARE_DERIVED_EXCEPTION( acceptance_exception,          chain_exception, 3060000 )
   FC_DECLARE_DERIVED_EXCEPTION( internal_exception,            chain_exception, 3990000 )

   FC_DECLARE_DERIVED_EXCEPTION( nonexistent_token,      database_query_exception,      3010001 )

   FC_DECLARE_DERIVED_EXCEPTION( ledger_not_initialized, transaction_process_exception, 3030001 )

   FC_DECLARE_DERIVED_EXCEPTION( unauthorized,           operation_evaluate_exception,  3050001 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance,   operation_evaluate_exception,  3050002 )
   FC_DECLARE_DERIVED_EXCEPTION( burn_exceeds_balance,   operation_evaluate_exception,  3050003 )

   /// outcomes of the receipt hook that abort the credit
   ///@{
   FC_DECLARE_DERIVED_EXCEPTION( rejected_by_selector,   acceptance_exception,          3060001 )
   FC_DECLARE_DERIVED_EXCEPTION( receiver_reverted,      acceptance_exception,          3060002 )
   FC_DECLARE_DERIVED_EXCEPTION( not_a_receiver,         acceptance_exception,          3060003 )
   FC_DECLARE_DERIVED_EXCEPTION( callee_panicked,        acceptance_exception,          3060004 )
   ///@}

   FC_DECLARE_DERIVED_EXCEPTION( unclassified_outcome,   internal_exception,            3990001 )

   /**
    * The reason string of a failed ledger call.
    *
    * Ledger failures are raised with the reason as the message of their first log
    * entry ("InsufficientBalance", "RejectedBySelector", the recipient's own
    * reason, ...). Context appended while the exception propagates does not
    * change it.
    */
   std::string failure_reason( const fc::exception& e );

} } // multitoken::chain
