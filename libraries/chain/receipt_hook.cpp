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
#include <multitoken/chain/receipt_hook.hpp>
#include <multitoken/chain/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace multitoken { namespace chain {

namespace {

   struct receipt_outcome_classifier
   {
      typedef void result_type;

      uint32_t expected_selector;

      explicit receipt_outcome_classifier( uint32_t selector ):expected_selector(selector){}

      void operator()( const hook_returned& r )const
      {
         MULTITOKEN_ASSERT( r.value == expected_selector, rejected_by_selector, "RejectedBySelector",
                            ("returned",r.value)("expected",expected_selector) );
      }
      void operator()( const hook_reverted_with_reason& r )const
      {
         FC_THROW_EXCEPTION( receiver_reverted, "${reason}", ("reason",r.reason) );
      }
      void operator()( const hook_reverted& r )const
      {
         FC_THROW_EXCEPTION( not_a_receiver, "NotAnERC1155Receiver", ("data",r.data) );
      }
      void operator()( const hook_panicked& r )const
      {
         FC_THROW_EXCEPTION( callee_panicked, "CalleePanicked", ("code",r.code) );
      }
   };

} // anonymous namespace

void classify_receipt_outcome( const receipt_outcome& outcome, uint32_t expected_selector )
{
   MULTITOKEN_ASSERT( outcome.which() >= 0 && outcome.which() < receipt_outcome::count(),
                      unclassified_outcome, "Unclassified receipt outcome ${which}", ("which",outcome.which()) );
   outcome.visit( receipt_outcome_classifier( expected_selector ) );
}

void check_acceptance( receipt_hook* hook, const address& target, const receipt_call& call )
{ try {
   if( hook == nullptr || !hook->is_programmatic( target ) )
      return;

   receipt_outcome outcome;
   try
   {
      outcome = hook->on_received( target, call );
   }
   catch( const fc::exception& e )
   {
      wlog( "Receipt hook of ${target} threw: ${e}", ("target",target)("e",e.to_detail_string()) );
      outcome = hook_panicked();
   }
   catch( const std::exception& e )
   {
      wlog( "Receipt hook of ${target} threw: ${e}", ("target",target)("e",e.what()) );
      outcome = hook_panicked();
   }

   dlog( "Receipt hook of ${target} returned ${outcome}", ("target",target)("outcome",outcome) );
   classify_receipt_outcome( outcome, acceptance_selector( call ) );
} FC_CAPTURE_AND_RETHROW( (target) ) }

} } // multitoken::chain
