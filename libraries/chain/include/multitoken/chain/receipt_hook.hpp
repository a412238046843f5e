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

#include <multitoken/chain/types.hpp>
#include <multitoken/protocol/receipt.hpp>

namespace multitoken { namespace chain {

   /**
    * @brief Gateway to code running at recipient addresses
    *
    * The ledger owns no code of its own at any address. Whoever hosts programmatic
    * recipients implements this interface and installs it with
    * database::set_receipt_hook(). Calls are synchronous: on_received() returns
    * only after the recipient has decided.
    */
   class receipt_hook
   {
      public:
         virtual ~receipt_hook() = default;

         /// true when @p target runs code and must be asked before a credit becomes final
         virtual bool is_programmatic( const address& target )const = 0;

         /**
          * Invokes the receipt hook of @p target and reports how it ended. Failures
          * of the recipient are described by the returned outcome, not thrown.
          * The ledger is in the middle of a transaction, so pushing another one
          * from here fails.
          */
         virtual receipt_outcome on_received( const address& target, const receipt_call& call ) = 0;
   };

   /**
    * Turns the outcome of a receipt hook call into a decision. Returns when
    * @p outcome accepts a credit that required @p expected_selector, throws the
    * acceptance_exception matching the outcome otherwise.
    */
   void classify_receipt_outcome( const receipt_outcome& outcome, uint32_t expected_selector );

   /**
    * Asks @p target whether it accepts the credit described by @p call.
    *
    * Plain addresses, and every address when @p hook is null, accept implicitly.
    * An exception escaping the hook counts as a panic of the recipient.
    */
   void check_acceptance( receipt_hook* hook, const address& target, const receipt_call& call );

} } // multitoken::chain
