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
#include <multitoken/protocol/address.hpp>

namespace multitoken { namespace protocol {

   /**
    * @defgroup receipt Receipt hook calls
    *
    * A programmatic holder decides whether it accepts a credit. After a transfer
    * has moved the balances, the ledger calls the recipient's receipt hook with
    * one of the receipt_call cases below and classifies what comes back as a
    * receipt_outcome.
    * @{
    */

   struct single_receipt
   {
      address        operator_account;
      address        from;
      token_id_type  token_id;
      share_type     amount;
      bytes          data;
   };

   struct batch_receipt
   {
      address                operator_account;
      address                from;
      vector<token_id_type>  token_ids;
      vector<share_type>     amounts;
      bytes                  data;
   };

   typedef fc::static_variant< single_receipt, batch_receipt > receipt_call;

   /// the value the recipient must return to accept @p call
   uint32_t acceptance_selector( const receipt_call& call );

   /// The hook returned normally with a four byte value
   struct hook_returned
   {
      uint32_t value = 0;
   };

   /// The hook failed and explained why
   struct hook_reverted_with_reason
   {
      string reason;
   };

   /// The hook failed without a readable reason, or the target has no hook at all
   struct hook_reverted
   {
      bytes data;
   };

   /// The hook hit an unrecoverable fault
   struct hook_panicked
   {
      uint32_t code = 0;
   };

   typedef fc::static_variant<
            hook_returned,
            hook_reverted_with_reason,
            hook_reverted,
            hook_panicked
         > receipt_outcome;

   ///@}

} } // multitoken::protocol

FC_REFLECT( multitoken::protocol::single_receipt, (operator_account)(from)(token_id)(amount)(data) )
FC_REFLECT( multitoken::protocol::batch_receipt, (operator_account)(from)(token_ids)(amounts)(data) )
FC_REFLECT( multitoken::protocol::hook_returned, (value) )
FC_REFLECT( multitoken::protocol::hook_reverted_with_reason, (reason) )
FC_REFLECT( multitoken::protocol::hook_reverted, (data) )
FC_REFLECT( multitoken::protocol::hook_panicked, (code) )
FC_REFLECT_TYPENAME( multitoken::protocol::receipt_call )
FC_REFLECT_TYPENAME( multitoken::protocol::receipt_outcome )
