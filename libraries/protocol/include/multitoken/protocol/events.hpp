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
    * @defgroup events Ledger Events
    *
    * Events are queued while a transaction is evaluated and published in the
    * order they were raised, only after the transaction commits.
    *
    * Mints are reported with the null address as source and burns with the null
    * address as recipient.
    * @{
    */

   struct transfer_single_event
   {
      address        operator_account; ///< Caller that performed the movement
      address        from;
      address        to;
      token_id_type  token_id;
      share_type     amount;
   };

   struct transfer_batch_event
   {
      address                operator_account;
      address                from;
      address                to;
      vector<token_id_type>  token_ids; ///< In the order the operation listed them
      vector<share_type>     amounts;
   };

   struct approval_for_all_event
   {
      address  owner;
      address  operator_account;
      bool     approved = false;
   };

   /// Metadata location assigned to a token class
   struct uri_event
   {
      string         uri;
      token_id_type  token_id;
   };

   typedef fc::static_variant<
            transfer_single_event,
            transfer_batch_event,
            approval_for_all_event,
            uri_event
         > ledger_event;

   ///@}

} } // multitoken::protocol

FC_REFLECT( multitoken::protocol::transfer_single_event, (operator_account)(from)(to)(token_id)(amount) )
FC_REFLECT( multitoken::protocol::transfer_batch_event, (operator_account)(from)(to)(token_ids)(amounts) )
FC_REFLECT( multitoken::protocol::approval_for_all_event, (owner)(operator_account)(approved) )
FC_REFLECT( multitoken::protocol::uri_event, (uri)(token_id) )
FC_REFLECT_TYPENAME( multitoken::protocol::ledger_event )
