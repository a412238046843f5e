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
#include <multitoken/protocol/base.hpp>

namespace multitoken { namespace protocol {

   /**
    * @brief Move one amount of one token class between holders
    * @ingroup operations
    *
    * The caller must be @ref from or an operator approved by it. If @ref to is
    * programmatic it must accept the credit through its receipt hook, otherwise
    * the transfer is undone.
    */
   struct transfer_operation : public base_operation
   {
      address        from;      ///< Holder whose balance is debited
      address        to;        ///< Holder whose balance is credited
      token_id_type  token_id;  ///< Token class being moved
      share_type     amount;    ///< Quantity being moved, zero is allowed
      bytes          data;      ///< Forwarded unchanged to the recipient's receipt hook

      void validate()const;
   };

   /**
    * @brief Move several token classes between the same two holders at once
    * @ingroup operations
    *
    * token_ids and amounts pair up by position. Either every pair is applied or
    * none is. The recipient's batch receipt hook is called once, after all pairs.
    */
   struct transfer_batch_operation : public base_operation
   {
      address                from;
      address                to;
      vector<token_id_type>  token_ids;
      vector<share_type>     amounts;
      bytes                  data;

      void validate()const;
   };

} } // multitoken::protocol

FC_REFLECT( multitoken::protocol::transfer_operation,
            (from)(to)(token_id)(amount)(data) )
FC_REFLECT( multitoken::protocol::transfer_batch_operation,
            (from)(to)(token_ids)(amounts)(data) )

MULTITOKEN_DECLARE_EXTERNAL_SERIALIZATION( multitoken::protocol::transfer_operation )
MULTITOKEN_DECLARE_EXTERNAL_SERIALIZATION( multitoken::protocol::transfer_batch_operation )
