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
#include <multitoken/protocol/exceptions.hpp>
#include <multitoken/protocol/types.hpp>

namespace multitoken { namespace protocol {

   /**
    *  @defgroup operations Ledger Operations
    *
    *  Operations are the only way the ledger state changes. Each one is validated
    *  statelessly by validate() and then evaluated against the database by its
    *  evaluator, on behalf of a caller supplied by whoever dispatches the
    *  transaction.
    *
    *  @{
    */

   struct void_result{};
   typedef fc::static_variant<void_result,token_id_type> operation_result;

   struct base_operation
   {
      void validate()const{}
   };

   ///@}

} } // multitoken::protocol

FC_REFLECT_TYPENAME( multitoken::protocol::operation_result )
FC_REFLECT( multitoken::protocol::void_result, )
