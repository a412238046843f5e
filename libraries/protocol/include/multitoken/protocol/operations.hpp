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
#include <multitoken/protocol/approval.hpp>
#include <multitoken/protocol/token.hpp>
#include <multitoken/protocol/transfer.hpp>

namespace multitoken { namespace protocol {

   /**
    * Every operation the ledger understands. New operations are appended, the
    * position of an operation is its tag in serialized form.
    */
   typedef fc::static_variant<
            /*  0 */ transfer_operation,
            /*  1 */ transfer_batch_operation,
            /*  2 */ set_approval_for_all_operation,
            /*  3 */ token_class_create_operation,
            /*  4 */ mint_operation,
            /*  5 */ mint_batch_operation,
            /*  6 */ burn_operation,
            /*  7 */ burn_batch_operation
         > operation;

   void operation_validate( const operation& op );

} } // multitoken::protocol

FC_REFLECT_TYPENAME( multitoken::protocol::operation )
