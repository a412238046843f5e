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
#include <multitoken/protocol/operations.hpp>

namespace multitoken { namespace protocol {

   /**
    * @brief an ordered list of operations applied all-or-nothing
    *
    * The ledger applies the operations in order inside one undo session. If any of
    * them fails, the effects of the ones before it are undone as well and no
    * event of the transaction is published.
    *
    * Transactions carry no signatures. The dispatcher that pushes a transaction
    * authenticates the caller and passes it alongside.
    */
   struct transaction
   {
      vector<operation> operations;

      /// stateless checks of every operation, throws on the first failure
      void validate()const;
   };

   /**
    *  @brief captures the result of evaluating the operations contained in the transaction
    */
   struct processed_transaction : public transaction
   {
      processed_transaction( const transaction& trx = transaction() )
         : transaction(trx){}

      vector<operation_result> operation_results;
   };

} } // multitoken::protocol

FC_REFLECT( multitoken::protocol::transaction, (operations) )
FC_REFLECT_DERIVED( multitoken::protocol::processed_transaction, (multitoken::protocol::transaction),
                    (operation_results) )

MULTITOKEN_DECLARE_EXTERNAL_SERIALIZATION( multitoken::protocol::transaction )
MULTITOKEN_DECLARE_EXTERNAL_SERIALIZATION( multitoken::protocol::processed_transaction )
