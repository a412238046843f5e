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
#include <multitoken/protocol/transaction.hpp>

namespace multitoken { namespace chain {
   class database;

   /**
    *  State tracked while one transaction is being applied: the database it is
    *  applied to, the caller the dispatcher authenticated, and the results of the
    *  operations applied so far.
    */
   class transaction_evaluation_state
   {
      public:
         transaction_evaluation_state( database* db, const address& caller )
         :_db(db),_caller(caller){}

         database& db()const { FC_ASSERT( _db != nullptr ); return *_db; }
         const address& caller()const { return _caller; }

         vector<operation_result> operation_results;

         database*            _db = nullptr;
         address              _caller;
   };
} } // namespace multitoken::chain
