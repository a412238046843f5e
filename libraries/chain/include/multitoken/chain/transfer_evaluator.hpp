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
#include <multitoken/chain/evaluator.hpp>

#include <multitoken/protocol/transfer.hpp>

namespace multitoken { namespace chain {

   class transfer_evaluator : public evaluator<transfer_evaluator>
   {
      public:
         using operation_type = transfer_operation;

         void_result do_evaluate( const transfer_operation& op );
         void_result do_apply( const transfer_operation& op );
   };

   class transfer_batch_evaluator : public evaluator<transfer_batch_evaluator>
   {
      public:
         using operation_type = transfer_batch_operation;

         void_result do_evaluate( const transfer_batch_operation& op );
         void_result do_apply( const transfer_batch_operation& op );
   };

   /**
    * Checks that @p holder can give up every (token_ids[i], amounts[i]) pair in
    * order, as if each pair were debited before the next one is checked. Pairs
    * that name the same token class draw on the same balance.
    *
    * When @p refunded is set the debited units come straight back to the holder
    * (a self transfer), so every pair is checked against the full balance.
    *
    * @return false on the first pair that cannot be covered, whose index is
    * stored in @p failed_pair
    */
   bool can_cover_batch( const database& d, const address& holder,
                         const vector<token_id_type>& token_ids, const vector<share_type>& amounts,
                         bool refunded, size_t& failed_pair );

} } // multitoken::chain
