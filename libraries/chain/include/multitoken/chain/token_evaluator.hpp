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

#include <multitoken/protocol/token.hpp>

namespace multitoken { namespace chain {

   class token_class_create_evaluator : public evaluator<token_class_create_evaluator>
   {
      public:
         using operation_type = token_class_create_operation;

         void_result do_evaluate( const token_class_create_operation& op );
         token_id_type do_apply( const token_class_create_operation& op );
   };

   class mint_evaluator : public evaluator<mint_evaluator>
   {
      public:
         using operation_type = mint_operation;

         void_result do_evaluate( const mint_operation& op );
         void_result do_apply( const mint_operation& op );
   };

   class mint_batch_evaluator : public evaluator<mint_batch_evaluator>
   {
      public:
         using operation_type = mint_batch_operation;

         void_result do_evaluate( const mint_batch_operation& op );
         void_result do_apply( const mint_batch_operation& op );
   };

   class burn_evaluator : public evaluator<burn_evaluator>
   {
      public:
         using operation_type = burn_operation;

         void_result do_evaluate( const burn_operation& op );
         void_result do_apply( const burn_operation& op );
   };

   class burn_batch_evaluator : public evaluator<burn_batch_evaluator>
   {
      public:
         using operation_type = burn_batch_operation;

         void_result do_evaluate( const burn_batch_operation& op );
         void_result do_apply( const burn_batch_operation& op );
   };

} } // multitoken::chain
