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

#include <multitoken/chain/transaction_evaluation_state.hpp>
#include <multitoken/protocol/operations.hpp>

namespace multitoken { namespace chain {

   class database;

   class generic_evaluator
   {
   public:
      virtual ~generic_evaluator(){}

      virtual operation_result start_evaluate( transaction_evaluation_state& eval_state, const operation& op, bool apply );

      /**
       * @note derived classes should ASSUME that the default validation that is
       * indepenent of ledger state has been performed by op.validate() and should
       * not perform these extra checks.
       */
      virtual operation_result evaluate( const operation& op ) = 0;
      virtual operation_result apply( const operation& op ) = 0;

      database& db()const;

      /// the address on whose behalf the operation is being applied
      const address& caller()const;

   protected:
      transaction_evaluation_state* trx_state = nullptr;
   };

   class op_evaluator
   {
   public:
      virtual ~op_evaluator(){}
      virtual operation_result evaluate( transaction_evaluation_state& eval_state, const operation& op, bool apply ) = 0;
   };

   template<typename T>
   class op_evaluator_impl : public op_evaluator
   {
   public:
      operation_result evaluate( transaction_evaluation_state& eval_state, const operation& op, bool apply = true ) override
      {
         T eval;
         return eval.start_evaluate( eval_state, op, apply );
      }
   };

   /**
    * Derived evaluators name their operation as operation_type and implement
    * do_evaluate(), which checks the operation against the current ledger state
    * without changing it, and do_apply(), which performs the changes.
    */
   template<typename DerivedEvaluator>
   class evaluator : public generic_evaluator
   {
   public:
      operation_result evaluate( const operation& o ) final override
      {
         auto* eval = static_cast<DerivedEvaluator*>(this);
         const auto& op = o.get<typename DerivedEvaluator::operation_type>();
         return eval->do_evaluate( op );
      }

      operation_result apply( const operation& o ) final override
      {
         auto* eval = static_cast<DerivedEvaluator*>(this);
         const auto& op = o.get<typename DerivedEvaluator::operation_type>();
         return eval->do_apply( op );
      }
   };
} }
