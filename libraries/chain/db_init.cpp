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

#include <multitoken/chain/database.hpp>

#include <multitoken/chain/approval_evaluator.hpp>
#include <multitoken/chain/token_evaluator.hpp>
#include <multitoken/chain/transfer_evaluator.hpp>

#include <multitoken/chain/approval_object.hpp>
#include <multitoken/chain/balance_object.hpp>
#include <multitoken/chain/ledger_property_object.hpp>
#include <multitoken/chain/token_class_object.hpp>

namespace multitoken { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize(operation::count());
   register_evaluator<transfer_evaluator>();
   register_evaluator<transfer_batch_evaluator>();
   register_evaluator<set_approval_for_all_evaluator>();
   register_evaluator<token_class_create_evaluator>();
   register_evaluator<mint_evaluator>();
   register_evaluator<mint_batch_evaluator>();
   register_evaluator<burn_evaluator>();
   register_evaluator<burn_batch_evaluator>();
}

void database::initialize_indexes()
{
   //Protocol object indexes
   add_index< primary_index<token_class_index> >();
   add_index< primary_index<token_balance_index> >();
   add_index< primary_index<operator_approval_index> >();

   //Implementation object indexes
   add_index< primary_index<ledger_property_index> >();
}

} } // multitoken::chain
