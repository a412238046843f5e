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

#include <multitoken/chain/approval_object.hpp>
#include <multitoken/chain/balance_object.hpp>
#include <multitoken/chain/ledger_property_object.hpp>
#include <multitoken/chain/token_class_object.hpp>

FC_REFLECT_DERIVED_NO_TYPENAME( multitoken::chain::token_class_object, (multitoken::db::object),
                                (token_id)(creator)(initial_supply)(uri) )

FC_REFLECT_DERIVED_NO_TYPENAME( multitoken::chain::token_balance_object, (multitoken::db::object),
                                (token_id)(owner)(amount) )

FC_REFLECT_DERIVED_NO_TYPENAME( multitoken::chain::operator_approval_object, (multitoken::db::object),
                                (owner)(operator_account)(approved) )

FC_REFLECT_DERIVED_NO_TYPENAME( multitoken::chain::ledger_property_object, (multitoken::db::object),
                                (ledger_owner)(next_token_id) )

MULTITOKEN_IMPLEMENT_EXTERNAL_SERIALIZATION( multitoken::chain::token_class_object )
MULTITOKEN_IMPLEMENT_EXTERNAL_SERIALIZATION( multitoken::chain::token_balance_object )
MULTITOKEN_IMPLEMENT_EXTERNAL_SERIALIZATION( multitoken::chain::operator_approval_object )
MULTITOKEN_IMPLEMENT_EXTERNAL_SERIALIZATION( multitoken::chain::ledger_property_object )
