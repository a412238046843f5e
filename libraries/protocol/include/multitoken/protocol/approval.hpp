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
    * @brief Grant or revoke blanket permission for an operator to move every
    *  token class held by @ref owner
    * @ingroup operations
    *
    * Must be sent by the owner. Setting the value it already has is not an error
    * and is announced again.
    */
   struct set_approval_for_all_operation : public base_operation
   {
      address  owner;
      address  operator_account;
      bool     approved = false;

      void validate()const;
   };

} } // multitoken::protocol

FC_REFLECT( multitoken::protocol::set_approval_for_all_operation, (owner)(operator_account)(approved) )

MULTITOKEN_DECLARE_EXTERNAL_SERIALIZATION( multitoken::protocol::set_approval_for_all_operation )
