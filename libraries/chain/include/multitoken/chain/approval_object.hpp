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
#include <multitoken/db/generic_index.hpp>

namespace multitoken { namespace chain {

   /**
    *  @brief Whether an operator may move every token class of an owner
    *  @ingroup object
    *
    *  Written the first time the owner sets the approval, absent pairs read as
    *  not approved.
    */
   class operator_approval_object : public abstract_object<operator_approval_object>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = operator_approval_object_type;

         address  owner;
         address  operator_account;
         bool     approved = false;
   };

   struct by_owner_operator;

   using operator_approval_multi_index_type = multi_index_container<
      operator_approval_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_owner_operator>,
            composite_key< operator_approval_object,
               member< operator_approval_object, address, &operator_approval_object::owner >,
               member< operator_approval_object, address, &operator_approval_object::operator_account >
            >
         >
      >
   >;

   using operator_approval_index = generic_index<operator_approval_object, operator_approval_multi_index_type>;

} } // multitoken::chain

MULTITOKEN_MAP_OBJECT_ID_TO_TYPE( multitoken::chain::operator_approval_object )

FC_REFLECT_TYPENAME( multitoken::chain::operator_approval_object )

MULTITOKEN_DECLARE_EXTERNAL_SERIALIZATION( multitoken::chain::operator_approval_object )
