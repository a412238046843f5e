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
    *  @brief Quantity of one token class held by one address
    *  @ingroup object
    *
    *  Created the first time the holder is credited with the token class and
    *  never removed. A missing entry reads as zero, an emptied entry stays behind
    *  with a zero amount.
    */
   class token_balance_object : public abstract_object<token_balance_object>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = token_balance_object_type;

         token_id_type  token_id;
         address        owner;
         share_type     amount;
   };

   struct by_token_owner;
   struct by_owner;

   using token_balance_multi_index_type = multi_index_container<
      token_balance_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_token_owner>,
            composite_key< token_balance_object,
               member< token_balance_object, token_id_type, &token_balance_object::token_id >,
               member< token_balance_object, address, &token_balance_object::owner >
            >
         >,
         ordered_unique< tag<by_owner>,
            composite_key< token_balance_object,
               member< token_balance_object, address, &token_balance_object::owner >,
               member< token_balance_object, token_id_type, &token_balance_object::token_id >
            >
         >
      >
   >;

   using token_balance_index = generic_index<token_balance_object, token_balance_multi_index_type>;

} } // multitoken::chain

MULTITOKEN_MAP_OBJECT_ID_TO_TYPE( multitoken::chain::token_balance_object )

FC_REFLECT_TYPENAME( multitoken::chain::token_balance_object )

MULTITOKEN_DECLARE_EXTERNAL_SERIALIZATION( multitoken::chain::token_balance_object )
