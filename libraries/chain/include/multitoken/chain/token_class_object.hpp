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
 *  @brief Identity record of a token class
 *  @ingroup object
 *
 *  Exists from the moment a token_class_create_operation assigns the id. Ids that
 *  were never created have no record; they still accept mints and report a null
 *  creator and zero initial supply.
 *
 *  initial_supply is the figure given at creation and is never updated by later
 *  mints or burns.
 */
class token_class_object : public abstract_object<token_class_object>
{
   public:
      static constexpr uint8_t space_id = protocol_ids;
      static constexpr uint8_t type_id  = token_class_object_type;

      token_id_type  token_id;
      address        creator;
      share_type     initial_supply;
      string         uri;
};

struct by_token_id;

using token_class_multi_index_type = multi_index_container<
   token_class_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_token_id>,
         member< token_class_object, token_id_type, &token_class_object::token_id >
      >
   >
>;

using token_class_index = generic_index<token_class_object, token_class_multi_index_type>;

} } // multitoken::chain

MULTITOKEN_MAP_OBJECT_ID_TO_TYPE( multitoken::chain::token_class_object )

FC_REFLECT_TYPENAME( multitoken::chain::token_class_object )

MULTITOKEN_DECLARE_EXTERNAL_SERIALIZATION( multitoken::chain::token_class_object )
