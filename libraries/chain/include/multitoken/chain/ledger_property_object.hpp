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
    * @class ledger_property_object
    * @brief Ledger-wide state, exactly one instance exists once the ledger is initialized
    * @ingroup object
    * @ingroup implementation
    */
   class ledger_property_object : public abstract_object<ledger_property_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_ledger_property_object_type;

         address        ledger_owner;   ///< The only caller allowed to create token classes and mint
         token_id_type  next_token_id = MULTITOKEN_FIRST_TOKEN_ID; ///< Assigned to the next created token class
   };

   using ledger_property_index = sparse_index<ledger_property_object>;

} } // multitoken::chain

MULTITOKEN_MAP_OBJECT_ID_TO_TYPE( multitoken::chain::ledger_property_object )

FC_REFLECT_TYPENAME( multitoken::chain::ledger_property_object )

MULTITOKEN_DECLARE_EXTERNAL_SERIALIZATION( multitoken::chain::ledger_property_object )
