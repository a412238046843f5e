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

#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/seq/enum.hpp>
#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/seq/transform.hpp>
#include <boost/preprocessor/tuple/elem.hpp>

#include <multitoken/db/object.hpp>
#include <multitoken/protocol/address.hpp>
#include <multitoken/protocol/types.hpp>

#define MULTITOKEN_NAME_TO_OBJECT_TYPE(x, prefix, name) BOOST_PP_CAT(prefix, BOOST_PP_CAT(name, _object_type))
#define MULTITOKEN_NAME_TO_ID_TYPE(x, y, name) BOOST_PP_CAT(name, _id_type)
#define MULTITOKEN_DECLARE_ID(x, space_prefix_seq, name) \
    using BOOST_PP_CAT(name, _id_type) = multitoken::db::object_id<BOOST_PP_TUPLE_ELEM(2, 0, space_prefix_seq), \
                            MULTITOKEN_NAME_TO_OBJECT_TYPE(x, BOOST_PP_TUPLE_ELEM(2, 1, space_prefix_seq), name)>;
#define MULTITOKEN_REFLECT_ID(x, id_namespace, name) FC_REFLECT_TYPENAME(multitoken::id_namespace::name)

#define MULTITOKEN_DEFINE_IDS(id_namespace, object_space, object_type_prefix, names_seq) \
   namespace multitoken { namespace id_namespace { \
   \
   enum BOOST_PP_CAT(object_type_prefix, object_type) { \
      BOOST_PP_SEQ_ENUM(BOOST_PP_SEQ_TRANSFORM(MULTITOKEN_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   }; \
   \
   BOOST_PP_SEQ_FOR_EACH(MULTITOKEN_DECLARE_ID, (object_space, object_type_prefix), names_seq) \
   \
   } } \
   \
   FC_REFLECT_ENUM(multitoken::id_namespace::BOOST_PP_CAT(object_type_prefix, object_type), \
                   BOOST_PP_SEQ_TRANSFORM(MULTITOKEN_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   BOOST_PP_SEQ_FOR_EACH(MULTITOKEN_REFLECT_ID, id_namespace, BOOST_PP_SEQ_TRANSFORM(MULTITOKEN_NAME_TO_ID_TYPE, , names_seq))

namespace multitoken { namespace chain {

   using namespace multitoken::protocol;

   using namespace multitoken::db;

   enum reserved_spaces {
      protocol_ids          = 1,
      implementation_ids    = 2
   };

} } // multitoken::chain

MULTITOKEN_DEFINE_IDS(chain, protocol_ids, /*protocol objects are not prefixed*/,
                      (null)
                      (token_class)
                      (token_balance)
                      (operator_approval))

MULTITOKEN_DEFINE_IDS(chain, implementation_ids, impl_,
                      /* 2.0.x */ (ledger_property))
