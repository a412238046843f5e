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
#include <multitoken/db/object_id.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>

#include <memory>

namespace multitoken { namespace db {

   using std::unique_ptr;
   using fc::variant;

   /**
    *  @brief base for all ledger objects
    *
    *  Objects are the unit the undo database snapshots and restores. Each one is
    *  assigned a sequential id inside the space/type pair declared by its class.
    *
    *  Objects must be cheap to copy: the undo database clones an object the first
    *  time it is modified inside a session.
    *
    *  @note Do not use multiple inheritance with object because the code assumes
    *  a static_cast will work between object and derived types.
    */
   class object
   {
      public:
         object(){}
         virtual ~object(){}

         static constexpr uint8_t space_id = 0;
         static constexpr uint8_t type_id  = 0;
         static constexpr uint32_t MAX_NESTING = 200;

         object_id_type id;

         /// implemented for derived classes by inheriting abstract_object<DerivedClass>
         virtual unique_ptr<object> clone()const = 0;
         virtual void               move_from( object& obj ) = 0;
         virtual variant            to_variant()const  = 0;
   };

   /**
    * @class abstract_object
    * @brief CRTP helper that gives every object class polymorphic clone, move and
    *  variant conversion.
    */
   template<typename DerivedClass>
   class abstract_object : public object
   {
      public:
         unique_ptr<object> clone()const override
         {
            return std::make_unique<DerivedClass>( *static_cast<const DerivedClass*>(this) );
         }

         void move_from( object& obj ) override
         {
            static_cast<DerivedClass&>(*this) = std::move( static_cast<DerivedClass&>(obj) );
         }

         variant to_variant()const override
         {
            return variant( static_cast<const DerivedClass&>(*this), MAX_NESTING );
         }
   };

} } // multitoken::db

FC_REFLECT_TYPENAME( multitoken::db::object_id_type )
FC_REFLECT( multitoken::db::object, (id) )
