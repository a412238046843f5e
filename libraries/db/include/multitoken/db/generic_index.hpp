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
#include <multitoken/db/index.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/composite_key.hpp>

namespace multitoken { namespace db {

   using boost::multi_index_container;
   using namespace boost::multi_index;

   struct by_id;

   /**
    *  Keeps the objects of one type in a boost::multi_index_container whose first
    *  index is an ordered_unique key on the object id. Further indices serve the
    *  lookups by content (see the by_* tags in the chain object headers).
    *
    *  Instances are always wrapped in primary_index, which supplies the ids.
    */
   template<typename ObjectType, typename MultiIndexType>
   class generic_index : public index
   {
      public:
         typedef MultiIndexType index_type;
         typedef ObjectType     object_type;

         const object& insert( object&& obj )override
         {
            auto insert_result = _indices.insert( std::move( static_cast<ObjectType&>(obj) ) );
            FC_ASSERT( insert_result.second, "Could not insert object ${id}, a uniqueness constraint was violated",
                       ("id",insert_result.first->id) );
            return *insert_result.first;
         }

         void modify( const object& obj, const std::function<void(object&)>& m )override
         {
            auto ok = _indices.modify( _indices.iterator_to( static_cast<const ObjectType&>(obj) ),
                                       [&m]( ObjectType& o ){ m(o); } );
            FC_ASSERT( ok, "Could not modify object ${id}, an index constraint was violated", ("id",obj.id) );
         }

         void remove( const object& obj )override
         {
            _indices.erase( _indices.iterator_to( static_cast<const ObjectType&>(obj) ) );
         }

         const object* find( object_id_type id )const override
         {
            auto itr = _indices.find( id );
            return itr == _indices.end() ? nullptr : &*itr;
         }

         const index_type& indices()const { return _indices; }

      protected:
         const object& emplace( object_id_type id, const std::function<void(object&)>& constructor )
         {
            ObjectType item;
            item.id = id;
            constructor( item );
            return generic_index::insert( std::move( item ) );
         }

      private:
         index_type _indices;
   };

   /**
    * @brief An index type for objects that are only looked up by id
    */
   template< class T >
   struct sparse_index : public generic_index<T, boost::multi_index_container<
      T,
      indexed_by<
         ordered_unique< tag<by_id>, member<object, object_id_type, &object::id> >
      >
   >>{};

} } // multitoken::db
