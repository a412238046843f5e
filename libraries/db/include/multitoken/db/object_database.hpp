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
#include <multitoken/db/object.hpp>
#include <multitoken/db/index.hpp>
#include <multitoken/db/undo_database.hpp>

#include <fc/log/logger.hpp>

#include <map>
#include <memory>

namespace multitoken { namespace db {

   /**
    *   @class object_database
    *   @brief keeps one index per object type and routes every change through the
    *   undo database
    *
    *   Indexes are registered once with add_index(). Reads go through the const
    *   accessors; create(), modify(), insert() and remove() are the only mutators.
    */
   class object_database
   {
      public:
         object_database();
         virtual ~object_database() = default;

         template<typename IndexType>
         IndexType* add_index()
         {
            using ObjectType = typename IndexType::object_type;
            auto& slot = _indexes[ index_key( ObjectType::space_id, ObjectType::type_id ) ];
            FC_ASSERT( !slot, "Index ${s}.${t} already exists",
                       ("s",ObjectType::space_id)("t",ObjectType::type_id) );
            slot = std::make_unique<IndexType>( *this );
            return static_cast<IndexType*>( slot.get() );
         }

         template<typename IndexType>
         const IndexType& get_index_type()const
         {
            static_assert( std::is_base_of<index,IndexType>::value, "Type must be an index type" );
            using ObjectType = typename IndexType::object_type;
            return static_cast<const IndexType&>( get_index( ObjectType::space_id, ObjectType::type_id ) );
         }

         const object& get_object( const object_id_type& id )const;
         const object* find_object( const object_id_type& id )const;

         template<uint8_t SpaceID, uint8_t TypeID>
         auto find( const object_id<SpaceID,TypeID>& id )const -> const object_downcast_t<object_id<SpaceID,TypeID>>*
         {
            return static_cast<const object_downcast_t<object_id<SpaceID,TypeID>>*>(
                     find_object( object_id_type( id ) ) );
         }

         template<typename T, typename F>
         const T& create( F&& constructor )
         {
            auto& idx = get_mutable_index( T::space_id, T::type_id );
            return static_cast<const T&>( idx.create( [&constructor]( object& o ) {
               constructor( static_cast<T&>(o) );
            }));
         }

         template<typename T, typename Lambda>
         void modify( const T& obj, const Lambda& m )
         {
            get_mutable_index( obj.id.space(), obj.id.type() ).modify( obj, [&m]( object& o ) {
               m( static_cast<T&>(o) );
            });
         }

         const object& insert( object&& obj );
         void          remove( const object& obj );

         /** public for testing purposes only... should be private in practice. */
         undo_database _undo_db;

      private:
         friend class undo_database;

         static uint16_t index_key( uint8_t space_id, uint8_t type_id )
         {
            return uint16_t( (uint16_t(space_id) << 8) | type_id );
         }

         const index& get_index( uint8_t space_id, uint8_t type_id )const;
         index&       get_mutable_index( uint8_t space_id, uint8_t type_id );

         std::map< uint16_t, std::unique_ptr<index> > _indexes;
   };

} } // multitoken::db
