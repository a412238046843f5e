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
#include <multitoken/db/object_database.hpp>

namespace multitoken { namespace db {

object_database::object_database()
:_undo_db(*this)
{
}

const object* object_database::find_object( const object_id_type& id )const
{
   return get_index( id.space(), id.type() ).find( id );
}

const object& object_database::get_object( const object_id_type& id )const
{
   return get_index( id.space(), id.type() ).get( id );
}

const object& object_database::insert( object&& obj )
{
   return get_mutable_index( obj.id.space(), obj.id.type() ).insert( std::move( obj ) );
}

void object_database::remove( const object& obj )
{
   get_mutable_index( obj.id.space(), obj.id.type() ).remove( obj );
}

const index& object_database::get_index( uint8_t space_id, uint8_t type_id )const
{
   auto itr = _indexes.find( index_key( space_id, type_id ) );
   FC_ASSERT( itr != _indexes.end(), "Database index ${space_id}.${type_id} does not exist",
              ("space_id",space_id)("type_id",type_id) );
   return *itr->second;
}

index& object_database::get_mutable_index( uint8_t space_id, uint8_t type_id )
{
   auto itr = _indexes.find( index_key( space_id, type_id ) );
   FC_ASSERT( itr != _indexes.end(), "Database index ${space_id}.${type_id} does not exist",
              ("space_id",space_id)("type_id",type_id) );
   return *itr->second;
}

} } // multitoken::db
