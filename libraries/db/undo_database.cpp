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
#include <multitoken/db/undo_database.hpp>

namespace multitoken { namespace db {

undo_database::session undo_database::start_undo_session()
{
   if( _disabled )
      return session( *this, false );
   _stack.emplace_back();
   return session( *this, true );
}

void undo_database::on_create( const object& obj )
{
   if( _disabled || _stack.empty() )
      return;
   auto& state = _stack.back();
   state.next_ids.emplace( obj.id.first_of_type(), obj.id );
   state.created.insert( obj.id );
}

void undo_database::on_modify( const object& obj )
{
   if( _disabled || _stack.empty() )
      return;
   auto& state = _stack.back();
   if( state.created.count( obj.id ) || state.modified.count( obj.id ) )
      return;
   state.modified.emplace( obj.id, obj.clone() );
}

void undo_database::on_remove( const object& obj )
{
   if( _disabled || _stack.empty() )
      return;
   auto& state = _stack.back();
   if( state.created.erase( obj.id ) )
      return;
   if( state.removed.count( obj.id ) )
      return;

   auto snapshot = state.modified.find( obj.id );
   if( snapshot != state.modified.end() )
   {
      state.removed.emplace( obj.id, std::move( snapshot->second ) );
      state.modified.erase( snapshot );
      return;
   }
   state.removed.emplace( obj.id, obj.clone() );
}

void undo_database::undo()
{ try {
   FC_ASSERT( !_disabled, "Undo is disabled" );
   FC_ASSERT( !_stack.empty(), "No undo session to roll back" );

   top_state_release release{ *this };
   auto& state = _stack.back();
   disable();

   for( auto& item : state.modified )
      _db.modify( _db.get_object( item.first ), [&item]( object& obj ) { obj.move_from( *item.second ); } );

   for( const auto& id : state.created )
      _db.remove( _db.get_object( id ) );

   for( const auto& item : state.next_ids )
      _db.get_mutable_index( item.first.space(), item.first.type() ).set_next_id( item.second );

   for( auto& item : state.removed )
      _db.insert( std::move( *item.second ) );
} FC_CAPTURE_AND_RETHROW() }

void undo_database::merge()
{
   FC_ASSERT( _stack.size() >= 2, "No enclosing undo session to merge into" );
   auto& inner = _stack.back();
   auto& outer = _stack[ _stack.size() - 2 ];

   for( auto& item : inner.modified )
   {
      if( outer.created.count( item.first ) || outer.modified.count( item.first ) )
         continue;
      outer.modified.emplace( item.first, std::move( item.second ) );
   }

   outer.created.insert( inner.created.begin(), inner.created.end() );

   for( const auto& item : inner.next_ids )
      outer.next_ids.emplace( item.first, item.second );

   for( auto& item : inner.removed )
   {
      // created by the outer session, it simply never existed
      if( outer.created.erase( item.first ) )
         continue;
      // the outer snapshot predates the inner one
      auto snapshot = outer.modified.find( item.first );
      if( snapshot != outer.modified.end() )
      {
         outer.removed.emplace( item.first, std::move( snapshot->second ) );
         outer.modified.erase( snapshot );
         continue;
      }
      outer.removed.emplace( item.first, std::move( item.second ) );
   }

   _stack.pop_back();
}

void undo_database::commit()
{
   FC_ASSERT( !_stack.empty(), "No undo session to commit" );
   if( _stack.size() > 1 )
      merge();
   else
      _stack.pop_back();
}

} } // multitoken::db
