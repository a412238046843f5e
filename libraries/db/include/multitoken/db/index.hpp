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

#include <functional>

namespace multitoken { namespace db {

   class object_database;

   /**
    *  @class index
    *  @brief abstract store of the objects of one space and type
    *
    *  Ids are handed out sequentially and never reused, except that undoing a
    *  creation hands its id out again. Objects are only changed through modify();
    *  outside of the callback all references are const.
    */
   class index
   {
      public:
         virtual ~index(){}

         virtual object_id_type next_id()const = 0;
         virtual void           set_next_id( object_id_type id ) = 0;

         /// stores an object that already carries its id
         virtual const object&  insert( object&& obj ) = 0;
         /// default-constructs an object with the next id and lets @p constructor fill it in
         virtual const object&  create( const std::function<void(object&)>& constructor ) = 0;
         virtual void           modify( const object& obj, const std::function<void(object&)>& m ) = 0;
         virtual void           remove( const object& obj ) = 0;

         virtual const object*  find( object_id_type id )const = 0;
         const object&          get( object_id_type id )const
         {
            auto maybe_found = find( id );
            FC_ASSERT( maybe_found != nullptr, "Unable to find object ${id}", ("id",id) );
            return *maybe_found;
         }
   };

   /**
    *  Reports the changes made through a primary_index to the undo database of
    *  the owning object_database.
    */
   class base_primary_index
   {
      public:
         explicit base_primary_index( object_database& db ):_db(db){}

      protected:
         void on_create( const object& obj );
         void on_modify( const object& obj );
         void on_remove( const object& obj );

         object_database& _db;
   };

   /**
    * @class primary_index
    * @brief owns the id counter of a derived index and records every change it
    *  makes for the undo database
    */
   template<typename DerivedIndex>
   class primary_index : public DerivedIndex, public base_primary_index
   {
      public:
         using object_type = typename DerivedIndex::object_type;

         explicit primary_index( object_database& db )
         :base_primary_index(db),_next_id(object_type::space_id,object_type::type_id,0) {}

         object_id_type next_id()const override                { return _next_id; }
         void           set_next_id( object_id_type id ) override { _next_id = id; }

         const object& insert( object&& obj ) override
         {
            const auto& result = DerivedIndex::insert( std::move( obj ) );
            on_create( result );
            return result;
         }

         const object& create( const std::function<void(object&)>& constructor ) override
         {
            const auto& result = DerivedIndex::emplace( _next_id, constructor );
            ++_next_id.number;
            on_create( result );
            return result;
         }

         void modify( const object& obj, const std::function<void(object&)>& m ) override
         {
            on_modify( obj );
            DerivedIndex::modify( obj, m );
         }

         void remove( const object& obj ) override
         {
            on_remove( obj );
            DerivedIndex::remove( obj );
         }

      private:
         object_id_type _next_id;
   };

} } // multitoken::db
