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

#include <fc/log/logger.hpp>

#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace multitoken { namespace db {

   class object_database;

   /// Everything needed to put the database back the way one session found it
   struct undo_state
   {
      /// snapshot taken on the first modification of an object older than the session
      std::unordered_map<object_id_type, unique_ptr<object>> modified;
      /// objects created during the session
      std::unordered_set<object_id_type>                     created;
      /// objects older than the session that it removed, as they were before the session
      std::unordered_map<object_id_type, unique_ptr<object>> removed;
      /// first id handed out per index during the session, keyed by object_id_type::first_of_type()
      std::unordered_map<object_id_type, object_id_type>     next_ids;
   };

   /**
    * @class undo_database
    * @brief records the changes made to an object_database so they can be rolled back
    *
    * Sessions nest and each one owns an undo_state on the stack. A session that
    * goes out of scope without commit() rolls the database back to where it
    * started. Committing the outermost session forgets its state and makes the
    * changes permanent; committing a nested session folds its state into the
    * enclosing one.
    *
    * Recording starts disabled, so that an initial state can be written without
    * sessions. Call enable() once it is in place.
    */
   class undo_database
   {
      public:
         explicit undo_database( object_database& db ):_db(db){}

         class session
         {
            public:
               session( session&& mv )
               :_db(mv._db),_apply_undo(mv._apply_undo)
               {
                  mv._apply_undo = false;
               }
               ~session()
               {
                  if( !_apply_undo )
                     return;
                  try
                  {
                     _db.undo();
                  }
                  catch( const fc::exception& e )
                  {
                     elog( "Rolling back an undo session failed: ${e}", ("e",e.to_detail_string()) );
                  }
               }

               void commit() { if( _apply_undo ) _db.commit(); _apply_undo = false; }
               void undo()   { if( _apply_undo ) _db.undo();   _apply_undo = false; }

               session& operator = ( session&& mv ) = delete;

            private:
               friend class undo_database;
               session( undo_database& db, bool apply_undo ):_db(db),_apply_undo(apply_undo) {}
               undo_database& _db;
               bool _apply_undo = true;
         };

         void disable() { _disabled = true; }
         void enable()  { _disabled = false; }
         bool enabled()const { return !_disabled; }

         /// a session that does nothing while recording is disabled
         session start_undo_session();

         void on_create( const object& obj ); ///< after @p obj was added
         void on_modify( const object& obj ); ///< before @p obj is changed
         void on_remove( const object& obj ); ///< before @p obj is erased

         /// number of sessions in progress
         std::size_t size()const { return _stack.size(); }

      private:
         /// drops the top state and resumes recording, even when a rollback fails part way
         struct top_state_release
         {
            undo_database& self;
            ~top_state_release() { self._stack.pop_back(); self.enable(); }
         };

         void undo();
         void commit();
         void merge();

         bool                    _disabled = true;
         std::deque<undo_state>  _stack;
         object_database&        _db;
   };

} } // multitoken::db
