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

#include <multitoken/chain/database.hpp>

#include <boost/filesystem/path.hpp>

namespace multitoken { namespace app {

   using namespace multitoken::chain;

   /**
    * One transaction of a replay script, pushed on behalf of @ref caller.
    *
    * When @ref expect_failure is set, the step is expected to be rejected with
    * that reason string; a step that succeeds, or fails for another reason, is a
    * mismatch.
    */
   struct script_step
   {
      address               caller;
      vector<operation>     operations;
      optional<string>      expect_failure;
   };

   /// Outcome of replaying one script_step
   struct step_result
   {
      bool                        applied = false;
      string                      failure;           ///< reason string when not applied
      vector<operation_result>    operation_results;
      bool                        matched_expectation = true;
   };

   /**
    * @brief Replays scripted transactions against a database
    *
    * Each step is an independent transaction. Rejected steps leave the ledger
    * unchanged and replay continues with the next step.
    */
   class script_player
   {
      public:
         explicit script_player( chain::database& db ):_db(db){}

         step_result play( const script_step& step );
         vector<step_result> play_all( const vector<script_step>& steps );

         /// Reads a JSON array of script_step
         static vector<script_step> load( const boost::filesystem::path& json_file );

      private:
         chain::database& _db;
   };

} } // multitoken::app

FC_REFLECT( multitoken::app::script_step, (caller)(operations)(expect_failure) )
FC_REFLECT( multitoken::app::step_result, (applied)(failure)(operation_results)(matched_expectation) )
