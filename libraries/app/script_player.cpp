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
#include <multitoken/app/script_player.hpp>

#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

namespace multitoken { namespace app {

step_result script_player::play( const script_step& step )
{
   step_result result;
   transaction trx;
   trx.operations = step.operations;
   try
   {
      auto processed = _db.push_transaction( trx, step.caller );
      result.applied = true;
      result.operation_results = std::move( processed.operation_results );
   }
   catch( const fc::exception& e )
   {
      result.failure = failure_reason( e );
   }

   if( step.expect_failure.valid() )
      result.matched_expectation = !result.applied && result.failure == *step.expect_failure;
   else
      result.matched_expectation = result.applied;

   if( !result.matched_expectation )
      wlog( "Step by ${c} did not go as expected: expected ${x}, got ${r}",
            ("c",step.caller)("x",step.expect_failure.valid() ? *step.expect_failure : string("success"))
            ("r",result.applied ? string("success") : result.failure) );
   return result;
}

vector<step_result> script_player::play_all( const vector<script_step>& steps )
{
   vector<step_result> results;
   results.reserve( steps.size() );
   for( const auto& step : steps )
      results.push_back( play( step ) );
   return results;
}

vector<script_step> script_player::load( const boost::filesystem::path& json_file )
{ try {
   return fc::json::from_file( json_file ).as<vector<script_step>>( MULTITOKEN_MAX_NESTED_OBJECTS );
} FC_CAPTURE_AND_RETHROW( (json_file.string()) ) }

} } // multitoken::app
