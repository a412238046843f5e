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
#include <multitoken/app/scripted_receiver_registry.hpp>

#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

namespace multitoken { namespace app {

void scripted_receiver_registry::register_receiver( const address& target, const receiver_behavior& behavior )
{
   FC_ASSERT( !target.is_null(), "The null address cannot run a receipt hook" );
   _receivers[target] = behavior;
}

void scripted_receiver_registry::register_receivers( const vector<receiver_definition>& definitions )
{
   for( const auto& d : definitions )
      register_receiver( d.target, d.behavior );
}

void scripted_receiver_registry::load( const boost::filesystem::path& json_file )
{ try {
   auto definitions = fc::json::from_file( json_file )
                         .as<vector<receiver_definition>>( MULTITOKEN_MAX_NESTED_OBJECTS );
   register_receivers( definitions );
   ilog( "Loaded ${n} scripted receivers from ${f}", ("n",definitions.size())("f",json_file.string()) );
} FC_CAPTURE_AND_RETHROW( (json_file.string()) ) }

bool scripted_receiver_registry::is_programmatic( const address& target )const
{
   return _receivers.find( target ) != _receivers.end();
}

receipt_outcome scripted_receiver_registry::on_received( const address& target, const receipt_call& call )
{
   auto itr = _receivers.find( target );
   FC_ASSERT( itr != _receivers.end(), "${t} has no receipt hook", ("t",target) );
   _calls.emplace_back( target, call );

   const receiver_behavior& b = itr->second;
   switch( b.mode )
   {
      case accept_receipt:
         return hook_returned{ acceptance_selector( call ) };
      case return_value:
         return hook_returned{ b.value };
      case revert_with_reason:
         return hook_reverted_with_reason{ b.reason };
      case revert_silently:
         return hook_reverted();
      case panic:
         return hook_panicked{ b.code };
   }
   FC_THROW( "Unknown receiver mode ${m}", ("m",int(b.mode)) );
}

} } // multitoken::app
