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

#include <multitoken/chain/database.hpp>
#include <multitoken/chain/exceptions.hpp>

namespace multitoken { namespace chain {

database::database()
{
   initialize_indexes();
   initialize_evaluators();
}

database::~database() = default;

void database::initialize( const address& ledger_owner )
{ try {
   FC_ASSERT( !is_initialized(), "Ledger is already initialized" );
   FC_ASSERT( !ledger_owner.is_null(), "Ledger owner must not be the null address" );

   create<ledger_property_object>( [&ledger_owner]( ledger_property_object& p ) {
      p.ledger_owner  = ledger_owner;
      p.next_token_id = MULTITOKEN_FIRST_TOKEN_ID;
   });

   // the ledger record is permanent, every later change runs in an undo session
   _undo_db.enable();
   ilog( "Ledger initialized, owner ${o}", ("o",ledger_owner) );
} FC_CAPTURE_AND_RETHROW( (ledger_owner) ) }

bool database::is_initialized()const
{
   return find( ledger_property_id_type() ) != nullptr;
}

void database::set_receipt_hook( std::shared_ptr<receipt_hook> hook )
{
   _receipt_hook = std::move( hook );
}

} } // multitoken::chain
