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

namespace multitoken { namespace app {

   using namespace multitoken::chain;

   /**
    * @brief Call surface of the ledger for dispatchers
    *
    * Every mutating call is one transaction pushed on behalf of @p caller, which
    * the dispatcher has already authenticated. Failures propagate as the
    * fc::exception thrown by the ledger; chain::failure_reason() extracts the
    * reason string.
    */
   class ledger_api
   {
      public:
         explicit ledger_api( chain::database& db );

         /////////////
         // Queries //
         /////////////

         share_type         balance_of( const token_id_type& token_id, const address& holder )const;
         vector<share_type> balance_of_batch( const vector<address>& holders,
                                              const vector<token_id_type>& token_ids )const;
         bool               is_approved_for_all( const address& owner, const address& operator_account )const;
         bool               exists( const token_id_type& token_id )const;
         address            creator_of( const token_id_type& token_id )const;
         share_type         initial_supply_of( const token_id_type& token_id )const;
         token_id_type      get_next_token_id()const;

         ///////////////
         // Transfers //
         ///////////////

         void safe_transfer_from( const address& caller, const address& from, const address& to,
                                  const token_id_type& token_id, const share_type& amount,
                                  const bytes& data = bytes() );
         void safe_batch_transfer_from( const address& caller, const address& from, const address& to,
                                        const vector<token_id_type>& token_ids,
                                        const vector<share_type>& amounts,
                                        const bytes& data = bytes() );

         void set_approval_for_all( const address& caller, const address& operator_account, bool approved );

         ///////////////////////
         // Supply management //
         ///////////////////////

         /**
          * @brief Creates a token class and mints its initial supply to @p initial_holder
          *
          * With @p atomic set, creation and mint are pushed as one transaction and
          * fail together. Otherwise they are pushed one after the other, and a
          * failing mint leaves the class created with nothing minted.
          *
          * @return id of the created token class
          */
         token_id_type create_token_class( const address& caller, const address& creator,
                                           const share_type& initial_supply, const string& uri,
                                           const address& initial_holder, bool atomic );

         void mint( const address& caller, const address& to, const token_id_type& token_id,
                    const share_type& amount, const bytes& data = bytes() );
         void mint_batch( const address& caller, const address& to, const vector<token_id_type>& token_ids,
                          const vector<share_type>& amounts, const bytes& data = bytes() );
         void burn( const address& caller, const address& owner, const token_id_type& token_id,
                    const share_type& amount );
         void burn_batch( const address& caller, const address& owner, const vector<token_id_type>& token_ids,
                          const vector<share_type>& amounts );

      private:
         chain::database& _db;
   };

} } // multitoken::app
