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

#include <multitoken/chain/receipt_hook.hpp>

#include <boost/filesystem/path.hpp>

#include <map>

namespace multitoken { namespace app {

   using multitoken::chain::receipt_hook;
   using namespace multitoken::protocol;

   /// How a scripted recipient answers its receipt hook
   enum receiver_mode
   {
      accept_receipt,       ///< returns the selector matching the call
      return_value,         ///< returns receiver_behavior::value, whatever the call
      revert_with_reason,   ///< reverts with receiver_behavior::reason
      revert_silently,      ///< reverts without a reason
      panic                 ///< faults with receiver_behavior::code
   };

   struct receiver_behavior
   {
      receiver_mode  mode = accept_receipt;
      uint32_t       value = 0;
      string         reason;
      uint32_t       code = 0;
   };

   struct receiver_definition
   {
      address            target;
      receiver_behavior  behavior;
   };

   /**
    * @brief receipt_hook whose programmatic recipients follow fixed scripts
    *
    * Stands in for the code a host would run at recipient addresses. Every
    * registered address is programmatic; all others are plain. Calls are
    * recorded in order so they can be inspected afterwards.
    */
   class scripted_receiver_registry : public receipt_hook
   {
      public:
         void register_receiver( const address& target, const receiver_behavior& behavior );
         void register_receivers( const vector<receiver_definition>& definitions );

         /// Reads a JSON array of receiver_definition
         void load( const boost::filesystem::path& json_file );

         bool is_programmatic( const address& target )const override;
         receipt_outcome on_received( const address& target, const receipt_call& call ) override;

         const vector<pair<address, receipt_call>>& received_calls()const { return _calls; }

      private:
         std::map<address, receiver_behavior>   _receivers;
         vector<pair<address, receipt_call>>    _calls;
   };

} } // multitoken::app

FC_REFLECT_ENUM( multitoken::app::receiver_mode,
                 (accept_receipt)(return_value)(revert_with_reason)(revert_silently)(panic) )
FC_REFLECT( multitoken::app::receiver_behavior, (mode)(value)(reason)(code) )
FC_REFLECT( multitoken::app::receiver_definition, (target)(behavior) )
