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
#include <multitoken/protocol/base.hpp>

namespace multitoken { namespace protocol {

   /**
    * @brief Register a new token class
    * @ingroup operations
    *
    * The ledger assigns the next id of its sequence and returns it as the
    * operation result. No units exist until a mint_operation targets the new id;
    * callers that want creation and initial supply to succeed or fail together
    * put both operations in one transaction.
    *
    * Only the ledger owner may create token classes.
    */
   struct token_class_create_operation : public base_operation
   {
      address     creator;          ///< Recorded once and never changed
      share_type  initial_supply;   ///< Creation-time supply figure, kept as a label
      string      uri;              ///< Metadata location, announced when not empty

      void validate()const;
   };

   /**
    * @brief Credit new units of a token class to a holder
    * @ingroup operations
    *
    * Only the ledger owner may mint. Minting does not consult the recipient's
    * receipt hook.
    */
   struct mint_operation : public base_operation
   {
      address        to;
      token_id_type  token_id;
      share_type     amount;
      bytes          data;

      void validate()const;
   };

   /// @ingroup operations
   struct mint_batch_operation : public base_operation
   {
      address                to;
      vector<token_id_type>  token_ids;
      vector<share_type>     amounts;
      bytes                  data;

      void validate()const;
   };

   /**
    * @brief Destroy units of a token class held by @ref owner
    * @ingroup operations
    *
    * Allowed for the holder itself, its approved operators and the ledger owner.
    */
   struct burn_operation : public base_operation
   {
      address        owner;
      token_id_type  token_id;
      share_type     amount;

      void validate()const;
   };

   /// @ingroup operations
   struct burn_batch_operation : public base_operation
   {
      address                owner;
      vector<token_id_type>  token_ids;
      vector<share_type>     amounts;

      void validate()const;
   };

} } // multitoken::protocol

FC_REFLECT( multitoken::protocol::token_class_create_operation, (creator)(initial_supply)(uri) )
FC_REFLECT( multitoken::protocol::mint_operation, (to)(token_id)(amount)(data) )
FC_REFLECT( multitoken::protocol::mint_batch_operation, (to)(token_ids)(amounts)(data) )
FC_REFLECT( multitoken::protocol::burn_operation, (owner)(token_id)(amount) )
FC_REFLECT( multitoken::protocol::burn_batch_operation, (owner)(token_ids)(amounts) )

MULTITOKEN_DECLARE_EXTERNAL_SERIALIZATION( multitoken::protocol::token_class_create_operation )
MULTITOKEN_DECLARE_EXTERNAL_SERIALIZATION( multitoken::protocol::mint_operation )
MULTITOKEN_DECLARE_EXTERNAL_SERIALIZATION( multitoken::protocol::mint_batch_operation )
MULTITOKEN_DECLARE_EXTERNAL_SERIALIZATION( multitoken::protocol::burn_operation )
MULTITOKEN_DECLARE_EXTERNAL_SERIALIZATION( multitoken::protocol::burn_batch_operation )
