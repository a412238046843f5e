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

#define MULTITOKEN_ADDRESS_PREFIX "0x"
#define MULTITOKEN_ADDRESS_HEX_LENGTH 40

#define MULTITOKEN_MAX_NESTED_OBJECTS (200)

/**
 * Values a programmatic recipient must return from its receipt hook to accept a
 * single or a batch credit. They are the first four bytes of the keccak256 hash
 * of the hook signatures, kept as they are on the wire.
 */
///@{
#define MULTITOKEN_RECEIVED_SELECTOR       (uint32_t(0xf23a6e61))
#define MULTITOKEN_BATCH_RECEIVED_SELECTOR (uint32_t(0xbc197c81))
///@}

/** The first token class issued by a fresh ledger */
#define MULTITOKEN_FIRST_TOKEN_ID 1
