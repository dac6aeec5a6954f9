// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
// Copyright 2024 Mozilla Foundation
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "sift.h"

#include <cstdint>
#include <string>
#include <vector>

#if defined(__cpp_exceptions) || defined(__EXCEPTIONS) || defined(_CPPUNWIND)
#define SIFT_LOGIC_ERROR(s) throw std::logic_error(s)
#else
#define SIFT_LOGIC_ERROR(s) abort()
#endif

namespace sift {
namespace detail {

enum class Type : uint8_t
{
    Null,
    Bool,
    Int,
    Uint,
    Float,
    String,
    Array,
    Object
};

const char*
TypeToString(Type type);

// Scalar payload produced by the scanner. Only the field selected by type
// is meaningful.
struct Scalar
{
    Type type = Type::Null;
    bool bool_value = false;
    long long int_value = 0;
    unsigned long long uint_value = 0;
    double float_value = 0;
    std::string string_value;
};

// A classified, unparsed range of the document.
struct Span
{
    Type type = Type::Null;
    const char* begin = nullptr;
    const char* end = nullptr;
};

// One parsed node. Containers are followed by their children; object
// members alternate key entry, value entry. next is the index one past the
// node's subtree.
struct TapeEntry
{
    Type type = Type::Null;
    uint32_t next = 0;
    union
    {
        bool bool_value;
        long long int_value;
        unsigned long long uint_value;
        double float_value;
        struct
        {
            uint32_t offset;
            uint32_t length;
        } str;
    };

    TapeEntry() : int_value(0)
    {
    }
};

struct Tape
{
    std::vector<TapeEntry> entries;
    std::string strings;

    void clear()
    {
        entries.clear();
        strings.clear();
    }
};

inline bool
IsSpace(int c)
{
    return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

inline void
skipWhitespace(const char*& p, const char* e)
{
    while (p < e && IsSpace(*p & 255))
        ++p;
}

// Decodes a string body. p points just past the opening quote and is left
// just past the closing quote.
Status
parseString(const char*& p, const char* e, std::string& out);

// Advances p past a string body without decoding it.
Status
skipString(const char*& p, const char* e);

// Parses a number token starting at a '-' or digit. out.type is set to
// Int, Uint or Float.
Status
parseNumber(const char*& p, const char* e, Scalar& out);

// Advances p past exactly one value, leading whitespace included. Containers
// are skipped by bracket counting, without recursion or allocation.
Status
skipValue(const char*& p, const char* e);

// Determines the type of the value starting at p (no leading whitespace).
Status
classify(const char* p, const char* e, Type& type);

// Parses the scalar token in [p, e). The whole range must be consumed.
Status
parseScalar(const char* p, const char* e, Scalar& out);

// Full structural parse of a document. The root value's range is written
// to root. When tape is non-null the parsed nodes are recorded in it.
Status
scanDocument(const char* p, const char* e, Tape* tape, Span& root);

} // namespace detail
} // namespace sift
