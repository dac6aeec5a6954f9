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

#include "scanner.h"
#include "jtckdint.h"

#include <cctype>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <cstring>

#include "double-conversion/string-to-double.h"

#define KEY 1
#define COMMA 2
#define COLON 4
#define ARRAY 8
#define OBJECT 16

#define ASCII 0
#define C0 1
#define DQUOTE 2
#define BACKSLASH 3
#define UTF8_2 4
#define UTF8_3 5
#define UTF8_4 6
#define C1 7
#define UTF8_3_E0 8
#define UTF8_3_ED 9
#define UTF8_4_F0 10
#define BADUTF8 11
#define EVILUTF8 12

#define UTF16_MASK 0xfc00
#define UTF16_MOAR 0xd800 // 0xD800..0xDBFF
#define UTF16_CONT 0xdc00 // 0xDC00..0xDFFF

#define READ32LE(S) \
    ((uint_least32_t)(255 & (S)[3]) << 030 | \
     (uint_least32_t)(255 & (S)[2]) << 020 | \
     (uint_least32_t)(255 & (S)[1]) << 010 | \
     (uint_least32_t)(255 & (S)[0]) << 000)

#define IsCont(x) (0200 == (0300 & (x)))
#define IsSurrogate(wc) ((0xf800 & (wc)) == 0xd800)
#define IsHighSurrogate(wc) (((wc) & UTF16_MASK) == UTF16_MOAR)
#define IsLowSurrogate(wc) (((wc) & UTF16_MASK) == UTF16_CONT)
#define MergeUtf16(hi, lo) ((((hi) - 0xD800) << 10) + ((lo) - 0xDC00) + 0x10000)

namespace sift {
namespace detail {

static_assert(kMaxInputSize <= UINT32_MAX,
              "tape offsets are 32-bit; inputs must stay below 4 GiB");

static const char kJsonStr[256] = {
    1,  1,  1,  1,  1,  1,  1,  1, // 0000 ascii (0)
    1,  1,  1,  1,  1,  1,  1,  1, // 0010
    1,  1,  1,  1,  1,  1,  1,  1, // 0020 c0 (1)
    1,  1,  1,  1,  1,  1,  1,  1, // 0030
    0,  0,  2,  0,  0,  0,  0,  0, // 0040 dquote (2)
    0,  0,  0,  0,  0,  0,  0,  0, // 0050
    0,  0,  0,  0,  0,  0,  0,  0, // 0060
    0,  0,  0,  0,  0,  0,  0,  0, // 0070
    0,  0,  0,  0,  0,  0,  0,  0, // 0100
    0,  0,  0,  0,  0,  0,  0,  0, // 0110
    0,  0,  0,  0,  0,  0,  0,  0, // 0120
    0,  0,  0,  0,  3,  0,  0,  0, // 0130 backslash (3)
    0,  0,  0,  0,  0,  0,  0,  0, // 0140
    0,  0,  0,  0,  0,  0,  0,  0, // 0150
    0,  0,  0,  0,  0,  0,  0,  0, // 0160
    0,  0,  0,  0,  0,  0,  0,  0, // 0170
    7,  7,  7,  7,  7,  7,  7,  7, // 0200 c1 (7)
    7,  7,  7,  7,  7,  7,  7,  7, // 0210
    7,  7,  7,  7,  7,  7,  7,  7, // 0220
    7,  7,  7,  7,  7,  7,  7,  7, // 0230
    11, 11, 11, 11, 11, 11, 11, 11, // 0240 stray continuation (11)
    11, 11, 11, 11, 11, 11, 11, 11, // 0250
    11, 11, 11, 11, 11, 11, 11, 11, // 0260
    11, 11, 11, 11, 11, 11, 11, 11, // 0270
    12, 12, 4,  4,  4,  4,  4,  4, // 0300 utf8-2 (4)
    4,  4,  4,  4,  4,  4,  4,  4, // 0310
    4,  4,  4,  4,  4,  4,  4,  4, // 0320 utf8-2
    4,  4,  4,  4,  4,  4,  4,  4, // 0330
    8,  5,  5,  5,  5,  5,  5,  5, // 0340 utf8-3 (5)
    5,  5,  5,  5,  5,  9,  5,  5, // 0350
    10, 6,  6,  6,  6,  11, 11, 11, // 0360 utf8-4 (6)
    11, 11, 11, 11, 11, 11, 11, 11, // 0370
};

alignas(signed char) static const signed char kHexToInt[256] = {
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x00
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x10
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x20
    0,  1,  2,  3,  4,  5,  6,  7,  8,  9,  -1, -1, -1, -1, -1, -1, // 0x30
    -1, 10, 11, 12, 13, 14, 15, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x40
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x50
    -1, 10, 11, 12, 13, 14, 15, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x60
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x70
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x80
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x90
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xa0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xb0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xc0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xd0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xe0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xf0
};

static const double_conversion::StringToDoubleConverter kJsonToDouble(
  double_conversion::StringToDoubleConverter::ALLOW_TRAILING_JUNK,
  0.0,
  1.0,
  "Infinity",
  "NaN");

const char*
TypeToString(Type type)
{
    switch (type) {
        case Type::Null:
            return "null";
        case Type::Bool:
            return "boolean";
        case Type::Int:
        case Type::Uint:
            return "integer";
        case Type::Float:
            return "float";
        case Type::String:
            return "string";
        case Type::Array:
            return "array";
        case Type::Object:
            return "object";
        default:
            return "unknown";
    }
}

static bool
ReadHex4(const char* p, const char* e, int& c)
{
    int A, B, C, D;
    if (p + 4 <= e && //
        (A = kHexToInt[p[0] & 255]) != -1 && //
        (B = kHexToInt[p[1] & 255]) != -1 && //
        (C = kHexToInt[p[2] & 255]) != -1 && //
        (D = kHexToInt[p[3] & 255]) != -1) {
        c = A << 12 | B << 8 | C << 4 | D;
        return true;
    }
    return false;
}

static void
AppendUtf8(std::string& b, int c)
{
    char w[4];
    int i;
    if (c <= 0x7f) {
        w[0] = c;
        i = 1;
    } else if (c <= 0x7ff) {
        w[0] = 0300 | (c >> 6);
        w[1] = 0200 | (c & 077);
        i = 2;
    } else if (c <= 0xffff || c > 0x10ffff) {
        if (IsSurrogate(c) || c > 0xffff)
            c = 0xfffd;
        w[0] = 0340 | (c >> 12);
        w[1] = 0200 | ((c >> 6) & 077);
        w[2] = 0200 | (c & 077);
        i = 3;
    } else {
        w[0] = 0360 | (c >> 18);
        w[1] = 0200 | ((c >> 12) & 077);
        w[2] = 0200 | ((c >> 6) & 077);
        w[3] = 0200 | (c & 077);
        i = 4;
    }
    b.append(w, i);
}

// p points just past "\u".
static Status
ParseUnicodeEscape(const char*& p, const char* e, std::string& b)
{
    int c, u;
    if (!ReadHex4(p, e, c))
        return invalid_unicode_escape;
    if (!IsSurrogate(c)) {
        p += 4;
        AppendUtf8(b, c);
        return success;
    }
    // A surrogate must be a high half immediately followed by a low half.
    if (IsHighSurrogate(c) && p + 4 + 6 <= e && p[4] == '\\' && p[5] == 'u' &&
        ReadHex4(p + 6, e, u) && IsLowSurrogate(u)) {
        p += 4 + 6;
        AppendUtf8(b, MergeUtf16(c, u));
        return success;
    }
    return invalid_unicode_escape;
}

static Status
ParseEscape(const char*& p, const char* e, std::string& b)
{
    int c;
    if (p >= e)
        return unexpected_end_of_string;
    switch ((c = *p++ & 255)) {
        case '"':
        case '/':
        case '\\':
            b += c;
            return success;
        case 'b':
            b += '\b';
            return success;
        case 'f':
            b += '\f';
            return success;
        case 'n':
            b += '\n';
            return success;
        case 'r':
            b += '\r';
            return success;
        case 't':
            b += '\t';
            return success;
        case 'u':
            return ParseUnicodeEscape(p, e, b);
        default:
            return invalid_escape_character;
    }
}

Status
parseString(const char*& p, const char* e, std::string& b)
{
    int A, B, c;
    Status status;
    for (;;) {
        if (p >= e)
            return unexpected_end_of_string;
        switch (kJsonStr[(c = *p++ & 255)]) {

            case ASCII:
                b += c;
                break;

            case DQUOTE:
                return success;

            case BACKSLASH:
                if ((status = ParseEscape(p, e, b)) != success)
                    return status;
                break;

            case UTF8_2:
                if (p < e && IsCont(p[0])) {
                    AppendUtf8(b, (c & 037) << 6 | (p[0] & 077));
                    p += 1;
                    break;
                }
                return malformed_utf8;

            case UTF8_3_E0:
                if (p + 2 <= e && (p[0] & 0377) < 0240 && IsCont(p[0]) &&
                    IsCont(p[1]))
                    return overlong_utf8_0x7ff;
                // fallthrough

            case UTF8_3:
            ThreeUtf8:
                if (p + 2 <= e && IsCont(p[0]) && IsCont(p[1])) {
                    AppendUtf8(b,
                               (c & 017) << 12 | (p[0] & 077) << 6 |
                                 (p[1] & 077));
                    p += 2;
                    break;
                }
                return malformed_utf8;

            case UTF8_3_ED:
                if (p + 2 <= e && (p[0] & 0377) >= 0240) {
                    if (p + 5 <= e && //
                        (p[0] & 0377) >= 0256 && //
                        IsCont(p[1]) && //
                        (p[2] & 0377) == 0355 && //
                        (p[3] & 0377) >= 0260 && //
                        IsCont(p[4])) {
                        // CESU-8 surrogate pair
                        A = (0355 & 017) << 12 | (p[0] & 077) << 6 |
                            (p[1] & 077);
                        B = (0355 & 017) << 12 | (p[3] & 077) << 6 |
                            (p[4] & 077);
                        AppendUtf8(b, ((A - 0xDB80) << 10) + (B - 0xDC00) +
                                        0x10000);
                        p += 5;
                        break;
                    }
                    if (IsCont(p[0]) && IsCont(p[1]))
                        return utf16_surrogate_in_utf8;
                    return malformed_utf8;
                }
                goto ThreeUtf8;

            case UTF8_4_F0:
                if (p + 3 <= e && (p[0] & 0377) < 0220 && IsCont(p[0]) &&
                    IsCont(p[1]) && IsCont(p[2]))
                    return overlong_utf8_0xffff;
                // fallthrough

            case UTF8_4:
                if (p + 3 <= e && IsCont(p[0]) && IsCont(p[1]) &&
                    IsCont(p[2])) {
                    A = (c & 7) << 18 | (p[0] & 077) << 12 |
                        (p[1] & 077) << 6 | (p[2] & 077);
                    if (A > 0x10FFFF)
                        return utf8_exceeds_utf16_range;
                    AppendUtf8(b, A);
                    p += 3;
                    break;
                }
                return malformed_utf8;

            case EVILUTF8:
                if (p < e && IsCont(p[0]))
                    return overlong_ascii;
                // fallthrough
            case BADUTF8:
                return illegal_utf8_character;
            case C0:
                return non_del_c0_control_code_in_string;
            case C1:
                return c1_control_code_in_string;
            default:
                SIFT_LOGIC_ERROR("Unhandled character category during string parsing.");
        }
    }
}

Status
skipString(const char*& p, const char* e)
{
    int c;
    while (p < e) {
        c = *p++ & 255;
        if (c == '"')
            return success;
        if (c == '\\') {
            if (p >= e)
                break;
            ++p;
        }
    }
    return unexpected_end_of_string;
}

Status
parseNumber(const char*& p, const char* e, Scalar& out)
{
    const char* a = p;
    unsigned long long x = 0;
    bool negative = false;
    int c, n;

    if (p < e && *p == '-') {
        ++p;
        if (p >= e || !isdigit(*p & 255))
            return bad_negative;
        negative = true;
    }
    if (p >= e)
        return unexpected_eof;

    if (*p == '0') {
        ++p;
        if (p < e) {
            if (*p == '.') {
                if (p + 1 == e || !isdigit(p[1] & 255))
                    return bad_double;
                goto UseDouble;
            } else if (*p == 'e' || *p == 'E') {
                goto UseDouble;
            } else if (isdigit(*p & 255)) {
                return unexpected_octal;
            }
        }
        out.type = Type::Int;
        out.int_value = 0;
        return success;
    }

    for (; p < e; ++p) {
        c = *p & 255;
        if (isdigit(c)) {
            if (ckd_mul(&x, x, 10) || ckd_add(&x, x, c - '0'))
                goto UseDouble;
        } else if (c == '.') {
            if (p + 1 == e || !isdigit(p[1] & 255))
                return bad_double;
            goto UseDouble;
        } else if (c == 'e' || c == 'E') {
            goto UseDouble;
        } else {
            break;
        }
    }

    if (negative) {
        if (x > (unsigned long long)LLONG_MAX + 1)
            goto UseDouble;
        out.type = Type::Int;
        out.int_value = (long long)(0 - x);
    } else if (x > (unsigned long long)LLONG_MAX) {
        out.type = Type::Uint;
        out.uint_value = x;
    } else {
        out.type = Type::Int;
        out.int_value = (long long)x;
    }
    return success;

UseDouble:
    out.type = Type::Float;
    out.float_value = kJsonToDouble.StringToDouble(a, e - a, &n);
    if (n <= 0)
        return bad_double;
    if (a + n < e && (a[n] == 'e' || a[n] == 'E'))
        return bad_exponent;
    p = a + n;
    return success;
}

static Status
MatchLiteral(const char*& p, const char* e)
{
    switch (*p) {
        case 'n':
            if (p + 4 <= e && READ32LE(p) == READ32LE("null")) {
                p += 4;
                return success;
            }
            break;
        case 't':
            if (p + 4 <= e && READ32LE(p) == READ32LE("true")) {
                p += 4;
                return success;
            }
            break;
        case 'f':
            if (p + 5 <= e && READ32LE(p + 1) == READ32LE("alse")) {
                p += 5;
                return success;
            }
            break;
        default:
            break;
    }
    return illegal_character;
}

Status
skipValue(const char*& p, const char* e)
{
    Scalar number;
    Status status;
    size_t depth;
    skipWhitespace(p, e);
    if (p >= e)
        return unexpected_eof;
    switch (*p & 255) {
        case '"':
            ++p;
            return skipString(p, e);
        case '[':
        case '{':
            for (depth = 0; p < e;) {
                switch (*p++ & 255) {
                    case '"':
                        if ((status = skipString(p, e)) != success)
                            return status;
                        break;
                    case '[':
                    case '{':
                        ++depth;
                        break;
                    case ']':
                    case '}':
                        if (!--depth)
                            return success;
                        break;
                    default:
                        break;
                }
            }
            return unexpected_eof;
        case 'n':
        case 't':
        case 'f':
            return MatchLiteral(p, e);
        case '-':
        case '0':
        case '1':
        case '2':
        case '3':
        case '4':
        case '5':
        case '6':
        case '7':
        case '8':
        case '9':
            return parseNumber(p, e, number);
        default:
            return illegal_character;
    }
}

Status
classify(const char* p, const char* e, Type& type)
{
    Scalar number;
    Status status;
    if (p >= e)
        return unexpected_eof;
    switch (*p & 255) {
        case '"':
            type = Type::String;
            return success;
        case '[':
            type = Type::Array;
            return success;
        case '{':
            type = Type::Object;
            return success;
        case 'n':
            type = Type::Null;
            return success;
        case 't':
        case 'f':
            type = Type::Bool;
            return success;
        case '-':
        case '0':
        case '1':
        case '2':
        case '3':
        case '4':
        case '5':
        case '6':
        case '7':
        case '8':
        case '9':
            if ((status = parseNumber(p, e, number)) != success)
                return status;
            type = number.type;
            return success;
        default:
            return illegal_character;
    }
}

Status
parseScalar(const char* p, const char* e, Scalar& out)
{
    Status status;
    if (p >= e)
        return unexpected_eof;
    switch (*p & 255) {
        case '"':
            ++p;
            out.type = Type::String;
            out.string_value.clear();
            status = parseString(p, e, out.string_value);
            break;
        case 'n':
            out.type = Type::Null;
            status = MatchLiteral(p, e);
            break;
        case 't':
        case 'f':
            out.type = Type::Bool;
            out.bool_value = *p == 't';
            status = MatchLiteral(p, e);
            break;
        case '-':
        case '0':
        case '1':
        case '2':
        case '3':
        case '4':
        case '5':
        case '6':
        case '7':
        case '8':
        case '9':
            status = parseNumber(p, e, out);
            break;
        default:
            return illegal_character;
    }
    if (status == success && p != e)
        return trailing_content;
    return status;
}

namespace {

// Strict recursive-descent parser driven by a context bitmask of what may
// legally come next. With a null tape it only validates.
class TapeBuilder
{
  public:
    TapeBuilder(const char* e, Tape* tape) : e_(e), tape_(tape)
    {
    }

    Status parse(const char*& p, int context, int depth, Type& type);

  private:
    const char* e_;
    Tape* tape_;
    std::string scratch_;

    size_t push(Type type)
    {
        if (!tape_)
            return 0;
        size_t index = tape_->entries.size();
        tape_->entries.emplace_back();
        tape_->entries[index].type = type;
        tape_->entries[index].next = index + 1;
        return index;
    }

    void close(size_t index)
    {
        if (tape_)
            tape_->entries[index].next = tape_->entries.size();
    }

    TapeEntry* last()
    {
        return tape_ ? &tape_->entries.back() : nullptr;
    }
};

Status
TapeBuilder::parse(const char*& p, int context, int depth, Type& type)
{
    TapeEntry* entry;
    Status status;
    Type child;
    size_t index;
    int c;

    // An empty container at the limit is fine; any value below it is not.
    if (depth > kMaxDepth) {
        skipWhitespace(p, e_);
        if (p >= e_ || (*p != ']' && *p != '}'))
            return depth_exceeded;
    }

    while (p < e_) {
        switch ((c = *p++ & 255)) {
            case ' ': // spaces
            case '\n':
            case '\r':
            case '\t':
                break;

            case ',': // present in list and object
                if (context & COMMA) {
                    context = 0;
                    break;
                }
                return unexpected_comma;

            case ':': // present only in object after key
                if (context & COLON) {
                    context = 0;
                    break;
                }
                return unexpected_colon;

            case 'n': // null
            case 't': // true
            case 'f': // false
                if (context & (KEY | COLON | COMMA))
                    goto OnColonCommaKey;
                --p;
                type = c == 'n' ? Type::Null : Type::Bool;
                if ((status = MatchLiteral(p, e_)) != success)
                    return status;
                push(type);
                if ((entry = last()))
                    entry->bool_value = c == 't';
                return success;

            default:
                return illegal_character;

            OnColonCommaKey:
                if (context & KEY)
                    return object_key_must_be_string;
            OnColonComma:
                if (context & COLON)
                    return missing_colon;
                return missing_comma;

            case '-': // number
            case '0':
            case '1':
            case '2':
            case '3':
            case '4':
            case '5':
            case '6':
            case '7':
            case '8':
            case '9': {
                if (context & (COLON | COMMA | KEY))
                    goto OnColonCommaKey;
                Scalar number;
                --p;
                if ((status = parseNumber(p, e_, number)) != success)
                    return status;
                type = number.type;
                push(type);
                if ((entry = last())) {
                    if (type == Type::Int)
                        entry->int_value = number.int_value;
                    else if (type == Type::Uint)
                        entry->uint_value = number.uint_value;
                    else
                        entry->float_value = number.float_value;
                }
                return success;
            }

            case '[': // array
                if (context & (COLON | COMMA | KEY))
                    goto OnColonCommaKey;
                index = push(Type::Array);
                for (context = ARRAY;;) {
                    status = parse(p, context, depth + 1, child);
                    if (status == absent_value)
                        break;
                    if (status != success)
                        return status;
                    context = ARRAY | COMMA;
                }
                close(index);
                type = Type::Array;
                return success;

            case ']':
                if (context & ARRAY)
                    return absent_value;
                return unexpected_end_of_array;

            case '}':
                if (context & OBJECT)
                    return absent_value;
                return unexpected_end_of_object;

            case '{': // object
                if (context & (COLON | COMMA | KEY))
                    goto OnColonCommaKey;
                index = push(Type::Object);
                for (context = KEY | OBJECT;;) {
                    status = parse(p, context, depth + 1, child);
                    if (status == absent_value)
                        break;
                    if (status != success)
                        return status;
                    if (child != Type::String)
                        return object_key_must_be_string;
                    status = parse(p, COLON, depth + 1, child);
                    if (status == absent_value)
                        return object_missing_value;
                    if (status != success)
                        return status;
                    context = KEY | COMMA | OBJECT;
                }
                close(index);
                type = Type::Object;
                return success;

            case '"': // string
                if (context & (COLON | COMMA))
                    goto OnColonComma;
                scratch_.clear();
                if ((status = parseString(p, e_, scratch_)) != success)
                    return status;
                type = Type::String;
                push(type);
                if ((entry = last())) {
                    entry->str.offset = tape_->strings.size();
                    entry->str.length = scratch_.size();
                    tape_->strings += scratch_;
                }
                return success;
        }
    }
    if (!depth)
        return absent_value;
    return unexpected_eof;
}

} // namespace

Status
scanDocument(const char* p, const char* e, Tape* tape, Span& root)
{
    TapeBuilder builder(e, tape);
    Status status;
    Type type;
    const char* begin;
    if (tape)
        tape->clear();
    begin = p;
    skipWhitespace(begin, e);
    if ((status = builder.parse(p, 0, 0, type)) != success)
        return status;
    root.type = type;
    root.begin = begin;
    root.end = p;
    skipWhitespace(p, e);
    if (p != e)
        return trailing_content;
    return success;
}

} // namespace detail
} // namespace sift
