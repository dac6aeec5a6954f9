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

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Guard limits. Override at build time with -D to change them.
#ifndef SIFT_MAX_INPUT_SIZE
#define SIFT_MAX_INPUT_SIZE (64 * 1024 * 1024)
#endif
#ifndef SIFT_MAX_DEPTH
#define SIFT_MAX_DEPTH 512
#endif
#ifndef SIFT_MAX_PATH_SEGMENTS
#define SIFT_MAX_PATH_SEGMENTS 256
#endif

namespace sift {

constexpr size_t kMaxInputSize = SIFT_MAX_INPUT_SIZE;
constexpr int kMaxDepth = SIFT_MAX_DEPTH;
constexpr size_t kMaxPathSegments = SIFT_MAX_PATH_SEGMENTS;

enum Status
{
    success,
    bad_double,
    absent_value,
    bad_negative,
    bad_exponent,
    missing_comma,
    missing_colon,
    malformed_utf8,
    depth_exceeded,
    unexpected_eof,
    overlong_ascii,
    unexpected_comma,
    unexpected_colon,
    unexpected_octal,
    trailing_content,
    illegal_character,
    overlong_utf8_0x7ff,
    overlong_utf8_0xffff,
    object_missing_value,
    illegal_utf8_character,
    invalid_unicode_escape,
    utf16_surrogate_in_utf8,
    unexpected_end_of_array,
    invalid_escape_character,
    utf8_exceeds_utf16_range,
    unexpected_end_of_string,
    unexpected_end_of_object,
    object_key_must_be_string,
    c1_control_code_in_string,
    non_del_c0_control_code_in_string,
    input_too_large,
    invalid_pointer,
    path_too_long,
    invalid_index,
    path_not_found,
    type_mismatch,
    unknown_type,
    io_error,
};

const char*
StatusToString(Status status);

// Materialized JSON value handed back to callers.
//
// Objects keep their members in document order. Unsigned integers that do
// not fit in a signed 64-bit integer are stored as Double.
class Value
{
  public:
    enum Type
    {
        Null,
        Bool,
        Long,
        Double,
        String,
        Array,
        Object
    };

    typedef std::vector<Value> ArrayType;
    typedef std::vector<std::pair<std::string, Value>> ObjectType;

  private:
    Type type_;
    union
    {
        bool bool_value;
        long long long_value;
        double double_value;
        std::string string_value;
        ArrayType array_value;
        ObjectType object_value;
    };

  public:
    static std::pair<Status, Value> parse(const std::string& s);

    Value(const Value&);
    Value(Value&&);
    Value(unsigned long);
    Value(unsigned long long);
    Value(const char*);
    Value(const std::string&);
    Value(std::string&&);
    ~Value();

    Value(const std::nullptr_t = nullptr) : type_(Null)
    {
    }

    Value(bool value) : type_(Bool), bool_value(value)
    {
    }

    Value(int value) : type_(Long), long_value(value)
    {
    }

    Value(long value) : type_(Long), long_value(value)
    {
    }

    Value(long long value) : type_(Long), long_value(value)
    {
    }

    Value(unsigned value) : type_(Long), long_value(value)
    {
    }

    Value(double value) : type_(Double), double_value(value)
    {
    }

    Type getType() const
    {
        return type_;
    }

    bool isNull() const
    {
        return type_ == Null;
    }

    bool isBool() const
    {
        return type_ == Bool;
    }

    bool isNumber() const
    {
        return type_ == Long || type_ == Double;
    }

    bool isLong() const
    {
        return type_ == Long;
    }

    bool isDouble() const
    {
        return type_ == Double;
    }

    bool isString() const
    {
        return type_ == String;
    }

    bool isArray() const
    {
        return type_ == Array;
    }

    bool isObject() const
    {
        return type_ == Object;
    }

    bool getBool() const;
    long long getLong() const;
    double getDouble() const;
    double getNumber() const;
    std::string& getString();
    const std::string& getString() const;
    ArrayType& getArray();
    const ArrayType& getArray() const;
    ObjectType& getObject();
    const ObjectType& getObject() const;

    size_t size() const;
    bool contains(const std::string& key) const;
    const Value* find(const std::string& key) const;
    Value* find(const std::string& key);

    void setArray();
    void setObject();
    void clear();

    Value& operator=(const Value&);
    Value& operator=(Value&&);
    Value& operator[](size_t index);
    Value& operator[](const std::string& key);

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const
    {
        return !(*this == other);
    }
};

// Error raised by the throwing API. kind() is the category callers branch
// on; status() is the precise reason.
class Error : public std::runtime_error
{
  public:
    enum Kind
    {
        ParseError,
        InvalidPointer,
        PathTooLong,
        InvalidIndex,
        KeyNotFound,
        TypeError,
        IoError
    };

    Error(Kind kind, Status status, const std::string& detail);

    Kind kind() const
    {
        return kind_;
    }

    Status status() const
    {
        return status_;
    }

    static const char* KindToString(Kind kind);

  private:
    Kind kind_;
    Status status_;
};

struct PathStep
{
    enum class Kind
    {
        Key,
        Index
    };

    Kind kind = Kind::Key;
    std::string key;
    size_t index = 0;

    static PathStep makeKey(std::string key);
    static PathStep makeIndex(size_t index);

    bool operator==(const PathStep& other) const;
};

// Parses an RFC 6901 pointer. The empty pointer yields no steps.
Status
parsePointer(const std::string& pointer, std::vector<PathStep>& steps);

// Lazy cursor over a shared, immutable document.
//
// Navigation only records path steps. Nothing is parsed until one of the
// hydration methods is called, and each of those walks the document again
// from its root.
class Query
{
  public:
    explicit Query(std::string json);

    Query pointer(const std::string& ptr) const;
    Query get(const std::string& key) const;
    Query index(long long i) const;

    std::string getString() const;
    long long getLong() const;
    double getDouble() const;
    bool getBool() const;
    bool isNull() const;
    bool isArray() const;
    bool isObject() const;
    std::string typeName() const;
    std::string raw() const;
    Value value() const;

    const std::vector<PathStep>& path() const
    {
        return path_;
    }

    const std::string& document() const
    {
        return *json_;
    }

  private:
    Query(std::shared_ptr<const std::string> json, std::vector<PathStep> path);

    std::shared_ptr<const std::string> json_;
    std::vector<PathStep> path_;
};

Value
decode(const std::string& json);

Value
getByPointer(const std::string& json, const std::string& pointer);

bool
isValid(const std::string& json);

Query
query(std::string json);

} // namespace sift
