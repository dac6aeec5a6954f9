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

#include "sift.h"
#include "materializer.h"
#include "resolver.h"
#include "scanner.h"

#include <cstdlib>

namespace sift {

static const char*
KindToPrefix(Error::Kind kind)
{
    switch (kind) {
        case Error::ParseError:
            return "JSON parse error: ";
        case Error::InvalidPointer:
            return "Invalid JSON pointer: ";
        case Error::PathTooLong:
            return "Path too long: ";
        case Error::InvalidIndex:
            return "Invalid index: ";
        case Error::KeyNotFound:
            return "Key not found: ";
        case Error::TypeError:
            return "Type conversion error: ";
        case Error::IoError:
            return "IO error: ";
        default:
            SIFT_LOGIC_ERROR("Unhandled error kind.");
    }
}

Error::Error(Kind kind, Status status, const std::string& detail)
  : std::runtime_error(KindToPrefix(kind) + detail)
  , kind_(kind)
  , status_(status)
{
}

const char*
Error::KindToString(Kind kind)
{
    switch (kind) {
        case ParseError:
            return "ParseError";
        case InvalidPointer:
            return "InvalidPointer";
        case PathTooLong:
            return "PathTooLong";
        case InvalidIndex:
            return "InvalidIndex";
        case KeyNotFound:
            return "KeyNotFound";
        case TypeError:
            return "TypeError";
        case IoError:
            return "IoError";
        default:
            SIFT_LOGIC_ERROR("Unhandled error kind.");
    }
}

// Turns a failed Status from the parsing layer into an exception. The
// detail text never includes caller-supplied keys or pointers.
[[noreturn]] static void
Raise(Status status, size_t size = 0)
{
    switch (status) {
        case input_too_large:
            throw Error(Error::ParseError,
                        status,
                        "Input size (" + std::to_string(size) +
                          " bytes) exceeds maximum allowed (" +
                          std::to_string(kMaxInputSize) + " bytes)");
        case depth_exceeded:
            throw Error(Error::ParseError,
                        status,
                        "Maximum nesting depth (" + std::to_string(kMaxDepth) +
                          ") exceeded");
        case invalid_pointer:
            throw Error(Error::InvalidPointer,
                        status,
                        "Pointer must start with '/' or be empty");
        case path_too_long:
            throw Error(Error::PathTooLong,
                        status,
                        "Path has too many segments (max " +
                          std::to_string(kMaxPathSegments) + ")");
        case path_not_found:
            throw Error(Error::KeyNotFound, status, "Path not found");
        case unknown_type:
            throw Error(Error::TypeError, status, "Unknown JSON value type");
        case invalid_index:
        case type_mismatch:
        case io_error:
        case success:
            SIFT_LOGIC_ERROR("Status needs a caller-specific message.");
        default:
            throw Error(Error::ParseError, status, StatusToString(status));
    }
}

// Steps that do not apply are KeyNotFound; malformed bytes met on the
// route stay ParseError with their precise status.
static detail::Span
Resolve(const std::string& json, const std::vector<PathStep>& path)
{
    detail::Span span;
    Status status;
    if ((status = detail::resolve(json, path, span)) != success)
        Raise(status, json.size());
    return span;
}

static void
CheckType(bool ok, const char* what)
{
    if (!ok)
        throw Error(Error::TypeError,
                    type_mismatch,
                    std::string("Value is not ") + what);
}

static detail::Scalar
ParseScalar(const detail::Span& span)
{
    detail::Scalar scalar;
    Status status;
    if ((status = detail::parseScalar(span.begin, span.end, scalar)) !=
        success)
        Raise(status);
    return scalar;
}

static Value
Materialize(const detail::Span& span)
{
    Value value;
    Status status;
    if ((status = detail::materializeSpan(span, value)) != success)
        Raise(status);
    return value;
}

Query::Query(std::string json)
  : json_(std::make_shared<const std::string>(std::move(json)))
{
}

Query::Query(std::shared_ptr<const std::string> json,
             std::vector<PathStep> path)
  : json_(std::move(json)), path_(std::move(path))
{
}

Query
Query::pointer(const std::string& ptr) const
{
    std::vector<PathStep> steps;
    Status status;
    if (ptr.empty())
        return *this;
    if ((status = parsePointer(ptr, steps)) != success) {
        if (ptr[0] == '/')
            throw Error(Error::InvalidPointer,
                        status,
                        "Pointer has too many segments (max " +
                          std::to_string(kMaxPathSegments) + ")");
        Raise(status);
    }
    if (path_.size() + steps.size() > kMaxPathSegments)
        Raise(path_too_long);
    std::vector<PathStep> path;
    path.reserve(path_.size() + steps.size());
    path = path_;
    for (PathStep& step : steps)
        path.push_back(std::move(step));
    return Query(json_, std::move(path));
}

Query
Query::get(const std::string& key) const
{
    if (path_.size() >= kMaxPathSegments)
        Raise(path_too_long);
    std::vector<PathStep> path;
    path.reserve(path_.size() + 1);
    path = path_;
    path.push_back(PathStep::makeKey(key));
    return Query(json_, std::move(path));
}

Query
Query::index(long long i) const
{
    if (i < 0)
        throw Error(Error::InvalidIndex,
                    invalid_index,
                    "Array index must be non-negative, got " +
                      std::to_string(i));
    if (path_.size() >= kMaxPathSegments)
        Raise(path_too_long);
    std::vector<PathStep> path;
    path.reserve(path_.size() + 1);
    path = path_;
    path.push_back(PathStep::makeIndex((size_t)i));
    return Query(json_, std::move(path));
}

std::string
Query::getString() const
{
    detail::Span span = Resolve(*json_, path_);
    CheckType(span.type == detail::Type::String, "a string");
    return std::move(ParseScalar(span).string_value);
}

long long
Query::getLong() const
{
    detail::Span span = Resolve(*json_, path_);
    CheckType(span.type == detail::Type::Int, "an integer");
    return ParseScalar(span).int_value;
}

double
Query::getDouble() const
{
    detail::Span span = Resolve(*json_, path_);
    detail::Scalar scalar;
    CheckType(span.type == detail::Type::Int ||
                span.type == detail::Type::Uint ||
                span.type == detail::Type::Float,
              "a float");
    scalar = ParseScalar(span);
    switch (scalar.type) {
        case detail::Type::Int:
            return scalar.int_value;
        case detail::Type::Uint:
            return scalar.uint_value;
        default:
            return scalar.float_value;
    }
}

bool
Query::getBool() const
{
    detail::Span span = Resolve(*json_, path_);
    CheckType(span.type == detail::Type::Bool, "a boolean");
    return ParseScalar(span).bool_value;
}

bool
Query::isNull() const
{
    return Resolve(*json_, path_).type == detail::Type::Null;
}

bool
Query::isArray() const
{
    return Resolve(*json_, path_).type == detail::Type::Array;
}

bool
Query::isObject() const
{
    return Resolve(*json_, path_).type == detail::Type::Object;
}

std::string
Query::typeName() const
{
    return detail::TypeToString(Resolve(*json_, path_).type);
}

std::string
Query::raw() const
{
    detail::Span span = Resolve(*json_, path_);
    return std::string(span.begin, span.end);
}

Value
Query::value() const
{
    return Materialize(Resolve(*json_, path_));
}

Value
decode(const std::string& json)
{
    std::pair<Status, Value> res = Value::parse(json);
    if (res.first != success)
        Raise(res.first, json.size());
    return std::move(res.second);
}

Value
getByPointer(const std::string& json, const std::string& pointer)
{
    std::vector<PathStep> steps;
    Status status;
    if (json.size() > kMaxInputSize)
        Raise(input_too_large, json.size());
    if (pointer.empty())
        return decode(json);
    if ((status = parsePointer(pointer, steps)) != success) {
        if (pointer[0] == '/')
            throw Error(Error::InvalidPointer,
                        status,
                        "Pointer has too many segments (max " +
                          std::to_string(kMaxPathSegments) + ")");
        Raise(status);
    }
    return Materialize(Resolve(json, steps));
}

bool
isValid(const std::string& json)
{
    detail::Span root;
    if (json.size() > kMaxInputSize)
        return false;
    return detail::scanDocument(
             json.data(), json.data() + json.size(), nullptr, root) ==
           success;
}

Query
query(std::string json)
{
    return Query(std::move(json));
}

const char*
StatusToString(Status status)
{
    switch (status) {
        case success:
            return "success";
        case bad_double:
            return "bad_double";
        case absent_value:
            return "absent_value";
        case bad_negative:
            return "bad_negative";
        case bad_exponent:
            return "bad_exponent";
        case missing_comma:
            return "missing_comma";
        case missing_colon:
            return "missing_colon";
        case malformed_utf8:
            return "malformed_utf8";
        case depth_exceeded:
            return "depth_exceeded";
        case unexpected_eof:
            return "unexpected_eof";
        case overlong_ascii:
            return "overlong_ascii";
        case unexpected_comma:
            return "unexpected_comma";
        case unexpected_colon:
            return "unexpected_colon";
        case unexpected_octal:
            return "unexpected_octal";
        case trailing_content:
            return "trailing_content";
        case illegal_character:
            return "illegal_character";
        case overlong_utf8_0x7ff:
            return "overlong_utf8_0x7ff";
        case overlong_utf8_0xffff:
            return "overlong_utf8_0xffff";
        case object_missing_value:
            return "object_missing_value";
        case illegal_utf8_character:
            return "illegal_utf8_character";
        case invalid_unicode_escape:
            return "invalid_unicode_escape";
        case utf16_surrogate_in_utf8:
            return "utf16_surrogate_in_utf8";
        case unexpected_end_of_array:
            return "unexpected_end_of_array";
        case invalid_escape_character:
            return "invalid_escape_character";
        case utf8_exceeds_utf16_range:
            return "utf8_exceeds_utf16_range";
        case unexpected_end_of_string:
            return "unexpected_end_of_string";
        case unexpected_end_of_object:
            return "unexpected_end_of_object";
        case object_key_must_be_string:
            return "object_key_must_be_string";
        case c1_control_code_in_string:
            return "c1_control_code_in_string";
        case non_del_c0_control_code_in_string:
            return "non_del_c0_control_code_in_string";
        case input_too_large:
            return "input_too_large";
        case invalid_pointer:
            return "invalid_pointer";
        case path_too_long:
            return "path_too_long";
        case invalid_index:
            return "invalid_index";
        case path_not_found:
            return "path_not_found";
        case type_mismatch:
            return "type_mismatch";
        case unknown_type:
            return "unknown_type";
        case io_error:
            return "io_error";
        default:
            SIFT_LOGIC_ERROR("Unhandled status value.");
    }
}

} // namespace sift
