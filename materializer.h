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

#include "scanner.h"

#include <string>
#include <unordered_map>
#include <utility>

namespace sift {
namespace detail {

// Node over an unparsed span. Children are located and validated as they
// are visited, so a subtree that is never visited is never parsed.
class LazyNode
{
  public:
    explicit LazyNode(const Span& span) : span_(span)
    {
    }

    Type type() const
    {
        return span_.type;
    }

    Status scalar(Scalar& out) const
    {
        return parseScalar(span_.begin, span_.end, out);
    }

    template<typename F>
    Status forEachElement(F&& visit) const
    {
        const char* p = span_.begin + 1;
        const char* e = span_.end;
        Status status;
        Span item;
        skipWhitespace(p, e);
        if (p < e && *p == ']')
            return success;
        for (;;) {
            if ((status = next(p, e, item)) != success)
                return status;
            if ((status = visit(LazyNode(item))) != success)
                return status;
            skipWhitespace(p, e);
            if (p >= e)
                return unexpected_eof;
            if (*p == ']')
                return success;
            if (*p != ',')
                return separator(*p);
            ++p;
            skipWhitespace(p, e);
            if (p < e && *p == ']')
                return unexpected_end_of_array;
        }
    }

    template<typename F>
    Status forEachMember(F&& visit) const
    {
        const char* p = span_.begin + 1;
        const char* e = span_.end;
        Status status;
        Span item;
        skipWhitespace(p, e);
        if (p < e && *p == '}')
            return success;
        for (;;) {
            std::string key;
            if (p >= e)
                return unexpected_eof;
            if (*p == ',')
                return unexpected_comma;
            if (*p != '"')
                return object_key_must_be_string;
            ++p;
            if ((status = parseString(p, e, key)) != success)
                return status;
            skipWhitespace(p, e);
            if (p >= e)
                return unexpected_eof;
            if (*p != ':')
                return missing_colon;
            ++p;
            skipWhitespace(p, e);
            if (p < e && (*p == '}' || *p == ','))
                return object_missing_value;
            if ((status = next(p, e, item)) != success)
                return status;
            if ((status = visit(std::move(key), LazyNode(item))) != success)
                return status;
            skipWhitespace(p, e);
            if (p >= e)
                return unexpected_eof;
            if (*p == '}')
                return success;
            if (*p != ',')
                return separator(*p);
            ++p;
            skipWhitespace(p, e);
            if (p < e && *p == '}')
                return unexpected_end_of_object;
        }
    }

  private:
    Span span_;

    static Status next(const char*& p, const char* e, Span& item)
    {
        Status status;
        skipWhitespace(p, e);
        if (p < e && *p == ',')
            return unexpected_comma;
        item.begin = p;
        if ((status = classify(p, e, item.type)) != success)
            return status;
        if ((status = skipValue(p, e)) != success)
            return status;
        item.end = p;
        return success;
    }

    static Status separator(char c)
    {
        switch (c) {
            case ']':
                return unexpected_end_of_array;
            case '}':
                return unexpected_end_of_object;
            case ':':
                return unexpected_colon;
            default:
                return missing_comma;
        }
    }
};

// Node over a tape recorded by scanDocument. Everything was validated when
// the tape was built.
class TapeNode
{
  public:
    TapeNode(const Tape& tape, size_t index) : tape_(&tape), index_(index)
    {
    }

    Type type() const
    {
        return entry().type;
    }

    Status scalar(Scalar& out) const
    {
        const TapeEntry& x = entry();
        out.type = x.type;
        switch (x.type) {
            case Type::Null:
                return success;
            case Type::Bool:
                out.bool_value = x.bool_value;
                return success;
            case Type::Int:
                out.int_value = x.int_value;
                return success;
            case Type::Uint:
                out.uint_value = x.uint_value;
                return success;
            case Type::Float:
                out.float_value = x.float_value;
                return success;
            case Type::String:
                out.string_value = text(x);
                return success;
            default:
                return unknown_type;
        }
    }

    template<typename F>
    Status forEachElement(F&& visit) const
    {
        Status status;
        const std::vector<TapeEntry>& entries = tape_->entries;
        for (size_t i = index_ + 1; i < entries[index_].next;
             i = entries[i].next)
            if ((status = visit(TapeNode(*tape_, i))) != success)
                return status;
        return success;
    }

    template<typename F>
    Status forEachMember(F&& visit) const
    {
        Status status;
        const std::vector<TapeEntry>& entries = tape_->entries;
        for (size_t i = index_ + 1; i < entries[index_].next;
             i = entries[i + 1].next)
            if ((status = visit(text(entries[i]), TapeNode(*tape_, i + 1))) !=
                success)
                return status;
        return success;
    }

  private:
    const Tape* tape_;
    size_t index_;

    const TapeEntry& entry() const
    {
        return tape_->entries[index_];
    }

    std::string text(const TapeEntry& x) const
    {
        return tape_->strings.substr(x.str.offset, x.str.length);
    }
};

inline Status
convertScalar(Scalar& scalar, Value& out)
{
    switch (scalar.type) {
        case Type::Null:
            out = nullptr;
            return success;
        case Type::Bool:
            out = scalar.bool_value;
            return success;
        case Type::Int:
            out = scalar.int_value;
            return success;
        case Type::Uint:
            out = scalar.uint_value;
            return success;
        case Type::Float:
            out = scalar.float_value;
            return success;
        case Type::String:
            out = std::move(scalar.string_value);
            return success;
        default:
            return unknown_type;
    }
}

// Builds a Value from any node provider. Member order is preserved; when a
// key repeats, the later value replaces the earlier one in its original
// position.
template<typename Node>
Status
materialize(const Node& node, Value& out, int depth)
{
    if (depth > kMaxDepth)
        return depth_exceeded;
    switch (node.type()) {
        case Type::Null:
        case Type::Bool:
        case Type::Int:
        case Type::Uint:
        case Type::Float:
        case Type::String: {
            Scalar scalar;
            Status status;
            if ((status = node.scalar(scalar)) != success)
                return status;
            return convertScalar(scalar, out);
        }
        case Type::Array: {
            out.setArray();
            Value::ArrayType& array = out.getArray();
            return node.forEachElement([&](const Node& child) {
                array.emplace_back();
                return materialize(child, array.back(), depth + 1);
            });
        }
        case Type::Object: {
            out.setObject();
            Value::ObjectType& object = out.getObject();
            std::unordered_map<std::string, size_t> seen;
            return node.forEachMember(
              [&](std::string&& key, const Node& child) -> Status {
                  Value item;
                  Status status;
                  if ((status = materialize(child, item, depth + 1)) !=
                      success)
                      return status;
                  auto found = seen.find(key);
                  if (found != seen.end()) {
                      object[found->second].second = std::move(item);
                      return success;
                  }
                  seen.emplace(key, object.size());
                  object.emplace_back(std::move(key), std::move(item));
                  return success;
              });
        }
        default:
            return unknown_type;
    }
}

inline Status
materializeSpan(const Span& span, Value& out)
{
    return materialize(LazyNode(span), out, 0);
}

inline Status
materializeTape(const Tape& tape, Value& out)
{
    if (tape.entries.empty())
        return absent_value;
    return materialize(TapeNode(tape, 0), out, 0);
}

} // namespace detail
} // namespace sift
