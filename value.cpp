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
#include "scanner.h"

#include <climits>
#include <cstdlib>
#include <new>

namespace sift {

Value::Value(unsigned long value)
{
    if (value <= LLONG_MAX) {
        type_ = Long;
        long_value = value;
    } else {
        type_ = Double;
        double_value = value;
    }
}

Value::Value(unsigned long long value)
{
    if (value <= LLONG_MAX) {
        type_ = Long;
        long_value = value;
    } else {
        type_ = Double;
        double_value = value;
    }
}

Value::Value(const char* value)
{
    if (value) {
        type_ = String;
        new (&string_value) std::string(value);
    } else {
        type_ = Null;
    }
}

Value::Value(const std::string& value) : type_(String), string_value(value)
{
}

Value::Value(std::string&& value)
  : type_(String), string_value(std::move(value))
{
}

Value::~Value()
{
    if (type_ >= String)
        clear();
}

void
Value::clear()
{
    switch (type_) {
        case String:
            string_value.~basic_string();
            break;
        case Array:
            array_value.~ArrayType();
            break;
        case Object:
            object_value.~ObjectType();
            break;
        default:
            break;
    }
    type_ = Null;
}

Value::Value(const Value& other) : type_(other.type_)
{
    switch (type_) {
        case Null:
            break;
        case Bool:
            bool_value = other.bool_value;
            break;
        case Long:
            long_value = other.long_value;
            break;
        case Double:
            double_value = other.double_value;
            break;
        case String:
            new (&string_value) std::string(other.string_value);
            break;
        case Array:
            new (&array_value) ArrayType(other.array_value);
            break;
        case Object:
            new (&object_value) ObjectType(other.object_value);
            break;
        default:
            SIFT_LOGIC_ERROR("Unhandled value type.");
    }
}

Value&
Value::operator=(const Value& other)
{
    if (this != &other) {
        // Copy first: other may live inside this value.
        Value copy(other);
        *this = std::move(copy);
    }
    return *this;
}

Value::Value(Value&& other) : type_(other.type_)
{
    switch (type_) {
        case Null:
            break;
        case Bool:
            bool_value = other.bool_value;
            break;
        case Long:
            long_value = other.long_value;
            break;
        case Double:
            double_value = other.double_value;
            break;
        case String:
            new (&string_value) std::string(std::move(other.string_value));
            break;
        case Array:
            new (&array_value) ArrayType(std::move(other.array_value));
            break;
        case Object:
            new (&object_value) ObjectType(std::move(other.object_value));
            break;
        default:
            SIFT_LOGIC_ERROR("Unhandled value type.");
    }
    other.clear();
}

Value&
Value::operator=(Value&& other)
{
    if (this != &other) {
        Value moved(std::move(other));
        if (type_ >= String)
            clear();
        type_ = moved.type_;
        switch (type_) {
            case Null:
                break;
            case Bool:
                bool_value = moved.bool_value;
                break;
            case Long:
                long_value = moved.long_value;
                break;
            case Double:
                double_value = moved.double_value;
                break;
            case String:
                new (&string_value) std::string(std::move(moved.string_value));
                break;
            case Array:
                new (&array_value) ArrayType(std::move(moved.array_value));
                break;
            case Object:
                new (&object_value) ObjectType(std::move(moved.object_value));
                break;
            default:
                SIFT_LOGIC_ERROR("Unhandled value type.");
        }
    }
    return *this;
}

double
Value::getNumber() const
{
    switch (type_) {
        case Long:
            return long_value;
        case Double:
            return double_value;
        default:
            SIFT_LOGIC_ERROR("Value is not a number.");
    }
}

long long
Value::getLong() const
{
    switch (type_) {
        case Long:
            return long_value;
        default:
            SIFT_LOGIC_ERROR("Value is not a long.");
    }
}

bool
Value::getBool() const
{
    switch (type_) {
        case Bool:
            return bool_value;
        default:
            SIFT_LOGIC_ERROR("Value is not a bool.");
    }
}

double
Value::getDouble() const
{
    switch (type_) {
        case Double:
            return double_value;
        default:
            SIFT_LOGIC_ERROR("Value is not a floating-point number.");
    }
}

std::string&
Value::getString()
{
    switch (type_) {
        case String:
            return string_value;
        default:
            SIFT_LOGIC_ERROR("Value is not a string.");
    }
}

const std::string&
Value::getString() const
{
    switch (type_) {
        case String:
            return string_value;
        default:
            SIFT_LOGIC_ERROR("Value is not a string.");
    }
}

Value::ArrayType&
Value::getArray()
{
    switch (type_) {
        case Array:
            return array_value;
        default:
            SIFT_LOGIC_ERROR("Value is not an array.");
    }
}

const Value::ArrayType&
Value::getArray() const
{
    switch (type_) {
        case Array:
            return array_value;
        default:
            SIFT_LOGIC_ERROR("Value is not an array.");
    }
}

Value::ObjectType&
Value::getObject()
{
    switch (type_) {
        case Object:
            return object_value;
        default:
            SIFT_LOGIC_ERROR("Value is not an object.");
    }
}

const Value::ObjectType&
Value::getObject() const
{
    switch (type_) {
        case Object:
            return object_value;
        default:
            SIFT_LOGIC_ERROR("Value is not an object.");
    }
}

void
Value::setArray()
{
    if (type_ >= String)
        clear();
    type_ = Array;
    new (&array_value) ArrayType();
}

void
Value::setObject()
{
    if (type_ >= String)
        clear();
    type_ = Object;
    new (&object_value) ObjectType();
}

size_t
Value::size() const
{
    switch (type_) {
        case Array:
            return array_value.size();
        case Object:
            return object_value.size();
        default:
            return 0;
    }
}

const Value*
Value::find(const std::string& key) const
{
    if (!isObject())
        return nullptr;
    for (const auto& member : object_value)
        if (member.first == key)
            return &member.second;
    return nullptr;
}

Value*
Value::find(const std::string& key)
{
    if (!isObject())
        return nullptr;
    for (auto& member : object_value)
        if (member.first == key)
            return &member.second;
    return nullptr;
}

bool
Value::contains(const std::string& key) const
{
    return find(key) != nullptr;
}

Value&
Value::operator[](size_t index)
{
    if (!isArray())
        setArray();
    if (index >= array_value.size())
        array_value.resize(index + 1);
    return array_value[index];
}

Value&
Value::operator[](const std::string& key)
{
    Value* found;
    if (!isObject())
        setObject();
    if ((found = find(key)))
        return *found;
    object_value.emplace_back(key, nullptr);
    return object_value.back().second;
}

bool
Value::operator==(const Value& other) const
{
    if (type_ != other.type_)
        return false;
    switch (type_) {
        case Null:
            return true;
        case Bool:
            return bool_value == other.bool_value;
        case Long:
            return long_value == other.long_value;
        case Double:
            return double_value == other.double_value;
        case String:
            return string_value == other.string_value;
        case Array:
            return array_value == other.array_value;
        case Object:
            return object_value == other.object_value;
        default:
            SIFT_LOGIC_ERROR("Unhandled value type.");
    }
}

std::pair<Status, Value>
Value::parse(const std::string& s)
{
    std::pair<Status, Value> res;
    detail::Tape tape;
    detail::Span root;
    if (s.size() > kMaxInputSize) {
        res.first = input_too_large;
        return res;
    }
    res.first = detail::scanDocument(s.data(), s.data() + s.size(), &tape, root);
    if (res.first == success)
        res.first = detail::materializeTape(tape, res.second);
    if (res.first != success)
        res.second.clear();
    return res;
}

} // namespace sift
