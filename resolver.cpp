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

#include "resolver.h"

#include <cstring>

namespace sift {
namespace detail {

// p points just past the opening quote of a key. Keys without escapes are
// compared byte for byte; the rest are decoded first.
static Status
matchKey(const char*& p, const char* e, const std::string& key, bool& match)
{
    const char* a = p;
    std::string name;
    Status status;
    if ((status = skipString(p, e)) != success)
        return status;
    size_t n = p - 1 - a;
    if (!memchr(a, '\\', n)) {
        match = n == key.size() && !memcmp(a, key.data(), n);
        return success;
    }
    if ((status = parseString(a, e, name)) != success)
        return status;
    match = name == key;
    return success;
}

static Status
descendKey(const char*& p, const char* e, const std::string& key)
{
    Status status;
    bool match;
    if (*p != '{')
        return path_not_found;
    ++p;
    for (bool first = true;; first = false) {
        skipWhitespace(p, e);
        if (p >= e)
            return unexpected_eof;
        if (*p == '}')
            return first ? path_not_found : unexpected_end_of_object;
        if (*p == ',')
            return unexpected_comma;
        if (*p != '"')
            return object_key_must_be_string;
        ++p;
        if ((status = matchKey(p, e, key, match)) != success)
            return status;
        skipWhitespace(p, e);
        if (p >= e)
            return unexpected_eof;
        if (*p != ':')
            return missing_colon;
        ++p;
        skipWhitespace(p, e);
        if (p >= e)
            return unexpected_eof;
        if (*p == '}' || *p == ',')
            return object_missing_value;
        if (match)
            return success;
        if ((status = skipValue(p, e)) != success)
            return status;
        skipWhitespace(p, e);
        if (p >= e)
            return unexpected_eof;
        if (*p == '}')
            return path_not_found;
        if (*p != ',')
            return missing_comma;
        ++p;
    }
}

static Status
descendIndex(const char*& p, const char* e, size_t index)
{
    Status status;
    if (*p != '[')
        return path_not_found;
    ++p;
    skipWhitespace(p, e);
    if (p >= e)
        return unexpected_eof;
    if (*p == ']')
        return path_not_found;
    for (size_t i = 0; i < index; ++i) {
        if ((status = skipValue(p, e)) != success)
            return status;
        skipWhitespace(p, e);
        if (p >= e)
            return unexpected_eof;
        if (*p == ']')
            return path_not_found;
        if (*p != ',')
            return missing_comma;
        ++p;
        skipWhitespace(p, e);
        if (p >= e)
            return unexpected_eof;
        if (*p == ']')
            return unexpected_end_of_array;
    }
    if (*p == ',')
        return unexpected_comma;
    return success;
}

Status
resolve(const std::string& doc, const std::vector<PathStep>& path, Span& out)
{
    const char* p = doc.data();
    const char* e = p + doc.size();
    Status status;
    Span span;

    if (doc.size() > kMaxInputSize)
        return input_too_large;
    if (path.empty())
        return scanDocument(p, e, nullptr, out);

    for (const PathStep& step : path) {
        skipWhitespace(p, e);
        if (p >= e)
            return unexpected_eof;
        if (step.kind == PathStep::Kind::Key)
            status = descendKey(p, e, step.key);
        else
            status = descendIndex(p, e, step.index);
        if (status != success)
            return status;
    }

    skipWhitespace(p, e);
    span.begin = p;
    if ((status = classify(p, e, span.type)) != success)
        return status;
    if ((status = skipValue(p, e)) != success)
        return status;
    span.end = p;
    out = span;
    return success;
}

} // namespace detail
} // namespace sift
