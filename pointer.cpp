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
#include "jtckdint.h"

#include <cctype>

namespace sift {

PathStep
PathStep::makeKey(std::string key)
{
    PathStep step;
    step.kind = Kind::Key;
    step.key = std::move(key);
    return step;
}

PathStep
PathStep::makeIndex(size_t index)
{
    PathStep step;
    step.kind = Kind::Index;
    step.index = index;
    return step;
}

bool
PathStep::operator==(const PathStep& other) const
{
    if (kind != other.kind)
        return false;
    if (kind == Kind::Key)
        return key == other.key;
    return index == other.index;
}

static void
ReplaceAll(std::string& s, const char* from, char to)
{
    size_t i = 0;
    while ((i = s.find(from, i)) != std::string::npos) {
        s.replace(i, 2, 1, to);
        ++i;
    }
}

// "~1" must be decoded before "~0" so that "~01" stays "~1".
static std::string
UnescapeSegment(std::string s)
{
    ReplaceAll(s, "~1", '/');
    ReplaceAll(s, "~0", '~');
    return s;
}

// Digits only, no sign, no leading zero, and small enough for size_t.
static bool
ParseIndex(const std::string& s, size_t& index)
{
    size_t x = 0;
    if (s.empty() || (s[0] == '0' && s.size() > 1))
        return false;
    for (char c : s) {
        if (!isdigit(c & 255))
            return false;
        if (ckd_mul(&x, x, 10) || ckd_add(&x, x, c - '0'))
            return false;
    }
    index = x;
    return true;
}

Status
parsePointer(const std::string& pointer, std::vector<PathStep>& steps)
{
    size_t i, j, index;
    steps.clear();
    if (pointer.empty())
        return success;
    if (pointer[0] != '/')
        return invalid_pointer;
    for (i = 1;; i = j + 1) {
        if (steps.size() >= kMaxPathSegments)
            return invalid_pointer;
        if ((j = pointer.find('/', i)) == std::string::npos)
            j = pointer.size();
        std::string segment = UnescapeSegment(pointer.substr(i, j - i));
        if (ParseIndex(segment, index))
            steps.push_back(PathStep::makeIndex(index));
        else
            steps.push_back(PathStep::makeKey(std::move(segment)));
        if (j == pointer.size())
            return success;
    }
}

} // namespace sift
