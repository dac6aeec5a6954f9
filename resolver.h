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

namespace sift {
namespace detail {

// Walks path from the root of doc, skipping every sibling without decoding
// it, and reports the span of the addressed value.
//
// An empty path validates the whole document. Otherwise only the bytes on
// the route are examined, so damage elsewhere in the document goes
// unnoticed. A step that does not apply (missing key, index out of range,
// key applied to an array, index applied to an object, any step applied to
// a scalar) yields path_not_found.
Status
resolve(const std::string& doc, const std::vector<PathStep>& path, Span& out);

} // namespace detail
} // namespace sift
