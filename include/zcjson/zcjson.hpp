#pragma once

// zcjson: a header-only C++17 zero-copy JSON decoder.
// Values are read-only views into the source text; numbers keep an exact
// 128-bit mantissa next to a table-scaled double.

#include <zcjson/config.hpp>
#include <zcjson/error.hpp>
#include <zcjson/source_view.hpp>
#include <zcjson/number.hpp>
#include <zcjson/escape.hpp>
#include <zcjson/arena.hpp>
#include <zcjson/value.hpp>
#include <zcjson/parser.hpp>
#include <zcjson/document.hpp>
