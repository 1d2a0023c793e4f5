#pragma once

/// @file domjson.hpp
/// @brief Main header file for the domjson library.
///
/// @code
///   auto v = domjson::to_owned_value(R"({"name":"x","tags":[1,2]})");
///   auto tag = v.get("tags")->get_idx(1)->as_u8();   // 2
///
///   std::string input = R"(["a","b"])";
///   auto b = domjson::to_borrowed_value(input);      // strings view input
///
///   auto encoded = domjson::to_value(std::vector<int>{1, 2});
///   bool same = encoded == domjson::to_owned_value("[1,2]");
/// @endcode

#include "config.hpp"
#include "fwd.hpp"
#include "error.hpp"
#include "options.hpp"
#include "number.hpp"
#include "cow_string.hpp"
#include "object.hpp"
#include "value_trait.hpp"
#include "owned_value.hpp"
#include "borrowed_value.hpp"
#include "decoder.hpp"
#include "serialize.hpp"
#include "encoder.hpp"
