/*
  Lynx, a bitboard chess board core derived from Feliscatus
  Copyright (C) 2008-2016 Gunnar Harms (Bobcat author)
  Copyright (C) 2017      FireFather (Tomcat author)
  Copyright (C) 2020-2022 Rudy Alex Kohn

  Lynx is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  Lynx is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#pragma once

#include <charconv>
#include <optional>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace util {

template<int Min, int Max>
constexpr bool in_between(const int v) {
  return static_cast<unsigned int>(v) - static_cast<unsigned int>(Min) <= static_cast<unsigned int>(Max) - static_cast<unsigned int>(Min);
}

template<typename Integral>
constexpr char to_char(const Integral v) {
  return static_cast<char>(v + '0');
}

template<typename T>
constexpr T from_char(const char c) {
  return static_cast<T>(c - '0');
}

/// to_integral() parses the whole string as a decimal number, empty if anything is left over or it does not fit in T
template<typename T>
std::optional<T> to_integral(const std::string_view str) {

  static_assert(std::is_integral_v<T>, "Only integrals allowed.");

  auto value = T(0);
  const auto *const last = str.data() + str.size();
  const auto [ptr, ec]   = std::from_chars(str.data(), last, value);

  if (ec != std::errc() || ptr != last)
    return std::nullopt;

  return value;
}

}
