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

#include <sstream>

#include <fmt/format.h>

#include "miscellaneous.hpp"
#include "util.hpp"

namespace
{

std::string compiler_info()
{
#if defined(__clang__)
  return fmt::format("[Clang/LLVM {}.{}.{}]", __clang_major__, __clang_minor__, __clang_patchlevel__);
#elif defined(__GNUC__) || defined(__GNUG__)
  return fmt::format("[GNU GCC {}]", __VERSION__);
#elif defined(_MSC_VER)
  return fmt::format("[MS Visual Studio {}]", _MSC_VER);
#else
  return std::string("Unknown compiler");
#endif
}

}   // namespace

namespace misc
{

std::string print_engine_info()
{
  static constexpr std::string_view title_short{"Lynx"};
  static constexpr std::string_view all_months{"Jan Feb Mar Apr May Jun Jul Aug Sep Oct Nov Dec"};
  std::string m, d, y;

  std::stringstream date(std::string(__DATE__));

  date >> m >> d >> y;

  const auto month = 1 + all_months.find(m) / 4;
  const auto day   = util::to_integral<int>(d).value_or(0);
  const auto year  = y.substr(y.size() - 2);

  return fmt::format("{} {:02}-{:02}-{} {}\n", title_short, month, day, year, compiler_info());
}

}   // namespace misc
