/*
 * Matchbox - Structural pattern matching over garbage-collected values
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#include "matchbox/matcher.hpp"
#include "matchbox/exceptions.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

class MatcherTest: public ::testing::Test { };

TEST_F(MatcherTest, SequenceCapture)
{
  mbx::matcher m {1};
  const mbx::variable v = m[0];
  EXPECT_TRUE(m(mbx::tuple_pattern(1, v, 3), mbx::tuple(1, 2, 3)));
  EXPECT_TRUE(m.matched());
  EXPECT_EQ(v.bound_value(), mbx::num(2));
}

TEST_F(MatcherTest, TypePatternBindsNothing)
{
  mbx::matcher m {1};
  EXPECT_TRUE(m.match(mbx::types::num, mbx::num(5)));
  EXPECT_FALSE(m[0].is_bound());
}

TEST_F(MatcherTest, SetPattern)
{
  mbx::matcher m {1};
  const mbx::variable v = m[0];
  const mbx::pattern p = mbx::set_pattern(1, v);

  ASSERT_TRUE(m(p, mbx::set(1, 2, 3)));
  const mbx::value bound = v.bound_value();
  EXPECT_TRUE(bound == mbx::num(2) or bound == mbx::num(3));

  EXPECT_FALSE(m(p, mbx::set(1)));
  EXPECT_FALSE(v.is_bound());
}

TEST_F(MatcherTest, MapPatternBindsKey)
{
  mbx::matcher m {1};
  const mbx::variable v = m[0];
  const mbx::value subject = mbx::dict({{mbx::str("a"), mbx::str("x")},
                                        {mbx::str("b"), mbx::str("y")}});
  ASSERT_TRUE(m(mbx::dict_pattern({{v, mbx::str("x")}}), subject));
  EXPECT_EQ(v.bound_value(), mbx::str("a"));
}

TEST_F(MatcherTest, RepeatedVariableIsAnError)
{
  mbx::matcher m {1};
  const mbx::variable v = m[0];
  ASSERT_TRUE(m(v, mbx::num(1)));

  EXPECT_THROW(m.match(mbx::tuple_pattern(v, v), mbx::tuple(1, 1)),
               mbx::repeated_variable);
  // Reset happened, nothing was bound
  EXPECT_FALSE(m.matched());
  EXPECT_FALSE(v.is_bound());
}

TEST_F(MatcherTest, FamilyMismatch)
{
  mbx::matcher m;
  EXPECT_FALSE(m(mbx::list_pattern(1, 2), mbx::tuple(1, 2)));
  EXPECT_TRUE(m(mbx::list_pattern(1, 2), mbx::list(1, 2)));
}

TEST_F(MatcherTest, FailureResetsVariables)
{
  mbx::matcher m {2};
  const mbx::variable x = m[0], y = m[1];
  ASSERT_TRUE(m(mbx::tuple_pattern(x, y), mbx::tuple(1, 2)));
  EXPECT_TRUE(x.is_bound());

  // `x` would match the first element before the second one fails
  EXPECT_FALSE(m(mbx::tuple_pattern(x, 3), mbx::tuple(1, 2)));
  EXPECT_FALSE(x.is_bound());
  EXPECT_FALSE(y.is_bound());
  for (const mbx::value val : m.values())
    EXPECT_TRUE(mbx::is(val, mbx::unmatched));
}

TEST_F(MatcherTest, UnusedVariablesStayUnmatched)
{
  mbx::matcher m {2};
  const mbx::variable x = m[0], y = m[1];
  ASSERT_TRUE(m(mbx::tuple_pattern(x, mbx::any), mbx::tuple(1, 2)));
  EXPECT_EQ(x.bound_value(), mbx::num(1));
  EXPECT_TRUE(mbx::is(y.bound_value(), mbx::unmatched));
}

TEST_F(MatcherTest, Deterministic)
{
  mbx::matcher m {2};
  const mbx::variable x = m[0], y = m[1];
  const mbx::pattern p = mbx::set_pattern(x, y);
  const mbx::value subject = mbx::set(1, 2, 3, 4);

  ASSERT_TRUE(m(p, subject));
  const auto vals = m.values();
  const std::vector<mbx::value> first (vals.begin(), vals.end());
  for (int i = 0; i < 5; ++i)
  {
    ASSERT_TRUE(m(p, subject));
    EXPECT_EQ(x.bound_value(), first[0]);
    EXPECT_EQ(y.bound_value(), first[1]);
  }
}

TEST_F(MatcherTest, Destructuring)
{
  auto [m, vars] = mbx::matcher {2};
  ASSERT_EQ(vars.size(), 2u);
  const mbx::variable a = vars[0], b = vars[1];
  EXPECT_NE(a.id(), b.id());

  ASSERT_TRUE(m(mbx::list_pattern(a, b), mbx::list("p", "q")));
  EXPECT_EQ(a.bound_value(), mbx::str("p"));
  EXPECT_EQ(b.bound_value(), mbx::str("q"));
}

TEST_F(MatcherTest, ValuesInDeclarationOrder)
{
  mbx::matcher m {3};
  ASSERT_TRUE(m(mbx::tuple_pattern(m[2], m[0]), mbx::tuple("c", "a")));
  const auto view = m.values();
  const std::vector<mbx::value> vals (view.begin(), view.end());
  ASSERT_EQ(vals.size(), 3u);
  EXPECT_EQ(vals[0], mbx::str("a"));
  EXPECT_TRUE(mbx::is(vals[1], mbx::unmatched));
  EXPECT_EQ(vals[2], mbx::str("c"));
}

TEST_F(MatcherTest, TypeLiteralVersusTypeCheck)
{
  mbx::matcher m;
  EXPECT_TRUE(m(mbx::pattern::literal(mbx::types::num), mbx::types::num));
  EXPECT_FALSE(m(mbx::pattern::literal(mbx::types::num), mbx::num(1)));
  EXPECT_TRUE(m(mbx::types::num, mbx::num(1)));
  EXPECT_FALSE(m(mbx::types::num, mbx::types::num));
}

TEST_F(MatcherTest, SubpatternConstrainsVariable)
{
  mbx::matcher m {1};
  const mbx::variable v = m[0];
  const mbx::pattern p = mbx::tuple_pattern(v[mbx::types::str]);

  EXPECT_FALSE(m(p, mbx::tuple(1)));
  EXPECT_FALSE(v.is_bound());
  ASSERT_TRUE(m(p, mbx::tuple("s")));
  EXPECT_EQ(v.bound_value(), mbx::str("s"));
}

TEST_F(MatcherTest, NestedSubpatternBindsBoth)
{
  mbx::matcher m {2};
  const mbx::variable whole = m[0], part = m[1];
  ASSERT_TRUE(m(whole[mbx::list_pattern(1, part)], mbx::list(1, 2)));
  EXPECT_EQ(whole.bound_value(), mbx::list(1, 2));
  EXPECT_EQ(part.bound_value(), mbx::num(2));
}

TEST_F(MatcherTest, SelfNestingIsAnError)
{
  mbx::matcher m {1};
  const mbx::variable v = m[0];
  EXPECT_THROW(m.match(v[mbx::list_pattern(v)], mbx::list(mbx::list())),
               mbx::repeated_variable);
}

TEST_F(MatcherTest, ForeignVariablesAreBound)
{
  mbx::matcher m;
  const mbx::variable foreign;
  ASSERT_TRUE(m(mbx::tuple_pattern(foreign), mbx::tuple(9)));
  EXPECT_EQ(foreign.bound_value(), mbx::num(9));
  EXPECT_EQ(m.size(), 0u);
}

TEST_F(MatcherTest, OutOfRangeVariable)
{
  mbx::matcher m {1};
  EXPECT_THROW((void)m[1], std::out_of_range);
}

TEST_F(MatcherTest, MoveKeepsVariables)
{
  mbx::matcher m {1};
  const mbx::variable v = m[0];
  mbx::matcher moved {std::move(m)};
  ASSERT_EQ(moved.size(), 1u);
  EXPECT_TRUE(moved[0] == v);
  ASSERT_TRUE(moved(v, mbx::num(3)));
  EXPECT_EQ(v.bound_value(), mbx::num(3));
}

} // namespace
