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


#include "matchbox/match.hpp"
#include "matchbox/pattern.hpp"
#include "matchbox/value.hpp"

#include <gtest/gtest.h>
#include <map>

namespace {

// Test fixture for the pattern dispatcher
class MatchTest: public ::testing::Test {
  protected:
  mbx::bindings result;
};

// Literals compare by value equality
TEST_F(MatchTest, Literals)
{
  EXPECT_TRUE(mbx::match(mbx::num(1), mbx::num(1), result));
  EXPECT_FALSE(mbx::match(mbx::num(1), mbx::num(2), result));
  EXPECT_FALSE(mbx::match(mbx::num(1), mbx::True, result));
  EXPECT_TRUE(mbx::match(mbx::str("a"), mbx::str("a"), result));
  EXPECT_TRUE(result.empty());
}

TEST_F(MatchTest, Wildcard)
{
  for (const mbx::value subject :
       {mbx::nil, mbx::num(1), mbx::tuple(1, 2), mbx::set(), mbx::unmatched})
    EXPECT_TRUE(mbx::match(mbx::any, subject, result));
  EXPECT_TRUE(result.empty());
}

TEST_F(MatchTest, TypeCheck)
{
  const mbx::value shape = mbx::make_type("shape");
  const mbx::value circle = mbx::make_type("circle", shape);

  EXPECT_TRUE(mbx::match(mbx::types::num, mbx::num(5), result));
  EXPECT_FALSE(mbx::match(mbx::types::str, mbx::num(5), result));
  EXPECT_TRUE(mbx::match(shape, mbx::instance(circle), result));
  EXPECT_FALSE(mbx::match(circle, mbx::instance(shape), result));
  EXPECT_TRUE(mbx::match(mbx::types::tuple, mbx::tuple(1, 2), result));
  EXPECT_TRUE(result.empty());

  // A type as a literal is compared to the type itself
  EXPECT_TRUE(mbx::match(mbx::pattern::literal(mbx::types::num),
                         mbx::types::num, result));
  EXPECT_FALSE(mbx::match(mbx::pattern::literal(mbx::types::num),
                          mbx::num(5), result));
  EXPECT_FALSE(mbx::match(mbx::types::num, mbx::types::num, result));
}

TEST_F(MatchTest, VariableCapture)
{
  const mbx::variable x;
  ASSERT_TRUE(mbx::match(x, mbx::num(7), result));
  ASSERT_TRUE(result.contains(x.id()));
  EXPECT_EQ(result.at(x.id()), mbx::num(7));

  // The dispatcher itself leaves the variable untouched
  EXPECT_FALSE(x.is_bound());
}

TEST_F(MatchTest, VariableSubpattern)
{
  const mbx::variable x, y;
  const mbx::pattern p = x[mbx::tuple_pattern(1, y)];

  ASSERT_TRUE(mbx::match(p, mbx::tuple(1, "a"), result));
  EXPECT_EQ(result.at(x.id()), mbx::tuple(1, "a"));
  EXPECT_EQ(result.at(y.id()), mbx::str("a"));

  mbx::bindings other;
  EXPECT_FALSE(mbx::match(p, mbx::tuple(2, "a"), other));
  EXPECT_TRUE(other.empty());
}

TEST_F(MatchTest, Sequences)
{
  const mbx::variable x;
  EXPECT_TRUE(mbx::match(mbx::tuple_pattern(1, x, 3), mbx::tuple(1, 2, 3),
                         result));
  EXPECT_EQ(result.at(x.id()), mbx::num(2));

  mbx::bindings other;
  // Length mismatch
  EXPECT_FALSE(mbx::match(mbx::tuple_pattern(1, x), mbx::tuple(1, 2, 3),
                          other));
  // Family mismatch
  EXPECT_FALSE(mbx::match(mbx::list_pattern(1, 2), mbx::tuple(1, 2), other));
  EXPECT_FALSE(mbx::match(mbx::tuple_pattern(1, 2), mbx::list(1, 2), other));
  // Not a sequence
  EXPECT_FALSE(mbx::match(mbx::tuple_pattern(1, 2), mbx::set(1, 2), other));
  EXPECT_TRUE(mbx::match(mbx::list_pattern(), mbx::list(), other));
  EXPECT_TRUE(other.empty());
}

TEST_F(MatchTest, FailedSequenceKeepsNoPartialBindings)
{
  const mbx::variable x, y;
  EXPECT_FALSE(mbx::match(mbx::tuple_pattern(x, y, 3), mbx::tuple(1, 2, 4),
                          result));
  EXPECT_TRUE(result.empty());
}

TEST_F(MatchTest, UserFamilies)
{
  const mbx::value point = mbx::make_family("point");
  const mbx::variable x;
  EXPECT_TRUE(mbx::match(mbx::seq_pattern(point, x, 0), mbx::seq(point, 4, 0),
                         result));
  EXPECT_EQ(result.at(x.id()), mbx::num(4));

  mbx::bindings other;
  EXPECT_FALSE(mbx::match(mbx::seq_pattern(point, x, 0), mbx::tuple(4, 0),
                          other));
}

TEST_F(MatchTest, Sets)
{
  const mbx::variable x;
  EXPECT_TRUE(mbx::match(mbx::set_pattern(1, x), mbx::set(1, 2, 3), result));
  ASSERT_TRUE(result.contains(x.id()));
  const mbx::value bound = result.at(x.id());
  EXPECT_TRUE(bound == mbx::num(2) or bound == mbx::num(3));

  mbx::bindings other;
  EXPECT_FALSE(mbx::match(mbx::set_pattern(1, x), mbx::set(1), other));
  EXPECT_FALSE(mbx::match(mbx::set_pattern(1, 4), mbx::set(1, 2, 3), other));
  EXPECT_FALSE(mbx::match(mbx::set_pattern(1), mbx::tuple(1), other));
  EXPECT_TRUE(mbx::match(mbx::set_pattern(), mbx::set(1, 2), other));
  EXPECT_TRUE(other.empty());
}

TEST_F(MatchTest, SetsRequireDistinctSubjects)
{
  EXPECT_FALSE(mbx::match(mbx::set_pattern(mbx::types::num, mbx::any),
                          mbx::set(1), result));
  EXPECT_TRUE(mbx::match(mbx::set_pattern(mbx::types::num, mbx::any),
                         mbx::set(1, "a"), result));
}

TEST_F(MatchTest, SetsBacktrack)
{
  const mbx::variable x, y;
  // `x` must not take the only string
  const mbx::pattern p = mbx::set_pattern(x, y[mbx::types::str]);
  ASSERT_TRUE(mbx::match(p, mbx::set("a", 1), result));
  EXPECT_EQ(result.at(x.id()), mbx::num(1));
  EXPECT_EQ(result.at(y.id()), mbx::str("a"));
}

TEST_F(MatchTest, Maps)
{
  const mbx::variable k, v;
  const mbx::value subject = mbx::dict({{mbx::str("a"), mbx::str("x")},
                                        {mbx::str("b"), mbx::str("y")}});

  ASSERT_TRUE(mbx::match(mbx::dict_pattern({{k, mbx::str("x")}}), subject,
                         result));
  EXPECT_EQ(result.at(k.id()), mbx::str("a"));

  mbx::bindings other;
  ASSERT_TRUE(mbx::match(mbx::dict_pattern({{mbx::str("b"), v}}), subject,
                         other));
  EXPECT_EQ(other.at(v.id()), mbx::str("y"));

  mbx::bindings none;
  EXPECT_FALSE(mbx::match(mbx::dict_pattern({{mbx::str("c"), mbx::any}}),
                          subject, none));
  EXPECT_FALSE(mbx::match(mbx::dict_pattern({{mbx::str("a"), mbx::str("y")}}),
                          subject, none));
  EXPECT_FALSE(mbx::match(mbx::dict_pattern({{mbx::any, mbx::any}}),
                          mbx::dict({}), none));
  EXPECT_FALSE(mbx::match(mbx::dict_pattern({{mbx::any, mbx::any}}),
                          mbx::set(1), none));
  EXPECT_TRUE(none.empty());
}

// Keys of a mapping pattern are matched as patterns, not looked up
TEST_F(MatchTest, MapKeysArePatterns)
{
  const mbx::variable k;
  const mbx::value subject = mbx::dict({{mbx::num(1), mbx::str("one")},
                                        {mbx::str("two"), mbx::num(2)}});
  ASSERT_TRUE(mbx::match(mbx::dict_pattern({{k[mbx::types::str], mbx::any}}),
                         subject, result));
  EXPECT_EQ(result.at(k.id()), mbx::str("two"));
}

TEST_F(MatchTest, NestedContainers)
{
  const mbx::variable x, y;
  const mbx::pattern p =
      mbx::list_pattern(mbx::set_pattern(mbx::tuple_pattern(x, 1)),
                        mbx::dict_pattern({{mbx::str("k"), y}}));
  const mbx::value subject =
      mbx::list(mbx::set(mbx::tuple(0, 0), mbx::tuple("z", 1)),
                mbx::dict({{mbx::str("k"), mbx::list()}}));

  ASSERT_TRUE(mbx::match(p, subject, result));
  EXPECT_EQ(result.at(x.id()), mbx::str("z"));
  EXPECT_EQ(result.at(y.id()), mbx::list());
}

TEST_F(MatchTest, CustomBindingMapping)
{
  const mbx::variable x;
  std::map<mbx::variable_id, mbx::value> custom;
  ASSERT_TRUE(mbx::match(mbx::tuple_pattern(x), mbx::tuple(1), custom));
  EXPECT_EQ(custom.at(x.id()), mbx::num(1));
}

} // namespace
