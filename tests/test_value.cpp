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


#include "matchbox/value.hpp"
#include "matchbox/format.hpp"

#include <gtest/gtest.h>
#include <format>
#include <sstream>
#include <stdexcept>

namespace {

class ValueTest: public ::testing::Test {
  protected:
  static std::string
  written(mbx::value x)
  {
    std::ostringstream buf;
    mbx::write(buf, x);
    return buf.str();
  }
};

TEST_F(ValueTest, ScalarEquality)
{
  EXPECT_EQ(mbx::num(2), mbx::num(2));
  EXPECT_NE(mbx::num(2), mbx::num(3));
  EXPECT_EQ(mbx::str("abc"), mbx::str("abc"));
  EXPECT_NE(mbx::str("abc"), mbx::sym("abc"));
  EXPECT_EQ(mbx::from(true), mbx::True);

  // No coercion between booleans and numbers
  EXPECT_NE(mbx::True, mbx::num(1));
  EXPECT_NE(mbx::nil, mbx::False);
}

TEST_F(ValueTest, SequenceEqualityRespectsFamily)
{
  EXPECT_EQ(mbx::tuple(1, 2), mbx::tuple(1, 2));
  EXPECT_NE(mbx::tuple(1, 2), mbx::tuple(2, 1));
  EXPECT_NE(mbx::tuple(1, 2), mbx::list(1, 2));
  EXPECT_NE(mbx::tuple(1, 2), mbx::tuple(1, 2, 3));

  const mbx::value point = mbx::make_family("point");
  EXPECT_EQ(mbx::seq(point, 1, 2), mbx::seq(point, 1, 2));
  EXPECT_NE(mbx::seq(point, 1, 2), mbx::tuple(1, 2));
}

TEST_F(ValueTest, SetsDropDuplicates)
{
  const mbx::value s = mbx::set(1, 2, 2, 3, 1);
  EXPECT_EQ(mbx::length(s), 3u);
  EXPECT_EQ(s, mbx::set(3, 2, 1));
  EXPECT_EQ(mbx::hash(s), mbx::hash(mbx::set(2, 3, 1)));
  EXPECT_NE(s, mbx::set(1, 2));
}

TEST_F(ValueTest, DictLastValueWins)
{
  const mbx::value d = mbx::dict({{mbx::str("a"), mbx::num(1)},
                                  {mbx::str("b"), mbx::num(2)},
                                  {mbx::str("a"), mbx::num(3)}});
  EXPECT_EQ(mbx::length(d), 2u);

  mbx::value val;
  ASSERT_TRUE(mbx::lookup(d, mbx::str("a"), val));
  EXPECT_EQ(val, mbx::num(3));
  EXPECT_FALSE(mbx::lookup(d, mbx::str("c"), val));

  EXPECT_EQ(d, mbx::dict({{mbx::str("b"), mbx::num(2)},
                          {mbx::str("a"), mbx::num(3)}}));
}

TEST_F(ValueTest, TypesCompareByIdentity)
{
  const mbx::value a = mbx::make_type("shape");
  const mbx::value b = mbx::make_type("shape");
  EXPECT_EQ(a, a);
  EXPECT_NE(a, b);
}

TEST_F(ValueTest, InstanceOf)
{
  const mbx::value shape = mbx::make_type("shape");
  const mbx::value circle = mbx::make_type("circle", shape);
  const mbx::value c = mbx::instance(circle, mbx::num(1));

  EXPECT_TRUE(mbx::isinstance(c, circle));
  EXPECT_TRUE(mbx::isinstance(c, shape));
  EXPECT_TRUE(mbx::isinstance(c, mbx::types::object));
  EXPECT_FALSE(mbx::isinstance(mbx::instance(shape), circle));

  EXPECT_TRUE(mbx::isinstance(mbx::num(5), mbx::types::num));
  EXPECT_FALSE(mbx::isinstance(mbx::True, mbx::types::num));
  EXPECT_TRUE(mbx::isinstance(mbx::list(1), mbx::types::list));
  EXPECT_FALSE(mbx::isinstance(mbx::list(1), mbx::types::tuple));
  EXPECT_TRUE(mbx::isinstance(circle, mbx::types::type));

  // Instances of distinct objects are distinct
  EXPECT_NE(mbx::instance(circle), mbx::instance(circle));

  EXPECT_THROW(mbx::isinstance(c, mbx::num(1)), std::invalid_argument);
  EXPECT_THROW(mbx::instance(mbx::types::list), std::invalid_argument);
}

TEST_F(ValueTest, Accessors)
{
  const mbx::value t = mbx::tuple(1, "two", 3.5);
  EXPECT_EQ(mbx::length(t), 3u);
  EXPECT_EQ(mbx::seq_ref(t, 1), mbx::str("two"));
  EXPECT_TRUE(mbx::is(mbx::seq_family(t), mbx::types::tuple));
  EXPECT_THROW(mbx::seq_ref(t, 3), std::out_of_range);
  EXPECT_THROW(mbx::length(mbx::num(1)), std::invalid_argument);
  EXPECT_THROW(mbx::num_val(mbx::str("1")), std::invalid_argument);
  EXPECT_EQ(mbx::str_view(mbx::str("text")), "text");
  EXPECT_EQ(mbx::type_name(mbx::types::num), "num");
}

TEST_F(ValueTest, Printing)
{
  EXPECT_EQ(written(mbx::tuple(1, 2)), "(1, 2)");
  EXPECT_EQ(written(mbx::tuple(1)), "(1,)");
  EXPECT_EQ(written(mbx::list(1, "a")), "[1, \"a\"]");
  EXPECT_EQ(written(mbx::set()), "set()");
  EXPECT_EQ(written(mbx::nil), "nil");
  EXPECT_EQ(written(mbx::True), "true");
  EXPECT_EQ(written(mbx::unmatched), "<unmatched>");
  EXPECT_EQ(written(mbx::types::num), "<type num>");

  EXPECT_EQ(std::format("{}", mbx::str("a")), "\"a\"");
  EXPECT_EQ(std::format("{:d}", mbx::str("a")), "a");
}

} // namespace
