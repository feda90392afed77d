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


static void
_initialize_type(mbx::object &obj, const char *name, mbx::object *parent,
                 bool family)
{
  obj.type.name = name;
  obj.type.len = std::char_traits<char>::length(name);
  obj.type.parent = parent;
  obj.type.family = family;
  obj.hash = mbx::hash(mbx::value {&obj});
}

static mbx::object*
_builtin_type(mbx::object &obj, const char *name, mbx::object *parent,
              bool family = false)
{
  _initialize_type(obj, name, parent, family);
  return &obj;
}


////////////////////////////////////////////////////////////////////////////////
//
//                              Nil
//
static
mbx::object nil_object {mbx::tag::nil};
const mbx::value mbx::nil {&nil_object};

////////////////////////////////////////////////////////////////////////////////
//
//                             Booleans
//
static mbx::object*
_initialize_boolean(mbx::object *ptr, bool val)
{
  ptr->boolean = val;
  ptr->hash = mbx::hash(mbx::value {ptr});
  return ptr;
}

static
mbx::object True_object {mbx::tag::boolean}, False_object {mbx::tag::boolean};
const mbx::value mbx::True {_initialize_boolean(&True_object, true)},
                 mbx::False {_initialize_boolean(&False_object, false)};

////////////////////////////////////////////////////////////////////////////////
//
//                            Unmatched
//
static
mbx::object unmatched_object {mbx::tag::unmatched};
const mbx::value mbx::unmatched {&unmatched_object};

////////////////////////////////////////////////////////////////////////////////
//
//                          Built-in types
//
static mbx::object object_type {mbx::tag::type}, nil_type {mbx::tag::type},
    boolean_type {mbx::tag::type}, num_type {mbx::tag::type},
    str_type {mbx::tag::type}, sym_type {mbx::tag::type},
    set_type {mbx::tag::type}, dict_type {mbx::tag::type},
    type_type {mbx::tag::type}, tuple_type {mbx::tag::type},
    list_type {mbx::tag::type};

const mbx::value
    mbx::types::object {_builtin_type(object_type, "object", nullptr)},
    mbx::types::nil {_builtin_type(nil_type, "nil", &object_type)},
    mbx::types::boolean {_builtin_type(boolean_type, "bool", &object_type)},
    mbx::types::num {_builtin_type(num_type, "num", &object_type)},
    mbx::types::str {_builtin_type(str_type, "str", &object_type)},
    mbx::types::sym {_builtin_type(sym_type, "sym", &object_type)},
    mbx::types::set {_builtin_type(set_type, "set", &object_type)},
    mbx::types::dict {_builtin_type(dict_type, "dict", &object_type)},
    mbx::types::type {_builtin_type(type_type, "type", &object_type)},
    mbx::types::tuple {_builtin_type(tuple_type, "tuple", &object_type, true)},
    mbx::types::list {_builtin_type(list_type, "list", &object_type, true)};
