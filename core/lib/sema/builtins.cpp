// gradual/sema/builtins.cpp - Built-in type names and initial context
//
#include "gradual/sema/builtins.hpp"

#include <vector>

namespace gradual
{

void TypeTable::register_builtins(TypeContext & types)
{
  // Primitives
  register_builtin("Int", types.int_type());
  register_builtin("Float", types.float_type());
  register_builtin("Bool", types.bool_type());
  register_builtin("String", types.string_type());
  register_builtin("()", types.unit_type());

  // Algebraic types
  register_builtin(
    "Ordering", types.get_sum_type({SumEntry{"LT", nullptr}, SumEntry{"EQ", nullptr},
                                    SumEntry{"GT", nullptr}}));

  // Aliases
  register_alias("Unit", "()");
}

Ctx builtin_ctx(TypeContext & types, const TypeTable & table)
{
  const Type * int_t = types.int_type();
  const Type * float_t = types.float_type();
  const Type * bool_t = types.bool_type();
  const Type * string_t = types.string_type();
  const Type * ordering = table.lookup("Ordering");

  const auto fn = [&types](const Type * a, const Type * b) { return types.get_arrow_type(a, b); };
  const auto pair = [&types](const Type * a, const Type * b) {
    return types.get_prod_type({a, b});
  };

  struct Binding
  {
    std::string_view name;
    const Type * typ;
  };
  const std::vector<Binding> functions = {
    // Constants
    {"pi", float_t},
    {"infinity", float_t},
    {"neg_infinity", float_t},
    {"nan", float_t},
    {"epsilon_float", float_t},
    {"max_int", int_t},
    {"min_int", int_t},

    // Conversions
    {"int_of_float", fn(float_t, int_t)},
    {"float_of_int", fn(int_t, float_t)},
    {"string_of_int", fn(int_t, string_t)},
    {"string_of_float", fn(float_t, string_t)},
    {"string_of_bool", fn(bool_t, string_t)},
    {"int_of_string", fn(string_t, int_t)},
    {"float_of_string", fn(string_t, float_t)},
    {"bool_of_string", fn(string_t, bool_t)},

    // Arithmetic
    {"abs", fn(int_t, int_t)},
    {"abs_float", fn(float_t, float_t)},
    {"ceil", fn(float_t, float_t)},
    {"floor", fn(float_t, float_t)},
    {"exp", fn(float_t, float_t)},
    {"log", fn(float_t, float_t)},
    {"log10", fn(float_t, float_t)},
    {"sqrt", fn(float_t, float_t)},
    {"sin", fn(float_t, float_t)},
    {"cos", fn(float_t, float_t)},
    {"tan", fn(float_t, float_t)},
    {"is_finite", fn(float_t, bool_t)},
    {"is_infinite", fn(float_t, bool_t)},
    {"is_nan", fn(float_t, bool_t)},
    {"mod", fn(pair(int_t, int_t), int_t)},
    {"compare", fn(pair(int_t, int_t), ordering)},

    // Strings
    {"string_length", fn(string_t, int_t)},
    {"string_compare", fn(pair(string_t, string_t), ordering)},
    {"string_trim", fn(string_t, string_t)},
    {"string_concat", fn(pair(string_t, types.get_list_type(string_t)), string_t)},
    {"string_sub", fn(types.get_prod_type({string_t, int_t, int_t}), string_t)},
  };

  Ctx ctx;
  for (const auto & b : functions) {
    ctx = ctx.extend_var(b.name, Id{}, b.typ);
  }
  for (const auto & v : ordering->variants) {
    ctx = ctx.extend_constructor(v.tag, Id{}, ordering);
  }
  return ctx;
}

}  // namespace gradual
