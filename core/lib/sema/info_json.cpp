// gradual/sema/info_json.cpp - JSON export of statics results
//
#include "gradual/sema/info_json.hpp"

#include <string>
#include <vector>

#include "gradual/basic/casting.hpp"
#include "gradual/sema/type_utils.hpp"

namespace gradual
{

namespace
{

using nlohmann::json;

json ctx_names(const Ctx & ctx)
{
  json names = json::array();
  for (const auto & entry : ctx.entries()) {
    if (entry.is_variable()) names.push_back(std::string(entry.name));
  }
  return names;
}

std::string type_str(TypeContext & types, const Type * ty)
{
  return ty ? to_string(strip_synswitch(types, ty)) : std::string("?");
}

}  // namespace

json to_json(const InfoMap & map, Id id)
{
  TypeContext & types = map.types();
  const Info & info = map.at(id);

  json j = {
    {"id", id.value},
    {"kind", std::string(to_string(info.get_kind()))},
    {"cls", std::string(info.cls())},
    {"error", is_error(info)},
    {"ctx", ctx_names(info.ctx)},
  };

  switch (info.get_kind()) {
    case InfoKind::Invalid:
      j["text"] = std::string(cast<InfoInvalid>(&info)->text);
      break;
    case InfoKind::Exp: {
      const auto * exp = cast<InfoExp>(&info);
      j["status"] = describe(exp->status);
      j["mode"] = to_string(exp_mode(map, id));
      j["self"] = type_str(types, exp_self_type(map, id));
      j["ty"] = type_str(types, exp->ty);
      j["uses"] = json::array();
      for (const auto name : exp->co_ctx.names()) {
        j["uses"].push_back(std::string(name));
      }
      break;
    }
    case InfoKind::Pat: {
      const auto * pat = cast<InfoPat>(&info);
      j["status"] = describe(pat->status);
      j["mode"] = to_string(pat_mode(map, id));
      j["self"] = type_str(types, pat_self_type(map, id));
      j["ty"] = type_str(types, pat->ty);
      json binds = json::array();
      for (const auto & entry : pat->ctx_out.added_since(pat->ctx)) {
        if (entry.is_variable()) binds.push_back(std::string(entry.name));
      }
      j["binds"] = binds;
      j["unused"] = is_unused_binding(info);
      break;
    }
    case InfoKind::Typ: {
      const auto * typ = cast<InfoTyp>(&info);
      j["status"] = std::string(to_string(typ->error));
      j["ty"] = type_str(types, typ->ty);
      break;
    }
    case InfoKind::Rul:
      j["status"] = "ok";
      break;
    case InfoKind::TPat:
      j["status"] = std::string(to_string(cast<InfoTPat>(&info)->error));
      break;
    case InfoKind::TSum: {
      const auto * sum = cast<InfoTSum>(&info);
      j["status"] = std::string(to_string(sum->error));
      if (sum->arg) j["arg"] = type_str(types, sum->arg);
      break;
    }
  }
  return j;
}

json to_json(const InfoMap & map)
{
  json entries = json::array();
  for (const Id id : map.ids()) {
    entries.push_back(to_json(map, id));
  }
  json j = {{"entries", entries}};
  j["root"] = map.root() ? json(map.root()->rep_id().value) : json(nullptr);
  return j;
}

}  // namespace gradual
