#include "contracts.hh"

namespace confl {

  using namespace trieste;

  Types::Types(Node type) : type_(type) {}

  bool valid_type(Node ty) {
    if (ty->type().in({TDyn, TNum, TBool, TStr, TList}))
      return ty->size() == 0;
    if (ty->type() == Type)
      return ty->size() == 1 && valid_type(ty->front());
    if (ty->type() == TypeArrow)
      return ty->size() == 2 && valid_type(ty->front()) && valid_type(ty->back());
    if (ty->type() == Flat)
      return ty->size() == 1;
    return false;
  }

  std::optional<Types> Types::from(Node type) {
    if (type->type() != Type || !valid_type(type)) {
      return std::nullopt;
    }
    return Types(type);
  }

  Types Types::flat(Node term) {
    return Types(Type << (Flat << term));
  }

  Node contract_of(Node ty) {
    if (ty->type() == TDyn)
      return Var ^ "$dyn";
    if (ty->type() == TNum)
      return Var ^ "$num";
    if (ty->type() == TBool)
      return Var ^ "$bool";
    if (ty->type() == TStr)
      return Var ^ "$str";
    if (ty->type() == TList)
      return Var ^ "$list";
    if (ty->type() == TypeArrow) {
      return App << (App << (Var ^ "$func") << contract_of(ty->front()))
                 << contract_of(ty->back());
    }
    if (ty->type() == Type)
      return contract_of(ty->front());

    // Flat, the only form left in a validated type
    return ty->front()->clone();
  }

  Node Types::contract() const {
    return contract_of(type_);
  }
}
