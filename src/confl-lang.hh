#pragma once
#include <trieste/trieste.h>

namespace confl {
  using namespace trieste;

  // --- Terms ---

  // Constants
  inline const auto Num = TokenDef("num", flag::print);
  inline const auto Str = TokenDef("str", flag::print);
  inline const auto True = TokenDef("true");
  inline const auto False = TokenDef("false");
  inline const auto Enum = TokenDef("enum", flag::print);
  inline const auto Lbl = TokenDef("label", flag::print);
  inline const auto Sym = TokenDef("symbol", flag::print);

  // Identifiers
  inline const auto Ident = TokenDef("ident", flag::print);
  inline const auto Var = TokenDef("var", flag::print);

  // Data structures
  inline const auto Record = TokenDef("record");
  inline const auto Field = TokenDef("field");
  inline const auto List = TokenDef("list");
  inline const auto Access = TokenDef("access");

  // Binders
  inline const auto Let = TokenDef("let");
  inline const auto Fun = TokenDef("fun");
  inline const auto App = TokenDef("app");

  // Conditionals
  inline const auto If = TokenDef("if");
  inline const auto Then = TokenDef("then");
  inline const auto Else = TokenDef("else");

  // Operators
  inline const auto Add = TokenDef("+");
  inline const auto Sub = TokenDef("-");
  inline const auto Mul = TokenDef("*");
  inline const auto LT = TokenDef("<");
  inline const auto Eq = TokenDef("==");

  // Imports
  inline const auto Import = TokenDef("import", flag::print);
  inline const auto ResolvedImport = TokenDef("resolved_import", flag::print);
  inline const auto FileRef = TokenDef("file_ref", flag::print);

  // Enriched values
  inline const auto DefaultValue = TokenDef("default");
  inline const auto ContractWithDefault = TokenDef("contract_default");
  inline const auto Docstring = TokenDef("docstring");
  inline const auto Doc = TokenDef("doc", flag::print);

  // --- Types ---
  inline const auto Type = TokenDef("type");
  inline const auto TDyn = TokenDef("Dyn");
  inline const auto TNum = TokenDef("Num");
  inline const auto TBool = TokenDef("Bool");
  inline const auto TStr = TokenDef("Str");
  inline const auto TList = TokenDef("List");
  inline const auto TypeArrow = TokenDef("->");
  inline const auto Flat = TokenDef("flat");

  // --- Parsing ---

  // Grouping tokens
  inline const auto Expr = TokenDef("expr");
  inline const auto Paren = TokenDef("()");
  inline const auto Brace = TokenDef("{}");
  inline const auto Square = TokenDef("[]");

  // Separators and keywords that do not survive parsing
  inline const auto Equals = TokenDef("=");
  inline const auto FatArrow = TokenDef("=>");
  inline const auto Colon = TokenDef(":");
  inline const auto Dot = TokenDef(".");
  inline const auto Hash = TokenDef("#");
  inline const auto InKw = TokenDef("in_kw");
  inline const auto ImportKw = TokenDef("import_kw");
  inline const auto DefaultKw = TokenDef("default_kw");
  inline const auto DocKw = TokenDef("doc_kw");

  // Convenience tokens
  inline const auto Lhs = TokenDef("lhs");
  inline const auto Rhs = TokenDef("rhs");
  inline const auto Op = TokenDef("op");
  inline const auto Ty1 = TokenDef("ty1");
  inline const auto Ty2 = TokenDef("ty2");
  inline const auto Cond = TokenDef("cond");
  inline const auto Bound = TokenDef("bound");
  inline const auto Body = TokenDef("body");
  inline const auto Value = TokenDef("value");
}
