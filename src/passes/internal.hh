#pragma once
#include "../confl-lang.hh"

// clang-format off
namespace confl{
 using namespace trieste;

    std::vector<Pass> parse_passes();
    Parse parser();

    inline const auto wf_types = TDyn | TNum | TBool | TStr | TList | TypeArrow | Flat;

    // Terms that are already in weak head normal form and cost nothing to copy.
    inline const auto wf_atoms = True | False | Num | Str | Lbl | Sym | Enum | Var | Fun;

    inline const auto wf_term = wf_atoms
    | Record | List | Access | Let | App | If
    | Add | Sub | Mul | LT | Eq
    | Import | ResolvedImport
    | DefaultValue | ContractWithDefault | Docstring;

    namespace init_parse{

    inline const auto wf_parse_tokens =
     Num | Str | True | False | Enum | Ident |
     Let | InKw | Fun | FatArrow | If | Then | Else |
     ImportKw | DefaultKw | DocKw |
     Equals | Colon | Dot | Hash |
     Add | Sub | Mul | LT | Eq |
     TDyn | TNum | TBool | TStr | TList | TypeArrow |
     Paren | Brace | Square
     ;

    inline const wf::Wellformed wf =
      (Top <<= File)
    | (File <<= Group++)
    | (Paren <<= Group++)
    | (Brace <<= Group++)
    | (Square <<= Group++)
    | (Group <<= wf_parse_tokens++[1])
    ;

    }
    namespace parse{

    inline const auto wf_parse_cleanup =
      init_parse::wf
    | (File <<= Expr)
    | (Expr <<= init_parse::wf_parse_tokens++)
    ;

    inline const auto wf_structure_tokens =
      (init_parse::wf_parse_tokens - (Paren | Brace | Square)) | Expr | Record | List;

    inline const auto wf_structure =
      (wf_parse_cleanup - Paren - Brace - Square - Group)
    | (Expr <<= wf_structure_tokens++)
    | (Record <<= Field++)
    | (Field <<= Ident * Expr)
    | (List <<= Expr++)
    ;

    inline const auto wf_type_tokens =
      TDyn | TNum | TBool | TStr | TList | TypeArrow | Hash | Ident | Expr;

    // Type tokens remain in the expressions of parenthesized types.
    inline const auto wf_let_tokens =
      (wf_structure_tokens - (InKw | FatArrow | Then | Else | Equals | Colon
                              | ImportKw | DefaultKw | DocKw))
    | Import | DefaultValue | ContractWithDefault | Docstring;

    inline const auto wf_let =
      wf_structure
    | (Expr <<= wf_let_tokens++)
    | (Let <<= Ident * (Bound >>= Expr) * (Body >>= Expr))
    | (Fun <<= Ident * (Body >>= Expr))
    | (If <<= (Cond >>= Expr) * (Then >>= Expr) * (Else >>= Expr))
    | (DefaultValue <<= Expr)
    | (ContractWithDefault <<= Type * Lbl * (Value >>= Expr))
    | (Docstring <<= Doc * (Value >>= Expr))
    | (Type <<= wf_type_tokens++)
    ;

    inline const auto wf_term_tokens =
      wf_let_tokens - (TDyn | TNum | TBool | TStr | TList | TypeArrow | Hash);

    inline const auto wf_annotations =
      wf_let
    | (Expr <<= wf_term_tokens++)
    | (Type <<= wf_types)
    | (TypeArrow <<= (Ty1 >>= wf_types) * (Ty2 >>= wf_types))
    | (Flat <<= Var)
    ;

    inline const auto wf_expr_tokens =
      (wf_term_tokens - (Ident | Dot)) | Var | Access;

    inline const auto wf_exprs =
      wf_annotations
    | (Expr <<= wf_expr_tokens++)
    | (Access <<= (Lhs >>= Expr) * Ident)
    ;

    inline const auto wf_funapp =
      wf_exprs
    | (Expr <<= (wf_expr_tokens | App)++)
    | (App <<= (Lhs >>= Expr) * (Rhs >>= Expr))
    ;

    inline const auto wf_mul =
      wf_funapp
    | (Mul <<= (Lhs >>= Expr) * (Rhs >>= Expr))
    ;

    inline const auto wf_add =
      wf_mul
    | (Add <<= (Lhs >>= Expr) * (Rhs >>= Expr))
    | (Sub <<= (Lhs >>= Expr) * (Rhs >>= Expr))
    ;

    inline const auto wf_cmp =
      wf_add
    | (LT <<= (Lhs >>= Expr) * (Rhs >>= Expr))
    | (Eq <<= (Lhs >>= Expr) * (Rhs >>= Expr))
    ;

    // Final WF
    inline const wf::Wellformed wf =
      (Top <<= File)
    | (File <<= wf_term)
    | (Record <<= Field++)
    | (Field <<= Ident * (Value >>= wf_term))
    | (List <<= wf_term++)
    | (Access <<= (Lhs >>= wf_term) * Ident)
    | (Let <<= Ident * (Bound >>= wf_term) * (Body >>= wf_term))
    | (Fun <<= Ident * (Body >>= wf_term))
    | (App <<= (Lhs >>= wf_term) * (Rhs >>= wf_term))
    | (If <<= (Cond >>= wf_term) * (Then >>= wf_term) * (Else >>= wf_term))
    | (Add <<= (Lhs >>= wf_term) * (Rhs >>= wf_term))
    | (Sub <<= (Lhs >>= wf_term) * (Rhs >>= wf_term))
    | (Mul <<= (Lhs >>= wf_term) * (Rhs >>= wf_term))
    | (LT <<= (Lhs >>= wf_term) * (Rhs >>= wf_term))
    | (Eq <<= (Lhs >>= wf_term) * (Rhs >>= wf_term))
    | (DefaultValue <<= wf_term)
    | (ContractWithDefault <<= Type * Lbl * (Value >>= wf_term))
    | (Docstring <<= Doc * (Value >>= wf_term))
    | (Type <<= wf_types)
    | (TypeArrow <<= (Ty1 >>= wf_types) * (Ty2 >>= wf_types))
    | (Flat <<= wf_term)
    ;

    }

    namespace transform{

    // Imports are resolved in place; the file itself lives in the resolver.
    inline const wf::Wellformed wf =
      parse::wf
    | (ResolvedImport <<= FileRef)
    ;

    }
}
// clang-format on
