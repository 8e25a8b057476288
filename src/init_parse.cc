#include "confl-lang.hh"
#include "passes/internal.hh"


namespace confl
{
  using namespace trieste;
  using namespace trieste::detail;

  namespace init_parse {
  Parse parser()
  {
    Parse p(depth::file, init_parse::wf);
    auto depth = std::make_shared<size_t>(0);

    p("start",
      {
        // whitespace
        "[[:space:]]+" >> [](auto&) {}, // no-op

        // Line comment.
        "//[^\n]*" >> [](auto&) {}, // no-op

        // Block comment /* ... */, may be nested
        "/\\*" >> [depth](auto& m) {
            ++(*depth);
            m.mode("comment");
        },

        // Delimiters. Each opens a node whose groups are separated by ','
        R"(\()" >> [](auto& m) { m.push(Paren); },
        R"(\))" >>
          [](auto& m) {
            m.term();
            m.pop(Paren);
          },
        R"(\{)" >> [](auto& m) { m.push(Brace); },
        R"(\})" >>
          [](auto& m) {
            m.term();
            m.pop(Brace);
          },
        R"(\[)" >> [](auto& m) { m.push(Square); },
        R"(\])" >>
          [](auto& m) {
            m.term();
            m.pop(Square);
          },
        "," >> [](auto& m) { m.term(); },

        // Arrows before the operators they start with
        "=>" >> [](auto& m) { m.add(FatArrow); },
        "->" >> [](auto& m) { m.add(TypeArrow); },
        "==" >> [](auto& m) { m.add(Eq); },
        "=" >> [](auto& m) { m.add(Equals); },

        // Operators ('+' and '*' are reserved RegEx characters)
        R"(\+)" >> [](auto& m) { m.add(Add); },
        "-" >> [](auto& m) { m.add(Sub); },
        R"(\*)" >> [](auto& m) { m.add(Mul); },
        "<" >> [](auto& m) { m.add(LT); },

        // Type annotation
        ":" >> [](auto& m) { m.add(Colon); },
        // Custom contract in a type
        "#" >> [](auto& m) { m.add(Hash); },

        // Constants. Numbers come before '.' so that 1.5 is a single token
        "[[:digit:]]+(?:\\.[[:digit:]]+)?" >> [](auto& m) { m.add(Num); },
        R"("(?:[^"\\]|\\.)*")" >> [](auto& m) { m.add(Str); },
        R"(`[_[:alpha:]][_[:alnum:]']*)" >> [](auto& m) { m.add(Enum); },

        // Static field access
        R"(\.)" >> [](auto& m) { m.add(Dot); },

        // Binders
        "let\\b" >> [](auto& m) { m.add(Let); },
        "in\\b" >> [](auto& m) { m.add(InKw); },
        "fun\\b" >> [](auto& m) { m.add(Fun); },

        // Expressions
        "if\\b" >> [](auto& m) { m.add(If); },
        "then\\b" >> [](auto& m) { m.add(Then); },
        "else\\b" >> [](auto& m) { m.add(Else); },
        "import\\b" >> [](auto& m) { m.add(ImportKw); },
        "default\\b" >> [](auto& m) { m.add(DefaultKw); },
        "doc\\b" >> [](auto& m) { m.add(DocKw); },

        // boolean values
        "true\\b" >> [](auto& m) { m.add(True); },
        "false\\b" >> [](auto& m) { m.add(False); },

        // Built-in types
        "Dyn\\b" >> [](auto& m) { m.add(TDyn); },
        "Num\\b" >> [](auto& m) { m.add(TNum); },
        "Bool\\b" >> [](auto& m) { m.add(TBool); },
        "Str\\b" >> [](auto& m) { m.add(TStr); },
        "List\\b" >> [](auto& m) { m.add(TList); },

        // Ident. '%' is never accepted so that generated names cannot clash
        R"([_[:alpha:]][_[:alnum:]']*)" >> [](auto& m) { m.add(Ident); },
      });

    p("comment", {
        // opening nested comments
        "/\\*" >> [depth](Make&) { ++(*depth); },
        // closing comments
        "\\*/" >>
          [depth](Make& m) {
            if (--(*depth) == 0) m.mode("start"); },
        // parse any token (except /* and */)
        ".|\n" >> [](Make&) {} } );

    p.done([depth](Make& m) {
      *depth = 0;
      if(m.mode() == "comment"){
        m.error("Unterminated comment");
      }
      m.term();
    });
    return p;
  }
  }
}
